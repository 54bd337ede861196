#include "bench_common.hpp"

#include "selfspy/config/config.hpp"

void run_config_benchmark() {
  selfspy::config::Config config;
  const std::string rendered = selfspy::config::render_config(config);

  selfspy::bench::run_bench("config_validate", 2000, [&] {
    (void)selfspy::config::validate_config(config);
  });
  selfspy::bench::run_bench("config_parse", 2000,
                            [&] { (void)selfspy::config::parse_config(rendered); });
}
