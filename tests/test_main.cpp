#include "test_framework.hpp"

#include "selfspy/observability/global.hpp"
#include "selfspy/observability/noop_observer.hpp"

#include <csignal>
#include <iostream>
#include <memory>

void register_common_tests(std::vector<selfspy::tests::TestCase> &tests);
void register_config_tests(std::vector<selfspy::tests::TestCase> &tests);
void register_observability_tests(std::vector<selfspy::tests::TestCase> &tests);
void register_codec_tests(std::vector<selfspy::tests::TestCase> &tests);
void register_window_deduplicator_tests(std::vector<selfspy::tests::TestCase> &tests);
void register_event_buffer_tests(std::vector<selfspy::tests::TestCase> &tests);
void register_store_tests(std::vector<selfspy::tests::TestCase> &tests);
void register_flush_coordinator_tests(std::vector<selfspy::tests::TestCase> &tests);
void register_stats_tests(std::vector<selfspy::tests::TestCase> &tests);
void register_engine_tests(std::vector<selfspy::tests::TestCase> &tests);
void register_engine_integration_tests(std::vector<selfspy::tests::TestCase> &tests);

int main() {
  // Ignore SIGPIPE to prevent crashes when output is piped
  std::signal(SIGPIPE, SIG_IGN);

  // Keep test output readable; tests that inspect events install their own.
  selfspy::observability::set_global_observer(
      std::make_unique<selfspy::observability::NoopObserver>());

  std::vector<selfspy::tests::TestCase> tests;
  register_common_tests(tests);
  register_config_tests(tests);
  register_observability_tests(tests);
  register_codec_tests(tests);
  register_window_deduplicator_tests(tests);
  register_event_buffer_tests(tests);
  register_store_tests(tests);
  register_flush_coordinator_tests(tests);
  register_stats_tests(tests);
  register_engine_tests(tests);
  register_engine_integration_tests(tests);

  std::size_t passed = 0;
  std::size_t failed = 0;

  for (const auto &test : tests) {
    try {
      test.fn();
      ++passed;
    } catch (const std::exception &ex) {
      ++failed;
      std::cerr << "[FAIL] " << test.name << ": " << ex.what() << "\n";
    }
  }

  std::cout << "Ran " << tests.size() << " tests: " << passed << " passed, " << failed
            << " failed\n";

  return failed == 0 ? 0 : 1;
}
