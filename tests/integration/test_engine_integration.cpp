#include "test_framework.hpp"

#include "selfspy/capture/engine.hpp"
#include "selfspy/config/config.hpp"
#include "selfspy/store/sqlite_store.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <algorithm>
#include <optional>

namespace {

using namespace selfspy;

struct ConfigOverrideGuard {
  std::optional<std::filesystem::path> old_override;

  explicit ConfigOverrideGuard(const std::filesystem::path &next) {
    old_override = config::config_path_override();
    config::set_config_path_override(next);
  }

  ~ConfigOverrideGuard() {
    if (old_override.has_value()) {
      config::set_config_path_override(*old_override);
    } else {
      config::clear_config_path_override();
    }
  }
};

capture::SecretKey password_key(const std::string &password) {
  auto key = capture::derive_key(password, capture::DEFAULT_KEY_SALT, 1'000);
  if (!key.ok()) {
    throw std::runtime_error(key.error());
  }
  return key.value();
}

std::unique_ptr<capture::Engine> open_engine(const config::Config &config,
                                             const capture::SecretKey &key) {
  auto engine = capture::create_engine(config, key);
  if (!engine.ok()) {
    throw std::runtime_error(engine.error());
  }
  return std::move(engine.value());
}

} // namespace

void register_engine_integration_tests(std::vector<selfspy::tests::TestCase> &tests) {
  using selfspy::tests::require;
  using selfspy::tests::require_ok;

  tests.push_back({"engine_integration_capture_flush_and_report", [] {
                     testing::TempDir dir;
                     const ConfigOverrideGuard guard(dir.path() / "config.toml");
                     auto written = testing::temp_config(dir);
                     written.encryption.enabled = true;
                     require(config::save_config(written).ok(), "save config");
                     auto loaded = config::load_config();
                     require(loaded.ok(), loaded.error());
                     const auto &config = loaded.value();
                     require(config.encryption.enabled, "encryption loaded from file");

                     const auto key = password_key("correct horse");
                     const common::TimestampMs base = common::now_ms() - 60'000;
                     {
                       auto engine = open_engine(config, key);
                       require_ok(engine->start(), "start");

                       engine->on_window_change(testing::window_event("Doc", "Editor", 11, base));
                       for (const char *text : {"a", "b", "c"}) {
                         engine->on_keystroke(text, {}, std::nullopt, base + 100);
                       }
                       engine->on_window_change(
                           testing::window_event("News", "Browser", 12, base + 30'000));
                       engine->on_pointer_event(40, 50, 1, capture::PointerEventType::Click,
                                                std::nullopt, base + 30'500);
                       engine->on_window_change(
                           testing::window_event("News", "Browser", 12, base + 45'000));

                       auto flushed = engine->flush();
                       require(flushed.ok(), flushed.error());

                       auto activity = engine->get_stats(1);
                       require(activity.ok(), activity.error());
                       require(activity.value().keystrokes == 3, "three keystrokes");
                       require(activity.value().clicks == 1, "one click");
                       require(activity.value().window_changes == 2, "two windows");
                       const auto &apps = activity.value().top_apps;
                       require(apps.size() == 2, "two applications");
                       const auto editor =
                           std::find_if(apps.begin(), apps.end(),
                                        [](const stats::AppUsage &app) { return app.name == "Editor"; });
                       require(editor != apps.end(), "editor ranked");
                       require(editor->percentage > 0.0 && editor->percentage < 100.0,
                               "editor holds part of the tracked time");
                       require(editor->duration_ms == 30'000, "editor span runs to the focus switch");

                       require_ok(engine->stop(), "stop");
                     }

                     {
                       store::SqliteActivityStore db(config::resolved_database_path(config),
                                                     config.database);
                       auto data = db.load_range(base - 1, common::now_ms() + 1);
                       require(data.ok(), data.error());
                       require(data.value().keystrokes.size() == 1, "one coalesced batch");
                       const auto &row = data.value().keystrokes.front();
                       require(row.encrypted && row.payload != "abc", "payload sealed at rest");
                       auto opened = capture::Codec(key).decrypt(row.payload);
                       require(opened.ok() && opened.value() == "abc", "payload decrypts");
                     }

                     {
                       auto engine = open_engine(config, password_key("wrong password"));
                       const auto started = engine->start();
                       require(!started.ok() && started.kind() == common::ErrorKind::Encryption,
                               "wrong password rejected on restart");
                     }

                     {
                       auto engine = open_engine(config, key);
                       require_ok(engine->start(), "restart with the same password");
                       auto exported = engine->export_range(1, stats::ExportFormat::Csv);
                       require(exported.ok(), exported.error());
                       require(exported.value().find("Browser") != std::string::npos,
                               "export reads persisted rows");
                       auto activity = engine->get_stats(1);
                       require(activity.ok() && activity.value().window_changes == 2,
                               "stats survive a restart");
                       require_ok(engine->stop(), "stop");
                     }
                   }});

  tests.push_back({"engine_integration_retries_transient_write_failure", [] {
                     testing::TempDir dir;
                     auto config = testing::temp_config(dir);
                     config.flush.max_attempts = 2;

                     auto flaky = std::make_unique<testing::FlakyStore>(
                         std::make_unique<store::SqliteActivityStore>(
                             config::resolved_database_path(config), config.database));
                     auto *store = flaky.get();
                     capture::Engine engine(config, std::move(flaky));
                     require_ok(engine.start(), "start");

                     const common::TimestampMs now = common::now_ms() - 1'000;
                     engine.on_window_change(testing::window_event("Doc", "Editor", 3, now));
                     engine.on_keystroke("x", {}, std::nullopt, now + 10);
                     store->fail_next_writes(1);

                     auto flushed = engine.flush();
                     require(flushed.ok(), flushed.error());
                     require(flushed.value().attempts == 2, "second attempt succeeded");
                     require(engine.flush_metrics().flushes_failed == 0, "no failed flush");
                     require(engine.status().last_error.empty(), "nothing escalated");

                     auto activity = engine.get_stats(1);
                     require(activity.ok() && activity.value().keystrokes == 1,
                             "retried batch persisted once");
                     require_ok(engine.stop(), "stop");
                   }});
}
