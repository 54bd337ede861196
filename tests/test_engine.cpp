#include "test_framework.hpp"

#include "selfspy/capture/engine.hpp"
#include "selfspy/config/config.hpp"
#include "selfspy/store/sqlite_store.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>

namespace {

using namespace selfspy;
using common::TimestampMs;

std::unique_ptr<capture::Engine> make_engine(const config::Config &config,
                                             std::optional<capture::SecretKey> key = std::nullopt) {
  auto engine = capture::create_engine(config, key);
  if (!engine.ok()) {
    throw std::runtime_error(engine.error());
  }
  return std::move(engine.value());
}

store::RangeData stored(const config::Config &config) {
  store::SqliteActivityStore db(config::resolved_database_path(config), config.database);
  auto range = db.load_range(0, common::now_ms() + common::kMsPerDay);
  if (!range.ok()) {
    throw std::runtime_error(range.error());
  }
  return range.value();
}

capture::KeyEvent key(const std::string &text, TimestampMs ts) {
  return capture::KeyEvent{.text = text, .timestamp_ms = ts};
}

capture::PointerEvent pointer(capture::PointerEventType type, TimestampMs ts) {
  return capture::PointerEvent{.x = 1, .y = 1, .button = 1, .type = type, .timestamp_ms = ts};
}

} // namespace

void register_engine_tests(std::vector<selfspy::tests::TestCase> &tests) {
  using selfspy::tests::require;
  using selfspy::tests::require_ok;
  using selfspy::common::ErrorKind;

  tests.push_back({"engine_requires_key_when_encryption_enabled", [] {
                     testing::TempDir dir;
                     auto config = testing::temp_config(dir);
                     config.encryption.enabled = true;
                     auto engine = make_engine(config);
                     const auto started = engine->start();
                     require(!started.ok() && started.kind() == ErrorKind::Encryption,
                             "start without key should fail");
                     require(!engine->status().monitoring_active, "not monitoring");
                   }});

  tests.push_back({"engine_key_check_guards_against_wrong_key", [] {
                     testing::TempDir dir;
                     auto config = testing::temp_config(dir);
                     config.encryption.enabled = true;
                     const auto key = capture::generate_key();
                     {
                       auto engine = make_engine(config, key);
                       require_ok(engine->start(), "first start should succeed");
                       require_ok(engine->stop(), "stop failed");
                     }
                     require(std::filesystem::exists(config::resolved_key_check_path(config)),
                             "key check file written");
                     {
                       auto engine = make_engine(config, capture::generate_key());
                       const auto started = engine->start();
                       require(!started.ok() && started.kind() == ErrorKind::Encryption,
                               "wrong key rejected");
                     }
                     {
                       auto engine = make_engine(config, key);
                       require_ok(engine->start(), "same key accepted");
                       require_ok(engine->stop(), "stop failed");
                     }
                   }});

  tests.push_back({"engine_rejects_double_start", [] {
                     testing::TempDir dir;
                     auto engine = make_engine(testing::temp_config(dir));
                     require_ok(engine->start(), "start failed");
                     const auto again = engine->start();
                     require(!again.ok() && again.kind() == ErrorKind::InvalidArgument,
                             "second start rejected");
                     require_ok(engine->stop(), "stop failed");
                   }});

  tests.push_back({"engine_ignores_events_when_not_running", [] {
                     testing::TempDir dir;
                     auto engine = make_engine(testing::temp_config(dir));
                     engine->on_keystroke(key("a", 10));
                     require(engine->status().buffered_count == 0, "nothing buffered before start");
                     require_ok(engine->start(), "start failed");
                     require_ok(engine->stop(), "stop failed");
                     engine->on_keystroke(key("b", 20));
                     require(engine->status().buffered_count == 0, "nothing buffered after stop");
                   }});

  tests.push_back({"engine_status_reports_buffer_and_session", [] {
                     testing::TempDir dir;
                     auto engine = make_engine(testing::temp_config(dir));
                     require_ok(engine->start(), "start failed");
                     const TimestampMs now = common::now_ms();
                     engine->on_window_change(testing::window_event("Doc", "Editor", 7, now));
                     engine->on_keystroke("a", {}, std::nullopt, now + 1);
                     engine->on_pointer_event(5, 5, 1, capture::PointerEventType::Click,
                                              std::nullopt, now + 2);

                     const auto status = engine->status();
                     require(status.monitoring_active, "monitoring");
                     require(status.buffered_count == 3, "three buffered events");
                     require(status.counters.keystrokes == 1 && status.counters.clicks == 1 &&
                                 status.counters.windows == 1,
                             "counters");
                     require(status.last_activity_ms == now + 2, "last activity");
                     require(status.session_id.has_value(), "session open");
                     require(status.last_error.empty(), "no error");

                     require_ok(engine->stop(), "stop failed");
                     require(!engine->status().monitoring_active, "stopped");
                   }});

  tests.push_back({"engine_stop_flushes_and_closes_session", [] {
                     testing::TempDir dir;
                     const auto config = testing::temp_config(dir);
                     {
                       auto engine = make_engine(config);
                       require_ok(engine->start(), "start failed");
                       const TimestampMs now = common::now_ms();
                       engine->on_window_change(testing::window_event("Doc", "Editor", 7, now));
                       engine->on_keystroke(key("h", now + 1));
                       engine->on_keystroke(key("i", now + 2));
                       require_ok(engine->stop(), "stop failed");
                     }
                     const auto data = stored(config);
                     require(data.windows.size() == 1, "window persisted");
                     require(data.keystrokes.size() == 1 && data.keystrokes[0].payload == "hi",
                             "keystrokes persisted");
                     require(data.sessions.size() == 1 && data.sessions[0].end_ms.has_value(),
                             "session closed");
                   }});

  tests.push_back({"engine_privacy_filters", [] {
                     testing::TempDir dir;
                     auto config = testing::temp_config(dir);
                     config.privacy.excluded_apps = {"Vault"};
                     config.monitoring.capture_moves = false;
                     auto engine = make_engine(config);
                     require_ok(engine->start(), "start failed");
                     const TimestampMs now = common::now_ms();

                     engine->on_window_change(testing::window_event("Secrets", "vault", 3, now));
                     engine->on_keystroke(key("p", now + 1));
                     engine->on_pointer_event(pointer(capture::PointerEventType::Click, now + 2));
                     require(engine->status().buffered_count == 0,
                             "nothing recorded while an excluded app has focus");

                     engine->on_window_change(testing::window_event("Doc", "Editor", 4, now + 3));
                     engine->on_keystroke(key("x", now + 4));
                     engine->on_pointer_event(pointer(capture::PointerEventType::Move, now + 5));
                     engine->on_pointer_event(pointer(capture::PointerEventType::Click, now + 6));
                     require(engine->status().buffered_count == 3,
                             "window, keystroke and click recorded; move dropped");

                     auto explicit_key = key("y", now + 7);
                     explicit_key.window = testing::window_key("Secrets", "Vault", 3);
                     engine->on_keystroke(explicit_key);
                     require(engine->status().buffered_count == 3,
                             "keystroke keyed to excluded app dropped");

                     engine->on_window_change("Unlock", "loginwindow", 9,
                                              std::string("com.apple.SecurityAgent"), 0, 0, 300,
                                              200, now + 8);
                     engine->on_keystroke(key("z", now + 9));
                     require(engine->status().buffered_count == 3,
                             "excluded bundle and its keystrokes dropped");
                     require_ok(engine->stop(), "stop failed");
                   }});

  tests.push_back({"engine_private_mode_drops_keystrokes", [] {
                     testing::TempDir dir;
                     auto config = testing::temp_config(dir);
                     config.privacy.private_mode = true;
                     auto engine = make_engine(config);
                     require_ok(engine->start(), "start failed");
                     const TimestampMs now = common::now_ms();
                     engine->on_window_change(testing::window_event("Doc", "Editor", 4, now));
                     engine->on_keystroke(key("x", now + 1));
                     require(engine->status().counters.keystrokes == 0, "keystroke dropped");
                     require(engine->status().counters.windows == 1, "windows still recorded");
                     require_ok(engine->stop(), "stop failed");
                   }});

  tests.push_back({"engine_record_dispatches_variant", [] {
                     testing::TempDir dir;
                     auto engine = make_engine(testing::temp_config(dir));
                     require_ok(engine->start(), "start failed");
                     const TimestampMs now = common::now_ms();
                     const std::vector<capture::ActivityEvent> events = {
                         testing::window_event("Doc", "Editor", 4, now),
                         key("a", now + 1),
                         pointer(capture::PointerEventType::Scroll, now + 2),
                     };
                     for (const auto &event : events) {
                       engine->record(event);
                     }
                     const auto counters = engine->status().counters;
                     require(counters.windows == 1 && counters.keystrokes == 1 &&
                                 counters.pointer_events == 1 && counters.clicks == 0,
                             "each kind routed");
                     require_ok(engine->stop(), "stop failed");
                   }});

  tests.push_back({"engine_flush_stats_and_export", [] {
                     testing::TempDir dir;
                     auto engine = make_engine(testing::temp_config(dir));
                     require_ok(engine->start(), "start failed");
                     const TimestampMs now = common::now_ms() - 5000;
                     engine->on_window_change(testing::window_event("Doc", "Editor", 4, now));
                     engine->on_keystroke(key("a", now + 1));
                     const auto flushed = engine->flush();
                     require(flushed.ok(), flushed.error());
                     require(engine->status().buffered_count == 0, "buffer drained");
                     require(engine->flush_metrics().flushes_ok >= 1, "flush counted");

                     const auto activity = engine->get_stats(1);
                     require(activity.ok(), activity.error());
                     require(activity.value().keystrokes == 1, "keystroke counted");
                     require(activity.value().window_changes == 1, "window counted");

                     const auto exported = engine->export_range(1, stats::ExportFormat::Json);
                     require(exported.ok(), exported.error());
                     require(exported.value().find("\"Editor\"") != std::string::npos,
                             "export includes the process");

                     const auto purged = engine->purge_older_than(30);
                     require(purged.ok(), purged.error());
                     require(purged.value().keystrokes == 0, "recent data kept");
                     require_ok(engine->stop(), "stop failed");
                   }});

  tests.push_back({"engine_buffers_to_hard_cap_while_store_unavailable", [] {
                     testing::ObserverCapture observed;
                     testing::TempDir dir;
                     auto config = testing::temp_config(dir);
                     config.buffer.flush_threshold = 2;
                     config.buffer.soft_cap = 3;
                     config.buffer.hard_cap = 4;

                     auto flaky = std::make_unique<testing::FlakyStore>(
                         std::make_unique<store::SqliteActivityStore>(
                             config::resolved_database_path(config), config.database));
                     auto *store = flaky.get();
                     std::vector<ErrorKind> escalations;
                     std::mutex escalations_mutex;
                     capture::Engine engine(config, std::move(flaky));
                     engine.set_supervisor([&](const common::Status &status) {
                       std::lock_guard<std::mutex> lock(escalations_mutex);
                       escalations.push_back(status.kind());
                     });
                     require_ok(engine.start(), "start failed");
                     store->set_available(false);

                     const TimestampMs now = common::now_ms();
                     for (int i = 0; i < 6; ++i) {
                       engine.on_pointer_event(pointer(capture::PointerEventType::Click, now + i));
                     }
                     require(engine.status().buffered_count == 4, "buffer holds the hard cap");
                     require(engine.status().counters.dropped == 2, "overflow dropped and counted");
                     require(observed.observer().count_events<observability::BufferOverflowEvent>() >= 1,
                             "soft cap logged");
                     require(observed.observer().count_events<observability::EventDroppedEvent>() == 2,
                             "drops logged");

                     const auto flushed = engine.flush();
                     require(!flushed.ok() && flushed.kind() == ErrorKind::StoreUnavailable,
                             "flush reports the store unavailable");
                     require(!engine.status().last_error.empty(), "last error recorded");
                     {
                       std::lock_guard<std::mutex> lock(escalations_mutex);
                       require(!escalations.empty() &&
                                   escalations.back() == ErrorKind::StoreUnavailable,
                               "supervisor notified");
                     }

                     store->set_available(true);
                     require_ok(engine.stop(), "final flush after recovery");
                     require(engine.flush_metrics().records_written == 4, "buffered events kept");
                   }});

  tests.push_back({"engine_stop_racing_producers_strands_nothing", [] {
                     for (int run = 0; run < 20; ++run) {
                       testing::TempDir dir;
                       const auto config = testing::temp_config(dir);
                       capture::EngineStatus after_stop;
                       {
                         auto engine = make_engine(config);
                         require_ok(engine->start(), "start failed");

                         std::atomic<bool> producing{true};
                         std::vector<std::thread> producers;
                         for (int t = 0; t < 4; ++t) {
                           producers.emplace_back([&engine, &producing]() {
                             for (int i = 0; i < 2000 && producing.load(); ++i) {
                               engine->on_pointer_event(
                                   pointer(capture::PointerEventType::Click, common::now_ms()));
                             }
                           });
                         }
                         std::this_thread::sleep_for(std::chrono::milliseconds(2));
                         require_ok(engine->stop(), "stop failed");
                         producing = false;
                         for (auto &producer : producers) {
                           producer.join();
                         }
                         after_stop = engine->status();
                       }
                       require(after_stop.buffered_count == 0, "nothing left behind after stop");
                       require(stored(config).pointer_events.size() ==
                                   after_stop.counters.pointer_events,
                               "every accepted event persisted");
                     }
                   }});

  tests.push_back({"engine_excluded_focus_ends_previous_window", [] {
                     testing::TempDir dir;
                     auto config = testing::temp_config(dir);
                     config.privacy.excluded_apps = {"Vault"};
                     const TimestampMs now = common::now_ms();
                     {
                       auto engine = make_engine(config);
                       require_ok(engine->start(), "start failed");
                       engine->on_window_change(testing::window_event("Doc", "Editor", 4, now));
                       engine->on_window_change(
                           testing::window_event("Secrets", "Vault", 3, now + 5000));
                       engine->on_keystroke(key("p", now + 5100));
                       require_ok(engine->flush(), "flush failed");
                       require_ok(engine->stop(), "stop failed");
                     }
                     const auto data = stored(config);
                     require(data.windows.size() == 1, "only the editor window stored");
                     require(data.windows[0].title == "Doc", "editor window");
                     require(data.windows[0].last_seen_ms == now + 5000,
                             "editor extended until the excluded app took focus");
                     require(data.keystrokes.empty(), "keystroke in excluded app dropped");
                   }});
}
