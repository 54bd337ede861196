#include "test_framework.hpp"

#include "selfspy/capture/flush_coordinator.hpp"
#include "selfspy/store/sqlite_store.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <chrono>
#include <thread>

namespace {

using namespace selfspy;
using common::TimestampMs;

config::FlushConfig fast_flush() {
  config::FlushConfig config;
  config.interval_ms = 60'000;
  config.max_attempts = 3;
  config.initial_backoff_ms = 1;
  config.max_backoff_ms = 2;
  config.attempt_timeout_ms = 5000;
  return config;
}

struct Fixture {
  testing::TempDir dir;
  testing::FlakyStore store{std::make_unique<store::SqliteActivityStore>(
      dir.path() / "selfspy.db", config::DatabaseConfig{})};
  capture::EventBuffer buffer{config::BufferConfig{}};
};

// One window, one keystroke batch ("abc") and one click.
void fill(capture::EventBuffer &buffer, TimestampMs base) {
  (void)buffer.add_window(testing::window_event("Doc", "Editor", 1, base));
  for (const char *text : {"a", "b", "c"}) {
    (void)buffer.add_keystroke(capture::KeyEvent{.text = text, .timestamp_ms = base + 10});
  }
  (void)buffer.add_pointer_event(capture::PointerEvent{
      .x = 1, .y = 2, .button = 1, .type = capture::PointerEventType::Click,
      .timestamp_ms = base + 20});
}

store::RangeData everything(store::IActivityStore &store) {
  auto range = store.load_range(0, common::now_ms() + common::kMsPerDay);
  if (!range.ok()) {
    throw std::runtime_error(range.error());
  }
  return range.value();
}

} // namespace

void register_flush_coordinator_tests(std::vector<selfspy::tests::TestCase> &tests) {
  using selfspy::tests::require;
  using selfspy::tests::require_ok;
  using selfspy::common::ErrorKind;

  tests.push_back({"flush_now_persists_and_empties_buffer", [] {
                     Fixture f;
                     capture::FlushCoordinator coordinator(f.buffer, f.store, fast_flush(),
                                                           std::nullopt);
                     fill(f.buffer, 1000);
                     const auto flushed = coordinator.flush_now();
                     require(flushed.ok(), flushed.error());
                     require(flushed.value().records == 3, "window, batch and click");
                     require(flushed.value().attempts == 1, "single attempt");
                     require(f.buffer.size() == 0, "buffer drained");

                     const auto data = everything(f.store);
                     require(data.windows.size() == 1, "one window row");
                     require(data.keystrokes.size() == 1, "one keystroke row");
                     require(data.keystrokes[0].payload == "abc" && !data.keystrokes[0].encrypted,
                             "plaintext payload without a codec");
                     require(data.keystrokes[0].count == 3, "count kept");
                     require(data.pointer_events.size() == 1, "one click row");
                     require(data.pointer_events[0].button == 1, "button code stored as integer");

                     const auto metrics = coordinator.metrics();
                     require(metrics.flushes_ok == 1 && metrics.records_written == 3, "metrics");
                   }});

  tests.push_back({"flush_now_with_empty_buffer_skips_store", [] {
                     Fixture f;
                     capture::FlushCoordinator coordinator(f.buffer, f.store, fast_flush(),
                                                           std::nullopt);
                     const auto flushed = coordinator.flush_now();
                     require(flushed.ok(), flushed.error());
                     require(flushed.value().records == 0, "nothing flushed");
                     require(f.store.write_calls() == 0, "store untouched");
                   }});

  tests.push_back({"flush_encrypts_keystroke_payloads", [] {
                     Fixture f;
                     const auto key = capture::generate_key();
                     capture::FlushCoordinator coordinator(f.buffer, f.store, fast_flush(),
                                                           capture::Codec(key));
                     fill(f.buffer, 1000);
                     require_ok(coordinator.flush_now(), "flush failed");

                     const auto data = everything(f.store);
                     require(data.keystrokes.size() == 1, "one keystroke row");
                     const auto &row = data.keystrokes[0];
                     require(row.encrypted, "row marked encrypted");
                     require(row.payload.find("abc") == std::string::npos, "no plaintext stored");
                     const auto opened = capture::decrypt(row.payload, key);
                     require(opened.ok(), opened.error());
                     require(opened.value() == "abc", "decrypts to the typed text");
                   }});

  tests.push_back({"flush_retry_after_failed_attempt_writes_once", [] {
                     Fixture f;
                     capture::FlushCoordinator coordinator(f.buffer, f.store, fast_flush(),
                                                           std::nullopt);
                     fill(f.buffer, 1000);
                     f.store.fail_next_writes(1);

                     const auto flushed = coordinator.flush_now();
                     require(flushed.ok(), flushed.error());
                     require(flushed.value().attempts == 2, "second attempt succeeds");
                     require(f.store.write_calls() == 2, "two write calls");

                     const auto data = everything(f.store);
                     require(data.processes.size() == 1, "no duplicate process");
                     require(data.windows.size() == 1, "no duplicate window");
                     require(data.keystrokes.size() == 1, "no duplicate keystrokes");
                     require(data.pointer_events.size() == 1, "no duplicate clicks");
                   }});

  tests.push_back({"flush_discards_batch_after_exhausting_attempts", [] {
                     testing::ObserverCapture observed;
                     Fixture f;
                     capture::FlushCoordinator coordinator(f.buffer, f.store, fast_flush(),
                                                           std::nullopt);
                     std::vector<common::Status> escalations;
                     coordinator.set_supervisor(
                         [&escalations](const common::Status &status) { escalations.push_back(status); });
                     fill(f.buffer, 1000);
                     f.store.fail_next_writes(3);

                     const auto flushed = coordinator.flush_now();
                     require(!flushed.ok(), "flush should fail");
                     require(flushed.kind() == ErrorKind::Flush, "kind should be Flush");
                     require(f.store.write_calls() == 3, "three attempts");
                     require(f.buffer.size() == 0, "batch is not re-buffered");
                     require(everything(f.store).windows.empty(), "nothing persisted");

                     const auto metrics = coordinator.metrics();
                     require(metrics.flushes_failed == 1, "failure counted");
                     require(metrics.records_lost == 3, "lost records counted");
                     require(!metrics.last_error.empty(), "last error kept");
                     require(escalations.size() == 1 && escalations[0].kind() == ErrorKind::Flush,
                             "supervisor notified");

                     const auto events = observed.observer().events();
                     bool reported = false;
                     for (const auto &event : events) {
                       if (const auto *failed = std::get_if<observability::FlushFailedEvent>(&event)) {
                         reported = failed->records == 3 && failed->attempts == 3 &&
                                    failed->first_timestamp_ms == 1000 &&
                                    failed->last_timestamp_ms == 1020;
                       }
                     }
                     require(reported, "failure event carries size and time range");
                   }});

  tests.push_back({"flush_keeps_buffer_when_store_unavailable", [] {
                     Fixture f;
                     capture::FlushCoordinator coordinator(f.buffer, f.store, fast_flush(),
                                                           std::nullopt);
                     int escalations = 0;
                     coordinator.set_supervisor([&escalations](const common::Status &status) {
                       escalations += status.kind() == ErrorKind::StoreUnavailable ? 1 : 0;
                     });
                     fill(f.buffer, 1000);
                     f.store.set_available(false);

                     const auto flushed = coordinator.flush_now();
                     require(!flushed.ok() && flushed.kind() == ErrorKind::StoreUnavailable,
                             "flush should report the store unavailable");
                     require(f.buffer.size() == 5, "events stay buffered");
                     require(escalations == 1, "supervisor notified");

                     f.store.set_available(true);
                     require_ok(coordinator.flush_now(), "flush after recovery");
                     require(f.buffer.size() == 0, "buffer drained after recovery");
                   }});

  tests.push_back({"coordinator_lifecycle_opens_and_closes_session", [] {
                     testing::ObserverCapture observed;
                     Fixture f;
                     capture::FlushCoordinator coordinator(f.buffer, f.store, fast_flush(),
                                                           std::nullopt);
                     require_ok(coordinator.start(), "start failed");
                     require(coordinator.is_running(), "running after start");
                     require(coordinator.session_id().has_value(), "session opened");
                     require(!coordinator.start().ok(), "second start rejected");

                     fill(f.buffer, common::now_ms());
                     const auto stopped = coordinator.stop();
                     require(stopped.ok(), stopped.error());
                     require(!coordinator.is_running(), "stopped");
                     require(!coordinator.session_id().has_value(), "session cleared");

                     const auto data = everything(f.store);
                     require(data.keystrokes.size() == 1, "final flush persisted events");
                     require(data.sessions.size() == 1 && data.sessions[0].end_ms.has_value(),
                             "session closed");
                     require(observed.observer().count_events<observability::SessionStartedEvent>() == 1,
                             "session start logged");
                     require(observed.observer().count_events<observability::SessionEndedEvent>() == 1,
                             "session end logged");
                   }});

  tests.push_back({"request_flush_wakes_periodic_task", [] {
                     Fixture f;
                     capture::FlushCoordinator coordinator(f.buffer, f.store, fast_flush(),
                                                           std::nullopt);
                     require_ok(coordinator.start(), "start failed");
                     fill(f.buffer, common::now_ms());
                     coordinator.request_flush();

                     const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
                     while (coordinator.metrics().flushes_ok == 0 &&
                            std::chrono::steady_clock::now() < deadline) {
                       std::this_thread::sleep_for(std::chrono::milliseconds(5));
                     }
                     require(coordinator.metrics().flushes_ok == 1, "requested flush ran");
                     require(f.buffer.size() == 0, "buffer drained by the task");
                     require_ok(coordinator.stop(), "stop failed");
                   }});

  tests.push_back({"periodic_task_flushes_on_interval", [] {
                     Fixture f;
                     auto config = fast_flush();
                     config.interval_ms = 20;
                     capture::FlushCoordinator coordinator(f.buffer, f.store, config,
                                                           std::nullopt);
                     require_ok(coordinator.start(), "start failed");
                     fill(f.buffer, common::now_ms());

                     const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
                     while (coordinator.metrics().flushes_ok == 0 &&
                            std::chrono::steady_clock::now() < deadline) {
                       std::this_thread::sleep_for(std::chrono::milliseconds(5));
                     }
                     require(coordinator.metrics().flushes_ok == 1, "interval tick flushed");
                     require(f.buffer.size() == 0, "buffer drained without a request");
                     require(everything(f.store).keystrokes.size() == 1, "batch persisted");
                     require_ok(coordinator.stop(), "stop failed");
                   }});

  tests.push_back({"purge_older_than_validates_and_deletes", [] {
                     Fixture f;
                     capture::FlushCoordinator coordinator(f.buffer, f.store, fast_flush(),
                                                           std::nullopt);
                     const auto negative = coordinator.purge_older_than(-1);
                     require(!negative.ok() && negative.kind() == ErrorKind::InvalidArgument,
                             "negative days rejected");

                     const TimestampMs old = common::now_ms() - 10 * common::kMsPerDay;
                     fill(f.buffer, old);
                     require_ok(coordinator.flush_now(), "flush failed");
                     fill(f.buffer, common::now_ms());
                     require_ok(coordinator.flush_now(), "flush failed");

                     const auto purged = coordinator.purge_older_than(5);
                     require(purged.ok(), purged.error());
                     require(purged.value().keystrokes == 1, "old keystrokes purged");
                     require(purged.value().pointer_events == 1, "old clicks purged");
                     const auto data = everything(f.store);
                     require(data.keystrokes.size() == 1, "recent keystrokes kept");
                   }});
}
