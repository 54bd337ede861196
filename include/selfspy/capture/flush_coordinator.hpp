#pragma once

#include "selfspy/capture/codec.hpp"
#include "selfspy/capture/event_buffer.hpp"
#include "selfspy/config/schema.hpp"
#include "selfspy/store/activity_store.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

namespace selfspy::capture {

struct FlushReport {
  std::size_t records = 0;
  std::size_t encryption_failures = 0;
  std::uint32_t attempts = 0;
  store::WriteReport written;
  std::chrono::milliseconds duration{0};
};

struct FlushMetrics {
  std::uint64_t flushes_ok = 0;
  std::uint64_t flushes_failed = 0;
  std::uint64_t records_written = 0;
  std::uint64_t records_lost = 0;
  std::uint64_t encryption_failures = 0;
  TimestampMs last_flush_ms = 0;
  std::string last_error;
};

/// Receives errors that need attention beyond the log: discarded batches and
/// an unavailable store.
using SupervisorCallback = std::function<void(const common::Status &)>;

/// Moves buffered activity into the store. The only writer of the store:
/// runs the periodic flush task, owns the session row, and serializes every
/// write behind one flush lock.
class FlushCoordinator {
public:
  FlushCoordinator(EventBuffer &buffer, store::IActivityStore &store, config::FlushConfig config,
                   std::optional<Codec> codec, std::uint32_t retention_days = 0);
  ~FlushCoordinator();

  FlushCoordinator(const FlushCoordinator &) = delete;
  FlushCoordinator &operator=(const FlushCoordinator &) = delete;

  /// Opens a session and starts the periodic task.
  [[nodiscard]] common::Status start();
  /// Stops the task after a final flush and closes the session.
  [[nodiscard]] common::Status stop();
  [[nodiscard]] bool is_running() const { return running_.load(); }

  /// Wakes the periodic task for an early flush.
  void request_flush();
  [[nodiscard]] common::Result<FlushReport> flush_now();
  [[nodiscard]] common::Result<store::PurgeReport> purge_older_than(int days);

  void set_supervisor(SupervisorCallback callback);
  [[nodiscard]] std::optional<std::int64_t> session_id() const;
  [[nodiscard]] FlushMetrics metrics() const;

private:
  void run_loop();
  [[nodiscard]] common::Status finish_session();
  [[nodiscard]] store::FlushBatch prepare_batch(Snapshot &snapshot, std::size_t &failures) const;
  void escalate(const common::Status &status);
  void maybe_purge();

  EventBuffer &buffer_;
  store::IActivityStore &store_;
  config::FlushConfig config_;
  std::optional<Codec> codec_;
  std::uint32_t retention_days_ = 0;

  std::mutex flush_mutex_;
  std::mutex wake_mutex_;
  std::condition_variable wake_;
  bool flush_requested_ = false;
  std::atomic<bool> running_{false};
  std::thread thread_;
  std::chrono::steady_clock::time_point next_purge_{};

  mutable std::mutex state_mutex_;
  FlushMetrics metrics_;
  std::optional<std::int64_t> session_id_;
  common::Status final_status_ = common::Status::success();
  SupervisorCallback supervisor_;
};

} // namespace selfspy::capture
