#include "selfspy/capture/flush_coordinator.hpp"

#include "selfspy/observability/global.hpp"

#include <algorithm>

namespace selfspy::capture {

namespace {

constexpr auto PURGE_INTERVAL = std::chrono::hours(1);

} // namespace

FlushCoordinator::FlushCoordinator(EventBuffer &buffer, store::IActivityStore &store,
                                   config::FlushConfig config, std::optional<Codec> codec,
                                   const std::uint32_t retention_days)
    : buffer_(buffer), store_(store), config_(std::move(config)), codec_(std::move(codec)),
      retention_days_(retention_days) {}

FlushCoordinator::~FlushCoordinator() {
  if (thread_.joinable()) {
    auto status = stop();
    if (!status.ok()) {
      observability::record_error("flush", "stop during teardown: " + status.error());
    }
  }
}

common::Status FlushCoordinator::start() {
  if (running_.load() || thread_.joinable()) {
    return common::Status::error(common::ErrorKind::InvalidArgument,
                                 "flush coordinator already running");
  }

  const TimestampMs started_at = common::now_ms();
  auto session = store_.begin_session(started_at);
  if (!session.ok()) {
    return common::Status::error(session.kind(), "failed to open session: " + session.error());
  }

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    session_id_ = session.value();
    final_status_ = common::Status::success();
  }
  observability::record_session_started(session.value(), started_at);

  next_purge_ = std::chrono::steady_clock::now();
  {
    std::lock_guard<std::mutex> lock(wake_mutex_);
    flush_requested_ = false;
    running_ = true;
  }
  thread_ = std::thread([this]() { run_loop(); });
  return common::Status::success();
}

common::Status FlushCoordinator::stop() {
  {
    std::lock_guard<std::mutex> lock(wake_mutex_);
    running_ = false;
  }
  wake_.notify_all();

  if (!thread_.joinable()) {
    return common::Status::success();
  }
  thread_.join();

  std::lock_guard<std::mutex> lock(state_mutex_);
  return final_status_;
}

void FlushCoordinator::request_flush() {
  {
    std::lock_guard<std::mutex> lock(wake_mutex_);
    flush_requested_ = true;
  }
  wake_.notify_one();
}

void FlushCoordinator::run_loop() {
  const auto interval = std::chrono::milliseconds(config_.interval_ms);
  while (true) {
    {
      std::unique_lock<std::mutex> lock(wake_mutex_);
      wake_.wait_for(lock, interval, [this]() { return flush_requested_ || !running_; });
      flush_requested_ = false;
      if (!running_) {
        break;
      }
    }

    // Failures are logged and escalated inside flush_now().
    auto flushed = flush_now();
    if (flushed.ok() && flushed.value().records > 0) {
      observability::record_metric(observability::BufferDepthMetric{.depth = buffer_.size()});
    }
    maybe_purge();
  }

  auto status = finish_session();
  std::lock_guard<std::mutex> lock(state_mutex_);
  final_status_ = std::move(status);
}

common::Status FlushCoordinator::finish_session() {
  auto flushed = flush_now();
  common::Status status = flushed.ok() ? common::Status::success()
                                       : common::Status::error(flushed.kind(), flushed.error());

  std::optional<std::int64_t> session;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    session = session_id_;
    session_id_.reset();
  }
  if (!session.has_value()) {
    return status;
  }

  const TimestampMs ended_at = common::now_ms();
  auto ended = store_.end_session(*session, ended_at);
  if (!ended.ok()) {
    observability::record_error("session", "failed to close session " +
                                               std::to_string(*session) + ": " + ended.error());
    return status.ok() ? ended : status;
  }
  observability::record_session_ended(*session, ended_at);
  return status;
}

store::FlushBatch FlushCoordinator::prepare_batch(Snapshot &snapshot, std::size_t &failures) const {
  store::FlushBatch batch;
  batch.windows = std::move(snapshot.windows);
  batch.pointer_events = std::move(snapshot.pointer_events);
  batch.keystrokes.reserve(snapshot.keystrokes.size());

  for (auto &keys : snapshot.keystrokes) {
    store::KeystrokeRow row;
    row.window = std::move(keys.window);
    row.modifiers = std::move(keys.modifiers);
    row.count = keys.count;
    row.recorded_at_ms = keys.first_ms;

    if (codec_.has_value()) {
      auto sealed = codec_->encrypt(keys.text);
      if (!sealed.ok()) {
        ++failures;
        observability::record_event_dropped("keystroke", "encryption failed: " + sealed.error());
        continue;
      }
      row.payload = std::move(sealed.value());
      row.encrypted = true;
    } else {
      row.payload = std::move(keys.text);
    }
    batch.keystrokes.push_back(std::move(row));
  }
  return batch;
}

common::Result<FlushReport> FlushCoordinator::flush_now() {
  std::lock_guard<std::mutex> flush_lock(flush_mutex_);

  if (!store_.is_available()) {
    auto status = common::Status::error(common::ErrorKind::StoreUnavailable,
                                        "store '" + std::string(store_.name()) +
                                            "' is unavailable; " +
                                            std::to_string(buffer_.size()) +
                                            " events remain buffered");
    observability::record_error("flush", status.error());
    escalate(status);
    return common::Result<FlushReport>::failure(status.kind(), status.error());
  }

  Snapshot snapshot = buffer_.drain();
  if (snapshot.empty()) {
    return common::Result<FlushReport>::success(FlushReport{});
  }

  const auto started = std::chrono::steady_clock::now();
  FlushReport report;
  report.records = snapshot.size();
  const TimestampMs first_ms = snapshot.first_timestamp_ms();
  const TimestampMs last_ms = snapshot.last_timestamp_ms();

  const store::FlushBatch batch = prepare_batch(snapshot, report.encryption_failures);
  if (report.encryption_failures > 0) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    metrics_.encryption_failures += report.encryption_failures;
  }

  const std::uint32_t max_attempts = std::max<std::uint32_t>(1, config_.max_attempts);
  auto backoff = std::chrono::milliseconds(config_.initial_backoff_ms);
  const auto max_backoff = std::chrono::milliseconds(config_.max_backoff_ms);
  std::string last_error;

  for (std::uint32_t attempt = 1; attempt <= max_attempts; ++attempt) {
    report.attempts = attempt;
    auto written = store_.write_batch(batch, std::chrono::milliseconds(config_.attempt_timeout_ms));
    if (written.ok()) {
      report.written = written.value();
      report.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - started);
      {
        std::lock_guard<std::mutex> lock(state_mutex_);
        ++metrics_.flushes_ok;
        metrics_.records_written += batch.size();
        metrics_.last_flush_ms = common::now_ms();
      }
      observability::record_flush_completed(batch.size(), attempt, report.duration);
      return common::Result<FlushReport>::success(report);
    }

    last_error = written.error();
    observability::record_error("flush", "attempt " + std::to_string(attempt) + "/" +
                                             std::to_string(max_attempts) + " failed (" +
                                             common::error_kind_name(written.kind()) +
                                             "): " + last_error);
    if (attempt < max_attempts) {
      std::this_thread::sleep_for(backoff);
      backoff = std::min(backoff * 2, std::max(max_backoff, backoff));
    }
  }

  observability::record_flush_failed(observability::FlushFailedEvent{.records = batch.size(),
                                                                     .first_timestamp_ms = first_ms,
                                                                     .last_timestamp_ms = last_ms,
                                                                     .attempts = report.attempts,
                                                                     .reason = last_error});
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    ++metrics_.flushes_failed;
    metrics_.records_lost += batch.size();
  }

  auto status = common::Status::error(
      common::ErrorKind::Flush, "discarded " + std::to_string(batch.size()) + " records after " +
                                    std::to_string(report.attempts) + " attempts: " + last_error);
  escalate(status);
  return common::Result<FlushReport>::failure(status.kind(), status.error());
}

common::Result<store::PurgeReport> FlushCoordinator::purge_older_than(const int days) {
  if (days < 0) {
    return common::Result<store::PurgeReport>::failure(common::ErrorKind::InvalidArgument,
                                                       "days must be >= 0");
  }
  std::lock_guard<std::mutex> flush_lock(flush_mutex_);
  const TimestampMs cutoff = common::now_ms() - static_cast<TimestampMs>(days) * common::kMsPerDay;
  return store_.purge_before(cutoff);
}

void FlushCoordinator::maybe_purge() {
  if (retention_days_ == 0 || std::chrono::steady_clock::now() < next_purge_) {
    return;
  }
  next_purge_ = std::chrono::steady_clock::now() + PURGE_INTERVAL;

  auto purged = purge_older_than(static_cast<int>(retention_days_));
  if (!purged.ok()) {
    observability::record_error("retention", purged.error());
  }
}

void FlushCoordinator::escalate(const common::Status &status) {
  SupervisorCallback callback;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    metrics_.last_error = status.error();
    callback = supervisor_;
  }
  if (callback) {
    callback(status);
  }
}

void FlushCoordinator::set_supervisor(SupervisorCallback callback) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  supervisor_ = std::move(callback);
}

std::optional<std::int64_t> FlushCoordinator::session_id() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return session_id_;
}

FlushMetrics FlushCoordinator::metrics() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return metrics_;
}

} // namespace selfspy::capture
