#include "tests/helpers/test_helpers.hpp"

#include "selfspy/observability/global.hpp"
#include "selfspy/observability/noop_observer.hpp"

#include <random>

namespace selfspy::testing {

TempDir::TempDir() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() / ("selfspy-test-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempDir::~TempDir() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

config::Config temp_config(const TempDir &dir) {
  config::Config config;
  config.data_dir = dir.path().string();
  config.encryption.enabled = false;
  config.observability.backend = "none";
  config.flush.interval_ms = 60'000;
  config.flush.initial_backoff_ms = 1;
  config.flush.max_backoff_ms = 2;
  return config;
}

capture::WindowEvent window_event(const std::string &title, const std::string &process,
                                  const std::int64_t pid, const common::TimestampMs ts) {
  capture::WindowEvent event;
  event.title = title;
  event.process_name = process;
  event.pid = pid;
  event.x = 10;
  event.y = 20;
  event.width = 800;
  event.height = 600;
  event.timestamp_ms = ts;
  return event;
}

capture::WindowKey window_key(const std::string &title, const std::string &process,
                              const std::int64_t pid) {
  return capture::WindowKey{.title = title, .process_name = process, .pid = pid};
}

FlakyStore::FlakyStore(std::unique_ptr<store::IActivityStore> inner) : inner_(std::move(inner)) {}

bool FlakyStore::is_available() { return available_.load() && inner_->is_available(); }

common::Result<std::int64_t> FlakyStore::begin_session(const common::TimestampMs start_ms) {
  return inner_->begin_session(start_ms);
}

common::Status FlakyStore::end_session(const std::int64_t session_id,
                                       const common::TimestampMs end_ms) {
  return inner_->end_session(session_id, end_ms);
}

common::Result<store::WriteReport> FlakyStore::write_batch(const store::FlushBatch &batch,
                                                           const std::chrono::milliseconds timeout) {
  ++write_calls_;
  if (failures_left_.load() > 0) {
    --failures_left_;
    return inner_->write_batch(batch, std::chrono::milliseconds(0));
  }
  return inner_->write_batch(batch, timeout);
}

common::Result<store::ActivityCounts> FlakyStore::count_activity(const common::TimestampMs since_ms,
                                                                 const common::TimestampMs until_ms) {
  ++query_calls_;
  return inner_->count_activity(since_ms, until_ms);
}

common::Result<std::vector<store::SessionRow>>
FlakyStore::session_spans(const common::TimestampMs since_ms, const common::TimestampMs until_ms) {
  ++query_calls_;
  return inner_->session_spans(since_ms, until_ms);
}

common::Result<std::vector<store::AppUsageRow>>
FlakyStore::app_usage(const common::TimestampMs since_ms, const common::TimestampMs until_ms) {
  ++query_calls_;
  return inner_->app_usage(since_ms, until_ms);
}

common::Result<store::HourlyKeystrokes>
FlakyStore::hourly_keystrokes(const common::TimestampMs since_ms,
                              const common::TimestampMs until_ms) {
  ++query_calls_;
  return inner_->hourly_keystrokes(since_ms, until_ms);
}

common::Result<std::vector<store::TimelineRow>>
FlakyStore::recent_windows(const common::TimestampMs since_ms, const common::TimestampMs until_ms,
                           const std::size_t limit) {
  ++query_calls_;
  return inner_->recent_windows(since_ms, until_ms, limit);
}

common::Result<store::RangeData> FlakyStore::load_range(const common::TimestampMs since_ms,
                                                        const common::TimestampMs until_ms) {
  ++query_calls_;
  return inner_->load_range(since_ms, until_ms);
}

common::Result<store::PurgeReport> FlakyStore::purge_before(const common::TimestampMs cutoff_ms) {
  return inner_->purge_before(cutoff_ms);
}

void FlakyStore::close() { inner_->close(); }

void CapturingObserver::record_event(const observability::ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  events_.push_back(event);
}

void CapturingObserver::record_metric(const observability::ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(mutex_);
  metrics_.push_back(metric);
}

std::vector<observability::ObserverEvent> CapturingObserver::events() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_;
}

std::vector<observability::ObserverMetric> CapturingObserver::metrics() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return metrics_;
}

ObserverCapture::ObserverCapture() {
  auto observer = std::make_unique<CapturingObserver>();
  observer_ = observer.get();
  observability::set_global_observer(std::move(observer));
}

ObserverCapture::~ObserverCapture() {
  observability::set_global_observer(std::make_unique<observability::NoopObserver>());
}

} // namespace selfspy::testing
