#include "selfspy/observability/global.hpp"

#include <mutex>

namespace selfspy::observability {

namespace {

std::mutex g_observer_mutex;
std::shared_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::shared_ptr<IObserver> previous;
  {
    std::lock_guard<std::mutex> lock(g_observer_mutex);
    previous = std::move(g_observer);
    g_observer = std::move(observer);
  }
  if (previous != nullptr) {
    previous->flush();
  }
}

std::shared_ptr<IObserver> get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer;
}

void record_event(const ObserverEvent &event) {
  if (auto observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_session_started(const std::int64_t session_id, const std::int64_t started_at_ms) {
  record_event(SessionStartedEvent{.session_id = session_id, .started_at_ms = started_at_ms});
}

void record_session_ended(const std::int64_t session_id, const std::int64_t ended_at_ms) {
  record_event(SessionEndedEvent{.session_id = session_id, .ended_at_ms = ended_at_ms});
}

void record_flush_completed(const std::size_t records, const std::uint32_t attempts,
                            const std::chrono::milliseconds duration) {
  record_event(FlushCompletedEvent{.records = records, .attempts = attempts, .duration = duration});
  record_metric(FlushLatencyMetric{.latency = duration});
}

void record_flush_failed(FlushFailedEvent event) { record_event(std::move(event)); }

void record_buffer_overflow(const std::size_t buffered, const std::size_t soft_cap) {
  record_event(BufferOverflowEvent{.buffered = buffered, .soft_cap = soft_cap});
}

void record_event_dropped(const std::string &kind, const std::string &reason) {
  record_event(EventDroppedEvent{.kind = kind, .reason = reason});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace selfspy::observability
