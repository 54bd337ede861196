#include "selfspy/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace selfspy::observability {

void LogObserver::write_line(const char *level, const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::cerr << "[" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, SessionStartedEvent>) {
          write_line("INFO", "session.start id=" + std::to_string(evt.session_id) +
                                 " at_ms=" + std::to_string(evt.started_at_ms));
        } else if constexpr (std::is_same_v<T, SessionEndedEvent>) {
          write_line("INFO", "session.end id=" + std::to_string(evt.session_id) +
                                 " at_ms=" + std::to_string(evt.ended_at_ms));
        } else if constexpr (std::is_same_v<T, FlushCompletedEvent>) {
          write_line("DEBUG", "flush.ok records=" + std::to_string(evt.records) +
                                  " attempts=" + std::to_string(evt.attempts) +
                                  " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, FlushFailedEvent>) {
          write_line("ERROR", "flush.failed records=" + std::to_string(evt.records) +
                                  " first_ms=" + std::to_string(evt.first_timestamp_ms) +
                                  " last_ms=" + std::to_string(evt.last_timestamp_ms) +
                                  " attempts=" + std::to_string(evt.attempts) +
                                  " reason=" + evt.reason);
        } else if constexpr (std::is_same_v<T, BufferOverflowEvent>) {
          write_line("WARN", "buffer.overflow buffered=" + std::to_string(evt.buffered) +
                                 " soft_cap=" + std::to_string(evt.soft_cap));
        } else if constexpr (std::is_same_v<T, EventDroppedEvent>) {
          write_line("WARN", "event.dropped kind=" + evt.kind + " reason=" + evt.reason);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          write_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, BufferDepthMetric>) {
          write_line("DEBUG", "metric.buffer_depth=" + std::to_string(m.depth));
        } else if constexpr (std::is_same_v<T, FlushLatencyMetric>) {
          write_line("DEBUG", "metric.flush_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, DroppedEventsMetric>) {
          write_line("DEBUG", "metric.dropped_events=" + std::to_string(m.total));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::cerr.flush();
}

} // namespace selfspy::observability
