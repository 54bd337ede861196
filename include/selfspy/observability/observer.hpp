#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace selfspy::observability {

struct SessionStartedEvent {
  std::int64_t session_id = 0;
  std::int64_t started_at_ms = 0;
};

struct SessionEndedEvent {
  std::int64_t session_id = 0;
  std::int64_t ended_at_ms = 0;
};

struct FlushCompletedEvent {
  std::size_t records = 0;
  std::uint32_t attempts = 0;
  std::chrono::milliseconds duration{0};
};

/// A batch that was discarded after exhausting its retries.
struct FlushFailedEvent {
  std::size_t records = 0;
  std::int64_t first_timestamp_ms = 0;
  std::int64_t last_timestamp_ms = 0;
  std::uint32_t attempts = 0;
  std::string reason;
};

struct BufferOverflowEvent {
  std::size_t buffered = 0;
  std::size_t soft_cap = 0;
};

struct EventDroppedEvent {
  std::string kind;
  std::string reason;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<SessionStartedEvent, SessionEndedEvent, FlushCompletedEvent, FlushFailedEvent,
                 BufferOverflowEvent, EventDroppedEvent, ErrorEvent>;

struct BufferDepthMetric {
  std::uint64_t depth = 0;
};

struct FlushLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct DroppedEventsMetric {
  std::uint64_t total = 0;
};

using ObserverMetric = std::variant<BufferDepthMetric, FlushLatencyMetric, DroppedEventsMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace selfspy::observability
