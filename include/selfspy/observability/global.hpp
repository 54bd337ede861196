#pragma once

#include "selfspy/observability/observer.hpp"

#include <memory>

namespace selfspy::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
[[nodiscard]] std::shared_ptr<IObserver> get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_session_started(std::int64_t session_id, std::int64_t started_at_ms);
void record_session_ended(std::int64_t session_id, std::int64_t ended_at_ms);
void record_flush_completed(std::size_t records, std::uint32_t attempts,
                            std::chrono::milliseconds duration);
void record_flush_failed(FlushFailedEvent event);
void record_buffer_overflow(std::size_t buffered, std::size_t soft_cap);
void record_event_dropped(const std::string &kind, const std::string &reason);
void record_error(const std::string &component, const std::string &message);

} // namespace selfspy::observability
