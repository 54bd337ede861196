#include "selfspy/capture/event_buffer.hpp"

#include <algorithm>
#include <limits>

namespace selfspy::capture {

TimestampMs Snapshot::first_timestamp_ms() const {
  TimestampMs first = std::numeric_limits<TimestampMs>::max();
  for (const auto &batch : keystrokes) {
    first = std::min(first, batch.first_ms);
  }
  for (const auto &event : pointer_events) {
    first = std::min(first, event.timestamp_ms);
  }
  for (const auto &window : windows) {
    first = std::min(first, window.first_seen_ms);
  }
  return empty() ? 0 : first;
}

TimestampMs Snapshot::last_timestamp_ms() const {
  TimestampMs last = std::numeric_limits<TimestampMs>::min();
  for (const auto &batch : keystrokes) {
    last = std::max(last, batch.last_ms);
  }
  for (const auto &event : pointer_events) {
    last = std::max(last, event.timestamp_ms);
  }
  for (const auto &window : windows) {
    last = std::max(last, window.last_seen_ms);
  }
  return empty() ? 0 : last;
}

EventBuffer::EventBuffer(config::BufferConfig config) : config_(std::move(config)) {}

AddOutcome EventBuffer::add_keystroke(KeyEvent event) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) {
    return reject_closed_locked();
  }
  if (full_locked()) {
    return drop_locked();
  }

  if (!event.window.has_value()) {
    event.window = windows_.current();
  }
  std::string modifiers = canonical_modifiers(event.modifiers);
  const TimestampMs ts = event.timestamp_ms;

  bool coalesced = false;
  if (!keystrokes_.empty()) {
    auto &last = keystrokes_.back();
    if (last.window == event.window && last.modifiers == modifiers && ts >= last.last_ms &&
        static_cast<std::uint64_t>(ts - last.last_ms) <= config_.keystroke_coalesce_ms) {
      last.text += event.text;
      ++last.count;
      last.last_ms = ts;
      coalesced = true;
    }
  }

  if (!coalesced) {
    KeystrokeBatch batch;
    batch.text = std::move(event.text);
    batch.modifiers = std::move(modifiers);
    batch.count = 1;
    batch.window = std::move(event.window);
    batch.first_ms = ts;
    batch.last_ms = ts;
    keystrokes_.push_back(std::move(batch));
  }

  ++size_;
  ++counters_.keystrokes;
  touch_locked(ts);
  return outcome_locked();
}

AddOutcome EventBuffer::add_pointer_event(PointerEvent event) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) {
    return reject_closed_locked();
  }
  if (full_locked()) {
    return drop_locked();
  }

  if (!event.window.has_value()) {
    event.window = windows_.current();
  }
  if (event.type == PointerEventType::Click) {
    ++counters_.clicks;
  }
  ++counters_.pointer_events;
  touch_locked(event.timestamp_ms);
  pointer_events_.push_back(std::move(event));

  ++size_;
  return outcome_locked();
}

AddOutcome EventBuffer::add_window(const WindowEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) {
    return reject_closed_locked();
  }
  // At the hard cap only refreshes of an already open record get through.
  if (full_locked() && windows_.state(event.key()) != WindowState::Open) {
    return drop_locked();
  }

  const bool switched = windows_.current() != event.key();
  size_ += windows_.observe(event);
  if (switched) {
    ++counters_.windows;
  }
  touch_locked(event.timestamp_ms);
  return outcome_locked();
}

AddOutcome EventBuffer::add_focus_lost(const TimestampMs ts) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) {
    return AddOutcome::Accepted;
  }
  size_ += windows_.blur(ts, !full_locked());
  return outcome_locked();
}

void EventBuffer::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  closed_ = true;
}

void EventBuffer::reopen() {
  std::lock_guard<std::mutex> lock(mutex_);
  closed_ = false;
}

bool EventBuffer::is_closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

Snapshot EventBuffer::drain() {
  Snapshot snapshot;
  std::lock_guard<std::mutex> lock(mutex_);
  snapshot.keystrokes.swap(keystrokes_);
  snapshot.pointer_events.swap(pointer_events_);
  snapshot.windows = windows_.close_all();
  snapshot.events = size_;
  size_ = 0;
  return snapshot;
}

std::size_t EventBuffer::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return size_;
}

BufferCounters EventBuffer::counters() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return counters_;
}

std::optional<WindowRecord> EventBuffer::current_window() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return windows_.current_record();
}

WindowState EventBuffer::window_state(const WindowKey &key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return windows_.state(key);
}

AddOutcome EventBuffer::outcome_locked() const {
  if (size_ >= config_.soft_cap) {
    return AddOutcome::OverSoftCap;
  }
  if (size_ >= config_.flush_threshold) {
    return AddOutcome::FlushSuggested;
  }
  return AddOutcome::Accepted;
}

AddOutcome EventBuffer::drop_locked() {
  ++counters_.dropped;
  return AddOutcome::Dropped;
}

AddOutcome EventBuffer::reject_closed_locked() {
  ++counters_.dropped;
  return AddOutcome::Closed;
}

void EventBuffer::touch_locked(const TimestampMs ts) {
  counters_.last_activity_ms = std::max(counters_.last_activity_ms, ts);
}

} // namespace selfspy::capture
