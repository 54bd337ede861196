#pragma once

#include "selfspy/capture/events.hpp"
#include "selfspy/capture/window_deduplicator.hpp"
#include "selfspy/config/schema.hpp"

#include <mutex>
#include <optional>
#include <vector>

namespace selfspy::capture {

enum class AddOutcome {
  Accepted,
  // The flush threshold is reached.
  FlushSuggested,
  // The soft cap is reached; flush immediately.
  OverSoftCap,
  // The hard cap is reached; the event was discarded and counted.
  Dropped,
  // The buffer was closed for the final flush; the event was discarded and counted.
  Closed,
};

/// Live totals since the buffer was created. Never reset by drain().
struct BufferCounters {
  std::uint64_t keystrokes = 0;
  std::uint64_t clicks = 0;
  std::uint64_t pointer_events = 0;
  std::uint64_t windows = 0;
  std::uint64_t dropped = 0;
  TimestampMs last_activity_ms = 0;
};

/// Everything that was pending at the moment of a drain.
struct Snapshot {
  std::vector<KeystrokeBatch> keystrokes;
  std::vector<PointerEvent> pointer_events;
  std::vector<WindowRecord> windows;
  std::size_t events = 0;

  [[nodiscard]] std::size_t size() const {
    return keystrokes.size() + pointer_events.size() + windows.size();
  }
  [[nodiscard]] bool empty() const { return size() == 0; }
  [[nodiscard]] TimestampMs first_timestamp_ms() const;
  [[nodiscard]] TimestampMs last_timestamp_ms() const;
};

class EventBuffer {
public:
  explicit EventBuffer(config::BufferConfig config);

  AddOutcome add_keystroke(KeyEvent event);
  AddOutcome add_pointer_event(PointerEvent event);
  AddOutcome add_window(const WindowEvent &event);
  /// Focus went to a window that is not recorded (see WindowDeduplicator::blur).
  AddOutcome add_focus_lost(TimestampMs ts);

  /// Rejects every later add. Whatever was accepted before stays for drain().
  void close();
  void reopen();
  [[nodiscard]] bool is_closed() const;

  /// Swaps out all pending records in one step.
  [[nodiscard]] Snapshot drain();

  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] BufferCounters counters() const;
  [[nodiscard]] std::optional<WindowRecord> current_window() const;
  [[nodiscard]] WindowState window_state(const WindowKey &key) const;
  [[nodiscard]] const config::BufferConfig &config() const { return config_; }

private:
  [[nodiscard]] AddOutcome outcome_locked() const;
  [[nodiscard]] bool full_locked() const { return size_ >= config_.hard_cap; }
  AddOutcome drop_locked();
  AddOutcome reject_closed_locked();
  void touch_locked(TimestampMs ts);

  config::BufferConfig config_;
  mutable std::mutex mutex_;
  WindowDeduplicator windows_;
  std::vector<KeystrokeBatch> keystrokes_;
  std::vector<PointerEvent> pointer_events_;
  std::size_t size_ = 0;
  bool closed_ = false;
  BufferCounters counters_;
};

} // namespace selfspy::capture
