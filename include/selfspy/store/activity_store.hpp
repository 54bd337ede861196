#pragma once

#include "selfspy/capture/events.hpp"
#include "selfspy/common/result.hpp"
#include "selfspy/common/time.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace selfspy::store {

using common::TimestampMs;

/// Keystroke batch as persisted; `payload` is ciphertext when `encrypted`.
struct KeystrokeRow {
  std::optional<capture::WindowKey> window;
  std::string payload;
  bool encrypted = false;
  std::string modifiers;
  std::uint32_t count = 0;
  TimestampMs recorded_at_ms = 0;
};

/// One flush worth of records, written in a single transaction.
struct FlushBatch {
  std::vector<capture::WindowRecord> windows;
  std::vector<KeystrokeRow> keystrokes;
  std::vector<capture::PointerEvent> pointer_events;

  [[nodiscard]] std::size_t size() const {
    return windows.size() + keystrokes.size() + pointer_events.size();
  }
  [[nodiscard]] bool empty() const { return size() == 0; }
};

struct WriteReport {
  std::size_t processes_created = 0;
  std::size_t windows_inserted = 0;
  std::size_t windows_extended = 0;
  std::size_t keystrokes = 0;
  std::size_t pointer_events = 0;
};

struct ActivityCounts {
  std::uint64_t keystrokes = 0;
  std::uint64_t clicks = 0;
  std::uint64_t pointer_events = 0;
  std::uint64_t window_changes = 0;
  // Distinct processes owning a window first seen in the range.
  std::uint64_t processes = 0;
};

/// Keystroke totals per local hour of day, index 0-23.
using HourlyKeystrokes = std::array<std::uint64_t, 24>;

/// A window first seen in the range, with the keystrokes recorded in it.
struct TimelineRow {
  std::int64_t window_id = 0;
  TimestampMs first_seen_ms = 0;
  std::string title;
  std::string process_name;
  std::uint64_t keystrokes = 0;
};

struct SessionRow {
  std::int64_t id = 0;
  TimestampMs start_ms = 0;
  std::optional<TimestampMs> end_ms;
};

/// Per-application usage inside a query range, durations clipped to it.
struct AppUsageRow {
  std::string name;
  std::uint64_t window_count = 0;
  std::int64_t duration_ms = 0;
  std::uint64_t event_count = 0;
};

struct ProcessRow {
  std::int64_t id = 0;
  std::string name;
  std::string bundle_id;
  TimestampMs first_seen_ms = 0;
  TimestampMs last_seen_ms = 0;
};

struct WindowRow {
  std::int64_t id = 0;
  std::int64_t process_id = 0;
  std::string title;
  std::int64_t pid = 0;
  int x = 0;
  int y = 0;
  int width = 0;
  int height = 0;
  TimestampMs first_seen_ms = 0;
  TimestampMs last_seen_ms = 0;
};

struct StoredKeystrokeRow {
  std::int64_t id = 0;
  std::optional<std::int64_t> window_id;
  std::string payload;
  bool encrypted = false;
  std::string modifiers;
  std::uint32_t count = 0;
  TimestampMs recorded_at_ms = 0;
};

struct PointerRow {
  std::int64_t id = 0;
  std::optional<std::int64_t> window_id;
  int x = 0;
  int y = 0;
  int button = 0;
  capture::PointerEventType type = capture::PointerEventType::Click;
  TimestampMs recorded_at_ms = 0;
};

/// Rows touching a time range, used by exports.
struct RangeData {
  std::vector<ProcessRow> processes;
  std::vector<WindowRow> windows;
  std::vector<StoredKeystrokeRow> keystrokes;
  std::vector<PointerRow> pointer_events;
  std::vector<SessionRow> sessions;
};

struct PurgeReport {
  std::uint64_t keystrokes = 0;
  std::uint64_t pointer_events = 0;
  std::uint64_t windows = 0;
  std::uint64_t processes = 0;
  std::uint64_t sessions = 0;
};

class IActivityStore {
public:
  virtual ~IActivityStore() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual bool is_available() = 0;

  [[nodiscard]] virtual common::Result<std::int64_t> begin_session(TimestampMs start_ms) = 0;
  [[nodiscard]] virtual common::Status end_session(std::int64_t session_id,
                                                   TimestampMs end_ms) = 0;

  /// Writes the batch atomically or not at all. Fails with
  /// ErrorKind::Timeout when `timeout` elapses first.
  [[nodiscard]] virtual common::Result<WriteReport>
  write_batch(const FlushBatch &batch, std::chrono::milliseconds timeout) = 0;

  [[nodiscard]] virtual common::Result<ActivityCounts> count_activity(TimestampMs since_ms,
                                                                      TimestampMs until_ms) = 0;
  [[nodiscard]] virtual common::Result<std::vector<SessionRow>>
  session_spans(TimestampMs since_ms, TimestampMs until_ms) = 0;
  [[nodiscard]] virtual common::Result<std::vector<AppUsageRow>>
  app_usage(TimestampMs since_ms, TimestampMs until_ms) = 0;
  [[nodiscard]] virtual common::Result<HourlyKeystrokes>
  hourly_keystrokes(TimestampMs since_ms, TimestampMs until_ms) = 0;
  /// Newest first, at most `limit` rows.
  [[nodiscard]] virtual common::Result<std::vector<TimelineRow>>
  recent_windows(TimestampMs since_ms, TimestampMs until_ms, std::size_t limit) = 0;
  [[nodiscard]] virtual common::Result<RangeData> load_range(TimestampMs since_ms,
                                                             TimestampMs until_ms) = 0;

  /// Deletes activity recorded before `cutoff_ms` and compacts the file.
  [[nodiscard]] virtual common::Result<PurgeReport> purge_before(TimestampMs cutoff_ms) = 0;

  virtual void close() = 0;
};

} // namespace selfspy::store
