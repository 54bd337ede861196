#pragma once

#include "selfspy/common/time.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace selfspy::capture {

using common::TimestampMs;

/// Identity of a window: same title in the same process instance.
struct WindowKey {
  std::string title;
  std::string process_name;
  std::int64_t pid = 0;

  bool operator==(const WindowKey &) const = default;
};

struct WindowKeyHash {
  [[nodiscard]] std::size_t operator()(const WindowKey &key) const noexcept;
};

enum class PointerEventType {
  Click,
  Move,
  Scroll,
};

[[nodiscard]] std::string pointer_event_type_to_string(PointerEventType type);
[[nodiscard]] std::optional<PointerEventType> pointer_event_type_from_string(std::string_view value);

struct KeyEvent {
  std::string text;
  std::vector<std::string> modifiers;
  std::optional<WindowKey> window;
  TimestampMs timestamp_ms = 0;
};

struct PointerEvent {
  int x = 0;
  int y = 0;
  int button = 0;
  PointerEventType type = PointerEventType::Click;
  std::optional<WindowKey> window;
  TimestampMs timestamp_ms = 0;
};

struct WindowEvent {
  std::string title;
  std::string process_name;
  std::int64_t pid = 0;
  std::string bundle_id;
  int x = 0;
  int y = 0;
  int width = 0;
  int height = 0;
  TimestampMs timestamp_ms = 0;

  [[nodiscard]] WindowKey key() const { return WindowKey{title, process_name, pid}; }
};

/// Everything an event source can deliver.
using ActivityEvent = std::variant<KeyEvent, PointerEvent, WindowEvent>;

[[nodiscard]] TimestampMs event_timestamp(const ActivityEvent &event);

/// Lower-cased, sorted, de-duplicated, joined with '+'.
[[nodiscard]] std::string canonical_modifiers(const std::vector<std::string> &modifiers);

enum class WindowState {
  Unseen,
  Open,
  Closed,
};

/// Buffered window observation covering [first_seen_ms, last_seen_ms].
struct WindowRecord {
  WindowKey key;
  std::string bundle_id;
  int x = 0;
  int y = 0;
  int width = 0;
  int height = 0;
  TimestampMs first_seen_ms = 0;
  TimestampMs last_seen_ms = 0;
  WindowState state = WindowState::Open;
  // Extends the most recent stored row for `key` instead of adding one.
  bool continuation = false;
};

/// Plaintext keystrokes coalesced for one window and modifier set.
struct KeystrokeBatch {
  std::string text;
  std::string modifiers;
  std::uint32_t count = 0;
  std::optional<WindowKey> window;
  TimestampMs first_ms = 0;
  TimestampMs last_ms = 0;
};

} // namespace selfspy::capture
