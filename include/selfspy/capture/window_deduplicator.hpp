#pragma once

#include "selfspy/capture/events.hpp"

#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace selfspy::capture {

/// Keeps at most one open record per WindowKey between drains and tracks
/// which window currently has focus. Not thread-safe; EventBuffer guards it.
class WindowDeduplicator {
public:
  /// Returns the number of new records the event produced (0, 1 or 2).
  std::size_t observe(const WindowEvent &event);

  /// Focus moved to a window that is not recorded. The focused window is
  /// extended to `ts` and nothing holds the focus afterwards. Returns the
  /// number of new records, which is 0 when `allow_new_record` is false.
  std::size_t blur(TimestampMs ts, bool allow_new_record = true);

  /// Closes and hands over every pending record. The focused window is
  /// remembered so that its next record extends the stored row.
  [[nodiscard]] std::vector<WindowRecord> close_all();

  [[nodiscard]] WindowState state(const WindowKey &key) const;
  [[nodiscard]] const std::optional<WindowKey> &current() const { return current_; }
  [[nodiscard]] std::optional<WindowRecord> current_record() const;
  [[nodiscard]] std::size_t pending() const { return records_.size(); }

private:
  std::size_t release_focus(TimestampMs ts, bool allow_new_record);

  std::vector<WindowRecord> records_;
  std::unordered_map<WindowKey, std::size_t, WindowKeyHash> open_;
  std::unordered_set<WindowKey, WindowKeyHash> closed_;
  std::optional<WindowKey> current_;
  std::optional<WindowRecord> carried_;
};

} // namespace selfspy::capture
