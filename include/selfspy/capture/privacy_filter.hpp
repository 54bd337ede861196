#pragma once

#include "selfspy/capture/events.hpp"
#include "selfspy/config/schema.hpp"

#include <atomic>
#include <optional>
#include <string>
#include <unordered_set>

namespace selfspy::capture {

/// Decides which events may enter the buffer. A returned reason means the
/// event must be dropped.
class PrivacyFilter {
public:
  PrivacyFilter(const config::PrivacyConfig &privacy, const config::MonitoringConfig &monitoring);

  [[nodiscard]] std::optional<std::string> check(const KeyEvent &event) const;
  [[nodiscard]] std::optional<std::string> check(const PointerEvent &event) const;
  /// Also tracks whether an excluded application holds the focus.
  [[nodiscard]] std::optional<std::string> check(const WindowEvent &event);

  [[nodiscard]] bool is_excluded(const std::string &process_name,
                                 const std::string &bundle_id = "") const;
  [[nodiscard]] bool excluded_has_focus() const { return excluded_focus_.load(); }

private:
  std::unordered_set<std::string> excluded_apps_;
  std::unordered_set<std::string> excluded_bundles_;
  bool private_mode_ = false;
  config::MonitoringConfig monitoring_;
  std::atomic<bool> excluded_focus_{false};
};

} // namespace selfspy::capture
