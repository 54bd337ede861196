#include "selfspy/capture/privacy_filter.hpp"

#include "selfspy/common/fs.hpp"

namespace selfspy::capture {

namespace {

std::unordered_set<std::string> normalized_set(const std::vector<std::string> &values) {
  std::unordered_set<std::string> out;
  for (const auto &value : values) {
    const std::string normalized = common::to_lower(common::trim(value));
    if (!normalized.empty()) {
      out.insert(normalized);
    }
  }
  return out;
}

} // namespace

PrivacyFilter::PrivacyFilter(const config::PrivacyConfig &privacy,
                             const config::MonitoringConfig &monitoring)
    : excluded_apps_(normalized_set(privacy.excluded_apps)),
      excluded_bundles_(normalized_set(privacy.excluded_bundles)),
      private_mode_(privacy.private_mode), monitoring_(monitoring) {}

bool PrivacyFilter::is_excluded(const std::string &process_name,
                                const std::string &bundle_id) const {
  if (excluded_apps_.contains(common::to_lower(common::trim(process_name)))) {
    return true;
  }
  return !bundle_id.empty() && excluded_bundles_.contains(common::to_lower(common::trim(bundle_id)));
}

std::optional<std::string> PrivacyFilter::check(const KeyEvent &event) const {
  if (!monitoring_.capture_text) {
    return "text capture disabled";
  }
  if (private_mode_) {
    return "private mode";
  }
  if (event.window.has_value()) {
    if (is_excluded(event.window->process_name)) {
      return "excluded application";
    }
  } else if (excluded_focus_.load()) {
    return "excluded application has focus";
  }
  return std::nullopt;
}

std::optional<std::string> PrivacyFilter::check(const PointerEvent &event) const {
  if (!monitoring_.capture_pointer) {
    return "pointer capture disabled";
  }
  if (event.type == PointerEventType::Move && !monitoring_.capture_moves) {
    return "pointer moves disabled";
  }
  if (event.window.has_value()) {
    if (is_excluded(event.window->process_name)) {
      return "excluded application";
    }
  } else if (excluded_focus_.load()) {
    return "excluded application has focus";
  }
  return std::nullopt;
}

std::optional<std::string> PrivacyFilter::check(const WindowEvent &event) {
  const bool excluded = is_excluded(event.process_name, event.bundle_id);
  excluded_focus_.store(excluded);
  if (!monitoring_.capture_windows) {
    return "window capture disabled";
  }
  if (excluded) {
    return "excluded application";
  }
  return std::nullopt;
}

} // namespace selfspy::capture
