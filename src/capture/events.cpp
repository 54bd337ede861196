#include "selfspy/capture/events.hpp"

#include "selfspy/common/fs.hpp"

#include <algorithm>
#include <functional>

namespace selfspy::capture {

std::size_t WindowKeyHash::operator()(const WindowKey &key) const noexcept {
  std::size_t seed = std::hash<std::string>{}(key.title);
  const auto mix = [&seed](std::size_t value) {
    seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
  };
  mix(std::hash<std::string>{}(key.process_name));
  mix(std::hash<std::int64_t>{}(key.pid));
  return seed;
}

std::string pointer_event_type_to_string(const PointerEventType type) {
  switch (type) {
  case PointerEventType::Click:
    return "click";
  case PointerEventType::Move:
    return "move";
  case PointerEventType::Scroll:
    return "scroll";
  }
  return "click";
}

std::optional<PointerEventType> pointer_event_type_from_string(const std::string_view value) {
  const std::string normalized = common::to_lower(std::string(value));
  if (normalized == "click") {
    return PointerEventType::Click;
  }
  if (normalized == "move") {
    return PointerEventType::Move;
  }
  if (normalized == "scroll") {
    return PointerEventType::Scroll;
  }
  return std::nullopt;
}

TimestampMs event_timestamp(const ActivityEvent &event) {
  return std::visit([](const auto &evt) { return evt.timestamp_ms; }, event);
}

std::string canonical_modifiers(const std::vector<std::string> &modifiers) {
  std::vector<std::string> normalized;
  normalized.reserve(modifiers.size());
  for (const auto &modifier : modifiers) {
    std::string value = common::to_lower(common::trim(modifier));
    if (!value.empty()) {
      normalized.push_back(std::move(value));
    }
  }
  std::sort(normalized.begin(), normalized.end());
  normalized.erase(std::unique(normalized.begin(), normalized.end()), normalized.end());

  std::string out;
  for (const auto &value : normalized) {
    if (!out.empty()) {
      out.push_back('+');
    }
    out += value;
  }
  return out;
}

} // namespace selfspy::capture
