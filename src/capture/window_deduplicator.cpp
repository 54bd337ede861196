#include "selfspy/capture/window_deduplicator.hpp"

#include <algorithm>

namespace selfspy::capture {

// The window losing focus stayed in front until `ts`.
std::size_t WindowDeduplicator::release_focus(const TimestampMs ts, const bool allow_new_record) {
  std::size_t created = 0;
  if (const auto it = open_.find(*current_); it != open_.end()) {
    auto &previous = records_[it->second];
    previous.last_seen_ms = std::max(previous.last_seen_ms, ts);
  } else if (allow_new_record && carried_.has_value() && carried_->key == *current_) {
    WindowRecord extension = *carried_;
    extension.first_seen_ms = ts;
    extension.last_seen_ms = ts;
    extension.state = WindowState::Closed;
    extension.continuation = true;
    records_.push_back(std::move(extension));
    ++created;
  }
  carried_.reset();
  return created;
}

std::size_t WindowDeduplicator::blur(const TimestampMs ts, const bool allow_new_record) {
  if (!current_.has_value()) {
    return 0;
  }
  const std::size_t created = release_focus(ts, allow_new_record);
  current_.reset();
  return created;
}

std::size_t WindowDeduplicator::observe(const WindowEvent &event) {
  const WindowKey key = event.key();
  const TimestampMs ts = event.timestamp_ms;
  std::size_t created = 0;

  if (current_.has_value() && *current_ != key) {
    created += release_focus(ts, true);
  }

  if (const auto it = open_.find(key); it != open_.end()) {
    auto &record = records_[it->second];
    record.first_seen_ms = std::min(record.first_seen_ms, ts);
    record.last_seen_ms = std::max(record.last_seen_ms, ts);
    record.x = event.x;
    record.y = event.y;
    record.width = event.width;
    record.height = event.height;
    if (!event.bundle_id.empty()) {
      record.bundle_id = event.bundle_id;
    }
  } else {
    WindowRecord record;
    record.key = key;
    record.bundle_id = event.bundle_id;
    record.x = event.x;
    record.y = event.y;
    record.width = event.width;
    record.height = event.height;
    record.first_seen_ms = ts;
    record.last_seen_ms = ts;
    record.continuation = carried_.has_value() && carried_->key == key;
    carried_.reset();

    open_.emplace(key, records_.size());
    closed_.erase(key);
    records_.push_back(std::move(record));
    ++created;
  }

  current_ = key;
  return created;
}

std::vector<WindowRecord> WindowDeduplicator::close_all() {
  if (current_.has_value()) {
    if (const auto it = open_.find(*current_); it != open_.end()) {
      carried_ = records_[it->second];
      carried_->continuation = false;
    }
  }

  closed_.clear();
  for (auto &record : records_) {
    record.state = WindowState::Closed;
    closed_.insert(record.key);
  }
  open_.clear();

  std::vector<WindowRecord> out;
  out.swap(records_);
  return out;
}

WindowState WindowDeduplicator::state(const WindowKey &key) const {
  if (open_.contains(key)) {
    return WindowState::Open;
  }
  if (closed_.contains(key)) {
    return WindowState::Closed;
  }
  return WindowState::Unseen;
}

std::optional<WindowRecord> WindowDeduplicator::current_record() const {
  if (!current_.has_value()) {
    return std::nullopt;
  }
  if (const auto it = open_.find(*current_); it != open_.end()) {
    return records_[it->second];
  }
  if (carried_.has_value() && carried_->key == *current_) {
    return carried_;
  }
  return std::nullopt;
}

} // namespace selfspy::capture
