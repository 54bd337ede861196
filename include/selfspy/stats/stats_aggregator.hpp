#pragma once

#include "selfspy/common/result.hpp"
#include "selfspy/store/activity_store.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace selfspy::stats {

using common::TimestampMs;

struct AppUsage {
  std::string name;
  // Share of tracked window time, 0-100. Unrounded.
  double percentage = 0.0;
  std::int64_t duration_ms = 0;
  std::uint64_t window_count = 0;
  std::uint64_t event_count = 0;
  double score = 0.0;
};

enum class ProductivityLevel {
  Quiet,
  GettingStarted,
  ModeratelyActive,
  VeryActive,
  HighlyProductive,
};

struct Productivity {
  int score = 0;
  ProductivityLevel level = ProductivityLevel::Quiet;
};

struct ActivityStats {
  int days = 0;
  TimestampMs since_ms = 0;
  TimestampMs until_ms = 0;
  std::uint64_t keystrokes = 0;
  std::uint64_t clicks = 0;
  std::uint64_t pointer_events = 0;
  std::uint64_t window_changes = 0;
  std::uint64_t processes = 0;
  std::int64_t active_seconds = 0;
  std::vector<AppUsage> top_apps;
  store::HourlyKeystrokes hourly_keystrokes{};
  // Newest window first.
  std::vector<store::TimelineRow> timeline;
  Productivity productivity;
};

/// One decimal place, for display only.
[[nodiscard]] std::string format_percentage(double percentage);

/// Session time inside [since_ms, until_ms]; open sessions run until `until_ms`.
[[nodiscard]] std::int64_t clipped_active_ms(const std::vector<store::SessionRow> &sessions,
                                             TimestampMs since_ms, TimestampMs until_ms);

/// Ranks by 0.5 * duration share + 0.5 * window share, ties by name.
[[nodiscard]] std::vector<AppUsage> rank_apps(const std::vector<store::AppUsageRow> &rows,
                                              std::size_t limit);

/// min(100, keystrokes / 50 + 2 * windows + 5 * processes), bucketed by 20.
[[nodiscard]] Productivity productivity_score(std::uint64_t keystrokes, std::uint64_t windows,
                                              std::uint64_t processes);
[[nodiscard]] std::string productivity_level_to_string(ProductivityLevel level);

/// Read-only view over the store; never touches the buffer.
class StatsAggregator {
public:
  explicit StatsAggregator(store::IActivityStore &store, std::size_t top_apps_limit = 10,
                           std::size_t timeline_limit = 50);

  [[nodiscard]] common::Result<ActivityStats> get_stats(int days) const;
  [[nodiscard]] common::Result<ActivityStats> get_stats_at(int days, TimestampMs now_ms) const;

private:
  store::IActivityStore &store_;
  std::size_t top_apps_limit_;
  std::size_t timeline_limit_;
};

} // namespace selfspy::stats
