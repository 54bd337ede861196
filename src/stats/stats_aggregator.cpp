#include "selfspy/stats/stats_aggregator.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace selfspy::stats {

std::string format_percentage(const double percentage) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(1) << percentage;
  return out.str();
}

std::int64_t clipped_active_ms(const std::vector<store::SessionRow> &sessions,
                               const TimestampMs since_ms, const TimestampMs until_ms) {
  std::int64_t total = 0;
  for (const auto &session : sessions) {
    const TimestampMs start = std::max(session.start_ms, since_ms);
    const TimestampMs end = std::min(session.end_ms.value_or(until_ms), until_ms);
    if (end > start) {
      total += end - start;
    }
  }
  return total;
}

std::vector<AppUsage> rank_apps(const std::vector<store::AppUsageRow> &rows,
                                const std::size_t limit) {
  std::int64_t total_duration = 0;
  std::uint64_t total_windows = 0;
  for (const auto &row : rows) {
    total_duration += std::max<std::int64_t>(row.duration_ms, 0);
    total_windows += row.window_count;
  }

  std::vector<AppUsage> apps;
  apps.reserve(rows.size());
  for (const auto &row : rows) {
    const double duration_share =
        total_duration > 0
            ? static_cast<double>(std::max<std::int64_t>(row.duration_ms, 0)) / total_duration
            : 0.0;
    const double window_share =
        total_windows > 0 ? static_cast<double>(row.window_count) / total_windows : 0.0;

    AppUsage app;
    app.name = row.name;
    app.duration_ms = row.duration_ms;
    app.window_count = row.window_count;
    app.event_count = row.event_count;
    app.score = 0.5 * duration_share + 0.5 * window_share;
    app.percentage = (total_duration > 0 ? duration_share : window_share) * 100.0;
    apps.push_back(std::move(app));
  }

  std::sort(apps.begin(), apps.end(), [](const AppUsage &a, const AppUsage &b) {
    if (a.score != b.score) {
      return a.score > b.score;
    }
    return a.name < b.name;
  });
  if (apps.size() > limit) {
    apps.resize(limit);
  }
  return apps;
}

Productivity productivity_score(const std::uint64_t keystrokes, const std::uint64_t windows,
                                const std::uint64_t processes) {
  const std::uint64_t raw = keystrokes / 50 + windows * 2 + processes * 5;
  Productivity out;
  out.score = static_cast<int>(std::min<std::uint64_t>(raw, 100));
  if (out.score >= 80) {
    out.level = ProductivityLevel::HighlyProductive;
  } else if (out.score >= 60) {
    out.level = ProductivityLevel::VeryActive;
  } else if (out.score >= 40) {
    out.level = ProductivityLevel::ModeratelyActive;
  } else if (out.score >= 20) {
    out.level = ProductivityLevel::GettingStarted;
  } else {
    out.level = ProductivityLevel::Quiet;
  }
  return out;
}

std::string productivity_level_to_string(const ProductivityLevel level) {
  switch (level) {
  case ProductivityLevel::HighlyProductive:
    return "highly_productive";
  case ProductivityLevel::VeryActive:
    return "very_active";
  case ProductivityLevel::ModeratelyActive:
    return "moderately_active";
  case ProductivityLevel::GettingStarted:
    return "getting_started";
  case ProductivityLevel::Quiet:
    return "quiet";
  }
  return "quiet";
}

StatsAggregator::StatsAggregator(store::IActivityStore &store, const std::size_t top_apps_limit,
                                 const std::size_t timeline_limit)
    : store_(store), top_apps_limit_(top_apps_limit), timeline_limit_(timeline_limit) {}

common::Result<ActivityStats> StatsAggregator::get_stats(const int days) const {
  return get_stats_at(days, common::now_ms());
}

common::Result<ActivityStats> StatsAggregator::get_stats_at(const int days,
                                                            const TimestampMs now_ms) const {
  if (days < 0) {
    return common::Result<ActivityStats>::failure(common::ErrorKind::InvalidArgument,
                                                  "days must be >= 0, got " +
                                                      std::to_string(days));
  }

  ActivityStats stats;
  stats.days = days;
  stats.until_ms = now_ms;
  stats.since_ms = now_ms - static_cast<TimestampMs>(days) * common::kMsPerDay;
  if (days == 0) {
    return common::Result<ActivityStats>::success(std::move(stats));
  }

  auto counts = store_.count_activity(stats.since_ms, stats.until_ms);
  if (!counts.ok()) {
    return common::Result<ActivityStats>::failure(counts.kind(), counts.error());
  }
  stats.keystrokes = counts.value().keystrokes;
  stats.clicks = counts.value().clicks;
  stats.pointer_events = counts.value().pointer_events;
  stats.window_changes = counts.value().window_changes;
  stats.processes = counts.value().processes;
  stats.productivity = productivity_score(stats.keystrokes, stats.window_changes, stats.processes);

  auto sessions = store_.session_spans(stats.since_ms, stats.until_ms);
  if (!sessions.ok()) {
    return common::Result<ActivityStats>::failure(sessions.kind(), sessions.error());
  }
  stats.active_seconds = clipped_active_ms(sessions.value(), stats.since_ms, stats.until_ms) / 1000;

  auto usage = store_.app_usage(stats.since_ms, stats.until_ms);
  if (!usage.ok()) {
    return common::Result<ActivityStats>::failure(usage.kind(), usage.error());
  }
  stats.top_apps = rank_apps(usage.value(), top_apps_limit_);

  auto hourly = store_.hourly_keystrokes(stats.since_ms, stats.until_ms);
  if (!hourly.ok()) {
    return common::Result<ActivityStats>::failure(hourly.kind(), hourly.error());
  }
  stats.hourly_keystrokes = hourly.value();

  if (timeline_limit_ > 0) {
    auto timeline = store_.recent_windows(stats.since_ms, stats.until_ms, timeline_limit_);
    if (!timeline.ok()) {
      return common::Result<ActivityStats>::failure(timeline.kind(), timeline.error());
    }
    stats.timeline = std::move(timeline.value());
  }

  return common::Result<ActivityStats>::success(std::move(stats));
}

} // namespace selfspy::stats
