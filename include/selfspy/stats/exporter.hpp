#pragma once

#include "selfspy/common/result.hpp"
#include "selfspy/stats/stats_aggregator.hpp"
#include "selfspy/store/activity_store.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace selfspy::stats {

enum class ExportFormat {
  Json,
  Csv,
  Sql,
};

[[nodiscard]] std::string export_format_to_string(ExportFormat format);
[[nodiscard]] std::optional<ExportFormat> export_format_from_string(std::string_view value);

[[nodiscard]] std::string render_json(const store::RangeData &data, const ActivityStats &stats,
                                      TimestampMs exported_at_ms);
[[nodiscard]] std::string render_csv(const store::RangeData &data);
[[nodiscard]] std::string render_sql(const store::RangeData &data);

/// Serializes stored activity of the last `days` days. Keystroke payloads are
/// exported as stored.
class Exporter {
public:
  Exporter(store::IActivityStore &store, const StatsAggregator &stats);

  [[nodiscard]] common::Result<std::string> export_range(int days, ExportFormat format) const;
  [[nodiscard]] common::Result<std::string> export_range_at(int days, ExportFormat format,
                                                            TimestampMs now_ms) const;

private:
  store::IActivityStore &store_;
  const StatsAggregator &stats_;
};

} // namespace selfspy::stats
