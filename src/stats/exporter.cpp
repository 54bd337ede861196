#include "selfspy/stats/exporter.hpp"

#include "selfspy/common/escape.hpp"
#include "selfspy/common/fs.hpp"
#include "selfspy/store/schema.hpp"

#include <sstream>

namespace selfspy::stats {

namespace {

std::string optional_number(const std::optional<std::int64_t> &value, const char *null_text) {
  return value.has_value() ? std::to_string(*value) : std::string(null_text);
}

std::string quoted(const std::string &value) { return "\"" + common::json_escape(value) + "\""; }

template <typename Rows, typename Fn>
void json_array(std::ostringstream &out, const char *key, const Rows &rows, Fn &&write_row) {
  out << "  \"" << key << "\": [";
  for (std::size_t i = 0; i < rows.size(); ++i) {
    out << (i == 0 ? "\n    " : ",\n    ");
    write_row(rows[i]);
  }
  out << (rows.empty() ? "]" : "\n  ]");
}

} // namespace

std::string export_format_to_string(const ExportFormat format) {
  switch (format) {
  case ExportFormat::Json:
    return "json";
  case ExportFormat::Csv:
    return "csv";
  case ExportFormat::Sql:
    return "sql";
  }
  return "json";
}

std::optional<ExportFormat> export_format_from_string(const std::string_view value) {
  const std::string normalized = common::to_lower(common::trim(std::string(value)));
  if (normalized == "json") {
    return ExportFormat::Json;
  }
  if (normalized == "csv") {
    return ExportFormat::Csv;
  }
  if (normalized == "sql") {
    return ExportFormat::Sql;
  }
  return std::nullopt;
}

std::string render_json(const store::RangeData &data, const ActivityStats &stats,
                        const TimestampMs exported_at_ms) {
  std::ostringstream out;
  out << "{\n";
  out << "  \"exported_at\": " << quoted(common::format_rfc3339_ms(exported_at_ms)) << ",\n";
  out << "  \"days\": " << stats.days << ",\n";
  out << "  \"range\": {\"since_ms\": " << stats.since_ms << ", \"until_ms\": " << stats.until_ms
      << "},\n";

  out << "  \"stats\": {\"keystrokes\": " << stats.keystrokes << ", \"clicks\": " << stats.clicks
      << ", \"pointer_events\": " << stats.pointer_events
      << ", \"window_changes\": " << stats.window_changes << ", \"processes\": " << stats.processes
      << ", \"active_seconds\": " << stats.active_seconds
      << ", \"productivity_score\": " << stats.productivity.score
      << ", \"productivity_level\": "
      << quoted(productivity_level_to_string(stats.productivity.level))
      << ", \"hourly_keystrokes\": [";
  for (std::size_t hour = 0; hour < stats.hourly_keystrokes.size(); ++hour) {
    out << (hour == 0 ? "" : ", ") << stats.hourly_keystrokes[hour];
  }
  out << "], \"top_apps\": [";
  for (std::size_t i = 0; i < stats.top_apps.size(); ++i) {
    const auto &app = stats.top_apps[i];
    out << (i == 0 ? "" : ", ") << "{\"name\": " << quoted(app.name)
        << ", \"percentage\": " << format_percentage(app.percentage)
        << ", \"duration_ms\": " << app.duration_ms << ", \"windows\": " << app.window_count
        << ", \"events\": " << app.event_count << "}";
  }
  out << "]},\n";

  json_array(out, "sessions", data.sessions, [&out](const store::SessionRow &row) {
    out << "{\"id\": " << row.id << ", \"start_ms\": " << row.start_ms
        << ", \"end_ms\": " << optional_number(row.end_ms, "null") << "}";
  });
  out << ",\n";
  json_array(out, "processes", data.processes, [&out](const store::ProcessRow &row) {
    out << "{\"id\": " << row.id << ", \"name\": " << quoted(row.name)
        << ", \"bundle_id\": " << quoted(row.bundle_id) << ", \"first_seen_ms\": "
        << row.first_seen_ms << ", \"last_seen_ms\": " << row.last_seen_ms << "}";
  });
  out << ",\n";
  json_array(out, "windows", data.windows, [&out](const store::WindowRow &row) {
    out << "{\"id\": " << row.id << ", \"process_id\": " << row.process_id
        << ", \"title\": " << quoted(row.title) << ", \"pid\": " << row.pid << ", \"x\": " << row.x
        << ", \"y\": " << row.y << ", \"width\": " << row.width << ", \"height\": " << row.height
        << ", \"first_seen_ms\": " << row.first_seen_ms << ", \"last_seen_ms\": "
        << row.last_seen_ms << "}";
  });
  out << ",\n";
  json_array(out, "keystrokes", data.keystrokes, [&out](const store::StoredKeystrokeRow &row) {
    out << "{\"id\": " << row.id << ", \"window_id\": " << optional_number(row.window_id, "null")
        << ", \"payload\": " << quoted(row.payload)
        << ", \"encrypted\": " << (row.encrypted ? "true" : "false")
        << ", \"modifiers\": " << quoted(row.modifiers) << ", \"count\": " << row.count
        << ", \"recorded_at_ms\": " << row.recorded_at_ms << "}";
  });
  out << ",\n";
  json_array(out, "pointer_events", data.pointer_events, [&out](const store::PointerRow &row) {
    out << "{\"id\": " << row.id << ", \"window_id\": " << optional_number(row.window_id, "null")
        << ", \"x\": " << row.x << ", \"y\": " << row.y << ", \"button\": " << row.button
        << ", \"event_type\": " << quoted(capture::pointer_event_type_to_string(row.type))
        << ", \"recorded_at_ms\": " << row.recorded_at_ms << "}";
  });
  out << "\n}\n";
  return out.str();
}

std::string render_csv(const store::RangeData &data) {
  std::ostringstream out;

  out << "# sessions\nid,start_ms,end_ms\n";
  for (const auto &row : data.sessions) {
    out << row.id << ',' << row.start_ms << ',' << optional_number(row.end_ms, "") << "\n";
  }

  out << "\n# processes\nid,name,bundle_id,first_seen_ms,last_seen_ms\n";
  for (const auto &row : data.processes) {
    out << row.id << ',' << common::csv_field(row.name) << ',' << common::csv_field(row.bundle_id)
        << ',' << row.first_seen_ms << ',' << row.last_seen_ms << "\n";
  }

  out << "\n# windows\nid,process_id,title,pid,x,y,width,height,first_seen_ms,last_seen_ms\n";
  for (const auto &row : data.windows) {
    out << row.id << ',' << row.process_id << ',' << common::csv_field(row.title) << ','
        << row.pid << ',' << row.x << ',' << row.y << ',' << row.width << ',' << row.height << ','
        << row.first_seen_ms << ',' << row.last_seen_ms << "\n";
  }

  out << "\n# keystrokes\nid,window_id,payload,encrypted,modifiers,count,recorded_at_ms\n";
  for (const auto &row : data.keystrokes) {
    out << row.id << ',' << optional_number(row.window_id, "") << ','
        << common::csv_field(row.payload) << ',' << (row.encrypted ? 1 : 0) << ','
        << common::csv_field(row.modifiers) << ',' << row.count << ',' << row.recorded_at_ms
        << "\n";
  }

  out << "\n# pointer_events\nid,window_id,x,y,button,event_type,recorded_at_ms\n";
  for (const auto &row : data.pointer_events) {
    out << row.id << ',' << optional_number(row.window_id, "") << ',' << row.x << ',' << row.y
        << ',' << row.button << ',' << capture::pointer_event_type_to_string(row.type) << ','
        << row.recorded_at_ms << "\n";
  }
  return out.str();
}

std::string render_sql(const store::RangeData &data) {
  std::ostringstream out;
  out << "-- selfspy activity export, schema version " << store::SCHEMA_VERSION << "\n";
  out << "BEGIN TRANSACTION;\n";
  out << store::SCHEMA_DDL << "\n";

  for (const auto &row : data.sessions) {
    out << "INSERT INTO sessions(id, start_time, end_time) VALUES(" << row.id << ", "
        << row.start_ms << ", " << optional_number(row.end_ms, "NULL") << ");\n";
  }
  for (const auto &row : data.processes) {
    out << "INSERT INTO processes(id, name, bundle_id, first_seen, last_seen) VALUES(" << row.id
        << ", " << common::sql_quote(row.name) << ", " << common::sql_quote(row.bundle_id) << ", "
        << row.first_seen_ms << ", " << row.last_seen_ms << ");\n";
  }
  for (const auto &row : data.windows) {
    out << "INSERT INTO windows(id, title, process_id, pid, x, y, width, height, first_seen, "
           "last_seen) VALUES("
        << row.id << ", " << common::sql_quote(row.title) << ", " << row.process_id << ", "
        << row.pid << ", " << row.x << ", " << row.y << ", " << row.width << ", " << row.height
        << ", " << row.first_seen_ms << ", " << row.last_seen_ms << ");\n";
  }
  for (const auto &row : data.keystrokes) {
    out << "INSERT INTO keystroke_batches(id, window_id, payload, encrypted, modifiers, count, "
           "recorded_at) VALUES("
        << row.id << ", " << optional_number(row.window_id, "NULL") << ", "
        << common::sql_quote(row.payload) << ", " << (row.encrypted ? 1 : 0) << ", "
        << common::sql_quote(row.modifiers) << ", " << row.count << ", " << row.recorded_at_ms
        << ");\n";
  }
  for (const auto &row : data.pointer_events) {
    out << "INSERT INTO pointer_events(id, window_id, x, y, button, event_type, recorded_at) "
           "VALUES("
        << row.id << ", " << optional_number(row.window_id, "NULL") << ", " << row.x << ", "
        << row.y << ", " << row.button << ", "
        << common::sql_quote(capture::pointer_event_type_to_string(row.type)) << ", "
        << row.recorded_at_ms << ");\n";
  }
  out << "COMMIT;\n";
  return out.str();
}

Exporter::Exporter(store::IActivityStore &store, const StatsAggregator &stats)
    : store_(store), stats_(stats) {}

common::Result<std::string> Exporter::export_range(const int days,
                                                   const ExportFormat format) const {
  return export_range_at(days, format, common::now_ms());
}

common::Result<std::string> Exporter::export_range_at(const int days, const ExportFormat format,
                                                      const TimestampMs now_ms) const {
  auto stats = stats_.get_stats_at(days, now_ms);
  if (!stats.ok()) {
    return common::Result<std::string>::failure(stats.kind(), stats.error());
  }

  store::RangeData data;
  if (days > 0) {
    auto loaded = store_.load_range(stats.value().since_ms, stats.value().until_ms);
    if (!loaded.ok()) {
      return common::Result<std::string>::failure(loaded.kind(), loaded.error());
    }
    data = std::move(loaded.value());
  }

  switch (format) {
  case ExportFormat::Json:
    return common::Result<std::string>::success(render_json(data, stats.value(), now_ms));
  case ExportFormat::Csv:
    return common::Result<std::string>::success(render_csv(data));
  case ExportFormat::Sql:
    return common::Result<std::string>::success(render_sql(data));
  }
  return common::Result<std::string>::failure(common::ErrorKind::InvalidArgument,
                                              "unknown export format");
}

} // namespace selfspy::stats
