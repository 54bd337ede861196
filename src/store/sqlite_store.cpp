#include "selfspy/store/sqlite_store.hpp"

#include "selfspy/common/fs.hpp"
#include "selfspy/store/schema.hpp"

#include <algorithm>
#include <map>
#include <unordered_map>
#include <utility>

namespace selfspy::store {

namespace {

constexpr int PROGRESS_OPS = 1000;

common::ErrorKind kind_for(const int rc) {
  return rc == SQLITE_INTERRUPT ? common::ErrorKind::Timeout : common::ErrorKind::Store;
}

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string msg = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(kind_for(rc), msg);
  }
  return common::Status::success();
}

/// Owns one prepared statement.
class Statement {
public:
  Statement(sqlite3 *db, const char *sql) : db_(db) {
    prepare_rc_ = sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr);
    if (prepare_rc_ != SQLITE_OK) {
      error_ = sqlite3_errmsg(db);
      sqlite3_finalize(stmt_);
      stmt_ = nullptr;
    }
  }
  ~Statement() { sqlite3_finalize(stmt_); }

  Statement(const Statement &) = delete;
  Statement &operator=(const Statement &) = delete;

  [[nodiscard]] bool ok() const { return stmt_ != nullptr; }
  [[nodiscard]] common::Status prepare_status() const {
    return ok() ? common::Status::success()
                : common::Status::error(kind_for(prepare_rc_), error_);
  }

  void reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
  }

  void bind(const int index, const std::string &value) {
    sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT);
  }
  void bind(const int index, const std::int64_t value) {
    sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value));
  }
  void bind(const int index, const int value) { sqlite3_bind_int(stmt_, index, value); }
  void bind(const int index, const std::optional<std::int64_t> &value) {
    if (value.has_value()) {
      bind(index, *value);
    } else {
      sqlite3_bind_null(stmt_, index);
    }
  }

  [[nodiscard]] int step() { return sqlite3_step(stmt_); }

  /// Runs a statement that returns no rows.
  [[nodiscard]] common::Status run() {
    const int rc = step();
    if (rc != SQLITE_DONE) {
      return common::Status::error(kind_for(rc), sqlite3_errmsg(db_));
    }
    return common::Status::success();
  }

  [[nodiscard]] common::Status step_error(const int rc) const {
    return common::Status::error(kind_for(rc), sqlite3_errmsg(db_));
  }

  [[nodiscard]] std::int64_t int64(const int column) const {
    return static_cast<std::int64_t>(sqlite3_column_int64(stmt_, column));
  }
  [[nodiscard]] int integer(const int column) const { return sqlite3_column_int(stmt_, column); }
  [[nodiscard]] bool is_null(const int column) const {
    return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
  }
  [[nodiscard]] std::optional<std::int64_t> optional_int64(const int column) const {
    if (is_null(column)) {
      return std::nullopt;
    }
    return int64(column);
  }
  [[nodiscard]] std::string text(const int column) const {
    const auto *value = sqlite3_column_text(stmt_, column);
    return value == nullptr ? std::string() : reinterpret_cast<const char *>(value);
  }

private:
  sqlite3 *db_ = nullptr;
  sqlite3_stmt *stmt_ = nullptr;
  int prepare_rc_ = SQLITE_OK;
  std::string error_;
};

template <typename T> common::Result<T> failed(const common::Status &status) {
  return common::Result<T>::failure(status.kind(), status.error());
}

} // namespace

SqliteActivityStore::SqliteActivityStore(std::filesystem::path db_path,
                                         config::DatabaseConfig config)
    : db_path_(std::move(db_path)), config_(std::move(config)) {
  const bool in_memory = db_path_.string() == ":memory:";
  if (!in_memory && db_path_.has_parent_path()) {
    auto dir = common::ensure_dir(db_path_.parent_path());
    if (!dir.ok()) {
      open_error_ = dir.error();
      return;
    }
  }

  if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
    open_error_ = db_ == nullptr ? "sqlite3_open failed" : sqlite3_errmsg(db_);
    sqlite3_close(db_);
    db_ = nullptr;
    return;
  }

  sqlite3_busy_timeout(db_, static_cast<int>(config_.busy_timeout_ms));
  sqlite3_progress_handler(db_, PROGRESS_OPS, &SqliteActivityStore::progress_callback, this);

  auto status = init_schema();
  if (!status.ok()) {
    open_error_ = status.error();
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

SqliteActivityStore::~SqliteActivityStore() { close(); }

int SqliteActivityStore::progress_callback(void *self) {
  const auto *store = static_cast<const SqliteActivityStore *>(self);
  if (store->deadline_active_ && std::chrono::steady_clock::now() >= store->deadline_) {
    return 1;
  }
  return 0;
}

common::Status SqliteActivityStore::init_schema() {
  if (db_ == nullptr) {
    return common::Status::error(common::ErrorKind::StoreUnavailable,
                                 "database is not initialized");
  }

  for (const char *pragma : {"PRAGMA journal_mode=WAL;", "PRAGMA synchronous=NORMAL;",
                             "PRAGMA foreign_keys=ON;"}) {
    auto status = exec_sql(db_, pragma);
    if (!status.ok()) {
      return status;
    }
  }

  auto status = exec_sql(db_, SCHEMA_DDL);
  if (!status.ok()) {
    return status;
  }

  return exec_sql(db_, "INSERT OR IGNORE INTO meta(key, value) VALUES('schema_version', '" +
                           std::to_string(SCHEMA_VERSION) + "');");
}

bool SqliteActivityStore::is_available() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return false;
  }
  return exec_sql(db_, "SELECT 1;").ok();
}

common::Result<std::int64_t> SqliteActivityStore::begin_session(const TimestampMs start_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::int64_t>::failure(common::ErrorKind::StoreUnavailable,
                                                 "database not initialized");
  }

  Statement stmt(db_, "INSERT INTO sessions(start_time, end_time) VALUES(?1, NULL)");
  if (!stmt.ok()) {
    return failed<std::int64_t>(stmt.prepare_status());
  }
  stmt.bind(1, start_ms);
  auto status = stmt.run();
  if (!status.ok()) {
    return failed<std::int64_t>(status);
  }
  return common::Result<std::int64_t>::success(
      static_cast<std::int64_t>(sqlite3_last_insert_rowid(db_)));
}

common::Status SqliteActivityStore::end_session(const std::int64_t session_id,
                                                const TimestampMs end_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error(common::ErrorKind::StoreUnavailable, "database not initialized");
  }

  Statement stmt(db_, "UPDATE sessions SET end_time = MAX(start_time, ?1) "
                      "WHERE id = ?2 AND end_time IS NULL");
  if (!stmt.ok()) {
    return stmt.prepare_status();
  }
  stmt.bind(1, end_ms);
  stmt.bind(2, session_id);
  auto status = stmt.run();
  if (!status.ok()) {
    return status;
  }
  if (sqlite3_changes(db_) == 0) {
    return common::Status::error(common::ErrorKind::InvalidArgument,
                                 "session " + std::to_string(session_id) + " is not open");
  }
  return common::Status::success();
}

common::Status SqliteActivityStore::check_deadline(const char *phase) const {
  if (deadline_active_ && std::chrono::steady_clock::now() >= deadline_) {
    return common::Status::error(common::ErrorKind::Timeout,
                                 std::string("write timed out during ") + phase);
  }
  return common::Status::success();
}

void SqliteActivityStore::rollback_locked() {
  deadline_active_ = false;
  if (db_ != nullptr && sqlite3_get_autocommit(db_) == 0) {
    auto status = exec_sql(db_, "ROLLBACK;");
    if (!status.ok()) {
      open_error_ = "rollback failed: " + status.error();
    }
  }
}

common::Result<WriteReport> SqliteActivityStore::write_batch(const FlushBatch &batch,
                                                             const std::chrono::milliseconds timeout) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<WriteReport>::failure(common::ErrorKind::StoreUnavailable,
                                                "database not initialized");
  }
  if (batch.empty()) {
    return common::Result<WriteReport>::success(WriteReport{});
  }

  const auto busy_ms =
      std::min<std::int64_t>(config_.busy_timeout_ms, std::max<std::int64_t>(timeout.count(), 0));
  sqlite3_busy_timeout(db_, static_cast<int>(busy_ms));
  deadline_ = std::chrono::steady_clock::now() + timeout;
  deadline_active_ = true;

  WriteReport report;
  auto status = exec_sql(db_, "BEGIN IMMEDIATE;");
  if (status.ok()) {
    status = write_batch_locked(batch, report);
  }
  if (status.ok()) {
    status = check_deadline("commit");
  }
  if (status.ok()) {
    status = exec_sql(db_, "COMMIT;");
  }

  deadline_active_ = false;
  sqlite3_busy_timeout(db_, static_cast<int>(config_.busy_timeout_ms));
  if (!status.ok()) {
    rollback_locked();
    return failed<WriteReport>(status);
  }
  return common::Result<WriteReport>::success(report);
}

common::Status SqliteActivityStore::write_batch_locked(const FlushBatch &batch,
                                                       WriteReport &report) {
  using ProcessKey = std::pair<std::string, std::string>;
  using WindowIds = std::unordered_map<capture::WindowKey, std::int64_t, capture::WindowKeyHash>;

  // Processes referenced by this batch, with their seen range.
  std::map<ProcessKey, std::pair<TimestampMs, TimestampMs>> seen;
  for (const auto &window : batch.windows) {
    const ProcessKey key{window.key.process_name, window.bundle_id};
    auto [it, inserted] = seen.emplace(key, std::make_pair(window.first_seen_ms, window.last_seen_ms));
    if (!inserted) {
      it->second.first = std::min(it->second.first, window.first_seen_ms);
      it->second.second = std::max(it->second.second, window.last_seen_ms);
    }
  }

  Statement find_process(db_, "SELECT id FROM processes WHERE name = ?1 AND bundle_id = ?2");
  Statement insert_process(
      db_, "INSERT INTO processes(name, bundle_id, first_seen, last_seen) VALUES(?1, ?2, ?3, ?4)");
  Statement touch_process(db_, "UPDATE processes SET first_seen = MIN(first_seen, ?1), "
                               "last_seen = MAX(last_seen, ?2) WHERE id = ?3");
  for (const auto *stmt : {&find_process, &insert_process, &touch_process}) {
    if (!stmt->ok()) {
      return stmt->prepare_status();
    }
  }

  std::map<ProcessKey, std::int64_t> process_ids;
  for (const auto &[key, range] : seen) {
    find_process.reset();
    find_process.bind(1, key.first);
    find_process.bind(2, key.second);
    const int rc = find_process.step();
    if (rc == SQLITE_ROW) {
      const std::int64_t id = find_process.int64(0);
      touch_process.reset();
      touch_process.bind(1, range.first);
      touch_process.bind(2, range.second);
      touch_process.bind(3, id);
      auto status = touch_process.run();
      if (!status.ok()) {
        return status;
      }
      process_ids[key] = id;
    } else if (rc == SQLITE_DONE) {
      insert_process.reset();
      insert_process.bind(1, key.first);
      insert_process.bind(2, key.second);
      insert_process.bind(3, range.first);
      insert_process.bind(4, range.second);
      auto status = insert_process.run();
      if (!status.ok()) {
        return status;
      }
      process_ids[key] = static_cast<std::int64_t>(sqlite3_last_insert_rowid(db_));
      ++report.processes_created;
    } else {
      return find_process.step_error(rc);
    }
  }

  auto status = check_deadline("process upsert");
  if (!status.ok()) {
    return status;
  }

  Statement latest_window(db_, R"(
SELECT w.id FROM windows w JOIN processes p ON p.id = w.process_id
WHERE w.title = ?1 AND p.name = ?2 AND w.pid = ?3
ORDER BY w.last_seen DESC, w.id DESC LIMIT 1
)");
  Statement insert_window(db_, R"(
INSERT INTO windows(title, process_id, pid, x, y, width, height, first_seen, last_seen)
VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9)
)");
  Statement extend_window(db_, "UPDATE windows SET last_seen = MAX(last_seen, ?1), x = ?2, "
                               "y = ?3, width = ?4, height = ?5 WHERE id = ?6");
  for (const auto *stmt : {&latest_window, &insert_window, &extend_window}) {
    if (!stmt->ok()) {
      return stmt->prepare_status();
    }
  }

  const auto find_latest = [&latest_window](const capture::WindowKey &key)
      -> common::Result<std::optional<std::int64_t>> {
    latest_window.reset();
    latest_window.bind(1, key.title);
    latest_window.bind(2, key.process_name);
    latest_window.bind(3, key.pid);
    const int rc = latest_window.step();
    if (rc == SQLITE_ROW) {
      return common::Result<std::optional<std::int64_t>>::success(latest_window.int64(0));
    }
    if (rc == SQLITE_DONE) {
      return common::Result<std::optional<std::int64_t>>::success(std::nullopt);
    }
    return failed<std::optional<std::int64_t>>(latest_window.step_error(rc));
  };

  WindowIds window_ids;
  for (const auto &window : batch.windows) {
    std::optional<std::int64_t> existing;
    if (window.continuation) {
      auto latest = find_latest(window.key);
      if (!latest.ok()) {
        return common::Status::error(latest.kind(), latest.error());
      }
      existing = latest.value();
    }

    if (existing.has_value()) {
      extend_window.reset();
      extend_window.bind(1, window.last_seen_ms);
      extend_window.bind(2, window.x);
      extend_window.bind(3, window.y);
      extend_window.bind(4, window.width);
      extend_window.bind(5, window.height);
      extend_window.bind(6, *existing);
      status = extend_window.run();
      if (!status.ok()) {
        return status;
      }
      window_ids[window.key] = *existing;
      ++report.windows_extended;
      continue;
    }

    insert_window.reset();
    insert_window.bind(1, window.key.title);
    insert_window.bind(2, process_ids.at(ProcessKey{window.key.process_name, window.bundle_id}));
    insert_window.bind(3, window.key.pid);
    insert_window.bind(4, window.x);
    insert_window.bind(5, window.y);
    insert_window.bind(6, window.width);
    insert_window.bind(7, window.height);
    insert_window.bind(8, window.first_seen_ms);
    insert_window.bind(9, window.last_seen_ms);
    status = insert_window.run();
    if (!status.ok()) {
      return status;
    }
    window_ids[window.key] = static_cast<std::int64_t>(sqlite3_last_insert_rowid(db_));
    ++report.windows_inserted;
  }

  status = check_deadline("window upsert");
  if (!status.ok()) {
    return status;
  }

  // Events may reference windows flushed by an earlier batch.
  const auto resolve = [&window_ids, &find_latest](const std::optional<capture::WindowKey> &key)
      -> common::Result<std::optional<std::int64_t>> {
    if (!key.has_value()) {
      return common::Result<std::optional<std::int64_t>>::success(std::nullopt);
    }
    if (const auto it = window_ids.find(*key); it != window_ids.end()) {
      return common::Result<std::optional<std::int64_t>>::success(it->second);
    }
    auto latest = find_latest(*key);
    if (latest.ok() && latest.value().has_value()) {
      window_ids[*key] = *latest.value();
    }
    return latest;
  };

  Statement insert_keystroke(db_, R"(
INSERT INTO keystroke_batches(window_id, payload, encrypted, modifiers, count, recorded_at)
VALUES(?1, ?2, ?3, ?4, ?5, ?6)
)");
  if (!insert_keystroke.ok()) {
    return insert_keystroke.prepare_status();
  }
  for (const auto &row : batch.keystrokes) {
    auto window_id = resolve(row.window);
    if (!window_id.ok()) {
      return common::Status::error(window_id.kind(), window_id.error());
    }
    insert_keystroke.reset();
    insert_keystroke.bind(1, window_id.value());
    insert_keystroke.bind(2, row.payload);
    insert_keystroke.bind(3, row.encrypted ? 1 : 0);
    insert_keystroke.bind(4, row.modifiers);
    insert_keystroke.bind(5, static_cast<std::int64_t>(row.count));
    insert_keystroke.bind(6, row.recorded_at_ms);
    status = insert_keystroke.run();
    if (!status.ok()) {
      return status;
    }
    ++report.keystrokes;
  }

  status = check_deadline("keystroke insert");
  if (!status.ok()) {
    return status;
  }

  Statement insert_pointer(db_, R"(
INSERT INTO pointer_events(window_id, x, y, button, event_type, recorded_at)
VALUES(?1, ?2, ?3, ?4, ?5, ?6)
)");
  if (!insert_pointer.ok()) {
    return insert_pointer.prepare_status();
  }
  for (const auto &event : batch.pointer_events) {
    auto window_id = resolve(event.window);
    if (!window_id.ok()) {
      return common::Status::error(window_id.kind(), window_id.error());
    }
    insert_pointer.reset();
    insert_pointer.bind(1, window_id.value());
    insert_pointer.bind(2, event.x);
    insert_pointer.bind(3, event.y);
    insert_pointer.bind(4, event.button);
    insert_pointer.bind(5, capture::pointer_event_type_to_string(event.type));
    insert_pointer.bind(6, event.timestamp_ms);
    status = insert_pointer.run();
    if (!status.ok()) {
      return status;
    }
    ++report.pointer_events;
  }

  return check_deadline("pointer insert");
}

common::Result<ActivityCounts> SqliteActivityStore::count_activity(const TimestampMs since_ms,
                                                                   const TimestampMs until_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<ActivityCounts>::failure(common::ErrorKind::StoreUnavailable,
                                                   "database not initialized");
  }

  Statement stmt(db_, R"(
SELECT
  (SELECT COALESCE(SUM(count), 0) FROM keystroke_batches WHERE recorded_at BETWEEN ?1 AND ?2),
  (SELECT COUNT(*) FROM pointer_events WHERE event_type = 'click' AND recorded_at BETWEEN ?1 AND ?2),
  (SELECT COUNT(*) FROM pointer_events WHERE recorded_at BETWEEN ?1 AND ?2),
  (SELECT COUNT(*) FROM windows WHERE first_seen BETWEEN ?1 AND ?2),
  (SELECT COUNT(DISTINCT process_id) FROM windows WHERE first_seen BETWEEN ?1 AND ?2)
)");
  if (!stmt.ok()) {
    return failed<ActivityCounts>(stmt.prepare_status());
  }
  stmt.bind(1, since_ms);
  stmt.bind(2, until_ms);
  const int rc = stmt.step();
  if (rc != SQLITE_ROW) {
    return failed<ActivityCounts>(stmt.step_error(rc));
  }

  ActivityCounts counts;
  counts.keystrokes = static_cast<std::uint64_t>(stmt.int64(0));
  counts.clicks = static_cast<std::uint64_t>(stmt.int64(1));
  counts.pointer_events = static_cast<std::uint64_t>(stmt.int64(2));
  counts.window_changes = static_cast<std::uint64_t>(stmt.int64(3));
  counts.processes = static_cast<std::uint64_t>(stmt.int64(4));
  return common::Result<ActivityCounts>::success(counts);
}

common::Result<std::vector<SessionRow>>
SqliteActivityStore::session_spans(const TimestampMs since_ms, const TimestampMs until_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::vector<SessionRow>>::failure(common::ErrorKind::StoreUnavailable,
                                                            "database not initialized");
  }

  Statement stmt(db_, "SELECT id, start_time, end_time FROM sessions "
                      "WHERE start_time <= ?2 AND (end_time IS NULL OR end_time >= ?1) "
                      "ORDER BY start_time ASC, id ASC");
  if (!stmt.ok()) {
    return failed<std::vector<SessionRow>>(stmt.prepare_status());
  }
  stmt.bind(1, since_ms);
  stmt.bind(2, until_ms);

  std::vector<SessionRow> rows;
  int rc = SQLITE_ROW;
  while ((rc = stmt.step()) == SQLITE_ROW) {
    rows.push_back(SessionRow{.id = stmt.int64(0),
                              .start_ms = stmt.int64(1),
                              .end_ms = stmt.optional_int64(2)});
  }
  if (rc != SQLITE_DONE) {
    return failed<std::vector<SessionRow>>(stmt.step_error(rc));
  }
  return common::Result<std::vector<SessionRow>>::success(std::move(rows));
}

common::Result<std::vector<AppUsageRow>>
SqliteActivityStore::app_usage(const TimestampMs since_ms, const TimestampMs until_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::vector<AppUsageRow>>::failure(common::ErrorKind::StoreUnavailable,
                                                             "database not initialized");
  }

  Statement stmt(db_, R"(
SELECT
  p.name,
  COUNT(w.id),
  COALESCE(SUM(MAX(0, MIN(w.last_seen, ?2) - MAX(w.first_seen, ?1))), 0),
  COALESCE(SUM(
    (SELECT COALESCE(SUM(k.count), 0) FROM keystroke_batches k
      WHERE k.window_id = w.id AND k.recorded_at BETWEEN ?1 AND ?2) +
    (SELECT COUNT(*) FROM pointer_events e
      WHERE e.window_id = w.id AND e.recorded_at BETWEEN ?1 AND ?2)), 0)
FROM windows w
JOIN processes p ON p.id = w.process_id
WHERE w.last_seen >= ?1 AND w.first_seen <= ?2
GROUP BY p.name
ORDER BY p.name ASC
)");
  if (!stmt.ok()) {
    return failed<std::vector<AppUsageRow>>(stmt.prepare_status());
  }
  stmt.bind(1, since_ms);
  stmt.bind(2, until_ms);

  std::vector<AppUsageRow> rows;
  int rc = SQLITE_ROW;
  while ((rc = stmt.step()) == SQLITE_ROW) {
    rows.push_back(AppUsageRow{.name = stmt.text(0),
                               .window_count = static_cast<std::uint64_t>(stmt.int64(1)),
                               .duration_ms = stmt.int64(2),
                               .event_count = static_cast<std::uint64_t>(stmt.int64(3))});
  }
  if (rc != SQLITE_DONE) {
    return failed<std::vector<AppUsageRow>>(stmt.step_error(rc));
  }
  return common::Result<std::vector<AppUsageRow>>::success(std::move(rows));
}

common::Result<HourlyKeystrokes>
SqliteActivityStore::hourly_keystrokes(const TimestampMs since_ms, const TimestampMs until_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<HourlyKeystrokes>::failure(common::ErrorKind::StoreUnavailable,
                                                     "database not initialized");
  }

  Statement stmt(db_, R"(
SELECT CAST(strftime('%H', recorded_at / 1000, 'unixepoch', 'localtime') AS INTEGER) AS hour,
       COALESCE(SUM(count), 0)
FROM keystroke_batches
WHERE recorded_at BETWEEN ?1 AND ?2
GROUP BY hour
)");
  if (!stmt.ok()) {
    return failed<HourlyKeystrokes>(stmt.prepare_status());
  }
  stmt.bind(1, since_ms);
  stmt.bind(2, until_ms);

  HourlyKeystrokes hours{};
  int rc = SQLITE_ROW;
  while ((rc = stmt.step()) == SQLITE_ROW) {
    const int hour = stmt.integer(0);
    if (hour >= 0 && hour < 24) {
      hours[static_cast<std::size_t>(hour)] += static_cast<std::uint64_t>(stmt.int64(1));
    }
  }
  if (rc != SQLITE_DONE) {
    return failed<HourlyKeystrokes>(stmt.step_error(rc));
  }
  return common::Result<HourlyKeystrokes>::success(hours);
}

common::Result<std::vector<TimelineRow>>
SqliteActivityStore::recent_windows(const TimestampMs since_ms, const TimestampMs until_ms,
                                    const std::size_t limit) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::vector<TimelineRow>>::failure(common::ErrorKind::StoreUnavailable,
                                                             "database not initialized");
  }

  Statement stmt(db_, R"(
SELECT w.id, w.first_seen, w.title, p.name,
       (SELECT COALESCE(SUM(k.count), 0) FROM keystroke_batches k WHERE k.window_id = w.id)
FROM windows w
JOIN processes p ON p.id = w.process_id
WHERE w.first_seen BETWEEN ?1 AND ?2
ORDER BY w.first_seen DESC, w.id DESC
LIMIT ?3
)");
  if (!stmt.ok()) {
    return failed<std::vector<TimelineRow>>(stmt.prepare_status());
  }
  stmt.bind(1, since_ms);
  stmt.bind(2, until_ms);
  stmt.bind(3, static_cast<std::int64_t>(limit));

  std::vector<TimelineRow> rows;
  int rc = SQLITE_ROW;
  while ((rc = stmt.step()) == SQLITE_ROW) {
    rows.push_back(TimelineRow{.window_id = stmt.int64(0),
                               .first_seen_ms = stmt.int64(1),
                               .title = stmt.text(2),
                               .process_name = stmt.text(3),
                               .keystrokes = static_cast<std::uint64_t>(stmt.int64(4))});
  }
  if (rc != SQLITE_DONE) {
    return failed<std::vector<TimelineRow>>(stmt.step_error(rc));
  }
  return common::Result<std::vector<TimelineRow>>::success(std::move(rows));
}

common::Result<RangeData> SqliteActivityStore::load_range(const TimestampMs since_ms,
                                                          const TimestampMs until_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<RangeData>::failure(common::ErrorKind::StoreUnavailable,
                                              "database not initialized");
  }

  RangeData data;
  int rc = SQLITE_ROW;

  {
    Statement stmt(db_, "SELECT id, start_time, end_time FROM sessions "
                        "WHERE start_time <= ?2 AND (end_time IS NULL OR end_time >= ?1) "
                        "ORDER BY id ASC");
    if (!stmt.ok()) {
      return failed<RangeData>(stmt.prepare_status());
    }
    stmt.bind(1, since_ms);
    stmt.bind(2, until_ms);
    while ((rc = stmt.step()) == SQLITE_ROW) {
      data.sessions.push_back(SessionRow{.id = stmt.int64(0),
                                         .start_ms = stmt.int64(1),
                                         .end_ms = stmt.optional_int64(2)});
    }
    if (rc != SQLITE_DONE) {
      return failed<RangeData>(stmt.step_error(rc));
    }
  }

  {
    Statement stmt(db_, R"(
SELECT id, name, bundle_id, first_seen, last_seen FROM processes
WHERE id IN (SELECT process_id FROM windows WHERE last_seen >= ?1 AND first_seen <= ?2)
ORDER BY id ASC
)");
    if (!stmt.ok()) {
      return failed<RangeData>(stmt.prepare_status());
    }
    stmt.bind(1, since_ms);
    stmt.bind(2, until_ms);
    while ((rc = stmt.step()) == SQLITE_ROW) {
      data.processes.push_back(ProcessRow{.id = stmt.int64(0),
                                          .name = stmt.text(1),
                                          .bundle_id = stmt.text(2),
                                          .first_seen_ms = stmt.int64(3),
                                          .last_seen_ms = stmt.int64(4)});
    }
    if (rc != SQLITE_DONE) {
      return failed<RangeData>(stmt.step_error(rc));
    }
  }

  {
    Statement stmt(db_, R"(
SELECT id, process_id, title, pid, x, y, width, height, first_seen, last_seen FROM windows
WHERE last_seen >= ?1 AND first_seen <= ?2
ORDER BY first_seen ASC, id ASC
)");
    if (!stmt.ok()) {
      return failed<RangeData>(stmt.prepare_status());
    }
    stmt.bind(1, since_ms);
    stmt.bind(2, until_ms);
    while ((rc = stmt.step()) == SQLITE_ROW) {
      data.windows.push_back(WindowRow{.id = stmt.int64(0),
                                       .process_id = stmt.int64(1),
                                       .title = stmt.text(2),
                                       .pid = stmt.int64(3),
                                       .x = stmt.integer(4),
                                       .y = stmt.integer(5),
                                       .width = stmt.integer(6),
                                       .height = stmt.integer(7),
                                       .first_seen_ms = stmt.int64(8),
                                       .last_seen_ms = stmt.int64(9)});
    }
    if (rc != SQLITE_DONE) {
      return failed<RangeData>(stmt.step_error(rc));
    }
  }

  {
    Statement stmt(db_, R"(
SELECT id, window_id, payload, encrypted, modifiers, count, recorded_at FROM keystroke_batches
WHERE recorded_at BETWEEN ?1 AND ?2
ORDER BY recorded_at ASC, id ASC
)");
    if (!stmt.ok()) {
      return failed<RangeData>(stmt.prepare_status());
    }
    stmt.bind(1, since_ms);
    stmt.bind(2, until_ms);
    while ((rc = stmt.step()) == SQLITE_ROW) {
      data.keystrokes.push_back(
          StoredKeystrokeRow{.id = stmt.int64(0),
                             .window_id = stmt.optional_int64(1),
                             .payload = stmt.text(2),
                             .encrypted = stmt.integer(3) != 0,
                             .modifiers = stmt.text(4),
                             .count = static_cast<std::uint32_t>(stmt.int64(5)),
                             .recorded_at_ms = stmt.int64(6)});
    }
    if (rc != SQLITE_DONE) {
      return failed<RangeData>(stmt.step_error(rc));
    }
  }

  {
    Statement stmt(db_, R"(
SELECT id, window_id, x, y, button, event_type, recorded_at FROM pointer_events
WHERE recorded_at BETWEEN ?1 AND ?2
ORDER BY recorded_at ASC, id ASC
)");
    if (!stmt.ok()) {
      return failed<RangeData>(stmt.prepare_status());
    }
    stmt.bind(1, since_ms);
    stmt.bind(2, until_ms);
    while ((rc = stmt.step()) == SQLITE_ROW) {
      data.pointer_events.push_back(PointerRow{
          .id = stmt.int64(0),
          .window_id = stmt.optional_int64(1),
          .x = stmt.integer(2),
          .y = stmt.integer(3),
          .button = stmt.integer(4),
          .type = capture::pointer_event_type_from_string(stmt.text(5))
                      .value_or(capture::PointerEventType::Click),
          .recorded_at_ms = stmt.int64(6)});
    }
    if (rc != SQLITE_DONE) {
      return failed<RangeData>(stmt.step_error(rc));
    }
  }

  return common::Result<RangeData>::success(std::move(data));
}

common::Result<PurgeReport> SqliteActivityStore::purge_before(const TimestampMs cutoff_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<PurgeReport>::failure(common::ErrorKind::StoreUnavailable,
                                                "database not initialized");
  }

  const std::pair<const char *, std::uint64_t PurgeReport::*> steps[] = {
      {"DELETE FROM keystroke_batches WHERE recorded_at < ?1", &PurgeReport::keystrokes},
      {"DELETE FROM pointer_events WHERE recorded_at < ?1", &PurgeReport::pointer_events},
      {"DELETE FROM windows WHERE last_seen < ?1 "
       "AND NOT EXISTS (SELECT 1 FROM keystroke_batches k WHERE k.window_id = windows.id) "
       "AND NOT EXISTS (SELECT 1 FROM pointer_events e WHERE e.window_id = windows.id)",
       &PurgeReport::windows},
      {"DELETE FROM processes WHERE last_seen < ?1 "
       "AND NOT EXISTS (SELECT 1 FROM windows w WHERE w.process_id = processes.id)",
       &PurgeReport::processes},
      {"DELETE FROM sessions WHERE end_time IS NOT NULL AND end_time < ?1",
       &PurgeReport::sessions},
  };

  PurgeReport report;
  auto status = exec_sql(db_, "BEGIN IMMEDIATE;");
  for (const auto &[sql, field] : steps) {
    if (!status.ok()) {
      break;
    }
    Statement stmt(db_, sql);
    status = stmt.prepare_status();
    if (status.ok()) {
      stmt.bind(1, cutoff_ms);
      status = stmt.run();
    }
    if (status.ok()) {
      report.*field = static_cast<std::uint64_t>(sqlite3_changes(db_));
    }
  }
  if (status.ok()) {
    status = exec_sql(db_, "COMMIT;");
  }
  if (!status.ok()) {
    rollback_locked();
    return failed<PurgeReport>(status);
  }

  status = exec_sql(db_, "VACUUM;");
  if (!status.ok()) {
    return failed<PurgeReport>(status);
  }
  return common::Result<PurgeReport>::success(report);
}

void SqliteActivityStore::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ != nullptr) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

} // namespace selfspy::store
