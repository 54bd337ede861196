#pragma once

#include "selfspy/config/schema.hpp"
#include "selfspy/store/activity_store.hpp"

#include <chrono>
#include <filesystem>
#include <mutex>
#include <sqlite3.h>

namespace selfspy::store {

class SqliteActivityStore final : public IActivityStore {
public:
  SqliteActivityStore(std::filesystem::path db_path, config::DatabaseConfig config);
  ~SqliteActivityStore() override;

  SqliteActivityStore(const SqliteActivityStore &) = delete;
  SqliteActivityStore &operator=(const SqliteActivityStore &) = delete;

  [[nodiscard]] std::string_view name() const override { return "sqlite"; }
  [[nodiscard]] bool is_available() override;

  [[nodiscard]] common::Result<std::int64_t> begin_session(TimestampMs start_ms) override;
  [[nodiscard]] common::Status end_session(std::int64_t session_id, TimestampMs end_ms) override;

  [[nodiscard]] common::Result<WriteReport> write_batch(const FlushBatch &batch,
                                                        std::chrono::milliseconds timeout) override;

  [[nodiscard]] common::Result<ActivityCounts> count_activity(TimestampMs since_ms,
                                                              TimestampMs until_ms) override;
  [[nodiscard]] common::Result<std::vector<SessionRow>> session_spans(TimestampMs since_ms,
                                                                      TimestampMs until_ms) override;
  [[nodiscard]] common::Result<std::vector<AppUsageRow>> app_usage(TimestampMs since_ms,
                                                                   TimestampMs until_ms) override;
  [[nodiscard]] common::Result<HourlyKeystrokes> hourly_keystrokes(TimestampMs since_ms,
                                                                   TimestampMs until_ms) override;
  [[nodiscard]] common::Result<std::vector<TimelineRow>>
  recent_windows(TimestampMs since_ms, TimestampMs until_ms, std::size_t limit) override;
  [[nodiscard]] common::Result<RangeData> load_range(TimestampMs since_ms,
                                                     TimestampMs until_ms) override;
  [[nodiscard]] common::Result<PurgeReport> purge_before(TimestampMs cutoff_ms) override;

  void close() override;

  [[nodiscard]] const std::filesystem::path &path() const { return db_path_; }
  [[nodiscard]] const std::string &open_error() const { return open_error_; }

private:
  [[nodiscard]] common::Status init_schema();
  [[nodiscard]] common::Status write_batch_locked(const FlushBatch &batch, WriteReport &report);
  [[nodiscard]] common::Status check_deadline(const char *phase) const;
  void rollback_locked();

  static int progress_callback(void *self);

  std::filesystem::path db_path_;
  config::DatabaseConfig config_;
  sqlite3 *db_ = nullptr;
  std::mutex mutex_;
  std::string open_error_;
  bool deadline_active_ = false;
  std::chrono::steady_clock::time_point deadline_{};
};

} // namespace selfspy::store
