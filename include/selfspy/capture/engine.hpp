#pragma once

#include "selfspy/capture/codec.hpp"
#include "selfspy/capture/event_buffer.hpp"
#include "selfspy/capture/events.hpp"
#include "selfspy/capture/flush_coordinator.hpp"
#include "selfspy/capture/privacy_filter.hpp"
#include "selfspy/common/result.hpp"
#include "selfspy/config/schema.hpp"
#include "selfspy/stats/exporter.hpp"
#include "selfspy/stats/stats_aggregator.hpp"
#include "selfspy/store/activity_store.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace selfspy::capture {

struct EngineStatus {
  bool monitoring_active = false;
  std::size_t buffered_count = 0;
  BufferCounters counters;
  TimestampMs last_activity_ms = 0;
  std::optional<std::int64_t> session_id;
  std::string last_error;
};

/// The activity monitor. Producers call the on_* entry points from any
/// thread; a background task moves buffered records into the store.
class Engine {
public:
  Engine(config::Config config, std::unique_ptr<store::IActivityStore> store,
         std::optional<SecretKey> key = std::nullopt);
  ~Engine();

  Engine(const Engine &) = delete;
  Engine &operator=(const Engine &) = delete;

  [[nodiscard]] common::Status start();
  /// Stops accepting events, waits for the final flush, closes the store.
  [[nodiscard]] common::Status stop();
  [[nodiscard]] bool is_running() const { return accepting_.load(); }

  void on_keystroke(KeyEvent event);
  void on_keystroke(std::string text, std::vector<std::string> modifiers,
                    std::optional<WindowKey> window, TimestampMs timestamp_ms);
  void on_pointer_event(PointerEvent event);
  void on_pointer_event(int x, int y, int button, PointerEventType type,
                        std::optional<WindowKey> window, TimestampMs timestamp_ms);
  void on_window_change(const WindowEvent &event);
  void on_window_change(std::string title, std::string process_name, std::int64_t pid,
                        std::optional<std::string> bundle_id, int x, int y, int width, int height,
                        TimestampMs timestamp_ms);
  void record(const ActivityEvent &event);

  [[nodiscard]] EngineStatus status() const;
  [[nodiscard]] common::Result<stats::ActivityStats> get_stats(int days) const;
  [[nodiscard]] common::Result<std::string> export_range(int days,
                                                         stats::ExportFormat format) const;
  [[nodiscard]] common::Result<FlushReport> flush();
  [[nodiscard]] common::Result<store::PurgeReport> purge_older_than(int days);
  [[nodiscard]] FlushMetrics flush_metrics() const;

  void set_supervisor(SupervisorCallback callback);

  [[nodiscard]] const config::Config &config() const { return config_; }

private:
  void handle_outcome(AddOutcome outcome, const char *kind);
  void note_error(const std::string &component, const std::string &message);
  void on_flush_escalation(const common::Status &status);

  config::Config config_;
  std::unique_ptr<store::IActivityStore> store_;
  std::optional<Codec> codec_;
  EventBuffer buffer_;
  PrivacyFilter filter_;
  FlushCoordinator coordinator_;
  stats::StatsAggregator stats_;
  stats::Exporter exporter_;

  std::atomic<bool> accepting_{false};
  std::mutex lifecycle_mutex_;
  mutable std::mutex error_mutex_;
  std::string last_error_;
  SupervisorCallback supervisor_;
};

/// Opens the SQLite store at the configured database path and installs the
/// configured observer when none is set yet.
[[nodiscard]] common::Result<std::unique_ptr<Engine>>
create_engine(const config::Config &config, std::optional<SecretKey> key = std::nullopt);

} // namespace selfspy::capture
