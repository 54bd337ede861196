#include "selfspy/capture/engine.hpp"

#include "selfspy/config/config.hpp"
#include "selfspy/observability/factory.hpp"
#include "selfspy/observability/global.hpp"
#include "selfspy/store/sqlite_store.hpp"

#include <type_traits>
#include <variant>

namespace selfspy::capture {

namespace {

std::optional<Codec> codec_for(const config::Config &config, const std::optional<SecretKey> &key) {
  if (!config.encryption.enabled || !key.has_value()) {
    return std::nullopt;
  }
  return Codec(*key);
}

} // namespace

Engine::Engine(config::Config config, std::unique_ptr<store::IActivityStore> store,
               std::optional<SecretKey> key)
    : config_(std::move(config)), store_(std::move(store)), codec_(codec_for(config_, key)),
      buffer_(config_.buffer), filter_(config_.privacy, config_.monitoring),
      coordinator_(buffer_, *store_, config_.flush, codec_, config_.database.retention_days),
      stats_(*store_, config_.stats.top_apps_limit, config_.stats.timeline_limit),
      exporter_(*store_, stats_) {
  coordinator_.set_supervisor(
      [this](const common::Status &status) { on_flush_escalation(status); });
}

Engine::~Engine() {
  if (accepting_.load() || coordinator_.is_running()) {
    auto status = stop();
    if (!status.ok()) {
      observability::record_error("engine", "stop during teardown: " + status.error());
    }
  }
}

common::Status Engine::start() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (accepting_.load() || coordinator_.is_running()) {
    return common::Status::error(common::ErrorKind::InvalidArgument, "engine already running");
  }

  if (config_.encryption.enabled) {
    if (!codec_.has_value()) {
      return common::Status::error(common::ErrorKind::Encryption,
                                   "encryption is enabled but no key was provided");
    }
    auto checked = verify_or_create_key_check(*codec_, config::resolved_key_check_path(config_));
    if (!checked.ok()) {
      return checked;
    }
  }

  if (!store_->is_available()) {
    return common::Status::error(common::ErrorKind::StoreUnavailable,
                                 std::string("store unavailable: ") + std::string(store_->name()));
  }

  buffer_.reopen();
  auto started = coordinator_.start();
  if (!started.ok()) {
    return started;
  }
  accepting_ = true;
  return common::Status::success();
}

common::Status Engine::stop() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  accepting_ = false;
  // Producers that already passed the accepting_ check must not land after the final drain.
  buffer_.close();
  auto status = coordinator_.stop();
  store_->close();
  return status;
}

void Engine::on_keystroke(KeyEvent event) {
  if (!accepting_.load()) {
    return;
  }
  try {
    if (filter_.check(event).has_value()) {
      return;
    }
    handle_outcome(buffer_.add_keystroke(std::move(event)), "keystroke");
  } catch (const std::exception &e) {
    note_error("capture", std::string("keystroke rejected: ") + e.what());
  }
}

void Engine::on_keystroke(std::string text, std::vector<std::string> modifiers,
                          std::optional<WindowKey> window, const TimestampMs timestamp_ms) {
  on_keystroke(KeyEvent{.text = std::move(text),
                        .modifiers = std::move(modifiers),
                        .window = std::move(window),
                        .timestamp_ms = timestamp_ms});
}

void Engine::on_pointer_event(PointerEvent event) {
  if (!accepting_.load()) {
    return;
  }
  try {
    if (filter_.check(event).has_value()) {
      return;
    }
    handle_outcome(buffer_.add_pointer_event(std::move(event)), "pointer");
  } catch (const std::exception &e) {
    note_error("capture", std::string("pointer event rejected: ") + e.what());
  }
}

void Engine::on_pointer_event(const int x, const int y, const int button,
                              const PointerEventType type, std::optional<WindowKey> window,
                              const TimestampMs timestamp_ms) {
  on_pointer_event(PointerEvent{.x = x,
                                .y = y,
                                .button = button,
                                .type = type,
                                .window = std::move(window),
                                .timestamp_ms = timestamp_ms});
}

void Engine::on_window_change(const WindowEvent &event) {
  if (!accepting_.load()) {
    return;
  }
  try {
    if (filter_.check(event).has_value()) {
      if (filter_.excluded_has_focus()) {
        handle_outcome(buffer_.add_focus_lost(event.timestamp_ms), "window");
      }
      return;
    }
    handle_outcome(buffer_.add_window(event), "window");
  } catch (const std::exception &e) {
    note_error("capture", std::string("window change rejected: ") + e.what());
  }
}

void Engine::on_window_change(std::string title, std::string process_name, const std::int64_t pid,
                              std::optional<std::string> bundle_id, const int x, const int y,
                              const int width, const int height, const TimestampMs timestamp_ms) {
  on_window_change(WindowEvent{.title = std::move(title),
                               .process_name = std::move(process_name),
                               .pid = pid,
                               .bundle_id = std::move(bundle_id).value_or(""),
                               .x = x,
                               .y = y,
                               .width = width,
                               .height = height,
                               .timestamp_ms = timestamp_ms});
}

void Engine::record(const ActivityEvent &event) {
  std::visit(
      [this](const auto &value) {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, KeyEvent>) {
          on_keystroke(value);
        } else if constexpr (std::is_same_v<T, PointerEvent>) {
          on_pointer_event(value);
        } else {
          on_window_change(value);
        }
      },
      event);
}

void Engine::handle_outcome(const AddOutcome outcome, const char *kind) {
  switch (outcome) {
  case AddOutcome::Accepted:
    return;
  case AddOutcome::FlushSuggested:
    coordinator_.request_flush();
    return;
  case AddOutcome::OverSoftCap:
    observability::record_buffer_overflow(buffer_.size(), config_.buffer.soft_cap);
    coordinator_.request_flush();
    return;
  case AddOutcome::Dropped:
    observability::record_event_dropped(kind, "buffer at hard cap");
    observability::record_metric(
        observability::DroppedEventsMetric{.total = buffer_.counters().dropped});
    coordinator_.request_flush();
    return;
  case AddOutcome::Closed:
    observability::record_event_dropped(kind, "engine stopping");
    observability::record_metric(
        observability::DroppedEventsMetric{.total = buffer_.counters().dropped});
    return;
  }
}

void Engine::note_error(const std::string &component, const std::string &message) {
  observability::record_error(component, message);
  std::lock_guard<std::mutex> lock(error_mutex_);
  last_error_ = message;
}

void Engine::on_flush_escalation(const common::Status &status) {
  SupervisorCallback supervisor;
  {
    std::lock_guard<std::mutex> lock(error_mutex_);
    last_error_ = status.error();
    supervisor = supervisor_;
  }
  if (supervisor) {
    supervisor(status);
  }
}

EngineStatus Engine::status() const {
  EngineStatus out;
  out.monitoring_active = accepting_.load();
  out.buffered_count = buffer_.size();
  out.counters = buffer_.counters();
  out.last_activity_ms = out.counters.last_activity_ms;
  out.session_id = coordinator_.session_id();
  std::lock_guard<std::mutex> lock(error_mutex_);
  out.last_error = last_error_;
  return out;
}

common::Result<stats::ActivityStats> Engine::get_stats(const int days) const {
  return stats_.get_stats(days);
}

common::Result<std::string> Engine::export_range(const int days,
                                                 const stats::ExportFormat format) const {
  return exporter_.export_range(days, format);
}

common::Result<FlushReport> Engine::flush() { return coordinator_.flush_now(); }

common::Result<store::PurgeReport> Engine::purge_older_than(const int days) {
  return coordinator_.purge_older_than(days);
}

FlushMetrics Engine::flush_metrics() const { return coordinator_.metrics(); }

void Engine::set_supervisor(SupervisorCallback callback) {
  std::lock_guard<std::mutex> lock(error_mutex_);
  supervisor_ = std::move(callback);
}

common::Result<std::unique_ptr<Engine>> create_engine(const config::Config &config,
                                                      std::optional<SecretKey> key) {
  auto validated = config::validate_config(config);
  if (!validated.ok()) {
    return common::Result<std::unique_ptr<Engine>>::failure(validated.kind(), validated.error());
  }

  if (observability::get_global_observer() == nullptr) {
    observability::set_global_observer(observability::create_observer(config));
  }
  for (const auto &warning : validated.value()) {
    observability::record_error("config", warning);
  }

  auto store = std::make_unique<store::SqliteActivityStore>(config::resolved_database_path(config),
                                                            config.database);
  if (!store->open_error().empty()) {
    return common::Result<std::unique_ptr<Engine>>::failure(common::ErrorKind::StoreUnavailable,
                                                            store->open_error());
  }

  return common::Result<std::unique_ptr<Engine>>::success(
      std::make_unique<Engine>(config, std::move(store), std::move(key)));
}

} // namespace selfspy::capture
