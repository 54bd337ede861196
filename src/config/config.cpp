#include "selfspy/config/config.hpp"

#include "selfspy/common/fs.hpp"
#include "selfspy/common/toml.hpp"

#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <sstream>

namespace selfspy::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".selfspy";
constexpr const char *CONFIG_FILENAME = "config.toml";
constexpr const char *DATABASE_FILENAME = "selfspy.db";
constexpr const char *KEY_CHECK_FILENAME = "password.digest";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("SELFSPY_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

const char *env_value(const char *name) {
  const char *value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return nullptr;
  }
  return value;
}

bool parse_env_bool(const std::string &raw, bool fallback) {
  const std::string value = common::to_lower(common::trim(raw));
  if (value == "1" || value == "true" || value == "yes" || value == "on") {
    return true;
  }
  if (value == "0" || value == "false" || value == "no" || value == "off") {
    return false;
  }
  return fallback;
}

std::string bool_to_toml(bool value) { return value ? "true" : "false"; }

template <typename T> T get_unsigned(const common::TomlDocument &doc, const std::string &key,
                                     T fallback) {
  return static_cast<T>(doc.get_u64(key, static_cast<std::uint64_t>(fallback)));
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    const std::filesystem::path &candidate = *override_path;
    if (std::filesystem::is_directory(candidate, ec) || candidate.filename().empty()) {
      return common::ensure_dir(candidate);
    }

    auto parent = candidate.parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            common::ErrorKind::Io, "unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.kind(), home.error());
  }
  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.kind(), cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  return path.ok() && std::filesystem::exists(path.value());
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

std::filesystem::path resolved_data_dir(const Config &config) {
  return std::filesystem::path(common::expand_path(config.data_dir));
}

std::filesystem::path resolved_database_path(const Config &config) {
  const std::string configured = common::trim(config.database.path);
  if (configured.empty()) {
    return resolved_data_dir(config) / DATABASE_FILENAME;
  }
  if (configured == ":memory:") {
    return std::filesystem::path(configured);
  }
  return std::filesystem::path(common::expand_path(configured));
}

std::filesystem::path resolved_key_check_path(const Config &config) {
  const std::string configured = common::trim(config.encryption.key_check_file);
  if (configured.empty()) {
    return resolved_data_dir(config) / KEY_CHECK_FILENAME;
  }
  return std::filesystem::path(common::expand_path(configured));
}

void apply_env_overrides(Config &config) {
  if (const char *dir = env_value("SELFSPY_DATA_DIR"); dir != nullptr) {
    config.data_dir = dir;
  }
  if (const char *db = env_value("SELFSPY_DB_PATH"); db != nullptr) {
    config.database.path = db;
  }
  if (const char *enc = env_value("SELFSPY_ENCRYPTION"); enc != nullptr) {
    config.encryption.enabled = parse_env_bool(enc, config.encryption.enabled);
  }
  if (const char *interval = env_value("SELFSPY_FLUSH_INTERVAL_MS"); interval != nullptr) {
    const std::string raw = common::trim(interval);
    std::uint64_t parsed = 0;
    const auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), parsed);
    if (ec == std::errc() && ptr == raw.data() + raw.size()) {
      config.flush.interval_ms = parsed;
    }
  }
  if (const char *backend = env_value("SELFSPY_OBSERVABILITY"); backend != nullptr) {
    config.observability.backend = backend;
  }
}

common::Result<Config> parse_config(const std::string &toml) {
  const auto parsed = common::parse_toml(toml);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(common::ErrorKind::Config, parsed.error());
  }
  const auto &doc = parsed.value();

  Config config;
  config.data_dir = doc.get_string("data_dir", config.data_dir);

  auto &db = config.database;
  db.path = doc.get_string("database.path", db.path);
  db.busy_timeout_ms = get_unsigned(doc, "database.busy_timeout_ms", db.busy_timeout_ms);
  db.retention_days = get_unsigned(doc, "database.retention_days", db.retention_days);

  auto &buffer = config.buffer;
  buffer.flush_threshold = get_unsigned(doc, "buffer.flush_threshold", buffer.flush_threshold);
  buffer.soft_cap = get_unsigned(doc, "buffer.soft_cap", buffer.soft_cap);
  buffer.hard_cap = get_unsigned(doc, "buffer.hard_cap", buffer.hard_cap);
  buffer.keystroke_coalesce_ms =
      doc.get_u64("buffer.keystroke_coalesce_ms", buffer.keystroke_coalesce_ms);

  auto &flush = config.flush;
  flush.interval_ms = doc.get_u64("flush.interval_ms", flush.interval_ms);
  flush.max_attempts = get_unsigned(doc, "flush.max_attempts", flush.max_attempts);
  flush.initial_backoff_ms = doc.get_u64("flush.initial_backoff_ms", flush.initial_backoff_ms);
  flush.max_backoff_ms = doc.get_u64("flush.max_backoff_ms", flush.max_backoff_ms);
  flush.attempt_timeout_ms = doc.get_u64("flush.attempt_timeout_ms", flush.attempt_timeout_ms);

  config.encryption.enabled = doc.get_bool("encryption.enabled", config.encryption.enabled);
  config.encryption.key_check_file =
      doc.get_string("encryption.key_check_file", config.encryption.key_check_file);

  auto &monitoring = config.monitoring;
  monitoring.capture_text = doc.get_bool("monitoring.capture_text", monitoring.capture_text);
  monitoring.capture_pointer =
      doc.get_bool("monitoring.capture_pointer", monitoring.capture_pointer);
  monitoring.capture_moves = doc.get_bool("monitoring.capture_moves", monitoring.capture_moves);
  monitoring.capture_windows =
      doc.get_bool("monitoring.capture_windows", monitoring.capture_windows);

  auto &privacy = config.privacy;
  privacy.private_mode = doc.get_bool("privacy.private_mode", privacy.private_mode);
  privacy.excluded_apps = doc.get_string_array("privacy.excluded_apps", privacy.excluded_apps);
  privacy.excluded_bundles =
      doc.get_string_array("privacy.excluded_bundles", privacy.excluded_bundles);

  config.stats.top_apps_limit =
      get_unsigned(doc, "stats.top_apps_limit", config.stats.top_apps_limit);
  config.stats.timeline_limit =
      get_unsigned(doc, "stats.timeline_limit", config.stats.timeline_limit);
  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.kind(), cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  if (!std::filesystem::exists(path)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  const auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure(common::ErrorKind::Config,
                                           "Unable to open config file: " + path.string());
  }

  auto config = parse_config(content.value());
  if (!config.ok()) {
    return common::Result<Config>::failure(config.kind(),
                                           path.string() + ": " + config.error());
  }
  apply_env_overrides(config.value());
  return config;
}

std::string render_config(const Config &config) {
  std::ostringstream out;
  out << "data_dir = " << common::quote_toml_string(config.data_dir) << "\n";

  out << "\n[database]\n";
  out << "path = " << common::quote_toml_string(config.database.path) << "\n";
  out << "busy_timeout_ms = " << config.database.busy_timeout_ms << "\n";
  out << "retention_days = " << config.database.retention_days << "\n";

  out << "\n[buffer]\n";
  out << "flush_threshold = " << config.buffer.flush_threshold << "\n";
  out << "soft_cap = " << config.buffer.soft_cap << "\n";
  out << "hard_cap = " << config.buffer.hard_cap << "\n";
  out << "keystroke_coalesce_ms = " << config.buffer.keystroke_coalesce_ms << "\n";

  out << "\n[flush]\n";
  out << "interval_ms = " << config.flush.interval_ms << "\n";
  out << "max_attempts = " << config.flush.max_attempts << "\n";
  out << "initial_backoff_ms = " << config.flush.initial_backoff_ms << "\n";
  out << "max_backoff_ms = " << config.flush.max_backoff_ms << "\n";
  out << "attempt_timeout_ms = " << config.flush.attempt_timeout_ms << "\n";

  out << "\n[encryption]\n";
  out << "enabled = " << bool_to_toml(config.encryption.enabled) << "\n";
  out << "key_check_file = " << common::quote_toml_string(config.encryption.key_check_file)
      << "\n";

  out << "\n[monitoring]\n";
  out << "capture_text = " << bool_to_toml(config.monitoring.capture_text) << "\n";
  out << "capture_pointer = " << bool_to_toml(config.monitoring.capture_pointer) << "\n";
  out << "capture_moves = " << bool_to_toml(config.monitoring.capture_moves) << "\n";
  out << "capture_windows = " << bool_to_toml(config.monitoring.capture_windows) << "\n";

  out << "\n[privacy]\n";
  out << "private_mode = " << bool_to_toml(config.privacy.private_mode) << "\n";
  out << "excluded_apps = " << common::toml_string_array(config.privacy.excluded_apps) << "\n";
  out << "excluded_bundles = " << common::toml_string_array(config.privacy.excluded_bundles)
      << "\n";

  out << "\n[stats]\n";
  out << "top_apps_limit = " << config.stats.top_apps_limit << "\n";
  out << "timeline_limit = " << config.stats.timeline_limit << "\n";

  out << "\n[observability]\n";
  out << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";
  return out.str();
}

common::Status save_config(const Config &config) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Status::error(cfg_path_result.kind(), cfg_path_result.error());
  }
  return common::write_file_atomic(cfg_path_result.value(), render_config(config));
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using Warnings = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  if (common::trim(config.data_dir).empty()) {
    return Warnings::failure(common::ErrorKind::Config, "data_dir must not be empty");
  }

  const auto &buffer = config.buffer;
  if (buffer.flush_threshold == 0) {
    return Warnings::failure(common::ErrorKind::Config, "buffer.flush_threshold must be > 0");
  }
  if (buffer.soft_cap < buffer.flush_threshold) {
    return Warnings::failure(common::ErrorKind::Config,
                             "buffer.soft_cap must be >= buffer.flush_threshold");
  }
  if (buffer.hard_cap < buffer.soft_cap) {
    return Warnings::failure(common::ErrorKind::Config,
                             "buffer.hard_cap must be >= buffer.soft_cap");
  }

  const auto &flush = config.flush;
  if (flush.interval_ms == 0) {
    return Warnings::failure(common::ErrorKind::Config, "flush.interval_ms must be > 0");
  }
  if (flush.max_attempts == 0) {
    return Warnings::failure(common::ErrorKind::Config, "flush.max_attempts must be >= 1");
  }
  if (flush.attempt_timeout_ms == 0) {
    return Warnings::failure(common::ErrorKind::Config, "flush.attempt_timeout_ms must be > 0");
  }
  if (flush.max_backoff_ms < flush.initial_backoff_ms) {
    warnings.push_back("flush.max_backoff_ms is below flush.initial_backoff_ms");
  }
  if (flush.interval_ms < 100) {
    warnings.push_back("flush.interval_ms below 100ms causes near-continuous store writes");
  }

  if (config.stats.top_apps_limit == 0) {
    warnings.push_back("stats.top_apps_limit is 0; top apps will always be empty");
  }
  if (!config.encryption.enabled) {
    warnings.push_back("encryption is disabled; keystrokes are stored as plaintext");
  }
  if (!config.monitoring.capture_text && config.privacy.private_mode) {
    warnings.push_back("privacy.private_mode has no effect while monitoring.capture_text is off");
  }

  std::stringstream backends(config.observability.backend);
  std::string part;
  while (std::getline(backends, part, ',')) {
    const std::string backend = common::to_lower(common::trim(part));
    if (!backend.empty() && backend != "log" && backend != "none" && backend != "noop") {
      return Warnings::failure(common::ErrorKind::Config,
                               "Invalid observability.backend: " + backend);
    }
  }

  return Warnings::success(std::move(warnings));
}

} // namespace selfspy::config
