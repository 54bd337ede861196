#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace selfspy::config {

struct DatabaseConfig {
  // Empty means `<data_dir>/selfspy.db`.
  std::string path;
  std::uint32_t busy_timeout_ms = 5'000;
  // 0 keeps everything.
  std::uint32_t retention_days = 0;
};

struct BufferConfig {
  std::size_t flush_threshold = 2'000;
  std::size_t soft_cap = 5'000;
  std::size_t hard_cap = 50'000;
  std::uint64_t keystroke_coalesce_ms = 1'000;
};

struct FlushConfig {
  std::uint64_t interval_ms = 5'000;
  std::uint32_t max_attempts = 3;
  std::uint64_t initial_backoff_ms = 100;
  std::uint64_t max_backoff_ms = 2'000;
  std::uint64_t attempt_timeout_ms = 5'000;
};

struct EncryptionConfig {
  bool enabled = true;
  // Empty means `<data_dir>/password.digest`.
  std::string key_check_file;
};

struct MonitoringConfig {
  bool capture_text = true;
  bool capture_pointer = true;
  bool capture_moves = true;
  bool capture_windows = true;
};

struct PrivacyConfig {
  bool private_mode = false;
  std::vector<std::string> excluded_apps = {"1Password", "Keychain Access", "System Settings"};
  std::vector<std::string> excluded_bundles = {"com.apple.SecurityAgent",
                                               "com.agilebits.onepassword7"};
};

struct StatsConfig {
  std::size_t top_apps_limit = 10;
  std::size_t timeline_limit = 50;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  std::string data_dir = "~/.selfspy";
  DatabaseConfig database;
  BufferConfig buffer;
  FlushConfig flush;
  EncryptionConfig encryption;
  MonitoringConfig monitoring;
  PrivacyConfig privacy;
  StatsConfig stats;
  ObservabilityConfig observability;
};

} // namespace selfspy::config
