#pragma once

#include "selfspy/common/result.hpp"
#include "selfspy/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace selfspy::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

[[nodiscard]] std::filesystem::path resolved_data_dir(const Config &config);
[[nodiscard]] std::filesystem::path resolved_database_path(const Config &config);
[[nodiscard]] std::filesystem::path resolved_key_check_path(const Config &config);

[[nodiscard]] common::Result<Config> parse_config(const std::string &toml);
[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] std::string render_config(const Config &config);
[[nodiscard]] common::Status save_config(const Config &config);

/// Fails on values the engine cannot run with; returns warnings otherwise.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace selfspy::config
