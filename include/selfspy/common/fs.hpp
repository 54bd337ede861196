#pragma once

#include "selfspy/common/result.hpp"
#include <filesystem>
#include <string>

namespace selfspy::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

/// Write `content` to `path` through a sibling temp file and rename.
[[nodiscard]] Status write_file_atomic(const std::filesystem::path &path,
                                       const std::string &content);
[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);

} // namespace selfspy::common
