#pragma once

#include <string>

namespace selfspy::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Quote a CSV field when it contains a separator, quote or line break.
[[nodiscard]] std::string csv_field(const std::string &value);

/// Single-quoted SQL string literal with embedded quotes doubled.
[[nodiscard]] std::string sql_quote(const std::string &value);

} // namespace selfspy::common
