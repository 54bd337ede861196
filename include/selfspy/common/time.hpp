#pragma once

#include <cstdint>
#include <string>

namespace selfspy::common {

/// Unix epoch milliseconds (UTC).
using TimestampMs = std::int64_t;

inline constexpr TimestampMs kMsPerDay = 86'400'000;

[[nodiscard]] TimestampMs now_ms();

/// `2024-05-01T12:30:00.250Z`
[[nodiscard]] std::string format_rfc3339_ms(TimestampMs ts);

} // namespace selfspy::common
