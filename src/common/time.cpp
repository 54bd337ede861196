#include "selfspy/common/time.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace selfspy::common {

TimestampMs now_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::string format_rfc3339_ms(const TimestampMs ts) {
  TimestampMs seconds = ts / 1000;
  TimestampMs millis = ts % 1000;
  if (millis < 0) {
    millis += 1000;
    --seconds;
  }

  const auto raw = static_cast<std::time_t>(seconds);
  std::tm tm{};
  gmtime_r(&raw, &tm);

  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis << 'Z';
  return out.str();
}

} // namespace selfspy::common
