#include "time.hpp"

#include <stdexcept>

namespace millsync::util {

TimePoint Now() {
  return std::chrono::system_clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

std::chrono::milliseconds ParseDuration(const std::string& text) {
  std::size_t consumed = 0;
  long long   value    = 0;
  try {
    value = std::stoll(text, &consumed);
  } catch (const std::exception&) {
    throw std::invalid_argument("invalid duration: '" + text + "'");
  }
  if (value < 0) {
    throw std::invalid_argument("negative duration: '" + text + "'");
  }

  const std::string unit = text.substr(consumed);
  if (unit == "ms") return std::chrono::milliseconds(value);
  if (unit == "s") return std::chrono::seconds(value);
  if (unit == "m") return std::chrono::minutes(value);
  if (unit == "h") return std::chrono::hours(value);

  throw std::invalid_argument("invalid duration unit in '" + text + "'");
}

} // namespace millsync::util
