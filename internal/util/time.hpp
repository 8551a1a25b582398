#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace millsync::util {

/*
  Time utilities. Everything persisted is unix milliseconds; components that
  need "now" take a Clock so tests can drive time explicitly.
*/

using TimePoint = std::chrono::system_clock::time_point;

TimePoint Now();

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

// Parses "250ms", "30s", "5m", "2h". Throws std::invalid_argument.
std::chrono::milliseconds ParseDuration(const std::string& text);

class Clock {
 public:
  virtual ~Clock() = default;

  virtual TimePoint Now() const = 0;

  uint64_t NowMillis() const {
    return ToUnixMillis(Now());
  }
};

class WallClock final : public Clock {
 public:
  TimePoint Now() const override {
    return util::Now();
  }
};

} // namespace millsync::util
