#include "dqv/core/clock.h"

#include <chrono>
#include <cstdio>
#include <ctime>

namespace dqv::core {

std::string SystemClock::now_iso8601() {
  using std::chrono::duration_cast;
  using std::chrono::milliseconds;

  const auto now = std::chrono::system_clock::now();
  const auto seconds = std::chrono::system_clock::to_time_t(now);
  const auto millis = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;

  std::tm utc{};
  gmtime_r(&seconds, &utc);

  // 2026-01-31T23:59:59.123Z
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", utc.tm_year + 1900,
                utc.tm_mon + 1, utc.tm_mday, utc.tm_hour, utc.tm_min, utc.tm_sec,
                static_cast<int>(millis));
  return buffer;
}

std::string FixedClock::now_iso8601() {
  return fixed_time_;
}

}  // namespace dqv::core
