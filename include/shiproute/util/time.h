#pragma once

#include <chrono>
#include <cstdio>
#include <ctime>
#include <string>

namespace shiproute {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Shift a time point by a (fractional) number of seconds, rounded to the clock tick.
inline TimePoint advance_seconds(TimePoint t, double seconds) {
  const auto d = std::chrono::duration<double>(seconds);
  return t + std::chrono::duration_cast<Clock::duration>(d);
}

inline double seconds_between(TimePoint from, TimePoint to) {
  return std::chrono::duration<double>(to - from).count();
}

// "YYYY-MM-DDTHH:MM:SSZ" (UTC, whole seconds).
inline std::string format_utc(TimePoint t) {
  const std::time_t tt = Clock::to_time_t(t);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02dZ", tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                tm.tm_hour, tm.tm_min, tm.tm_sec);
  return std::string(buf);
}

} // namespace shiproute
