#ifndef TIME_UTILS_H
#define TIME_UTILS_H

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace TimeUtils {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// UTC, ISO-8601 with millisecond precision: 2024-01-01T12:00:00.000Z
inline std::string toIsoString(TimePoint tp) {
  auto time_t = Clock::to_time_t(tp);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                tp.time_since_epoch()) %
            1000;
  if (ms.count() < 0) {
    ms += std::chrono::milliseconds(1000);
  }

  std::tm tm_buf{};
  if (!gmtime_r(&time_t, &tm_buf)) {
    return "";
  }

  std::ostringstream ss;
  ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
  ss << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z";
  return ss.str();
}

inline std::string getCurrentTimestamp() { return toIsoString(Clock::now()); }

template <typename Duration> double toSeconds(Duration duration) {
  return std::chrono::duration_cast<std::chrono::duration<double>>(duration)
      .count();
}

} // namespace TimeUtils

#endif
