#ifndef WELLWATCH_CORE_TIME_UTILS_HPP_
#define WELLWATCH_CORE_TIME_UTILS_HPP_

#include <chrono>
#include <cmath>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace wellwatch::core {

// Telemetry timestamps travel as fractional epoch seconds. The conversion keeps
// millisecond resolution, which is what sinks and logs render.
inline std::chrono::system_clock::time_point EpochSecondsToTimePoint(double epoch_seconds) {
  const auto millis = static_cast<std::int64_t>(std::llround(epoch_seconds * 1000.0));
  return std::chrono::system_clock::time_point(std::chrono::milliseconds(millis));
}

// Canonical UTC rendering used by logs, alert payloads and CLI summaries.
inline std::string FormatUtcTimestamp(std::chrono::system_clock::time_point timestamp) {
  const auto millis_since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
  const auto millis_component = static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);

  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(timestamp);
  std::tm utc_time{};
#if defined(_WIN32)
  if (gmtime_s(&utc_time, &epoch_seconds) != 0) {
    return "";
  }
#else
  if (gmtime_r(&epoch_seconds, &utc_time) == nullptr) {
    return "";
  }
#endif

  std::ostringstream out;
  out << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis_component << 'Z';
  return out.str();
}

inline std::string FormatEpochSeconds(double epoch_seconds) {
  return FormatUtcTimestamp(EpochSecondsToTimePoint(epoch_seconds));
}

} // namespace wellwatch::core

#endif // WELLWATCH_CORE_TIME_UTILS_HPP_
