#include "time.hpp"

#include <cstdio>
#include <ctime>

namespace trajectory::util {

TimePoint Now() {
  return Clock::now();
}

std::int64_t ToUnixMicros(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMicros(std::int64_t micros) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::microseconds(micros));
}

std::uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::string FormatUtc(TimePoint tp) {
  const auto        millis  = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
  const std::time_t seconds = static_cast<std::time_t>(millis / 1000);

  std::tm utc{};
  gmtime_r(&seconds, &utc);

  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday, utc.tm_hour,
                utc.tm_min, utc.tm_sec, static_cast<int>(millis % 1000));
  return buffer;
}

double DurationSeconds(TimePoint started_at, TimePoint completed_at) {
  if (started_at == TimePoint{} || completed_at == TimePoint{}) {
    return 0.0;
  }
  return std::chrono::duration<double>(completed_at - started_at).count();
}

} // namespace trajectory::util
