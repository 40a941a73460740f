#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace trajectory::util {

/*
  Wall-clock timestamps. Stored as unix microseconds.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

std::int64_t ToUnixMicros(TimePoint tp);
TimePoint    FromUnixMicros(std::int64_t micros);

std::uint64_t ToUnixMillis(TimePoint tp);

// UTC, millisecond precision: 2024-05-01T12:30:45.123Z
std::string FormatUtc(TimePoint tp);

// Seconds between two points; 0 when either is unset.
double DurationSeconds(TimePoint started_at, TimePoint completed_at);

} // namespace trajectory::util
