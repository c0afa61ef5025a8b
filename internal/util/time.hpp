#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace muse::util {

/*
  Time utilities. Components that make time-dependent decisions take a
  ClockFn so tests can pin "now".
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using ClockFn   = std::function<TimePoint()>;

TimePoint Now();

int64_t   ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(int64_t ms);

// ISO-8601 UTC with millisecond precision, e.g. 2026-01-02T03:04:05.678Z
std::string ToIso8601(TimePoint tp);

// Minutes since local midnight.
int LocalMinuteOfDay(TimePoint tp);

// Days since the Unix epoch, UTC. Used as the daily-quota key.
int64_t UtcDayNumber(TimePoint tp);

} // namespace muse::util
