#pragma once

#include <chrono>
#include <functional>

namespace vodbridge::util {

/*
  Time utilities: the one place clocks come from.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Injectable wall clock (cache expiry).
using ClockFn = std::function<TimePoint()>;

// Injectable monotonic clock (elapsed-time measurement).
using SteadyFn = std::function<std::chrono::steady_clock::time_point()>;

TimePoint Now();
std::chrono::steady_clock::time_point SteadyNow();

double    ToUnixSeconds(TimePoint tp);
TimePoint FromUnixSeconds(double seconds);

double ElapsedMs(std::chrono::steady_clock::time_point start, std::chrono::steady_clock::time_point end);

} // namespace vodbridge::util
