#include "time.hpp"

namespace vodbridge::util {

TimePoint Now() {
  return Clock::now();
}

std::chrono::steady_clock::time_point SteadyNow() {
  return std::chrono::steady_clock::now();
}

double ToUnixSeconds(TimePoint tp) {
  return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

TimePoint FromUnixSeconds(double seconds) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(seconds));
}

double ElapsedMs(std::chrono::steady_clock::time_point start, std::chrono::steady_clock::time_point end) {
  return std::chrono::duration<double, std::milli>(end - start).count();
}

} // namespace vodbridge::util
