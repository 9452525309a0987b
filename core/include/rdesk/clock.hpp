#pragma once
#include <chrono>
#include <functional>

namespace rdesk {

using SteadyClock = std::chrono::steady_clock;
using TimePoint = SteadyClock::time_point;
using ClockFn = std::function<TimePoint()>;

inline ClockFn system_clock_fn() {
  return [] { return SteadyClock::now(); };
}

inline long long ms_between(TimePoint from, TimePoint to) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(to - from)
      .count();
}

} // namespace rdesk
