#pragma once
#include "clock.hpp"
#include <deque>
#include <map>
#include <mutex>
#include <string>

namespace rdesk {

// At most `max_events` per key within any trailing `window`.
class SlidingWindowLimiter {
public:
  SlidingWindowLimiter(size_t max_events, std::chrono::milliseconds window,
                       ClockFn clock = system_clock_fn())
      : max_(max_events), window_(window), clock_(std::move(clock)) {}

  bool is_allowed(const std::string &key);
  void record(const std::string &key);
  // Check and record in one step.
  bool try_acquire(const std::string &key);
  void reset(const std::string &key);
  size_t count(const std::string &key);

private:
  void prune(std::deque<TimePoint> &q, TimePoint now) const;

  std::mutex mu_;
  std::map<std::string, std::deque<TimePoint>> events_;
  size_t max_;
  std::chrono::milliseconds window_;
  ClockFn clock_;
};

} // namespace rdesk
