#include "rdesk/rate_limiter.hpp"

namespace rdesk {

void SlidingWindowLimiter::prune(std::deque<TimePoint> &q,
                                 TimePoint now) const {
  while (!q.empty() && now - q.front() >= window_)
    q.pop_front();
}

bool SlidingWindowLimiter::is_allowed(const std::string &key) {
  auto now = clock_();
  std::lock_guard<std::mutex> lk(mu_);
  auto it = events_.find(key);
  if (it == events_.end())
    return max_ > 0;
  prune(it->second, now);
  if (it->second.empty()) {
    events_.erase(it);
    return max_ > 0;
  }
  return it->second.size() < max_;
}

void SlidingWindowLimiter::record(const std::string &key) {
  auto now = clock_();
  std::lock_guard<std::mutex> lk(mu_);
  auto &q = events_[key];
  prune(q, now);
  q.push_back(now);
}

bool SlidingWindowLimiter::try_acquire(const std::string &key) {
  auto now = clock_();
  std::lock_guard<std::mutex> lk(mu_);
  auto &q = events_[key];
  prune(q, now);
  if (q.size() >= max_)
    return false;
  q.push_back(now);
  return true;
}

void SlidingWindowLimiter::reset(const std::string &key) {
  std::lock_guard<std::mutex> lk(mu_);
  events_.erase(key);
}

size_t SlidingWindowLimiter::count(const std::string &key) {
  auto now = clock_();
  std::lock_guard<std::mutex> lk(mu_);
  auto it = events_.find(key);
  if (it == events_.end())
    return 0;
  prune(it->second, now);
  return it->second.size();
}

} // namespace rdesk
