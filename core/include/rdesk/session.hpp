#pragma once
#include "clock.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace rdesk {

enum class SessionState {
  Unauthenticated,
  AuthPending,
  Authenticated,
  Expired,
  LoggedOut,
  Disconnected,
};

const char *to_string(SessionState s);

struct Session {
  std::string token; // hex of 32 random bytes
  std::string identity;
  TimePoint created_at;
  TimePoint expires_at;
};

enum class TokenStatus { Valid, Expired, Unknown };

// Token -> session table shared by every connection.
class SessionManager {
public:
  explicit SessionManager(int ttl_sec = 3600, ClockFn clock = system_clock_fn())
      : ttl_(std::chrono::seconds(ttl_sec)), clock_(std::move(clock)) {}

  Session create(const std::string &identity);

  // Valid iff now < expires_at. An expired entry is purged on lookup.
  TokenStatus check(const std::string &token);
  std::optional<Session> lookup(const std::string &token);

  bool revoke(const std::string &token);
  size_t purge_expired();
  size_t size() const;

  std::chrono::seconds ttl() const { return ttl_; }
  TimePoint now() const { return clock_(); }

private:
  mutable std::mutex mu_;
  std::map<std::string, Session> sessions_;
  std::chrono::seconds ttl_;
  ClockFn clock_;
};

} // namespace rdesk
