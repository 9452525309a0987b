#include "rdesk/session.hpp"
#include "rdesk/crypto.hpp"
#include "rdesk/encoding.hpp"
#include "rdesk/logger.hpp"

namespace rdesk {

const char *to_string(SessionState s) {
  switch (s) {
  case SessionState::Unauthenticated: return "Unauthenticated";
  case SessionState::AuthPending: return "AuthPending";
  case SessionState::Authenticated: return "Authenticated";
  case SessionState::Expired: return "Expired";
  case SessionState::LoggedOut: return "LoggedOut";
  case SessionState::Disconnected: return "Disconnected";
  }
  return "Unknown";
}

Session SessionManager::create(const std::string &identity) {
  Session s;
  s.identity = identity;
  s.created_at = clock_();
  s.expires_at = s.created_at + ttl_;

  std::lock_guard<std::mutex> lk(mu_);
  // 256-bit tokens do not collide in practice; loop keeps the table unique.
  do {
    s.token = hex_encode(crypto::generate_token());
  } while (sessions_.count(s.token));
  sessions_.emplace(s.token, s);
  LOG_DEBUG("Session created for " + identity);
  return s;
}

TokenStatus SessionManager::check(const std::string &token) {
  auto now = clock_();
  std::lock_guard<std::mutex> lk(mu_);
  auto it = sessions_.find(token);
  if (it == sessions_.end())
    return TokenStatus::Unknown;
  if (now >= it->second.expires_at) {
    LOG_DEBUG("Session expired for " + it->second.identity);
    sessions_.erase(it);
    return TokenStatus::Expired;
  }
  return TokenStatus::Valid;
}

std::optional<Session> SessionManager::lookup(const std::string &token) {
  auto now = clock_();
  std::lock_guard<std::mutex> lk(mu_);
  auto it = sessions_.find(token);
  if (it == sessions_.end())
    return std::nullopt;
  if (now >= it->second.expires_at) {
    sessions_.erase(it);
    return std::nullopt;
  }
  return it->second;
}

bool SessionManager::revoke(const std::string &token) {
  std::lock_guard<std::mutex> lk(mu_);
  return sessions_.erase(token) > 0;
}

size_t SessionManager::purge_expired() {
  auto now = clock_();
  std::lock_guard<std::mutex> lk(mu_);
  size_t n = 0;
  for (auto it = sessions_.begin(); it != sessions_.end();) {
    if (now >= it->second.expires_at) {
      it = sessions_.erase(it);
      n++;
    } else {
      ++it;
    }
  }
  return n;
}

size_t SessionManager::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return sessions_.size();
}

} // namespace rdesk
