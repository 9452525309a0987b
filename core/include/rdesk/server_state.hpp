#pragma once
#include "capability.hpp"
#include "clock.hpp"
#include "config.hpp"
#include "credentials.hpp"
#include "file_transfer.hpp"
#include "rate_limiter.hpp"
#include "session.hpp"

#include <atomic>
#include <memory>

namespace rdesk {

// Everything connections share. Owned by the daemon (or a test) and passed
// by reference; each member does its own locking.
struct ServerState {
  ServerState(ServerConfig cfg, std::shared_ptr<ICapability> cap,
              ClockFn clk = system_clock_fn())
      : config(std::move(cfg)), capability(std::move(cap)),
        clock(std::move(clk)), credentials(config.users_file),
        sessions(config.session_ttl_sec, clock),
        auth_limiter((size_t)config.max_auth_failures,
                     std::chrono::seconds(config.auth_window_sec), clock),
        chunk_limiter((size_t)config.chunk_rate_max,
                      std::chrono::milliseconds(config.chunk_window_ms),
                      clock),
        resumes(clock), started_at(clock()) {}

  ServerConfig config;
  std::shared_ptr<ICapability> capability;
  ClockFn clock;

  CredentialStore credentials;
  SessionManager sessions;
  SlidingWindowLimiter auth_limiter;  // peer address, failures only
  SlidingWindowLimiter chunk_limiter; // "conn:<id>"
  ResumeRegistry resumes;

  std::atomic<int> active_connections{0};
  std::atomic<std::uint64_t> next_connection_id{1};
  TimePoint started_at;
};

} // namespace rdesk
