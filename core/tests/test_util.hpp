#pragma once
#include "rdesk/clock.hpp"
#include "rdesk/config.hpp"
#include "rdesk/credentials.hpp"
#include "rdesk/crypto.hpp"
#include "rdesk/encoding.hpp"
#include "rdesk/fake_capability.hpp"
#include "rdesk/server_state.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

namespace rdesk::test {

namespace fs = std::filesystem;

// Cheap derivation for fixtures; production paths use MIN_KDF_ITERATIONS.
inline constexpr std::uint32_t TEST_ITERATIONS = 1000;

// Single-threaded tests drive time explicitly.
struct ManualClock {
  std::shared_ptr<TimePoint> now = std::make_shared<TimePoint>(SteadyClock::now());

  ClockFn fn() const {
    auto p = now;
    return [p] { return *p; };
  }
  void advance(std::chrono::milliseconds d) { *now += d; }
  TimePoint get() const { return *now; }
};

class TempDir {
public:
  TempDir() {
    path_ = fs::temp_directory_path() /
            ("rdesk-test-" + hex_encode(crypto::random_bytes(8)));
    fs::create_directories(path_);
    path_ = fs::canonical(path_);
  }
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  const fs::path &path() const { return path_; }
  fs::path operator/(const std::string &rel) const { return path_ / rel; }

private:
  fs::path path_;
};

inline void write_file(const fs::path &p, const std::string &content) {
  std::ofstream f(p, std::ios::binary | std::ios::trunc);
  f << content;
}

inline std::string read_file(const fs::path &p) {
  std::ifstream f(p, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(f)),
                     std::istreambuf_iterator<char>());
}

inline CredentialRecord make_record(const std::string &user,
                                    const std::string &password,
                                    bool admin = false) {
  CredentialRecord r;
  r.username = user;
  r.salt = crypto::random_bytes(crypto::SALT_SIZE);
  r.iterations = TEST_ITERATIONS;
  r.key = crypto::derive_key(password, r.salt, r.iterations);
  r.is_admin = admin;
  return r;
}

inline ServerConfig test_config(const TempDir &dir) {
  ServerConfig c;
  c.port = 0;
  c.file_root = (dir / "root").string();
  fs::create_directories(c.file_root);
  c.users_file = (dir / "users.json").string();
  c.keepalive_timeout_ms = 5000;
  c.tick_ms = 10;
  c.capture_timeout_ms = 1000;
  return c;
}

// ServerState with user "alice"/"secret" and a fake 64x48 screen.
struct Fixture {
  TempDir dir;
  ManualClock clock;
  std::shared_ptr<FakeCapability> cap = std::make_shared<FakeCapability>();
  std::unique_ptr<ServerState> st;

  explicit Fixture(bool manual_clock = true) {
    st = std::make_unique<ServerState>(test_config(dir), cap,
                                       manual_clock ? clock.fn()
                                                    : system_clock_fn());
    st->credentials.put(make_record("alice", "secret"));
    st->credentials.set_decoy_iterations(TEST_ITERATIONS);
  }
};

} // namespace rdesk::test
