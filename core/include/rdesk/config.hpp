#pragma once
#include "tinyjson.hpp"
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace rdesk {

class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Defaults, then an optional JSON file, then command-line flags.
struct ServerConfig {
  std::string bind_address = "127.0.0.1";
  int port = 5000;
  int max_connections = 32;
  std::uint32_t max_message_size = 16u * 1024 * 1024;
  int keepalive_timeout_ms = 30000;
  int tick_ms = 50;

  int session_ttl_sec = 3600;
  int sweep_interval_sec = 60;
  std::uint32_t kdf_iterations = 100000;
  int max_auth_failures = 5;
  int auth_window_sec = 300;

  int chunk_rate_max = 256;
  int chunk_window_ms = 1000;
  std::string file_root;
  std::uint32_t chunk_size = 65536;
  int chunk_timeout_ms = 60000;
  int resume_ttl_sec = 86400;

  int capture_timeout_ms = 5000;
  int max_frames_in_flight = 1;
  int capture_backoff_base_ms = 500;
  int capture_backoff_max_ms = 30000;
  std::vector<std::string> screen_formats{"zlib", "raw"};
  int stream_max_fps = 30;

  std::uint64_t max_send_queue_bytes = 64ull * 1024 * 1024;

  std::string users_file = "users.json";
  std::string log_level = "INFO";
  std::string log_file;

  ServerConfig();

  // Overlays the keys present in `o`. Unknown keys and wrong types throw.
  void merge_json(const json::Object &o);
  void validate() const;
};

std::string default_file_root();
ServerConfig load_config_file(const std::string &path,
                              ServerConfig base = ServerConfig());

} // namespace rdesk
