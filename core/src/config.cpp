#include "rdesk/config.hpp"
#include "rdesk/crypto.hpp"
#include "rdesk/logger.hpp"

#include <cstdlib>
#include <fstream>
#include <functional>
#include <map>
#include <sstream>

namespace rdesk {

std::string default_file_root() {
#ifdef _WIN32
  const char *home = std::getenv("USERPROFILE");
#else
  const char *home = std::getenv("HOME");
#endif
  if (home && *home)
    return home;
  return ".";
}

ServerConfig::ServerConfig() : file_root(default_file_root()) {}

namespace {

int need_int(const json::Value &v, const std::string &key) {
  if (!v.is_num() || v.as_num() != (double)(long long)v.as_num())
    throw ConfigError("config: '" + key + "' must be an integer");
  double d = v.as_num();
  if (d < -2147483648.0 || d > 2147483647.0)
    throw ConfigError("config: '" + key + "' out of range");
  return (int)d;
}

std::uint64_t need_u64(const json::Value &v, const std::string &key) {
  if (!v.is_num() || v.as_num() < 0 ||
      v.as_num() != (double)(long long)v.as_num())
    throw ConfigError("config: '" + key + "' must be a non-negative integer");
  return (std::uint64_t)v.as_num();
}

std::string need_str(const json::Value &v, const std::string &key) {
  if (!v.is_str())
    throw ConfigError("config: '" + key + "' must be a string");
  return v.as_str();
}

} // namespace

void ServerConfig::merge_json(const json::Object &o) {
  using Setter = std::function<void(const json::Value &, const std::string &)>;
  auto int_field = [](int &dst) -> Setter {
    return [&dst](const json::Value &v, const std::string &k) {
      dst = need_int(v, k);
    };
  };
  auto u32_field = [](std::uint32_t &dst) -> Setter {
    return [&dst](const json::Value &v, const std::string &k) {
      auto n = need_u64(v, k);
      if (n > 0xFFFFFFFFull)
        throw ConfigError("config: '" + k + "' out of range");
      dst = (std::uint32_t)n;
    };
  };
  auto str_field = [](std::string &dst) -> Setter {
    return [&dst](const json::Value &v, const std::string &k) {
      dst = need_str(v, k);
    };
  };

  const std::map<std::string, Setter> fields = {
      {"bind_address", str_field(bind_address)},
      {"port", int_field(port)},
      {"max_connections", int_field(max_connections)},
      {"max_message_size", u32_field(max_message_size)},
      {"keepalive_timeout_ms", int_field(keepalive_timeout_ms)},
      {"tick_ms", int_field(tick_ms)},
      {"session_ttl_sec", int_field(session_ttl_sec)},
      {"sweep_interval_sec", int_field(sweep_interval_sec)},
      {"kdf_iterations", u32_field(kdf_iterations)},
      {"max_auth_failures", int_field(max_auth_failures)},
      {"auth_window_sec", int_field(auth_window_sec)},
      {"chunk_rate_max", int_field(chunk_rate_max)},
      {"chunk_window_ms", int_field(chunk_window_ms)},
      {"file_root", str_field(file_root)},
      {"chunk_size", u32_field(chunk_size)},
      {"chunk_timeout_ms", int_field(chunk_timeout_ms)},
      {"resume_ttl_sec", int_field(resume_ttl_sec)},
      {"capture_timeout_ms", int_field(capture_timeout_ms)},
      {"max_frames_in_flight", int_field(max_frames_in_flight)},
      {"capture_backoff_base_ms", int_field(capture_backoff_base_ms)},
      {"capture_backoff_max_ms", int_field(capture_backoff_max_ms)},
      {"stream_max_fps", int_field(stream_max_fps)},
      {"max_send_queue_bytes",
       [this](const json::Value &v, const std::string &k) {
         max_send_queue_bytes = need_u64(v, k);
       }},
      {"screen_formats",
       [this](const json::Value &v, const std::string &k) {
         if (!v.is_arr())
           throw ConfigError("config: '" + k + "' must be an array");
         std::vector<std::string> out;
         for (const auto &e : v.as_arr())
           out.push_back(need_str(e, k));
         screen_formats = std::move(out);
       }},
      {"users_file", str_field(users_file)},
      {"log_level", str_field(log_level)},
      {"log_file", str_field(log_file)},
  };

  for (const auto &[k, v] : o) {
    auto it = fields.find(k);
    if (it == fields.end())
      throw ConfigError("config: unknown key '" + k + "'");
    it->second(v, k);
  }
}

void ServerConfig::validate() const {
  if (port < 0 || port > 65535)
    throw ConfigError("port must be within 0..65535");
  if (max_connections < 1)
    throw ConfigError("max_connections must be at least 1");
  if (max_message_size < 1024)
    throw ConfigError("max_message_size must be at least 1024");
  if (keepalive_timeout_ms <= 0)
    throw ConfigError("keepalive_timeout_ms must be positive");
  if (tick_ms <= 0 || tick_ms > keepalive_timeout_ms)
    throw ConfigError("tick_ms must be positive and below the keepalive");
  if (session_ttl_sec <= 0)
    throw ConfigError("session_ttl_sec must be positive");
  if (sweep_interval_sec <= 0)
    throw ConfigError("sweep_interval_sec must be positive");
  if (kdf_iterations < crypto::MIN_KDF_ITERATIONS)
    throw ConfigError("kdf_iterations must be at least " +
                      std::to_string(crypto::MIN_KDF_ITERATIONS));
  if (max_auth_failures < 1 || auth_window_sec <= 0)
    throw ConfigError("auth limiter needs max >= 1 and a positive window");
  if (chunk_rate_max < 1 || chunk_window_ms <= 0)
    throw ConfigError("chunk limiter needs max >= 1 and a positive window");
  if (file_root.empty())
    throw ConfigError("file_root must not be empty");
  // A base64 chunk plus its JSON envelope and seal must fit in one message.
  if (chunk_size == 0 ||
      (std::uint64_t)chunk_size * 4 / 3 + 4096 > max_message_size)
    throw ConfigError("chunk_size must be positive and fit max_message_size");
  if (chunk_timeout_ms <= 0)
    throw ConfigError("chunk_timeout_ms must be positive");
  if (resume_ttl_sec <= 0)
    throw ConfigError("resume_ttl_sec must be positive");
  if (capture_timeout_ms <= 0)
    throw ConfigError("capture_timeout_ms must be positive");
  if (max_frames_in_flight < 1)
    throw ConfigError("max_frames_in_flight must be at least 1");
  if (capture_backoff_base_ms <= 0 ||
      capture_backoff_max_ms < capture_backoff_base_ms)
    throw ConfigError("capture backoff needs 0 < base <= max");
  if (screen_formats.empty())
    throw ConfigError("screen_formats must not be empty");
  for (const auto &f : screen_formats)
    if (f != "zlib" && f != "raw")
      throw ConfigError("unsupported screen format: " + f);
  if (stream_max_fps < 1)
    throw ConfigError("stream_max_fps must be at least 1");
  if (max_send_queue_bytes < max_message_size)
    throw ConfigError("max_send_queue_bytes must hold one full message");
  if (!parse_level(log_level))
    throw ConfigError("unknown log_level: " + log_level);
}

ServerConfig load_config_file(const std::string &path, ServerConfig base) {
  std::ifstream f(path, std::ios::binary);
  if (!f)
    throw ConfigError("cannot open config file: " + path);
  std::stringstream ss;
  ss << f.rdbuf();
  json::Value doc;
  try {
    doc = json::parse(ss.str());
  } catch (const json::ParseError &e) {
    throw ConfigError("config file " + path + ": " + e.what());
  }
  if (!doc.is_obj())
    throw ConfigError("config file " + path + ": expected an object");
  base.merge_json(doc.as_obj());
  LOG_DEBUG("Loaded config from " + path);
  return base;
}

} // namespace rdesk
