#include "rdesk/capability.hpp"
#include "rdesk/config.hpp"
#include "rdesk/credentials.hpp"
#include "rdesk/fake_capability.hpp"
#include "rdesk/logger.hpp"
#include "rdesk/net.hpp"
#include "rdesk/server_state.hpp"
#include "rdesk/tcp_server.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

using namespace rdesk;

namespace {

std::atomic<bool> g_running{true};

void on_signal(int) { g_running.store(false); }

void usage() {
  std::cerr
      << "usage: rdeskd [--config FILE] [--bind ADDR] [--port N]\n"
         "              [--users FILE] [--file-root DIR] [--max-conns N]\n"
         "              [--session-ttl SEC] [--keepalive-ms MS]\n"
         "              [--log-level LEVEL] [--log-file FILE] [--fake]\n"
         "       rdeskd adduser <users.json> <username> [--admin]\n"
         "              [--iterations N]   (password read from stdin)\n";
}

int run_adduser(int argc, char **argv) {
  if (argc < 4) {
    usage();
    return 2;
  }
  std::string path = argv[2], user = argv[3];
  bool admin = false;
  std::uint32_t iterations = crypto::MIN_KDF_ITERATIONS;
  for (int i = 4; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--admin")
      admin = true;
    else if (a == "--iterations" && i + 1 < argc)
      iterations = (std::uint32_t)std::stoul(argv[++i]);
    else {
      usage();
      return 2;
    }
  }
  if (iterations < crypto::MIN_KDF_ITERATIONS) {
    std::cerr << "iterations must be at least " << crypto::MIN_KDF_ITERATIONS
              << "\n";
    return 2;
  }

  std::string password;
  std::getline(std::cin, password);
  if (!password.empty() && password.back() == '\r')
    password.pop_back();
  if (password.empty()) {
    std::cerr << "empty password\n";
    return 2;
  }

  try {
    CredentialStore store(path);
    store.load();
    store.add_user(user, password, iterations, admin);
    store.save();
  } catch (const CredentialError &e) {
    std::cerr << "adduser: " << e.what() << "\n";
    return 1;
  }
  LOG_INFO("Added user '" + user + "' to " + path);
  return 0;
}

} // namespace

int main(int argc, char **argv) {
  if (argc >= 2 && std::string(argv[1]) == "adduser")
    return run_adduser(argc, argv);

  ServerConfig cfg;
  bool use_fake = false;
  try {
    // The config file is applied first so flags override it.
    for (int i = 1; i + 1 < argc; ++i)
      if (std::string(argv[i]) == "--config")
        cfg = load_config_file(argv[i + 1], cfg);

    for (int i = 1; i < argc; ++i) {
      std::string a = argv[i];
      bool has_val = i + 1 < argc;
      if (a == "--config" && has_val)
        ++i;
      else if (a == "--fake")
        use_fake = true;
      else if (a == "--bind" && has_val)
        cfg.bind_address = argv[++i];
      else if (a == "--port" && has_val)
        cfg.port = std::stoi(argv[++i]);
      else if (a == "--users" && has_val)
        cfg.users_file = argv[++i];
      else if (a == "--file-root" && has_val)
        cfg.file_root = argv[++i];
      else if (a == "--max-conns" && has_val)
        cfg.max_connections = std::stoi(argv[++i]);
      else if (a == "--session-ttl" && has_val)
        cfg.session_ttl_sec = std::stoi(argv[++i]);
      else if (a == "--keepalive-ms" && has_val)
        cfg.keepalive_timeout_ms = std::stoi(argv[++i]);
      else if (a == "--log-level" && has_val)
        cfg.log_level = argv[++i];
      else if (a == "--log-file" && has_val)
        cfg.log_file = argv[++i];
      else if (a == "--help" || a == "-h") {
        usage();
        return 0;
      } else {
        std::cerr << "unknown argument: " << a << "\n";
        usage();
        return 2;
      }
    }
    cfg.validate();
  } catch (const ConfigError &e) {
    std::cerr << "config: " << e.what() << "\n";
    return 2;
  } catch (const std::logic_error &e) {
    std::cerr << "bad numeric argument: " << e.what() << "\n";
    return 2;
  }

  Logger::get().set_level(*parse_level(cfg.log_level));
  if (!cfg.log_file.empty() && !Logger::get().set_file(cfg.log_file))
    LOG_WARN("Cannot open log file " + cfg.log_file);

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  LOG_INFO("rdesk daemon starting up (protocol " +
           std::string(PROTOCOL_VERSION) + ")");

  std::shared_ptr<ICapability> cap;
  try {
    cap = use_fake ? std::make_shared<FakeCapability>(1280, 720)
                   : make_platform_capability();
  } catch (const std::exception &e) {
    LOG_ERROR(std::string("Platform capability unavailable: ") + e.what());
    return 1;
  }
  LOG_INFO("Capability: " + cap->name());

  try {
    net::NetworkInit netinit;
    ServerState st(cfg, cap);
    st.credentials.load();
    st.credentials.set_decoy_iterations(cfg.kdf_iterations);
    if (st.credentials.size() == 0)
      LOG_WARN("No users configured in " + cfg.users_file +
               "; add one with 'rdeskd adduser'");
    LOG_INFO("File root: " + cfg.file_root);

    TcpServer tcp(st);
    tcp.start();

    // Session and parked-upload sweep; also the main wait loop.
    auto next_sweep = std::chrono::steady_clock::now() +
                      std::chrono::seconds(cfg.sweep_interval_sec);
    while (g_running.load()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
      if (std::chrono::steady_clock::now() >= next_sweep) {
        size_t n = st.sessions.purge_expired();
        if (n > 0)
          LOG_DEBUG("Purged " + std::to_string(n) + " expired sessions");
        n = st.resumes.purge_expired(std::chrono::seconds(cfg.resume_ttl_sec));
        if (n > 0)
          LOG_INFO("Discarded " + std::to_string(n) +
                   " stale resumable uploads");
        next_sweep = std::chrono::steady_clock::now() +
                     std::chrono::seconds(cfg.sweep_interval_sec);
      }
    }
    tcp.stop();
  } catch (const CredentialError &e) {
    LOG_ERROR(std::string("Users file: ") + e.what());
    return 1;
  } catch (const net::NetError &e) {
    LOG_ERROR(e.what());
    return 1;
  }

  LOG_INFO("rdesk daemon stopped");
  return 0;
}
