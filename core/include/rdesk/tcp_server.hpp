#pragma once
#include "connection.hpp"
#include "net.hpp"
#include "server_state.hpp"

#include <atomic>
#include <list>
#include <memory>
#include <mutex>
#include <thread>

namespace rdesk {

// Listener plus one thread per accepted client. stop() closes every live
// connection and joins all threads.
class TcpServer {
public:
  explicit TcpServer(ServerState &st);
  ~TcpServer();

  TcpServer(const TcpServer &) = delete;
  TcpServer &operator=(const TcpServer &) = delete;

  // Binds and starts accepting. Throws net::NetError.
  void start();
  void stop();

  bool running() const { return running_.load(); }
  // The bound port; resolves port 0 to the ephemeral one.
  int port() const { return port_; }
  size_t connection_count();

private:
  struct Client {
    std::shared_ptr<Connection> conn;
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  void accept_loop();
  void reap_finished();

  ServerState &st_;
  socket_t listen_sock_ = INVALID_SOCKET;
  int port_ = 0;
  std::atomic<bool> running_{false};
  std::thread accept_thread_;
  std::mutex mu_;
  std::list<Client> clients_;
};

} // namespace rdesk
