#include "rdesk/tcp_server.hpp"
#include "rdesk/logger.hpp"

namespace rdesk {

TcpServer::TcpServer(ServerState &st) : st_(st) {}

TcpServer::~TcpServer() { stop(); }

void TcpServer::start() {
  if (running_.load())
    return;
  listen_sock_ = net::listen_tcp(st_.config.bind_address, st_.config.port,
                                 SOMAXCONN);
  port_ = net::local_port(listen_sock_);
  running_.store(true);
  LOG_INFO("TCP Server listening on " + st_.config.bind_address + ":" +
           std::to_string(port_));
  accept_thread_ = std::thread(&TcpServer::accept_loop, this);
}

void TcpServer::stop() {
  if (!running_.exchange(false))
    return;
  LOG_INFO("TCP Server stopping");
  if (accept_thread_.joinable())
    accept_thread_.join();
  net::close_socket(listen_sock_);
  listen_sock_ = INVALID_SOCKET;

  std::list<Client> clients;
  {
    std::lock_guard<std::mutex> lk(mu_);
    clients.swap(clients_);
  }
  for (auto &c : clients)
    c.conn->close(CloseReason::ServerStop);
  for (auto &c : clients)
    if (c.thread.joinable())
      c.thread.join();
}

size_t TcpServer::connection_count() {
  std::lock_guard<std::mutex> lk(mu_);
  size_t n = 0;
  for (const auto &c : clients_)
    if (!c.done->load())
      n++;
  return n;
}

void TcpServer::reap_finished() {
  std::list<Client> finished;
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (auto it = clients_.begin(); it != clients_.end();) {
      if (it->done->load()) {
        auto next = std::next(it);
        finished.splice(finished.end(), clients_, it);
        it = next;
      } else {
        ++it;
      }
    }
  }
  for (auto &c : finished)
    if (c.thread.joinable())
      c.thread.join();
}

void TcpServer::accept_loop() {
  while (running_.load()) {
    reap_finished();
    auto w = net::wait_readable(listen_sock_, 100);
    if (w == net::WaitResult::Timeout)
      continue;
    if (w == net::WaitResult::Error) {
      LOG_ERROR("TCP Server: poll failed: " +
                std::to_string(net::last_error()));
      break;
    }

    std::string peer;
    socket_t s = net::accept_client(listen_sock_, &peer);
    if (!net::is_valid(s)) {
      LOG_WARN("TCP Server: accept failed: " +
               std::to_string(net::last_error()));
      continue;
    }

    if (st_.active_connections.load() >= st_.config.max_connections) {
      LOG_WARN("TCP Server: connection limit reached, refusing " + peer);
      net::close_socket(s);
      continue;
    }
    net::set_nodelay(s);

    std::uint64_t id = st_.next_connection_id.fetch_add(1);
    auto conn = std::make_shared<Connection>(st_, s, peer, id);
    auto done = std::make_shared<std::atomic<bool>>(false);
    st_.active_connections.fetch_add(1);

    std::lock_guard<std::mutex> lk(mu_);
    clients_.push_back(Client{conn, std::thread([this, conn, done] {
                                try {
                                  conn->run();
                                } catch (const std::exception &e) {
                                  LOG_ERROR("Connection " +
                                            std::to_string(conn->id()) +
                                            " aborted: " + e.what());
                                }
                                st_.active_connections.fetch_sub(1);
                                done->store(true);
                              }),
                              done});
  }
}

} // namespace rdesk
