#pragma once
#include "codec.hpp"
#include "crypto.hpp"
#include "dispatcher.hpp"
#include "net.hpp"
#include "server_state.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <thread>

namespace rdesk {

enum class CloseReason {
  None,
  PeerClosed,
  ReadError,
  WriteError,
  Disconnect,
  KeepaliveTimeout,
  ProtocolError,
  QueueOverflow,
  ServerStop,
};

const char *to_string(CloseReason r);

// One accepted socket. run() is the reader context: it decodes, answers
// PING, dispatches and finally tears down. A single writer thread owns all
// socket writes.
class Connection {
public:
  Connection(ServerState &st, socket_t sock, std::string peer,
             std::uint64_t id);
  ~Connection();

  Connection(const Connection &) = delete;
  Connection &operator=(const Connection &) = delete;

  // Blocks until the connection closes. Call once.
  void run();
  // Thread-safe; the first reason wins.
  void close(CloseReason why);

  bool closed() const { return closed_.load(); }
  CloseReason close_reason() const { return reason_.load(); }
  std::uint64_t id() const { return id_; }
  const std::string &peer() const { return peer_; }

private:
  void handle(const Message &m);
  void deliver(const DispatchResult &r);
  bool enqueue(MessageType type, const Bytes &payload);
  void writer_loop();
  void teardown();

  ServerState &st_;
  socket_t sock_;
  std::string peer_;
  std::uint64_t id_;

  FrameReader reader_;
  crypto::CryptoSession crypto_;
  ProtocolDispatcher dispatcher_;
  TimePoint last_received_at_;

  std::atomic<bool> closed_{false};
  std::atomic<CloseReason> reason_{CloseReason::None};

  std::mutex mu_;
  std::condition_variable cv_;
  std::deque<Bytes> queue_;
  std::uint64_t queued_bytes_ = 0;
  bool writer_stop_ = false;
  std::thread writer_;
  bool torn_down_ = false;
};

} // namespace rdesk
