#include "rdesk/connection.hpp"
#include "rdesk/logger.hpp"
#include "rdesk/payloads.hpp"

namespace rdesk {

const char *to_string(CloseReason r) {
  switch (r) {
  case CloseReason::None: return "none";
  case CloseReason::PeerClosed: return "peer closed";
  case CloseReason::ReadError: return "read error";
  case CloseReason::WriteError: return "write error";
  case CloseReason::Disconnect: return "disconnect";
  case CloseReason::KeepaliveTimeout: return "keepalive timeout";
  case CloseReason::ProtocolError: return "protocol error";
  case CloseReason::QueueOverflow: return "send queue overflow";
  case CloseReason::ServerStop: return "server stop";
  }
  return "unknown";
}

namespace {

bool is_sealed(MessageType t) {
  return t != MessageType::PING && t != MessageType::PONG;
}

} // namespace

Connection::Connection(ServerState &st, socket_t sock, std::string peer,
                       std::uint64_t id)
    : st_(st), sock_(sock), peer_(std::move(peer)), id_(id),
      reader_(st.config.max_message_size), dispatcher_(st, peer_, id),
      last_received_at_(st.clock()) {}

Connection::~Connection() {
  close(CloseReason::ServerStop);
  if (writer_.joinable()) {
    {
      std::lock_guard<std::mutex> lk(mu_);
      writer_stop_ = true;
    }
    cv_.notify_all();
    writer_.join();
  }
  teardown();
}

void Connection::close(CloseReason why) {
  bool expected = false;
  if (!closed_.compare_exchange_strong(expected, true))
    return;
  reason_.store(why);
  LOG_DEBUG("Connection " + std::to_string(id_) + " (" + peer_ +
            ") closing: " + to_string(why));
  // Unblocks a writer stuck on a peer that stopped reading.
  std::lock_guard<std::mutex> lk(mu_);
  if (why != CloseReason::Disconnect && why != CloseReason::ProtocolError)
    net::shutdown_both(sock_);
  cv_.notify_all();
}

bool Connection::enqueue(MessageType type, const Bytes &payload) {
  Bytes body = (crypto_.is_initialized() && is_sealed(type))
                   ? crypto_.encrypt(payload)
                   : payload;
  if (body.size() > st_.config.max_message_size) {
    LOG_ERROR("Connection " + std::to_string(id_) + ": " + to_string(type) +
              " reply of " + std::to_string(body.size()) +
              " bytes exceeds max_message_size");
    return enqueue(MessageType::ERROR,
                   build_error(ErrorCode::IoError, "reply too large"));
  }
  Bytes frame = encode(type, body);
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (queued_bytes_ + frame.size() > st_.config.max_send_queue_bytes) {
      LOG_WARN("Connection " + std::to_string(id_) +
               ": send queue full, dropping client");
    } else {
      queued_bytes_ += frame.size();
      queue_.push_back(std::move(frame));
      cv_.notify_one();
      return true;
    }
  }
  close(CloseReason::QueueOverflow);
  return false;
}

void Connection::writer_loop() {
  while (true) {
    Bytes frame;
    {
      std::unique_lock<std::mutex> lk(mu_);
      cv_.wait(lk, [&] { return writer_stop_ || !queue_.empty(); });
      if (queue_.empty())
        return;
      frame = std::move(queue_.front());
      queue_.pop_front();
      queued_bytes_ -= frame.size();
    }
    if (!net::send_all(sock_, frame.data(), frame.size())) {
      close(CloseReason::WriteError);
      std::lock_guard<std::mutex> lk(mu_);
      queue_.clear();
      queued_bytes_ = 0;
      return;
    }
  }
}

void Connection::deliver(const DispatchResult &r) {
  for (const auto &out : r.replies)
    if (!enqueue(out.type, out.payload))
      return;
  if (r.new_key)
    crypto_.set_key(*r.new_key);
  if (r.close)
    close(CloseReason::Disconnect);
}

void Connection::handle(const Message &in) {
  Message m = in;
  if (crypto_.is_initialized() && is_sealed(m.type)) {
    auto plain = crypto_.decrypt(m.payload);
    if (!plain) {
      LOG_WARN("Connection " + std::to_string(id_) +
               ": payload failed authentication");
      close(CloseReason::ProtocolError);
      return;
    }
    m.payload = std::move(*plain);
  }

  if (m.type == MessageType::PING) {
    dispatcher_.pipeline().acknowledge();
    enqueue(MessageType::PONG, m.payload);
    return;
  }

  try {
    deliver(dispatcher_.dispatch(m));
  } catch (const std::exception &e) {
    LOG_ERROR("Connection " + std::to_string(id_) + ": " + to_string(m.type) +
              " failed: " + e.what());
    enqueue(MessageType::ERROR, build_error(ErrorCode::IoError, e.what()));
  }
}

void Connection::run() {
  LOG_INFO("Connection " + std::to_string(id_) + " from " + peer_);
  net::set_send_timeout(sock_, st_.config.keepalive_timeout_ms);
  writer_ = std::thread(&Connection::writer_loop, this);

  std::uint8_t buf[16384];
  while (!closed()) {
    auto w = net::wait_readable(sock_, st_.config.tick_ms);
    if (w == net::WaitResult::Error) {
      close(CloseReason::ReadError);
      break;
    }
    if (w == net::WaitResult::Ready) {
      long n = net::recv_some(sock_, buf, sizeof(buf));
      if (n == 0) {
        close(CloseReason::PeerClosed);
        break;
      }
      if (n < 0) {
        close(CloseReason::ReadError);
        break;
      }
      reader_.feed(buf, (size_t)n);
      while (!closed()) {
        DecodeResult d = reader_.next();
        if (d.status == DecodeStatus::Incomplete)
          break;
        if (d.status != DecodeStatus::Ok) {
          LOG_WARN("Connection " + std::to_string(id_) + ": " +
                   to_string(d.status));
          close(CloseReason::ProtocolError);
          break;
        }
        last_received_at_ = st_.clock();
        handle(d.message);
      }
    }
    if (closed())
      break;

    if (ms_between(last_received_at_, st_.clock()) >
        st_.config.keepalive_timeout_ms) {
      LOG_INFO("Connection " + std::to_string(id_) + ": keepalive expired");
      close(CloseReason::KeepaliveTimeout);
      break;
    }
    try {
      deliver(dispatcher_.tick());
    } catch (const std::exception &e) {
      LOG_ERROR("Connection " + std::to_string(id_) + ": tick failed: " +
                e.what());
      close(CloseReason::ProtocolError);
    }
  }

  {
    std::lock_guard<std::mutex> lk(mu_);
    writer_stop_ = true;
  }
  cv_.notify_all();
  if (writer_.joinable())
    writer_.join();
  teardown();
}

void Connection::teardown() {
  if (torn_down_)
    return;
  torn_down_ = true;
  dispatcher_.on_disconnect();
  crypto_.clear();
  {
    std::lock_guard<std::mutex> lk(mu_);
    net::close_socket(sock_);
    sock_ = INVALID_SOCKET;
  }
  LOG_INFO("Connection " + std::to_string(id_) + " closed (" +
           to_string(close_reason()) + ")");
}

} // namespace rdesk
