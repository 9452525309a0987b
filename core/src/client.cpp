#include "rdesk/client.hpp"
#include "rdesk/encoding.hpp"
#include "rdesk/logger.hpp"

#include <chrono>
#include <algorithm>
#include <fstream>
#include <iterator>

namespace rdesk {

namespace {

bool is_sealed(MessageType t) {
  return t != MessageType::PING && t != MessageType::PONG;
}

} // namespace

void throw_if_error(const Message &m) {
  if (m.type != MessageType::ERROR)
    return;
  std::string code = "ProtocolError", msg = "server error";
  try {
    auto o = parse_object(m.payload);
    code = json::get_str(o, "code").value_or(code);
    msg = json::get_str(o, "message").value_or(msg);
  } catch (const PayloadError &e) {
    msg = e.what();
  }
  throw ClientError(code, code + ": " + msg);
}

Client::~Client() { close(); }

void Client::connect(const std::string &host, int port) {
  close();
  try {
    sock_ = net::connect_tcp(host, port);
  } catch (const net::NetError &e) {
    throw ClientError(to_string(ErrorCode::SocketFailure), e.what());
  }
  LOG_DEBUG("Connected to " + host + ":" + std::to_string(port));
}

void Client::close() {
  net::close_socket(sock_);
  sock_ = INVALID_SOCKET;
  crypto_.clear();
  reader_ = FrameReader();
  token_.clear();
}

void Client::send(MessageType type, const Bytes &payload) {
  if (!connected())
    throw ClientError(to_string(ErrorCode::SocketFailure), "not connected");
  Bytes frame = encode(type, (crypto_.is_initialized() && is_sealed(type))
                                 ? crypto_.encrypt(payload)
                                 : payload);
  if (!net::send_all(sock_, frame.data(), frame.size()))
    throw ClientError(to_string(ErrorCode::SocketFailure), "send failed");
}

std::optional<Message> Client::receive(int timeout_ms) {
  auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  std::uint8_t buf[16384];
  while (true) {
    DecodeResult d = reader_.next();
    if (d.status == DecodeStatus::Ok) {
      Message m = std::move(d.message);
      if (crypto_.is_initialized() && is_sealed(m.type)) {
        auto plain = crypto_.decrypt(m.payload);
        if (!plain)
          throw ClientError(to_string(ErrorCode::ProtocolError),
                            "reply failed authentication");
        m.payload = std::move(*plain);
      }
      return m;
    }
    if (d.status != DecodeStatus::Incomplete)
      throw ClientError(to_string(ErrorCode::ProtocolError),
                        std::string("bad frame: ") + to_string(d.status));

    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - std::chrono::steady_clock::now())
                    .count();
    if (left <= 0)
      return std::nullopt;
    auto w = net::wait_readable(sock_, (int)left);
    if (w == net::WaitResult::Timeout)
      return std::nullopt;
    if (w == net::WaitResult::Error)
      throw ClientError(to_string(ErrorCode::SocketFailure), "poll failed");
    long n = net::recv_some(sock_, buf, sizeof(buf));
    if (n <= 0)
      throw ClientError(to_string(ErrorCode::SocketFailure),
                        "connection closed by server");
    reader_.feed(buf, (size_t)n);
  }
}

Message Client::expect(MessageType type, int timeout_ms) {
  while (true) {
    auto m = receive(timeout_ms);
    if (!m)
      throw ClientError(to_string(ErrorCode::SocketFailure),
                        std::string("timed out waiting for ") +
                            to_string(type));
    if (m->type == type)
      return std::move(*m);
    throw_if_error(*m);
    LOG_DEBUG(std::string("Skipping ") + to_string(m->type));
  }
}

json::Object Client::authenticate(const std::string &username,
                                  const std::string &password) {
  json::Object req;
  req["username"] = username;
  req["password"] = password;
  send(MessageType::AUTH, to_payload(req));
  auto body = parse_object(expect(MessageType::AUTH_RESPONSE).payload);
  if (!json::get_bool(body, "success").value_or(false))
    return body;

  auto salt = hex_decode(json::get_str(body, "salt").value_or(""));
  auto nonce = hex_decode(json::get_str(body, "session_nonce").value_or(""));
  auto iterations = json::get_u64(body, "iterations");
  if (!salt || !nonce || !iterations)
    throw ClientError(to_string(ErrorCode::ProtocolError),
                      "AUTH_RESPONSE lacks key parameters");
  crypto::Key key = crypto::derive_key(password, *salt, (std::uint32_t)*iterations);
  crypto_.set_key(crypto::derive_transport_key(key, *nonce));
  token_ = json::get_str(body, "token").value_or("");
  return body;
}

Bytes Client::ping(const Bytes &payload) {
  send(MessageType::PING, payload);
  return expect(MessageType::PONG).payload;
}

json::Object Client::info() {
  send(MessageType::INFO, {});
  return parse_object(expect(MessageType::INFO).payload);
}

ScreenFrame Client::screenshot(bool force,
                               const std::vector<std::string> &formats) {
  json::Object req;
  req["force"] = force;
  if (!formats.empty()) {
    json::Array arr;
    for (const auto &f : formats)
      arr.push_back(f);
    req["formats"] = std::move(arr);
  }
  send(MessageType::SCREENSHOT, to_payload(req));
  return parse_screenshot(expect(MessageType::SCREENSHOT).payload);
}

void Client::mouse_move(int x, int y) {
  send(MessageType::MOUSE_MOVE, build_mouse_move(x, y));
}

void Client::mouse_click(int x, int y, MouseButton button, bool pressed) {
  send(MessageType::MOUSE_CLICK, build_mouse_click(x, y, button, pressed));
}

void Client::key(const std::string &name, bool pressed,
                 const std::vector<std::string> &modifiers) {
  json::Object req;
  req["key"] = name;
  req["pressed"] = pressed;
  json::Array mods;
  for (const auto &m : modifiers)
    mods.push_back(m);
  req["modifiers"] = std::move(mods);
  send(MessageType::KEY_EVENT, to_payload(req));
}

json::Object Client::system_command(const std::string &command,
                                    json::Object args) {
  json::Object req;
  req["command"] = command;
  if (!args.empty())
    req["args"] = std::move(args);
  send(MessageType::SYSTEM_COMMAND, to_payload(req));
  return parse_object(expect(MessageType::SYSTEM_COMMAND).payload);
}

json::Object Client::file_op(const std::string &op, json::Object args) {
  args["op"] = op;
  send(MessageType::FILE_TRANSFER, to_payload(args));
  auto r = parse_object(expect(MessageType::FILE_TRANSFER).payload);
  if (json::get_str(r, "status").value_or("") != "ok") {
    std::string code = json::get_str(r, "error").value_or("ProtocolError");
    throw ClientError(code, op + ": " + code + ": " +
                                json::get_str(r, "message").value_or(""));
  }
  return r;
}

void Client::download(const std::string &remote, const std::string &local) {
  json::Object args;
  args["path"] = remote;
  auto start = file_op("download", args);
  std::ofstream out(local, std::ios::binary | std::ios::trunc);
  if (!out)
    throw ClientError(to_string(ErrorCode::IoError), "cannot open " + local);

  while (true) {
    auto c = file_op("chunk");
    auto data = base64_decode(json::get_str(c, "data_b64").value_or(""));
    if (!data)
      throw ClientError(to_string(ErrorCode::IntegrityError),
                        "bad chunk encoding");
    out.write((const char *)data->data(), (std::streamsize)data->size());
    if (json::get_bool(c, "eof").value_or(true))
      break;
  }
  if (!out)
    throw ClientError(to_string(ErrorCode::IoError), "write failed: " + local);
}

void Client::upload(const std::string &local, const std::string &remote,
                    bool overwrite) {
  std::ifstream in(local, std::ios::binary);
  if (!in)
    throw ClientError(to_string(ErrorCode::NotFound), "cannot open " + local);
  Bytes content((std::istreambuf_iterator<char>(in)),
                std::istreambuf_iterator<char>());

  json::Object args;
  args["path"] = remote;
  args["total_size"] = (double)content.size();
  args["overwrite"] = overwrite;
  auto start = file_op("upload", args);
  size_t chunk = (size_t)json::get_u64(start, "chunk_size").value_or(65536);
  if (chunk == 0)
    chunk = 65536;

  for (size_t off = 0; off < content.size(); off += chunk) {
    size_t n = std::min(chunk, content.size() - off);
    json::Object c;
    c["offset"] = (double)off;
    c["data_b64"] = base64_encode(content.data() + off, n);
    file_op("chunk", c);
  }
  json::Object done;
  done["hash"] = crypto::blake2b_hex(content.data(), content.size());
  file_op("complete", done);
}

void Client::disconnect() {
  if (!connected())
    return;
  send(MessageType::DISCONNECT, {});
  close();
}

} // namespace rdesk
