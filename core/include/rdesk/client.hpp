#pragma once
#include "codec.hpp"
#include "crypto.hpp"
#include "net.hpp"
#include "payloads.hpp"
#include "tinyjson.hpp"

#include <optional>
#include <stdexcept>
#include <string>

namespace rdesk {

// Server replied with ERROR, a failed AUTH_RESPONSE or a FILE_TRANSFER
// error, or the stream broke. `code()` is the wire error code when there is
// one.
class ClientError : public std::runtime_error {
public:
  ClientError(std::string code, const std::string &msg)
      : std::runtime_error(msg), code_(std::move(code)) {}
  const std::string &code() const { return code_; }

private:
  std::string code_;
};

// Blocking protocol client. Used by the rdesk CLI and the socket tests.
class Client {
public:
  static constexpr int DEFAULT_TIMEOUT_MS = 10000;

  Client() = default;
  // Takes ownership of a connected socket.
  explicit Client(socket_t s) : sock_(s) {}
  ~Client();

  Client(const Client &) = delete;
  Client &operator=(const Client &) = delete;

  void connect(const std::string &host, int port);
  void close();
  bool connected() const { return net::is_valid(sock_); }

  void send(MessageType type, const Bytes &payload);
  // nullopt on timeout. Throws ClientError when the peer closes or a sealed
  // payload fails to open.
  std::optional<Message> receive(int timeout_ms = DEFAULT_TIMEOUT_MS);
  // Next message of `type`. ERROR replies throw; other types are skipped.
  Message expect(MessageType type, int timeout_ms = DEFAULT_TIMEOUT_MS);

  // Returns the AUTH_RESPONSE body. On success the transport key is derived
  // and installed; on failure the body is returned unchanged.
  json::Object authenticate(const std::string &username,
                            const std::string &password);
  const std::string &token() const { return token_; }
  bool encrypted() const { return crypto_.is_initialized(); }

  Bytes ping(const Bytes &payload);
  json::Object info();
  ScreenFrame screenshot(bool force = true,
                         const std::vector<std::string> &formats = {});
  void mouse_move(int x, int y);
  void mouse_click(int x, int y, MouseButton button, bool pressed);
  void key(const std::string &name, bool pressed,
           const std::vector<std::string> &modifiers = {});
  json::Object system_command(const std::string &command,
                              json::Object args = {});
  // Sends one FILE_TRANSFER op; an error status throws ClientError.
  json::Object file_op(const std::string &op, json::Object args = {});
  void download(const std::string &remote, const std::string &local);
  void upload(const std::string &local, const std::string &remote,
              bool overwrite = false);
  void disconnect();

private:
  socket_t sock_ = INVALID_SOCKET;
  FrameReader reader_;
  crypto::CryptoSession crypto_;
  std::string token_;
};

// Raises ClientError for an ERROR message, returns otherwise.
void throw_if_error(const Message &m);

} // namespace rdesk
