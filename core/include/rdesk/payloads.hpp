#pragma once
#include "codec.hpp"
#include "tinyjson.hpp"
#include "types.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace rdesk {

// A payload that does not match its message type. Carries the wire code the
// dispatcher reports for it.
class PayloadError : public std::runtime_error {
public:
  PayloadError(ErrorCode code, const std::string &msg)
      : std::runtime_error(msg), code_(code) {}
  ErrorCode code() const { return code_; }

private:
  ErrorCode code_;
};

struct AuthRequest {
  std::string username;
  std::string password;
};
struct AuthResponseMsg {
  json::Object body;
};
struct MouseMove {
  int x{}, y{};
};
struct MouseClick {
  int x{}, y{};
  MouseButton button = MouseButton::Left;
  bool pressed = true;
};
struct KeyEvent {
  std::string key;
  bool pressed = true;
  std::vector<std::string> modifiers;
};
struct ScreenshotRequest {
  bool force = false;
  std::vector<std::string> formats; // empty: server preference
  bool ack = false;
  std::optional<bool> stream;
  int fps = 0;
};
struct FileTransferRequest {
  std::string op;
  json::Object args;
};
struct ClipboardUpdate {
  std::string text;
};
struct SystemCommand {
  std::string command;
  json::Object args;
};
struct ErrorReport {
  std::string code;
  std::string message;
};
struct InfoRequest {};
struct DisconnectRequest {};
struct PingRequest {
  Bytes payload;
};
struct PongRequest {
  Bytes payload;
};

// One alternative per MessageType, in wire order.
using Request =
    std::variant<AuthRequest, AuthResponseMsg, MouseMove, MouseClick, KeyEvent,
                 ScreenshotRequest, FileTransferRequest, ClipboardUpdate,
                 SystemCommand, ErrorReport, InfoRequest, DisconnectRequest,
                 PingRequest, PongRequest>;

// Throws PayloadError.
Request parse_request(const Message &m);

// JSON object payload helpers. parse_object throws PayloadError(InvalidInput).
json::Object parse_object(const Bytes &payload);
Bytes to_payload(const json::Object &o);

// Builders
Bytes build_error(ErrorCode code, const std::string &message);
Bytes build_mouse_move(int x, int y);
Bytes build_mouse_click(int x, int y, MouseButton button, bool pressed);
Bytes build_screenshot(const ScreenFrame &frame);

// Client side: splits a server SCREENSHOT payload. Throws PayloadError.
ScreenFrame parse_screenshot(const Bytes &payload);

} // namespace rdesk
