#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rdesk {

using Bytes = std::vector<std::uint8_t>;

inline constexpr std::string_view PROTOCOL_VERSION = "1.0.0";

// Wire discriminants. Values are fixed by the protocol.
enum class MessageType : std::uint32_t {
  AUTH = 0,
  AUTH_RESPONSE = 1,
  MOUSE_MOVE = 2,
  MOUSE_CLICK = 3,
  KEY_EVENT = 4,
  SCREENSHOT = 5,
  FILE_TRANSFER = 6,
  CLIPBOARD_UPDATE = 7,
  SYSTEM_COMMAND = 8,
  ERROR = 9,
  INFO = 10,
  DISCONNECT = 11,
  PING = 12,
  PONG = 13,
};

inline constexpr std::uint32_t MESSAGE_TYPE_COUNT = 14;

std::optional<MessageType> message_type_from_u32(std::uint32_t v);
const char *to_string(MessageType t);

enum class ErrorCode {
  ProtocolError,
  AuthError,
  SessionExpired,
  Unauthenticated,
  InvalidInput,
  InputFailed,
  UnsupportedMessage,
  PathNotAllowed,
  AlreadyExists,
  IntegrityError,
  TransferInProgress,
  NoActiveTransfer,
  NotFound,
  IoError,
  TransferTimeout,
  RateLimited,
  CaptureUnavailable,
  SocketFailure,
};

const char *to_string(ErrorCode c);

enum class MouseButton : std::uint8_t { Left = 0, Middle = 1, Right = 2 };

std::optional<MouseButton> mouse_button_from_u8(std::uint8_t v);

struct DisplayInfo {
  int index{};
  std::string name;
  int x{}, y{};
  int width{}, height{};
  bool primary{};
};

// Frame as delivered by the capture collaborator, before encoding.
struct RawFrame {
  Bytes bytes;
  std::string format; // pixel layout, e.g. "bgra32"
  int width{}, height{};
};

struct ScreenFrame {
  std::uint64_t seq{};
  int width{}, height{};
  std::string format;
  std::string encoding; // "zlib" or "raw"
  std::uint64_t raw_size{};
  std::string content_hash; // hex BLAKE2b-256
  Bytes bytes;
};

struct ScreenBounds {
  int width{}, height{};
  bool known() const { return width > 0 && height > 0; }
};

} // namespace rdesk
