#include "rdesk/types.hpp"

namespace rdesk {

std::optional<MessageType> message_type_from_u32(std::uint32_t v) {
  if (v >= MESSAGE_TYPE_COUNT)
    return std::nullopt;
  return static_cast<MessageType>(v);
}

const char *to_string(MessageType t) {
  switch (t) {
  case MessageType::AUTH: return "AUTH";
  case MessageType::AUTH_RESPONSE: return "AUTH_RESPONSE";
  case MessageType::MOUSE_MOVE: return "MOUSE_MOVE";
  case MessageType::MOUSE_CLICK: return "MOUSE_CLICK";
  case MessageType::KEY_EVENT: return "KEY_EVENT";
  case MessageType::SCREENSHOT: return "SCREENSHOT";
  case MessageType::FILE_TRANSFER: return "FILE_TRANSFER";
  case MessageType::CLIPBOARD_UPDATE: return "CLIPBOARD_UPDATE";
  case MessageType::SYSTEM_COMMAND: return "SYSTEM_COMMAND";
  case MessageType::ERROR: return "ERROR";
  case MessageType::INFO: return "INFO";
  case MessageType::DISCONNECT: return "DISCONNECT";
  case MessageType::PING: return "PING";
  case MessageType::PONG: return "PONG";
  }
  return "UNKNOWN";
}

const char *to_string(ErrorCode c) {
  switch (c) {
  case ErrorCode::ProtocolError: return "ProtocolError";
  case ErrorCode::AuthError: return "AuthError";
  case ErrorCode::SessionExpired: return "SessionExpired";
  case ErrorCode::Unauthenticated: return "Unauthenticated";
  case ErrorCode::InvalidInput: return "InvalidInput";
  case ErrorCode::InputFailed: return "InputFailed";
  case ErrorCode::UnsupportedMessage: return "UnsupportedMessage";
  case ErrorCode::PathNotAllowed: return "PathNotAllowed";
  case ErrorCode::AlreadyExists: return "AlreadyExists";
  case ErrorCode::IntegrityError: return "IntegrityError";
  case ErrorCode::TransferInProgress: return "TransferInProgress";
  case ErrorCode::NoActiveTransfer: return "NoActiveTransfer";
  case ErrorCode::NotFound: return "NotFound";
  case ErrorCode::IoError: return "IoError";
  case ErrorCode::TransferTimeout: return "TransferTimeout";
  case ErrorCode::RateLimited: return "RateLimited";
  case ErrorCode::CaptureUnavailable: return "CaptureUnavailable";
  case ErrorCode::SocketFailure: return "SocketFailure";
  }
  return "Unknown";
}

std::optional<MouseButton> mouse_button_from_u8(std::uint8_t v) {
  if (v > 2)
    return std::nullopt;
  return static_cast<MouseButton>(v);
}

} // namespace rdesk
