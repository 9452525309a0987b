#include "rdesk/payloads.hpp"
#include "rdesk/encoding.hpp"
#include <algorithm>

namespace rdesk {

json::Object parse_object(const Bytes &payload) {
  json::Value v;
  try {
    v = json::parse(std::string_view(
        reinterpret_cast<const char *>(payload.data()), payload.size()));
  } catch (const json::ParseError &e) {
    throw PayloadError(ErrorCode::InvalidInput,
                       std::string("malformed JSON: ") + e.what());
  }
  if (!v.is_obj())
    throw PayloadError(ErrorCode::InvalidInput, "expected a JSON object");
  return v.as_obj();
}

Bytes to_payload(const json::Object &o) { return to_bytes(json::dumps(o)); }

namespace {

std::string require_str(const json::Object &o, const std::string &k) {
  auto v = json::get_str(o, k);
  if (!v)
    throw PayloadError(ErrorCode::InvalidInput,
                       "missing or non-string field '" + k + "'");
  return *v;
}

std::vector<std::string> string_list(const json::Object &o,
                                     const std::string &k) {
  std::vector<std::string> out;
  auto it = o.find(k);
  if (it == o.end() || it->second.is_null())
    return out;
  if (!it->second.is_arr())
    throw PayloadError(ErrorCode::InvalidInput, "'" + k + "' must be a list");
  for (const auto &e : it->second.as_arr()) {
    if (!e.is_str())
      throw PayloadError(ErrorCode::InvalidInput,
                         "'" + k + "' must hold strings");
    out.push_back(e.as_str());
  }
  return out;
}

bool optional_bool(const json::Object &o, const std::string &k, bool def) {
  auto it = o.find(k);
  if (it == o.end())
    return def;
  if (!it->second.is_bool())
    throw PayloadError(ErrorCode::InvalidInput, "'" + k + "' must be a bool");
  return it->second.as_bool();
}

json::Object object_or_empty(const Bytes &payload) {
  if (payload.empty())
    return {};
  return parse_object(payload);
}

} // namespace

Request parse_request(const Message &m) {
  switch (m.type) {
  case MessageType::AUTH: {
    auto o = parse_object(m.payload);
    return AuthRequest{require_str(o, "username"), require_str(o, "password")};
  }
  case MessageType::AUTH_RESPONSE:
    return AuthResponseMsg{object_or_empty(m.payload)};
  case MessageType::MOUSE_MOVE: {
    if (m.payload.size() != 4)
      throw PayloadError(ErrorCode::InvalidInput,
                         "MOUSE_MOVE payload must be 4 bytes");
    return MouseMove{get_i16_be(m.payload.data()),
                     get_i16_be(m.payload.data() + 2)};
  }
  case MessageType::MOUSE_CLICK: {
    if (m.payload.size() != 6)
      throw PayloadError(ErrorCode::InvalidInput,
                         "MOUSE_CLICK payload must be 6 bytes");
    auto button = mouse_button_from_u8(m.payload[4]);
    if (!button)
      throw PayloadError(ErrorCode::InvalidInput, "unknown mouse button");
    if (m.payload[5] > 1)
      throw PayloadError(ErrorCode::InvalidInput, "pressed must be 0 or 1");
    return MouseClick{get_i16_be(m.payload.data()),
                      get_i16_be(m.payload.data() + 2), *button,
                      m.payload[5] == 1};
  }
  case MessageType::KEY_EVENT: {
    auto o = parse_object(m.payload);
    KeyEvent k;
    k.key = require_str(o, "key");
    k.pressed = optional_bool(o, "pressed", true);
    k.modifiers = string_list(o, "modifiers");
    return k;
  }
  case MessageType::SCREENSHOT: {
    auto o = object_or_empty(m.payload);
    ScreenshotRequest r;
    r.force = optional_bool(o, "force", false);
    r.ack = optional_bool(o, "ack", false);
    r.formats = string_list(o, "formats");
    if (o.count("stream"))
      r.stream = optional_bool(o, "stream", false);
    if (o.count("fps")) {
      auto fps = json::get_u64(o, "fps");
      if (!fps || *fps == 0 || *fps > 1000)
        throw PayloadError(ErrorCode::InvalidInput,
                           "fps must be an integer in 1..1000");
      r.fps = (int)*fps;
    }
    return r;
  }
  case MessageType::FILE_TRANSFER: {
    auto o = parse_object(m.payload);
    FileTransferRequest r;
    r.op = require_str(o, "op");
    r.args = std::move(o);
    return r;
  }
  case MessageType::CLIPBOARD_UPDATE: {
    auto o = parse_object(m.payload);
    return ClipboardUpdate{require_str(o, "text")};
  }
  case MessageType::SYSTEM_COMMAND: {
    auto o = parse_object(m.payload);
    SystemCommand c;
    c.command = require_str(o, "command");
    c.args = std::move(o);
    return c;
  }
  case MessageType::ERROR: {
    auto o = object_or_empty(m.payload);
    return ErrorReport{json::get_str(o, "code").value_or(""),
                       json::get_str(o, "message").value_or("")};
  }
  case MessageType::INFO:
    return InfoRequest{};
  case MessageType::DISCONNECT:
    return DisconnectRequest{};
  case MessageType::PING:
    return PingRequest{m.payload};
  case MessageType::PONG:
    return PongRequest{m.payload};
  }
  throw PayloadError(ErrorCode::ProtocolError, "unknown message type");
}

Bytes build_error(ErrorCode code, const std::string &message) {
  json::Object o;
  o["code"] = std::string(to_string(code));
  o["message"] = message;
  return to_payload(o);
}

Bytes build_mouse_move(int x, int y) {
  Bytes b(4);
  put_i16_be(b.data(), (std::int16_t)x);
  put_i16_be(b.data() + 2, (std::int16_t)y);
  return b;
}

Bytes build_mouse_click(int x, int y, MouseButton button, bool pressed) {
  Bytes b(6);
  put_i16_be(b.data(), (std::int16_t)x);
  put_i16_be(b.data() + 2, (std::int16_t)y);
  b[4] = (std::uint8_t)button;
  b[5] = pressed ? 1 : 0;
  return b;
}

Bytes build_screenshot(const ScreenFrame &frame) {
  json::Object meta;
  meta["seq"] = (double)frame.seq;
  meta["width"] = (double)frame.width;
  meta["height"] = (double)frame.height;
  meta["format"] = frame.format;
  meta["encoding"] = frame.encoding;
  meta["raw_size"] = (double)frame.raw_size;
  meta["hash"] = frame.content_hash;
  std::string mj = json::dumps(meta);

  Bytes out(4 + mj.size() + frame.bytes.size());
  put_u32_be(out.data(), (std::uint32_t)mj.size());
  std::copy(mj.begin(), mj.end(), out.begin() + 4);
  std::copy(frame.bytes.begin(), frame.bytes.end(),
            out.begin() + 4 + (std::ptrdiff_t)mj.size());
  return out;
}

ScreenFrame parse_screenshot(const Bytes &payload) {
  if (payload.size() < 4)
    throw PayloadError(ErrorCode::ProtocolError, "SCREENSHOT too short");
  std::uint32_t mlen = get_u32_be(payload.data());
  if (mlen > payload.size() - 4)
    throw PayloadError(ErrorCode::ProtocolError, "SCREENSHOT meta overruns");
  auto meta = parse_object(Bytes(payload.begin() + 4,
                                 payload.begin() + 4 + (std::ptrdiff_t)mlen));
  ScreenFrame f;
  f.seq = json::get_u64(meta, "seq").value_or(0);
  f.width = (int)json::get_u64(meta, "width").value_or(0);
  f.height = (int)json::get_u64(meta, "height").value_or(0);
  f.format = json::get_str(meta, "format").value_or("");
  f.encoding = json::get_str(meta, "encoding").value_or("");
  f.raw_size = json::get_u64(meta, "raw_size").value_or(0);
  f.content_hash = json::get_str(meta, "hash").value_or("");
  f.bytes.assign(payload.begin() + 4 + (std::ptrdiff_t)mlen, payload.end());
  return f;
}

} // namespace rdesk
