#include "rdesk/dispatcher.hpp"
#include "rdesk/encoding.hpp"
#include "rdesk/logger.hpp"

#include <algorithm>
#include <variant>

#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#include <windows.h>
#else
#include <sys/utsname.h>
#include <unistd.h>
#endif

namespace rdesk {

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

ScreenPipelineOptions pipeline_options(const ServerConfig &c) {
  ScreenPipelineOptions o;
  o.formats = c.screen_formats;
  o.max_frames_in_flight = c.max_frames_in_flight;
  o.capture_timeout_ms = c.capture_timeout_ms;
  o.backoff_base_ms = c.capture_backoff_base_ms;
  o.backoff_max_ms = c.capture_backoff_max_ms;
  o.stream_max_fps = c.stream_max_fps;
  return o;
}

FileTransferOptions transfer_options(const ServerConfig &c) {
  FileTransferOptions o;
  o.root = c.file_root;
  o.chunk_size = c.chunk_size;
  o.chunk_timeout_ms = c.chunk_timeout_ms;
  return o;
}

json::Object display_json(const DisplayInfo &d) {
  json::Object o;
  o["index"] = (double)d.index;
  o["name"] = d.name;
  o["x"] = (double)d.x;
  o["y"] = (double)d.y;
  o["width"] = (double)d.width;
  o["height"] = (double)d.height;
  o["primary"] = d.primary;
  return o;
}

json::Array displays_json(ICapability &cap) {
  json::Array arr;
  for (const auto &d : cap.list_displays())
    arr.push_back(display_json(d));
  return arr;
}

} // namespace

std::string host_name() {
#ifdef _WIN32
  char buf[MAX_COMPUTERNAME_LENGTH + 1];
  DWORD n = sizeof(buf);
  if (GetComputerNameA(buf, &n))
    return std::string(buf, n);
  return "unknown";
#else
  char buf[256];
  if (gethostname(buf, sizeof(buf)) == 0) {
    buf[sizeof(buf) - 1] = '\0';
    return buf;
  }
  return "unknown";
#endif
}

std::string platform_name() {
#ifdef _WIN32
  return "windows";
#else
  struct utsname u;
  if (uname(&u) == 0)
    return std::string(u.sysname) + " " + u.release + " " + u.machine;
  return "unix";
#endif
}

ProtocolDispatcher::ProtocolDispatcher(ServerState &st,
                                       std::string peer_address,
                                       std::uint64_t connection_id)
    : st_(st), peer_(std::move(peer_address)), conn_id_(connection_id),
      conn_key_("conn:" + std::to_string(connection_id)),
      pipeline_(st.capability, pipeline_options(st.config)),
      input_(st.capability),
      files_(transfer_options(st.config), st.resumes, &st.chunk_limiter,
             conn_key_) {}

ProtocolDispatcher::~ProtocolDispatcher() { on_disconnect(); }

bool ProtocolDispatcher::allowed_before_auth(MessageType t) {
  return t == MessageType::AUTH || t == MessageType::PING ||
         t == MessageType::PONG || t == MessageType::DISCONNECT;
}

void ProtocolDispatcher::reply_error(DispatchResult &out, ErrorCode code,
                                     const std::string &msg) {
  out.replies.push_back(Outbound{MessageType::ERROR, build_error(code, msg)});
}

void ProtocolDispatcher::reply_input(DispatchResult &out,
                                     const InputOutcome &o) {
  if (!o.ok())
    reply_error(out, *o.error, o.message);
}

void ProtocolDispatcher::end_session(SessionState next) {
  if (!token_.empty())
    st_.sessions.revoke(token_);
  token_.clear();
  pipeline_.stop_stream();
  state_ = next;
}

bool ProtocolDispatcher::session_valid(DispatchResult &out) {
  if (st_.sessions.check(token_) == TokenStatus::Valid)
    return true;
  LOG_INFO("Session expired for " + identity_ + " (" + peer_ + ")");
  token_.clear();
  pipeline_.stop_stream();
  state_ = SessionState::Expired;
  reply_error(out, ErrorCode::SessionExpired, "session expired");
  return false;
}

DispatchResult ProtocolDispatcher::dispatch(const Message &m) {
  DispatchResult out;
  if (state_ == SessionState::Disconnected) {
    out.close = true;
    return out;
  }

  // Any inbound traffic means the client consumed what we sent.
  pipeline_.acknowledge();

  if (state_ != SessionState::Authenticated) {
    if (!allowed_before_auth(m.type)) {
      LOG_DEBUG(std::string("Rejected ") + to_string(m.type) + " in state " +
                to_string(state_));
      if (state_ == SessionState::Expired)
        reply_error(out, ErrorCode::SessionExpired, "session expired");
      else
        reply_error(out, ErrorCode::Unauthenticated,
                    "authentication required");
      return out;
    }
  } else if (!allowed_before_auth(m.type) && !session_valid(out)) {
    return out;
  }

  Request req;
  try {
    req = parse_request(m);
  } catch (const PayloadError &e) {
    LOG_DEBUG(std::string("Bad ") + to_string(m.type) + " payload: " +
              e.what());
    if (m.type == MessageType::AUTH) {
      json::Object r;
      r["success"] = false;
      r["error"] = std::string(to_string(e.code()));
      r["message"] = std::string(e.what());
      out.replies.push_back(
          Outbound{MessageType::AUTH_RESPONSE, to_payload(r)});
    } else if (m.type == MessageType::FILE_TRANSFER) {
      json::Object r;
      r["op"] = std::string("unknown");
      r["status"] = std::string("error");
      r["error"] = std::string(to_string(e.code()));
      r["message"] = std::string(e.what());
      out.replies.push_back(
          Outbound{MessageType::FILE_TRANSFER, to_payload(r)});
    } else {
      reply_error(out, e.code(), e.what());
    }
    return out;
  }

  std::visit(
      overloaded{
          [&](const AuthRequest &r) { on_auth(r, out); },
          [&](const AuthResponseMsg &) {
            reply_error(out, ErrorCode::UnsupportedMessage,
                        "AUTH_RESPONSE is server-to-client only");
          },
          [&](const MouseMove &r) {
            input_.set_bounds(pipeline_.bounds());
            reply_input(out, input_.mouse_move(r.x, r.y));
          },
          [&](const MouseClick &r) {
            input_.set_bounds(pipeline_.bounds());
            reply_input(out,
                        input_.mouse_click(r.x, r.y, r.button, r.pressed));
          },
          [&](const KeyEvent &r) { reply_input(out, input_.key_event(r)); },
          [&](const ScreenshotRequest &r) { on_screenshot(r, out); },
          [&](const FileTransferRequest &r) {
            out.replies.push_back(
                Outbound{MessageType::FILE_TRANSFER,
                         to_payload(files_.handle(r, st_.clock()))});
          },
          [&](const ClipboardUpdate &r) {
            if (!st_.capability->set_clipboard(r.text))
              reply_error(out, ErrorCode::InputFailed,
                          "clipboard update rejected");
          },
          [&](const SystemCommand &c) { on_system_command(c, out); },
          [&](const ErrorReport &r) {
            LOG_WARN("Client " + peer_ + " reported error " + r.code + ": " +
                     r.message);
          },
          [&](const InfoRequest &) {
            out.replies.push_back(
                Outbound{MessageType::INFO, to_payload(info_object())});
          },
          [&](const DisconnectRequest &) {
            LOG_INFO("Client " + peer_ + " requested disconnect");
            out.close = true;
          },
          [&](const PingRequest &r) {
            out.replies.push_back(Outbound{MessageType::PONG, r.payload});
          },
          [&](const PongRequest &) {},
      },
      req);
  return out;
}

void ProtocolDispatcher::on_auth(const AuthRequest &r, DispatchResult &out) {
  auto respond = [&](json::Object body) {
    out.replies.push_back(
        Outbound{MessageType::AUTH_RESPONSE, to_payload(body)});
  };
  auto failure = [&](ErrorCode code, const std::string &msg) {
    json::Object b;
    b["success"] = false;
    b["error"] = std::string(to_string(code));
    b["message"] = msg;
    respond(std::move(b));
  };

  if (!st_.auth_limiter.is_allowed(peer_)) {
    LOG_WARN("AUTH from " + peer_ + " rejected: too many failures");
    failure(ErrorCode::RateLimited, "too many failed attempts; try later");
    return;
  }

  if (state_ == SessionState::Authenticated)
    end_session(SessionState::Unauthenticated);
  state_ = SessionState::AuthPending;

  auto rec = st_.credentials.verify(r.username, r.password);
  if (!rec) {
    st_.auth_limiter.record(peer_);
    state_ = SessionState::Unauthenticated;
    LOG_WARN("Authentication failed for '" + r.username + "' from " + peer_);
    failure(ErrorCode::AuthError, "invalid username or password");
    return;
  }

  st_.auth_limiter.reset(peer_);
  Session s = st_.sessions.create(rec->username);
  Bytes nonce = crypto::random_bytes(crypto::TOKEN_SIZE);

  token_ = s.token;
  identity_ = rec->username;
  expires_at_ = s.expires_at;
  state_ = SessionState::Authenticated;
  files_.set_identity(identity_);
  out.new_key = crypto::derive_transport_key(rec->key, nonce);
  LOG_INFO("User '" + identity_ + "' authenticated from " + peer_);

  json::Object b;
  b["success"] = true;
  b["token"] = s.token;
  b["expires_in"] = (double)st_.sessions.ttl().count();
  b["salt"] = hex_encode(rec->salt);
  b["iterations"] = (double)rec->iterations;
  b["session_nonce"] = hex_encode(nonce);
  b["cipher"] = std::string(crypto::CIPHER_NAME);
  b["protocol_version"] = std::string(PROTOCOL_VERSION);
  respond(std::move(b));
}

void ProtocolDispatcher::emit_frame(const FrameResult &fr,
                                    DispatchResult &out) {
  switch (fr.outcome) {
  case FrameOutcome::Frame: {
    input_.set_bounds(pipeline_.bounds());
    Bytes payload = build_screenshot(fr.frame);
    if (payload.size() + crypto::SEAL_OVERHEAD > st_.config.max_message_size) {
      LOG_WARN("Frame of " + std::to_string(payload.size()) + " bytes (" +
               fr.frame.encoding + ") exceeds max_message_size");
      // Never sent: release its slot and resend on the next request.
      pipeline_.acknowledge();
      pipeline_.force_next();
      pipeline_.stop_stream();
      reply_error(out, ErrorCode::CaptureUnavailable,
                  "frame exceeds the maximum message size; use a compressed "
                  "format");
      break;
    }
    out.replies.push_back(Outbound{MessageType::SCREENSHOT, std::move(payload)});
    break;
  }
  case FrameOutcome::CaptureFailed:
    reply_error(out, ErrorCode::CaptureUnavailable,
                "screen capture unavailable");
    break;
  case FrameOutcome::Unchanged:
  case FrameOutcome::Throttled:
  case FrameOutcome::BackedOff:
    LOG_TRACE(std::string("Screen request: ") + to_string(fr.outcome));
    break;
  }
}

void ProtocolDispatcher::on_screenshot(const ScreenshotRequest &r,
                                       DispatchResult &out) {
  if (r.ack)
    pipeline_.acknowledge();
  if (!pipeline_.negotiate(r.formats)) {
    reply_error(out, ErrorCode::InvalidInput,
                "no supported screen format in request");
    return;
  }
  auto now = st_.clock();
  if (r.stream) {
    if (!*r.stream) {
      pipeline_.stop_stream();
      return;
    }
    pipeline_.start_stream(r.fps, now);
    if (r.force)
      pipeline_.force_next();
    if (auto fr = pipeline_.on_tick(now))
      emit_frame(*fr, out);
    return;
  }
  emit_frame(pipeline_.request_frame(r.force, now), out);
}

void ProtocolDispatcher::on_system_command(const SystemCommand &c,
                                           DispatchResult &out) {
  json::Object b;
  b["command"] = c.command;
  b["status"] = std::string("ok");

  if (c.command == "logout") {
    LOG_INFO("User '" + identity_ + "' logged out");
    end_session(SessionState::LoggedOut);
  } else if (c.command == "list_displays") {
    b["displays"] = displays_json(*st_.capability);
  } else if (c.command == "session") {
    b["identity"] = identity_;
    b["state"] = std::string(to_string(state_));
    b["expires_in"] =
        (double)std::max<long long>(0, ms_between(st_.clock(), expires_at_) /
                                           1000);
    b["connection"] = conn_key_;
    json::Array logs;
    for (const auto &l : Logger::get().get_recent_logs(20)) {
      json::Object e;
      e["level"] = std::string(to_string(l.level));
      e["time"] = l.timestamp;
      e["message"] = l.message;
      logs.push_back(std::move(e));
    }
    b["recent_logs"] = std::move(logs);
  } else if (c.command == "refresh") {
    pipeline_.force_next();
  } else if (c.command == "clipboard_get") {
    auto text = st_.capability->get_clipboard();
    if (!text) {
      reply_error(out, ErrorCode::InputFailed, "clipboard unavailable");
      return;
    }
    json::Object cb;
    cb["text"] = *text;
    out.replies.push_back(
        Outbound{MessageType::CLIPBOARD_UPDATE, to_payload(cb)});
    return;
  } else {
    reply_error(out, ErrorCode::InvalidInput,
                "unknown system command: " + c.command);
    return;
  }
  out.replies.push_back(Outbound{MessageType::SYSTEM_COMMAND, to_payload(b)});
}

json::Object ProtocolDispatcher::info_object() {
  json::Object o;
  o["protocol_version"] = std::string(PROTOCOL_VERSION);
  o["hostname"] = host_name();
  o["platform"] = platform_name();
  o["capability"] = st_.capability->name();
  o["displays"] = displays_json(*st_.capability);
  ScreenBounds b = input_.bounds();
  json::Object screen;
  screen["width"] = (double)b.width;
  screen["height"] = (double)b.height;
  o["screen"] = std::move(screen);
  o["identity"] = identity_;
  o["session_expires_in"] = (double)std::max<long long>(
      0, ms_between(st_.clock(), expires_at_) / 1000);
  o["file_root"] = files_.root().string();
  json::Array formats;
  for (const auto &f : st_.config.screen_formats)
    formats.push_back(f);
  o["formats"] = std::move(formats);
  return o;
}

DispatchResult ProtocolDispatcher::tick() {
  DispatchResult out;
  if (state_ == SessionState::Disconnected)
    return out;
  auto now = st_.clock();

  if (auto timeout = files_.tick(now))
    out.replies.push_back(
        Outbound{MessageType::FILE_TRANSFER, to_payload(*timeout)});

  if (state_ == SessionState::Authenticated && pipeline_.streaming()) {
    if (st_.sessions.check(token_) != TokenStatus::Valid) {
      LOG_INFO("Session expired during stream for " + identity_);
      token_.clear();
      pipeline_.stop_stream();
      state_ = SessionState::Expired;
      return out;
    }
    if (auto fr = pipeline_.on_tick(now))
      emit_frame(*fr, out);
  }
  return out;
}

void ProtocolDispatcher::on_disconnect() {
  if (torn_down_)
    return;
  torn_down_ = true;
  end_session(SessionState::Disconnected);
  files_.on_disconnect();
  st_.chunk_limiter.reset(conn_key_);
}

} // namespace rdesk
