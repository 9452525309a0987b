#include "doctest/doctest.h"
#include "rdesk/dispatcher.hpp"
#include "test_util.hpp"

using namespace rdesk;
using namespace rdesk::test;
using std::chrono::milliseconds;
using std::chrono::seconds;

namespace {

Message msg(MessageType t, const json::Object &o) { return {t, to_payload(o)}; }
Message msg(MessageType t, Bytes payload = {}) {
  return {t, std::move(payload)};
}

Message auth_msg(const std::string &user, const std::string &pw) {
  json::Object o;
  o["username"] = user;
  o["password"] = pw;
  return msg(MessageType::AUTH, o);
}

Message command(const std::string &name) {
  json::Object o;
  o["command"] = name;
  return msg(MessageType::SYSTEM_COMMAND, o);
}

json::Object body(const Outbound &o) { return parse_object(o.payload); }

std::string error_code(const DispatchResult &r) {
  DOCTEST_REQUIRE_EQ(r.replies.size(), 1u);
  DOCTEST_REQUIRE(r.replies[0].type == MessageType::ERROR);
  return *json::get_str(body(r.replies[0]), "code");
}

void login(ProtocolDispatcher &d) {
  auto r = d.dispatch(auth_msg("alice", "secret"));
  DOCTEST_REQUIRE_EQ(r.replies.size(), 1u);
  DOCTEST_REQUIRE(*json::get_bool(body(r.replies[0]), "success"));
  DOCTEST_REQUIRE(d.state() == SessionState::Authenticated);
}

} // namespace

DOCTEST_TEST_CASE("Protected messages are refused before AUTH") {
  Fixture f;
  ProtocolDispatcher d(*f.st, "1.2.3.4", 1);

  DOCTEST_REQUIRE_EQ(error_code(d.dispatch(msg(MessageType::INFO))),
                     "Unauthenticated");
  DOCTEST_REQUIRE_EQ(
      error_code(d.dispatch(msg(MessageType::MOUSE_MOVE,
                                build_mouse_move(1, 1)))),
      "Unauthenticated");
  DOCTEST_REQUIRE_EQ(error_code(d.dispatch(command("list_displays"))),
                     "Unauthenticated");
  DOCTEST_REQUIRE(f.cap->get_injected_events().empty());
  DOCTEST_REQUIRE_EQ(f.cap->capture_calls(), 0);

  // PING is answered in any state.
  auto r = d.dispatch(msg(MessageType::PING, to_bytes("hi")));
  DOCTEST_REQUIRE_EQ(r.replies.size(), 1u);
  DOCTEST_REQUIRE(r.replies[0].type == MessageType::PONG);
  DOCTEST_REQUIRE_EQ(to_string(r.replies[0].payload), "hi");
}

DOCTEST_TEST_CASE("Successful AUTH issues a token and a transport key") {
  Fixture f;
  ProtocolDispatcher d(*f.st, "1.2.3.4", 1);
  auto r = d.dispatch(auth_msg("alice", "secret"));
  DOCTEST_REQUIRE_EQ(r.replies.size(), 1u);
  DOCTEST_REQUIRE(r.replies[0].type == MessageType::AUTH_RESPONSE);
  DOCTEST_REQUIRE(r.new_key.has_value());

  auto b = body(r.replies[0]);
  DOCTEST_REQUIRE(*json::get_bool(b, "success"));
  auto token = *json::get_str(b, "token");
  DOCTEST_REQUIRE_EQ(token.size(), 64u);
  DOCTEST_REQUIRE_EQ(token, d.token());
  DOCTEST_REQUIRE_EQ(*json::get_u64(b, "expires_in"), 3600u);
  DOCTEST_REQUIRE_EQ(*json::get_u64(b, "iterations"), TEST_ITERATIONS);
  DOCTEST_REQUIRE_EQ(*json::get_str(b, "protocol_version"),
                     std::string(PROTOCOL_VERSION));
  DOCTEST_REQUIRE(f.st->sessions.check(token) == TokenStatus::Valid);
  DOCTEST_REQUIRE_EQ(d.identity(), "alice");

  // The client can derive the same key from what the reply carries.
  auto salt = *hex_decode(*json::get_str(b, "salt"));
  auto nonce = *hex_decode(*json::get_str(b, "session_nonce"));
  auto k = crypto::derive_key("secret", salt, TEST_ITERATIONS);
  DOCTEST_REQUIRE(crypto::derive_transport_key(k, nonce) == *r.new_key);
}

DOCTEST_TEST_CASE("Wrong password and unknown user are indistinguishable") {
  Fixture f;
  ProtocolDispatcher d(*f.st, "1.2.3.4", 1);
  auto a = body(d.dispatch(auth_msg("alice", "wrong")).replies.at(0));
  auto b = body(d.dispatch(auth_msg("mallory", "secret")).replies.at(0));
  DOCTEST_REQUIRE(!*json::get_bool(a, "success"));
  DOCTEST_REQUIRE_EQ(*json::get_str(a, "error"), "AuthError");
  DOCTEST_REQUIRE_EQ(*json::get_str(a, "message"),
                     *json::get_str(b, "message"));
  DOCTEST_REQUIRE(a.count("token") == 0);
  DOCTEST_REQUIRE(d.state() == SessionState::Unauthenticated);
  DOCTEST_REQUIRE_EQ(f.st->sessions.size(), 0u);
}

DOCTEST_TEST_CASE("Malformed AUTH payload gets a failed AUTH_RESPONSE") {
  Fixture f;
  ProtocolDispatcher d(*f.st, "1.2.3.4", 1);
  auto r = d.dispatch(msg(MessageType::AUTH, to_bytes("{\"username\":")));
  DOCTEST_REQUIRE_EQ(r.replies.size(), 1u);
  DOCTEST_REQUIRE(r.replies[0].type == MessageType::AUTH_RESPONSE);
  auto b = body(r.replies[0]);
  DOCTEST_REQUIRE(!*json::get_bool(b, "success"));
  DOCTEST_REQUIRE_EQ(*json::get_str(b, "error"), "InvalidInput");
}

DOCTEST_TEST_CASE("Repeated failures lock out the peer") {
  Fixture f;
  ProtocolDispatcher d(*f.st, "1.2.3.4", 1);
  for (int i = 0; i < 5; ++i)
    d.dispatch(auth_msg("alice", "nope"));

  auto b = body(d.dispatch(auth_msg("alice", "secret")).replies.at(0));
  DOCTEST_REQUIRE(!*json::get_bool(b, "success"));
  DOCTEST_REQUIRE_EQ(*json::get_str(b, "error"), "RateLimited");

  // Another peer is unaffected.
  ProtocolDispatcher other(*f.st, "5.6.7.8", 2);
  login(other);

  // The window slides.
  f.clock.advance(seconds(301));
  login(d);
}

DOCTEST_TEST_CASE("Expired session refuses protected messages") {
  Fixture f;
  ProtocolDispatcher d(*f.st, "1.2.3.4", 1);
  login(d);
  f.clock.advance(seconds(3600));
  DOCTEST_REQUIRE_EQ(error_code(d.dispatch(msg(MessageType::INFO))),
                     "SessionExpired");
  DOCTEST_REQUIRE(d.state() == SessionState::Expired);
  DOCTEST_REQUIRE_EQ(error_code(d.dispatch(msg(MessageType::INFO))),
                     "SessionExpired");

  // Re-authentication restores access.
  login(d);
  auto r = d.dispatch(msg(MessageType::INFO));
  DOCTEST_REQUIRE(r.replies.at(0).type == MessageType::INFO);
}

DOCTEST_TEST_CASE("INFO describes the host") {
  Fixture f;
  ProtocolDispatcher d(*f.st, "1.2.3.4", 1);
  login(d);
  auto r = d.dispatch(msg(MessageType::INFO));
  DOCTEST_REQUIRE_EQ(r.replies.size(), 1u);
  auto b = body(r.replies[0]);
  DOCTEST_REQUIRE_EQ(*json::get_str(b, "capability"), "fake");
  DOCTEST_REQUIRE_EQ(*json::get_str(b, "identity"), "alice");
  DOCTEST_REQUIRE_EQ(json::get_arr(b, "displays")->size(), 1u);
  const auto &screen = b.at("screen").as_obj();
  DOCTEST_REQUIRE_EQ(*json::get_u64(screen, "width"), 64u);
  DOCTEST_REQUIRE_EQ(*json::get_u64(screen, "height"), 48u);
}

DOCTEST_TEST_CASE("Identical screens produce one SCREENSHOT") {
  Fixture f;
  ProtocolDispatcher d(*f.st, "1.2.3.4", 1);
  login(d);

  auto first = d.dispatch(msg(MessageType::SCREENSHOT));
  DOCTEST_REQUIRE_EQ(first.replies.size(), 1u);
  DOCTEST_REQUIRE(first.replies[0].type == MessageType::SCREENSHOT);
  auto frame = parse_screenshot(first.replies[0].payload);
  DOCTEST_REQUIRE_EQ(frame.width, 64);
  DOCTEST_REQUIRE_EQ(frame.encoding, "zlib");

  auto second = d.dispatch(msg(MessageType::SCREENSHOT));
  DOCTEST_REQUIRE(second.replies.empty());

  json::Object force;
  force["force"] = true;
  auto third = d.dispatch(msg(MessageType::SCREENSHOT, force));
  DOCTEST_REQUIRE_EQ(third.replies.size(), 1u);
  DOCTEST_REQUIRE(parse_screenshot(third.replies[0].payload).seq > frame.seq);

  f.cap->set_frame_fill(7);
  auto changed = d.dispatch(msg(MessageType::SCREENSHOT));
  DOCTEST_REQUIRE_EQ(changed.replies.size(), 1u);
}

DOCTEST_TEST_CASE("Screen format negotiation") {
  Fixture f;
  ProtocolDispatcher d(*f.st, "1.2.3.4", 1);
  login(d);
  json::Object o;
  json::Array formats;
  formats.push_back(std::string("h264"));
  o["formats"] = formats;
  DOCTEST_REQUIRE_EQ(error_code(d.dispatch(msg(MessageType::SCREENSHOT, o))),
                     "InvalidInput");

  formats.push_back(std::string("raw"));
  o["formats"] = formats;
  auto r = d.dispatch(msg(MessageType::SCREENSHOT, o));
  auto frame = parse_screenshot(r.replies.at(0).payload);
  DOCTEST_REQUIRE_EQ(frame.encoding, "raw");
  DOCTEST_REQUIRE_EQ(frame.bytes.size(), frame.raw_size);
}

DOCTEST_TEST_CASE("Frames larger than the message limit are not sent") {
  Fixture f;
  // 64x48 bgra32 raw is 12288 bytes; uniform zlib output is far smaller.
  f.st->config.max_message_size = 4096;
  ProtocolDispatcher d(*f.st, "1.2.3.4", 1);
  login(d);

  json::Object raw;
  json::Array formats;
  formats.push_back(std::string("raw"));
  raw["formats"] = formats;
  DOCTEST_REQUIRE_EQ(error_code(d.dispatch(msg(MessageType::SCREENSHOT, raw))),
                     "CaptureUnavailable");
  DOCTEST_REQUIRE_EQ(d.pipeline().in_flight(), 0);
  DOCTEST_REQUIRE_EQ(
      error_code(d.dispatch(msg(MessageType::SCREENSHOT, raw))),
      "CaptureUnavailable");

  json::Object zlib;
  json::Array z;
  z.push_back(std::string("zlib"));
  zlib["formats"] = z;
  auto r = d.dispatch(msg(MessageType::SCREENSHOT, zlib));
  DOCTEST_REQUIRE_EQ(r.replies.size(), 1u);
  DOCTEST_REQUIRE(r.replies[0].type == MessageType::SCREENSHOT);
  DOCTEST_REQUIRE(r.replies[0].payload.size() <= 4096u);
}

DOCTEST_TEST_CASE("Capture failure is reported") {
  Fixture f;
  f.cap->set_capture_fails(true);
  ProtocolDispatcher d(*f.st, "1.2.3.4", 1);
  login(d);
  DOCTEST_REQUIRE_EQ(error_code(d.dispatch(msg(MessageType::SCREENSHOT))),
                     "CaptureUnavailable");
  // Backed off: the next request does not hit the capability.
  int calls = f.cap->capture_calls();
  DOCTEST_REQUIRE(d.dispatch(msg(MessageType::SCREENSHOT)).replies.empty());
  DOCTEST_REQUIRE_EQ(f.cap->capture_calls(), calls);
}

DOCTEST_TEST_CASE("Input is validated against the screen") {
  Fixture f;
  ProtocolDispatcher d(*f.st, "1.2.3.4", 1);
  login(d);

  auto ok = d.dispatch(msg(MessageType::MOUSE_CLICK,
                           build_mouse_click(10, 20, MouseButton::Left, true)));
  DOCTEST_REQUIRE(ok.replies.empty());

  DOCTEST_REQUIRE_EQ(
      error_code(d.dispatch(msg(
          MessageType::MOUSE_CLICK,
          build_mouse_click(100, 20, MouseButton::Left, true)))),
      "InvalidInput");
  DOCTEST_REQUIRE_EQ(error_code(d.dispatch(msg(MessageType::MOUSE_MOVE,
                                               build_mouse_move(-1, 0)))),
                     "InvalidInput");
  DOCTEST_REQUIRE_EQ(error_code(d.dispatch(msg(MessageType::MOUSE_MOVE,
                                               Bytes{0, 1}))),
                     "InvalidInput");

  auto events = f.cap->get_injected_events();
  DOCTEST_REQUIRE_EQ(events.size(), 1u);
  DOCTEST_REQUIRE(events[0].rfind("mouse_click:10,20", 0) == 0);

  f.cap->set_input_fails(true);
  DOCTEST_REQUIRE_EQ(error_code(d.dispatch(msg(MessageType::MOUSE_MOVE,
                                               build_mouse_move(1, 1)))),
                     "InputFailed");
}

DOCTEST_TEST_CASE("Clipboard set and get") {
  Fixture f;
  ProtocolDispatcher d(*f.st, "1.2.3.4", 1);
  login(d);
  json::Object cb;
  cb["text"] = std::string("copied");
  DOCTEST_REQUIRE(d.dispatch(msg(MessageType::CLIPBOARD_UPDATE, cb))
                      .replies.empty());
  auto r = d.dispatch(command("clipboard_get"));
  DOCTEST_REQUIRE_EQ(r.replies.size(), 1u);
  DOCTEST_REQUIRE(r.replies[0].type == MessageType::CLIPBOARD_UPDATE);
  DOCTEST_REQUIRE_EQ(*json::get_str(body(r.replies[0]), "text"), "copied");
}

DOCTEST_TEST_CASE("System commands") {
  Fixture f;
  ProtocolDispatcher d(*f.st, "1.2.3.4", 1);
  login(d);

  auto displays = d.dispatch(command("list_displays"));
  auto b = body(displays.replies.at(0));
  DOCTEST_REQUIRE_EQ(*json::get_str(b, "status"), "ok");
  DOCTEST_REQUIRE_EQ(json::get_arr(b, "displays")->size(), 1u);

  auto session = body(d.dispatch(command("session")).replies.at(0));
  DOCTEST_REQUIRE_EQ(*json::get_str(session, "identity"), "alice");
  DOCTEST_REQUIRE_EQ(*json::get_str(session, "connection"), "conn:1");

  DOCTEST_REQUIRE_EQ(error_code(d.dispatch(command("reboot"))),
                     "InvalidInput");

  std::string token = d.token();
  auto out = d.dispatch(command("logout"));
  DOCTEST_REQUIRE(out.replies.at(0).type == MessageType::SYSTEM_COMMAND);
  DOCTEST_REQUIRE(d.state() == SessionState::LoggedOut);
  DOCTEST_REQUIRE(f.st->sessions.check(token) == TokenStatus::Unknown);
  DOCTEST_REQUIRE_EQ(error_code(d.dispatch(msg(MessageType::INFO))),
                     "Unauthenticated");
}

DOCTEST_TEST_CASE("File transfer through the dispatcher") {
  Fixture f;
  ProtocolDispatcher d(*f.st, "1.2.3.4", 1);
  login(d);
  json::Object o;
  o["op"] = std::string("list");
  auto r = d.dispatch(msg(MessageType::FILE_TRANSFER, o));
  DOCTEST_REQUIRE(r.replies.at(0).type == MessageType::FILE_TRANSFER);
  DOCTEST_REQUIRE_EQ(*json::get_str(body(r.replies[0]), "status"), "ok");

  auto bad = d.dispatch(msg(MessageType::FILE_TRANSFER, json::Object{}));
  auto bb = body(bad.replies.at(0));
  DOCTEST_REQUIRE_EQ(*json::get_str(bb, "op"), "unknown");
  DOCTEST_REQUIRE_EQ(*json::get_str(bb, "error"), "InvalidInput");
}

DOCTEST_TEST_CASE("Disconnect revokes the session") {
  Fixture f;
  std::string token;
  {
    ProtocolDispatcher d(*f.st, "1.2.3.4", 1);
    login(d);
    token = d.token();
    auto r = d.dispatch(msg(MessageType::DISCONNECT));
    DOCTEST_REQUIRE(r.close);
    d.on_disconnect();
    d.on_disconnect();
    DOCTEST_REQUIRE(d.state() == SessionState::Disconnected);
    DOCTEST_REQUIRE(d.dispatch(msg(MessageType::INFO)).close);
  }
  DOCTEST_REQUIRE(f.st->sessions.check(token) == TokenStatus::Unknown);
}

DOCTEST_TEST_CASE("Streaming emits frames on tick") {
  Fixture f;
  ProtocolDispatcher d(*f.st, "1.2.3.4", 1);
  login(d);
  json::Object o;
  o["stream"] = true;
  o["fps"] = 10.0;
  auto first = d.dispatch(msg(MessageType::SCREENSHOT, o));
  DOCTEST_REQUIRE_EQ(first.replies.size(), 1u);
  DOCTEST_REQUIRE(d.pipeline().streaming());

  // Not acknowledged yet: nothing more is sent.
  f.cap->set_frame_fill(3);
  f.clock.advance(milliseconds(200));
  DOCTEST_REQUIRE(d.tick().replies.empty());

  d.dispatch(msg(MessageType::PONG));
  f.clock.advance(milliseconds(200));
  auto next = d.tick();
  DOCTEST_REQUIRE_EQ(next.replies.size(), 1u);
  DOCTEST_REQUIRE(next.replies[0].type == MessageType::SCREENSHOT);

  json::Object stop;
  stop["stream"] = false;
  d.dispatch(msg(MessageType::SCREENSHOT, stop));
  DOCTEST_REQUIRE(!d.pipeline().streaming());
}
