#include "doctest/doctest.h"
#include "rdesk/input_dispatcher.hpp"
#include "test_util.hpp"

using namespace rdesk;
using namespace rdesk::test;

DOCTEST_TEST_CASE("Out-of-range clicks are rejected with nothing forwarded") {
  auto cap = std::make_shared<FakeCapability>(1920, 1080);
  InputDispatcher in(cap);

  auto r = in.mouse_click(100000, 5, MouseButton::Left, true);
  DOCTEST_REQUIRE(!r.ok());
  DOCTEST_REQUIRE(*r.error == ErrorCode::InvalidInput);
  DOCTEST_REQUIRE(!in.mouse_click(-1, 5, MouseButton::Left, true).ok());
  DOCTEST_REQUIRE(!in.mouse_click(1920, 0, MouseButton::Left, true).ok());
  DOCTEST_REQUIRE(!in.mouse_move(0, 1080).ok());

  // An off-screen click as it arrives off the wire, within int16 range.
  auto wire = std::get<MouseClick>(parse_request(
      Message{MessageType::MOUSE_CLICK,
              build_mouse_click(30000, 5, MouseButton::Left, true)}));
  DOCTEST_REQUIRE_EQ(wire.x, 30000);
  auto rejected = in.mouse_click(wire.x, wire.y, wire.button, wire.pressed);
  DOCTEST_REQUIRE(!rejected.ok());
  DOCTEST_REQUIRE(*rejected.error == ErrorCode::InvalidInput);

  DOCTEST_REQUIRE(cap->get_injected_events().empty());
}

DOCTEST_TEST_CASE("Valid pointer events are forwarded exactly once") {
  auto cap = std::make_shared<FakeCapability>(100, 50);
  InputDispatcher in(cap);
  DOCTEST_REQUIRE(in.mouse_move(0, 0).ok());
  DOCTEST_REQUIRE(in.mouse_click(99, 49, MouseButton::Right, true).ok());
  DOCTEST_REQUIRE(in.mouse_click(99, 49, MouseButton::Right, false).ok());

  auto ev = cap->get_injected_events();
  DOCTEST_REQUIRE_EQ(ev.size(), 3u);
  DOCTEST_REQUIRE_EQ(ev[0], "mouse_move:0,0");
  DOCTEST_REQUIRE_EQ(ev[1], "mouse_click:99,49,2,down");
  DOCTEST_REQUIRE_EQ(ev[2], "mouse_click:99,49,2,up");
}

DOCTEST_TEST_CASE("Capture bounds take precedence over display info") {
  auto cap = std::make_shared<FakeCapability>(100, 50);
  InputDispatcher in(cap);
  in.set_bounds(ScreenBounds{10, 10});
  DOCTEST_REQUIRE(!in.mouse_move(50, 5).ok());
  in.set_bounds(ScreenBounds{0, 0}); // unknown bounds are ignored
  DOCTEST_REQUIRE_EQ(in.bounds().width, 10);
}

DOCTEST_TEST_CASE("No display and no capture means InvalidInput") {
  auto cap = std::make_shared<FakeCapability>();
  cap->set_displays({});
  InputDispatcher in(cap);
  auto r = in.mouse_move(1, 1);
  DOCTEST_REQUIRE(*r.error == ErrorCode::InvalidInput);
}

DOCTEST_TEST_CASE("Key events are validated and normalized") {
  auto cap = std::make_shared<FakeCapability>();
  InputDispatcher in(cap);

  KeyEvent k{"A", true, {"ctrl", "shift", "ctrl"}};
  DOCTEST_REQUIRE(in.key_event(k).ok());
  KeyEvent up{"enter", false, {}};
  DOCTEST_REQUIRE(in.key_event(up).ok());

  KeyEvent bad{"hyperspace", true, {}};
  DOCTEST_REQUIRE(*in.key_event(bad).error == ErrorCode::InvalidInput);
  KeyEvent bad_mod{"a", true, {"fn"}};
  DOCTEST_REQUIRE(*in.key_event(bad_mod).error == ErrorCode::InvalidInput);

  auto ev = cap->get_injected_events();
  DOCTEST_REQUIRE_EQ(ev.size(), 2u);
  DOCTEST_REQUIRE_EQ(ev[0], "key:a,down+ctrl+shift");
  DOCTEST_REQUIRE_EQ(ev[1], "key:enter,up");
}

DOCTEST_TEST_CASE("Capability failure is InputFailed") {
  auto cap = std::make_shared<FakeCapability>();
  cap->set_input_fails(true);
  InputDispatcher in(cap);
  DOCTEST_REQUIRE(*in.mouse_move(1, 1).error == ErrorCode::InputFailed);
  KeyEvent k{"f5", true, {}};
  DOCTEST_REQUIRE(*in.key_event(k).error == ErrorCode::InputFailed);
}

DOCTEST_TEST_CASE("Key names") {
  DOCTEST_REQUIRE(is_known_key("f12"));
  DOCTEST_REQUIRE(is_known_key("pagedown"));
  DOCTEST_REQUIRE(!is_known_key("f13"));
  DOCTEST_REQUIRE(is_known_modifier("meta"));
  DOCTEST_REQUIRE(!is_known_modifier("a"));
}
