#include "rdesk/input_dispatcher.hpp"
#include "rdesk/logger.hpp"

#include <algorithm>
#include <cctype>

namespace rdesk {

ScreenBounds InputDispatcher::bounds() {
  if (bounds_.known())
    return bounds_;
  for (const auto &d : cap_->list_displays()) {
    if (d.primary && d.width > 0 && d.height > 0) {
      bounds_ = ScreenBounds{d.width, d.height};
      break;
    }
  }
  return bounds_;
}

InputOutcome InputDispatcher::check_point(int x, int y) {
  ScreenBounds b = bounds();
  if (!b.known())
    return InputOutcome::fail(ErrorCode::InvalidInput,
                              "screen bounds unknown");
  if (x < 0 || y < 0 || x >= b.width || y >= b.height)
    return InputOutcome::fail(ErrorCode::InvalidInput,
                              "coordinates (" + std::to_string(x) + "," +
                                  std::to_string(y) + ") outside " +
                                  std::to_string(b.width) + "x" +
                                  std::to_string(b.height));
  return InputOutcome::success();
}

InputOutcome InputDispatcher::mouse_move(int x, int y) {
  auto v = check_point(x, y);
  if (!v.ok())
    return v;
  if (!cap_->send_mouse_move(x, y)) {
    LOG_WARN("Mouse move injection failed");
    return InputOutcome::fail(ErrorCode::InputFailed, "mouse move rejected");
  }
  return InputOutcome::success();
}

InputOutcome InputDispatcher::mouse_click(int x, int y, MouseButton button,
                                          bool pressed) {
  auto v = check_point(x, y);
  if (!v.ok())
    return v;
  if (!cap_->send_mouse_event(x, y, button, pressed)) {
    LOG_WARN("Mouse button injection failed");
    return InputOutcome::fail(ErrorCode::InputFailed, "mouse event rejected");
  }
  return InputOutcome::success();
}

InputOutcome InputDispatcher::key_event(const KeyEvent &ev) {
  std::string key = ev.key;
  std::transform(key.begin(), key.end(), key.begin(),
                 [](unsigned char c) { return (char)std::tolower(c); });
  if (!is_known_key(key))
    return InputOutcome::fail(ErrorCode::InvalidInput,
                              "unknown key: " + ev.key);
  std::vector<std::string> mods;
  for (const auto &m : ev.modifiers) {
    if (!is_known_modifier(m))
      return InputOutcome::fail(ErrorCode::InvalidInput,
                                "unknown modifier: " + m);
    if (std::find(mods.begin(), mods.end(), m) == mods.end())
      mods.push_back(m);
  }
  if (!cap_->send_key_event(key, ev.pressed, mods)) {
    LOG_WARN("Key injection failed for " + key);
    return InputOutcome::fail(ErrorCode::InputFailed, "key event rejected");
  }
  return InputOutcome::success();
}

} // namespace rdesk
