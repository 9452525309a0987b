#pragma once
#include "capability.hpp"
#include "payloads.hpp"
#include <memory>
#include <optional>
#include <string>

namespace rdesk {

struct InputOutcome {
  std::optional<ErrorCode> error;
  std::string message;

  bool ok() const { return !error; }
  static InputOutcome success() { return {}; }
  static InputOutcome fail(ErrorCode c, std::string msg) {
    return InputOutcome{c, std::move(msg)};
  }
};

// Validates pointer and keyboard events against the last known screen
// bounds and forwards valid ones exactly once.
class InputDispatcher {
public:
  explicit InputDispatcher(std::shared_ptr<ICapability> cap)
      : cap_(std::move(cap)) {}

  // Called after each successful capture.
  void set_bounds(ScreenBounds b) {
    if (b.known())
      bounds_ = b;
  }
  // Latest capture bounds, else the primary display's.
  ScreenBounds bounds();

  InputOutcome mouse_move(int x, int y);
  InputOutcome mouse_click(int x, int y, MouseButton button, bool pressed);
  InputOutcome key_event(const KeyEvent &ev);

private:
  InputOutcome check_point(int x, int y);

  std::shared_ptr<ICapability> cap_;
  ScreenBounds bounds_;
};

} // namespace rdesk
