#pragma once
#include "types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rdesk {

// Host screen and input devices. Implementations must tolerate calls from
// several connection threads at once.
class ICapability {
public:
  virtual ~ICapability() = default;

  virtual std::string name() const = 0;

  virtual std::optional<RawFrame> capture_screen() = 0;

  virtual bool send_mouse_move(int x, int y) = 0;
  virtual bool send_mouse_event(int x, int y, MouseButton button,
                                bool pressed) = 0;
  virtual bool send_key_event(const std::string &key, bool pressed,
                              const std::vector<std::string> &modifiers) = 0;

  virtual std::vector<DisplayInfo> list_displays() = 0;

  virtual std::optional<std::string> get_clipboard() = 0;
  virtual bool set_clipboard(const std::string &text) = 0;
};

// Linux: Xlib capture + uinput injection. Windows: GDI + SendInput.
std::shared_ptr<ICapability> make_platform_capability();

// Key names accepted in KEY_EVENT, lowercase.
const std::vector<std::string> &known_key_names();
bool is_known_key(std::string_view name);
bool is_known_modifier(std::string_view name);

} // namespace rdesk
