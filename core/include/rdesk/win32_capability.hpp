#pragma once
#include "capability.hpp"
#include <mutex>

#ifdef _WIN32

namespace rdesk {

// GDI screen capture and SendInput injection on the interactive desktop.
class Win32Capability final : public ICapability {
public:
  Win32Capability() = default;

  std::string name() const override { return "win32-gdi"; }

  std::optional<RawFrame> capture_screen() override;

  bool send_mouse_move(int x, int y) override;
  bool send_mouse_event(int x, int y, MouseButton button,
                        bool pressed) override;
  bool send_key_event(const std::string &key, bool pressed,
                      const std::vector<std::string> &modifiers) override;

  std::vector<DisplayInfo> list_displays() override;

  std::optional<std::string> get_clipboard() override;
  bool set_clipboard(const std::string &text) override;

private:
  std::mutex mu_;
};

} // namespace rdesk

#endif
