#pragma once
#include "capability.hpp"
#include <mutex>
#include <string>

#ifndef _WIN32

namespace rdesk {

// X11 screen capture plus a uinput virtual mouse/keyboard. Either half may be
// unavailable (no DISPLAY, no /dev/uinput access); the affected calls then
// fail and the rest keeps working.
class LinuxCapability final : public ICapability {
public:
  LinuxCapability();
  ~LinuxCapability() override;

  LinuxCapability(const LinuxCapability &) = delete;
  LinuxCapability &operator=(const LinuxCapability &) = delete;

  std::string name() const override { return "linux-x11-uinput"; }

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
  bool setup_uinput();
  bool emit(int type, int code, int value);
  bool syn();
  bool move_abs(int x, int y);

  std::mutex x_mu_;          // guards display_ (display queries only)
  void *display_ = nullptr; // Display*
  std::string display_name_;
  std::mutex in_mu_;
  int uinput_fd_ = -1;
  int screen_w_ = 0, screen_h_ = 0;
};

} // namespace rdesk

#endif
