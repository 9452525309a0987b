#pragma once
#include "capability.hpp"
#include <chrono>
#include <mutex>

namespace rdesk {

// Deterministic in-memory capability for tests and headless runs.
class FakeCapability final : public ICapability {
public:
  explicit FakeCapability(int width = 64, int height = 48);

  std::string name() const override { return "fake"; }

  std::optional<RawFrame> capture_screen() override;

  bool send_mouse_move(int x, int y) override;
  bool send_mouse_event(int x, int y, MouseButton button,
                        bool pressed) override;
  bool send_key_event(const std::string &key, bool pressed,
                      const std::vector<std::string> &modifiers) override;

  std::vector<DisplayInfo> list_displays() override;

  std::optional<std::string> get_clipboard() override;
  bool set_clipboard(const std::string &text) override;

  // Test helpers
  void set_frame_fill(std::uint8_t v);
  void set_capture_fails(bool fail);
  void set_capture_delay(std::chrono::milliseconds d);
  void set_input_fails(bool fail);
  void set_displays(std::vector<DisplayInfo> displays);
  int capture_calls() const;
  std::vector<std::string> get_injected_events() const;
  void clear_injected_events();

private:
  mutable std::mutex mu_;
  int width_, height_;
  std::uint8_t fill_ = 0;
  bool capture_fails_ = false;
  bool input_fails_ = false;
  std::chrono::milliseconds capture_delay_{0};
  int capture_calls_ = 0;
  std::vector<DisplayInfo> displays_;
  std::string clipboard_;
  std::vector<std::string> injected_events_;
};

} // namespace rdesk
