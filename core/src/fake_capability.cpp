#include "rdesk/fake_capability.hpp"
#include <thread>

namespace rdesk {

FakeCapability::FakeCapability(int width, int height)
    : width_(width), height_(height) {
  displays_.push_back(DisplayInfo{0, "fake-0", 0, 0, width, height, true});
}

std::optional<RawFrame> FakeCapability::capture_screen() {
  std::chrono::milliseconds delay;
  {
    std::lock_guard<std::mutex> lk(mu_);
    capture_calls_++;
    delay = capture_delay_;
  }
  if (delay.count() > 0)
    std::this_thread::sleep_for(delay);

  std::lock_guard<std::mutex> lk(mu_);
  if (capture_fails_)
    return std::nullopt;
  RawFrame f;
  f.width = width_;
  f.height = height_;
  f.format = "bgra32";
  f.bytes.assign((size_t)width_ * height_ * 4, fill_);
  return f;
}

bool FakeCapability::send_mouse_move(int x, int y) {
  std::lock_guard<std::mutex> lk(mu_);
  if (input_fails_)
    return false;
  injected_events_.push_back("mouse_move:" + std::to_string(x) + "," +
                             std::to_string(y));
  return true;
}

bool FakeCapability::send_mouse_event(int x, int y, MouseButton button,
                                      bool pressed) {
  std::lock_guard<std::mutex> lk(mu_);
  if (input_fails_)
    return false;
  injected_events_.push_back("mouse_click:" + std::to_string(x) + "," +
                             std::to_string(y) + "," +
                             std::to_string((int)button) + "," +
                             (pressed ? "down" : "up"));
  return true;
}

bool FakeCapability::send_key_event(const std::string &key, bool pressed,
                                    const std::vector<std::string> &modifiers) {
  std::lock_guard<std::mutex> lk(mu_);
  if (input_fails_)
    return false;
  std::string ev = "key:" + key + "," + (pressed ? "down" : "up");
  for (const auto &m : modifiers)
    ev += "+" + m;
  injected_events_.push_back(ev);
  return true;
}

std::vector<DisplayInfo> FakeCapability::list_displays() {
  std::lock_guard<std::mutex> lk(mu_);
  return displays_;
}

std::optional<std::string> FakeCapability::get_clipboard() {
  std::lock_guard<std::mutex> lk(mu_);
  return clipboard_;
}

bool FakeCapability::set_clipboard(const std::string &text) {
  std::lock_guard<std::mutex> lk(mu_);
  clipboard_ = text;
  injected_events_.push_back("clipboard_write:" + text);
  return true;
}

void FakeCapability::set_frame_fill(std::uint8_t v) {
  std::lock_guard<std::mutex> lk(mu_);
  fill_ = v;
}

void FakeCapability::set_capture_fails(bool fail) {
  std::lock_guard<std::mutex> lk(mu_);
  capture_fails_ = fail;
}

void FakeCapability::set_capture_delay(std::chrono::milliseconds d) {
  std::lock_guard<std::mutex> lk(mu_);
  capture_delay_ = d;
}

void FakeCapability::set_input_fails(bool fail) {
  std::lock_guard<std::mutex> lk(mu_);
  input_fails_ = fail;
}

void FakeCapability::set_displays(std::vector<DisplayInfo> displays) {
  std::lock_guard<std::mutex> lk(mu_);
  displays_ = std::move(displays);
}

int FakeCapability::capture_calls() const {
  std::lock_guard<std::mutex> lk(mu_);
  return capture_calls_;
}

std::vector<std::string> FakeCapability::get_injected_events() const {
  std::lock_guard<std::mutex> lk(mu_);
  return injected_events_;
}

void FakeCapability::clear_injected_events() {
  std::lock_guard<std::mutex> lk(mu_);
  injected_events_.clear();
}

} // namespace rdesk
