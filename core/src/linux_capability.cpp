#ifndef _WIN32
#include "rdesk/linux_capability.hpp"
#include "rdesk/logger.hpp"

#include <X11/Xlib.h>
#include <X11/Xutil.h>

#include <memory>

#include <linux/input.h>
#include <linux/uinput.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <map>
#include <sys/ioctl.h>
#include <unistd.h>

namespace rdesk {

namespace {

constexpr int ABS_MAX_VALUE = 32767;

const std::map<std::string, int> &evdev_keys() {
  static const std::map<std::string, int> keys = [] {
    std::map<std::string, int> m;
    const int letters[] = {KEY_A, KEY_B, KEY_C, KEY_D, KEY_E, KEY_F, KEY_G,
                           KEY_H, KEY_I, KEY_J, KEY_K, KEY_L, KEY_M, KEY_N,
                           KEY_O, KEY_P, KEY_Q, KEY_R, KEY_S, KEY_T, KEY_U,
                           KEY_V, KEY_W, KEY_X, KEY_Y, KEY_Z};
    for (int i = 0; i < 26; ++i)
      m[std::string(1, (char)('a' + i))] = letters[i];
    const int digits[] = {KEY_0, KEY_1, KEY_2, KEY_3, KEY_4,
                          KEY_5, KEY_6, KEY_7, KEY_8, KEY_9};
    for (int i = 0; i < 10; ++i)
      m[std::string(1, (char)('0' + i))] = digits[i];
    const int fkeys[] = {KEY_F1, KEY_F2, KEY_F3, KEY_F4,  KEY_F5,  KEY_F6,
                         KEY_F7, KEY_F8, KEY_F9, KEY_F10, KEY_F11, KEY_F12};
    for (int i = 0; i < 12; ++i)
      m["f" + std::to_string(i + 1)] = fkeys[i];
    m["enter"] = KEY_ENTER;
    m["escape"] = KEY_ESC;
    m["tab"] = KEY_TAB;
    m["space"] = KEY_SPACE;
    m["backspace"] = KEY_BACKSPACE;
    m["delete"] = KEY_DELETE;
    m["insert"] = KEY_INSERT;
    m["home"] = KEY_HOME;
    m["end"] = KEY_END;
    m["pageup"] = KEY_PAGEUP;
    m["pagedown"] = KEY_PAGEDOWN;
    m["up"] = KEY_UP;
    m["down"] = KEY_DOWN;
    m["left"] = KEY_LEFT;
    m["right"] = KEY_RIGHT;
    m["shift"] = KEY_LEFTSHIFT;
    m["ctrl"] = KEY_LEFTCTRL;
    m["alt"] = KEY_LEFTALT;
    m["meta"] = KEY_LEFTMETA;
    m["capslock"] = KEY_CAPSLOCK;
    m["minus"] = KEY_MINUS;
    m["equal"] = KEY_EQUAL;
    m["leftbracket"] = KEY_LEFTBRACE;
    m["rightbracket"] = KEY_RIGHTBRACE;
    m["backslash"] = KEY_BACKSLASH;
    m["semicolon"] = KEY_SEMICOLON;
    m["apostrophe"] = KEY_APOSTROPHE;
    m["grave"] = KEY_GRAVE;
    m["comma"] = KEY_COMMA;
    m["period"] = KEY_DOT;
    m["slash"] = KEY_SLASH;
    m["printscreen"] = KEY_SYSRQ;
    return m;
  }();
  return keys;
}

// Extracts one colour channel and scales it to 8 bits.
std::uint8_t mask_channel(unsigned long px, unsigned long mask) {
  if (!mask)
    return 0;
  int shift = 0;
  while (!(mask & 1)) {
    mask >>= 1;
    shift++;
  }
  int bits = 0;
  for (unsigned long m = mask; m; m >>= 1)
    bits++;
  unsigned long v = (px >> shift) & mask;
  if (bits >= 8)
    return (std::uint8_t)(v >> (bits - 8));
  return (std::uint8_t)(v << (8 - bits));
}

int button_code(MouseButton b) {
  switch (b) {
  case MouseButton::Left: return BTN_LEFT;
  case MouseButton::Middle: return BTN_MIDDLE;
  case MouseButton::Right: return BTN_RIGHT;
  }
  return BTN_LEFT;
}

} // namespace

LinuxCapability::LinuxCapability() {
  XInitThreads();
  Display *dpy = XOpenDisplay(nullptr);
  if (!dpy) {
    LOG_WARN("LinuxCapability: cannot open X display; capture disabled");
  } else {
    display_ = dpy;
    display_name_ = DisplayString(dpy);
    Screen *scr = DefaultScreenOfDisplay(dpy);
    screen_w_ = WidthOfScreen(scr);
    screen_h_ = HeightOfScreen(scr);
    LOG_INFO("LinuxCapability: X display " + std::string(DisplayString(dpy)) +
             " " + std::to_string(screen_w_) + "x" +
             std::to_string(screen_h_));
  }
  if (!setup_uinput())
    LOG_WARN("LinuxCapability: uinput unavailable; input injection disabled");
}

LinuxCapability::~LinuxCapability() {
  if (uinput_fd_ >= 0) {
    ioctl(uinput_fd_, UI_DEV_DESTROY);
    close(uinput_fd_);
  }
  if (display_)
    XCloseDisplay(static_cast<Display *>(display_));
}

bool LinuxCapability::setup_uinput() {
  int fd = open("/dev/uinput", O_WRONLY | O_NONBLOCK);
  if (fd < 0) {
    LOG_DEBUG("open /dev/uinput: " + std::string(strerror(errno)));
    return false;
  }

  bool ok = ioctl(fd, UI_SET_EVBIT, EV_KEY) >= 0 &&
            ioctl(fd, UI_SET_EVBIT, EV_SYN) >= 0 &&
            ioctl(fd, UI_SET_EVBIT, EV_ABS) >= 0 &&
            ioctl(fd, UI_SET_ABSBIT, ABS_X) >= 0 &&
            ioctl(fd, UI_SET_ABSBIT, ABS_Y) >= 0;
  for (int b : {BTN_LEFT, BTN_RIGHT, BTN_MIDDLE})
    ok = ok && ioctl(fd, UI_SET_KEYBIT, b) >= 0;
  for (const auto &[name, code] : evdev_keys())
    ok = ok && ioctl(fd, UI_SET_KEYBIT, code) >= 0;
  if (!ok) {
    LOG_WARN("uinput: capability ioctl failed");
    close(fd);
    return false;
  }

  struct uinput_setup usetup;
  std::memset(&usetup, 0, sizeof(usetup));
  usetup.id.bustype = BUS_VIRTUAL;
  usetup.id.vendor = 0x1d6b;
  usetup.id.product = 0x0104;
  std::snprintf(usetup.name, UINPUT_MAX_NAME_SIZE, "rdesk virtual input");

  for (int axis : {ABS_X, ABS_Y}) {
    struct uinput_abs_setup abs;
    std::memset(&abs, 0, sizeof(abs));
    abs.code = (std::uint16_t)axis;
    abs.absinfo.minimum = 0;
    abs.absinfo.maximum = ABS_MAX_VALUE;
    if (ioctl(fd, UI_ABS_SETUP, &abs) < 0) {
      LOG_WARN("uinput: UI_ABS_SETUP failed");
      close(fd);
      return false;
    }
  }

  if (ioctl(fd, UI_DEV_SETUP, &usetup) < 0 || ioctl(fd, UI_DEV_CREATE) < 0) {
    LOG_WARN("uinput: device creation failed: " +
             std::string(strerror(errno)));
    close(fd);
    return false;
  }
  uinput_fd_ = fd;
  return true;
}

bool LinuxCapability::emit(int type, int code, int value) {
  struct input_event ev;
  std::memset(&ev, 0, sizeof(ev));
  ev.type = (std::uint16_t)type;
  ev.code = (std::uint16_t)code;
  ev.value = value;
  return write(uinput_fd_, &ev, sizeof(ev)) == (ssize_t)sizeof(ev);
}

bool LinuxCapability::syn() { return emit(EV_SYN, SYN_REPORT, 0); }

bool LinuxCapability::move_abs(int x, int y) {
  int w = screen_w_ > 1 ? screen_w_ - 1 : 1;
  int h = screen_h_ > 1 ? screen_h_ - 1 : 1;
  int ax = (int)((long long)x * ABS_MAX_VALUE / w);
  int ay = (int)((long long)y * ABS_MAX_VALUE / h);
  return emit(EV_ABS, ABS_X, ax) && emit(EV_ABS, ABS_Y, ay);
}

std::optional<RawFrame> LinuxCapability::capture_screen() {
  if (display_name_.empty())
    return std::nullopt;
  // Own connection per capture: a stuck X server blocks only this call.
  std::unique_ptr<Display, int (*)(Display *)> conn(
      XOpenDisplay(display_name_.c_str()), XCloseDisplay);
  if (!conn) {
    LOG_WARN("Cannot open X display " + display_name_ + " for capture");
    return std::nullopt;
  }
  Display *dpy = conn.get();
  Window root = DefaultRootWindow(dpy);
  XWindowAttributes attrs;
  if (!XGetWindowAttributes(dpy, root, &attrs))
    return std::nullopt;

  XImage *img = XGetImage(dpy, root, 0, 0, (unsigned)attrs.width,
                          (unsigned)attrs.height, AllPlanes, ZPixmap);
  if (!img) {
    LOG_WARN("XGetImage failed");
    return std::nullopt;
  }

  RawFrame f;
  f.width = attrs.width;
  f.height = attrs.height;
  f.format = "bgra32";
  f.bytes.resize((size_t)f.width * f.height * 4);
  if (img->bits_per_pixel == 32 && img->byte_order == LSBFirst) {
    for (int row = 0; row < f.height; ++row)
      std::memcpy(f.bytes.data() + (size_t)row * f.width * 4,
                  img->data + (size_t)row * img->bytes_per_line,
                  (size_t)f.width * 4);
  } else {
    // Slow path for unusual visuals.
    size_t i = 0;
    for (int row = 0; row < f.height; ++row) {
      for (int col = 0; col < f.width; ++col) {
        unsigned long px = XGetPixel(img, col, row);
        f.bytes[i++] = mask_channel(px, img->blue_mask);
        f.bytes[i++] = mask_channel(px, img->green_mask);
        f.bytes[i++] = mask_channel(px, img->red_mask);
        f.bytes[i++] = 0xFF;
      }
    }
  }
  XDestroyImage(img);
  {
    std::lock_guard<std::mutex> lk(in_mu_);
    screen_w_ = f.width;
    screen_h_ = f.height;
  }
  return f;
}

bool LinuxCapability::send_mouse_move(int x, int y) {
  std::lock_guard<std::mutex> lk(in_mu_);
  if (uinput_fd_ < 0)
    return false;
  return move_abs(x, y) && syn();
}

bool LinuxCapability::send_mouse_event(int x, int y, MouseButton button,
                                       bool pressed) {
  std::lock_guard<std::mutex> lk(in_mu_);
  if (uinput_fd_ < 0)
    return false;
  return move_abs(x, y) && emit(EV_KEY, button_code(button), pressed ? 1 : 0) &&
         syn();
}

bool LinuxCapability::send_key_event(
    const std::string &key, bool pressed,
    const std::vector<std::string> &modifiers) {
  const auto &keys = evdev_keys();
  auto it = keys.find(key);
  if (it == keys.end())
    return false;

  std::lock_guard<std::mutex> lk(in_mu_);
  if (uinput_fd_ < 0)
    return false;
  bool ok = true;
  if (pressed) {
    for (const auto &m : modifiers)
      ok = ok && emit(EV_KEY, keys.at(m), 1);
    ok = ok && emit(EV_KEY, it->second, 1);
  } else {
    ok = ok && emit(EV_KEY, it->second, 0);
    for (auto m = modifiers.rbegin(); m != modifiers.rend(); ++m)
      ok = ok && emit(EV_KEY, keys.at(*m), 0);
  }
  return ok && syn();
}

std::vector<DisplayInfo> LinuxCapability::list_displays() {
  std::vector<DisplayInfo> out;
  std::lock_guard<std::mutex> lk(x_mu_);
  if (!display_)
    return out;
  Display *dpy = static_cast<Display *>(display_);
  int def = DefaultScreen(dpy);
  for (int i = 0; i < ScreenCount(dpy); ++i) {
    Screen *scr = ScreenOfDisplay(dpy, i);
    DisplayInfo d;
    d.index = i;
    d.name = std::string(DisplayString(dpy)) + "." + std::to_string(i);
    d.width = WidthOfScreen(scr);
    d.height = HeightOfScreen(scr);
    d.primary = (i == def);
    out.push_back(d);
  }
  return out;
}

std::optional<std::string> LinuxCapability::get_clipboard() {
  FILE *pipe = popen("xclip -selection clipboard -o 2>/dev/null", "r");
  if (!pipe)
    return std::nullopt;
  std::string out;
  char buf[4096];
  size_t n;
  while ((n = fread(buf, 1, sizeof(buf), pipe)) > 0)
    out.append(buf, n);
  if (pclose(pipe) != 0)
    return std::nullopt;
  return out;
}

bool LinuxCapability::set_clipboard(const std::string &text) {
  FILE *pipe = popen("xclip -selection clipboard -i 2>/dev/null", "w");
  if (!pipe)
    return false;
  bool ok = fwrite(text.data(), 1, text.size(), pipe) == text.size();
  return pclose(pipe) == 0 && ok;
}

std::shared_ptr<ICapability> make_platform_capability() {
  return std::make_shared<LinuxCapability>();
}

} // namespace rdesk
#endif
