#ifdef _WIN32
// rdesk headers come first: wingdi.h defines an ERROR macro.
#include "rdesk/logger.hpp"
#include "rdesk/win32_capability.hpp"

#define WIN32_LEAN_AND_MEAN
#include <windows.h>

#include <cstring>
#include <map>

namespace rdesk {

namespace {

const std::map<std::string, WORD> &vk_keys() {
  static const std::map<std::string, WORD> keys = [] {
    std::map<std::string, WORD> m;
    for (char c = 'a'; c <= 'z'; ++c)
      m[std::string(1, c)] = (WORD)('A' + (c - 'a'));
    for (char c = '0'; c <= '9'; ++c)
      m[std::string(1, c)] = (WORD)c;
    for (int i = 0; i < 12; ++i)
      m["f" + std::to_string(i + 1)] = (WORD)(VK_F1 + i);
    m["enter"] = VK_RETURN;
    m["escape"] = VK_ESCAPE;
    m["tab"] = VK_TAB;
    m["space"] = VK_SPACE;
    m["backspace"] = VK_BACK;
    m["delete"] = VK_DELETE;
    m["insert"] = VK_INSERT;
    m["home"] = VK_HOME;
    m["end"] = VK_END;
    m["pageup"] = VK_PRIOR;
    m["pagedown"] = VK_NEXT;
    m["up"] = VK_UP;
    m["down"] = VK_DOWN;
    m["left"] = VK_LEFT;
    m["right"] = VK_RIGHT;
    m["shift"] = VK_SHIFT;
    m["ctrl"] = VK_CONTROL;
    m["alt"] = VK_MENU;
    m["meta"] = VK_LWIN;
    m["capslock"] = VK_CAPITAL;
    m["minus"] = VK_OEM_MINUS;
    m["equal"] = VK_OEM_PLUS;
    m["leftbracket"] = VK_OEM_4;
    m["rightbracket"] = VK_OEM_6;
    m["backslash"] = VK_OEM_5;
    m["semicolon"] = VK_OEM_1;
    m["apostrophe"] = VK_OEM_7;
    m["grave"] = VK_OEM_3;
    m["comma"] = VK_OEM_COMMA;
    m["period"] = VK_OEM_PERIOD;
    m["slash"] = VK_OEM_2;
    m["printscreen"] = VK_SNAPSHOT;
    return m;
  }();
  return keys;
}

INPUT abs_move(int x, int y) {
  int sw = GetSystemMetrics(SM_CXSCREEN);
  int sh = GetSystemMetrics(SM_CYSCREEN);
  if (sw <= 1) sw = 2;
  if (sh <= 1) sh = 2;
  INPUT in = {};
  in.type = INPUT_MOUSE;
  in.mi.dx = (x * 65535) / (sw - 1);
  in.mi.dy = (y * 65535) / (sh - 1);
  in.mi.dwFlags = MOUSEEVENTF_ABSOLUTE | MOUSEEVENTF_MOVE;
  return in;
}

INPUT key_input(WORD vk, bool pressed) {
  INPUT in = {};
  in.type = INPUT_KEYBOARD;
  in.ki.wVk = vk;
  in.ki.dwFlags = pressed ? 0 : KEYEVENTF_KEYUP;
  return in;
}

BOOL CALLBACK collect_monitor(HMONITOR mon, HDC, LPRECT, LPARAM data) {
  auto *out = reinterpret_cast<std::vector<DisplayInfo> *>(data);
  MONITORINFOEXA mi;
  mi.cbSize = sizeof(mi);
  if (!GetMonitorInfoA(mon, &mi))
    return TRUE;
  DisplayInfo d;
  d.index = (int)out->size();
  d.name = mi.szDevice;
  d.x = mi.rcMonitor.left;
  d.y = mi.rcMonitor.top;
  d.width = mi.rcMonitor.right - mi.rcMonitor.left;
  d.height = mi.rcMonitor.bottom - mi.rcMonitor.top;
  d.primary = (mi.dwFlags & MONITORINFOF_PRIMARY) != 0;
  out->push_back(d);
  return TRUE;
}

} // namespace

std::optional<RawFrame> Win32Capability::capture_screen() {
  std::lock_guard<std::mutex> lk(mu_);
  int w = GetSystemMetrics(SM_CXSCREEN);
  int h = GetSystemMetrics(SM_CYSCREEN);
  if (w <= 0 || h <= 0)
    return std::nullopt;

  HDC screen = GetDC(nullptr);
  if (!screen)
    return std::nullopt;
  HDC mem = CreateCompatibleDC(screen);
  HBITMAP bmp = CreateCompatibleBitmap(screen, w, h);
  HGDIOBJ old = SelectObject(mem, bmp);

  std::optional<RawFrame> result;
  if (BitBlt(mem, 0, 0, w, h, screen, 0, 0, SRCCOPY | CAPTUREBLT)) {
    BITMAPINFO bi = {};
    bi.bmiHeader.biSize = sizeof(BITMAPINFOHEADER);
    bi.bmiHeader.biWidth = w;
    bi.bmiHeader.biHeight = -h; // top-down
    bi.bmiHeader.biPlanes = 1;
    bi.bmiHeader.biBitCount = 32;
    bi.bmiHeader.biCompression = BI_RGB;

    RawFrame f;
    f.width = w;
    f.height = h;
    f.format = "bgra32";
    f.bytes.resize((size_t)w * h * 4);
    if (GetDIBits(mem, bmp, 0, (UINT)h, f.bytes.data(), &bi, DIB_RGB_COLORS) ==
        h)
      result = std::move(f);
    else
      LOG_WARN("GetDIBits failed: " + std::to_string(GetLastError()));
  } else {
    LOG_WARN("BitBlt failed: " + std::to_string(GetLastError()));
  }

  SelectObject(mem, old);
  DeleteObject(bmp);
  DeleteDC(mem);
  ReleaseDC(nullptr, screen);
  return result;
}

bool Win32Capability::send_mouse_move(int x, int y) {
  INPUT in = abs_move(x, y);
  return SendInput(1, &in, sizeof(INPUT)) == 1;
}

bool Win32Capability::send_mouse_event(int x, int y, MouseButton button,
                                       bool pressed) {
  INPUT in = abs_move(x, y);
  switch (button) {
  case MouseButton::Left:
    in.mi.dwFlags |= pressed ? MOUSEEVENTF_LEFTDOWN : MOUSEEVENTF_LEFTUP;
    break;
  case MouseButton::Middle:
    in.mi.dwFlags |= pressed ? MOUSEEVENTF_MIDDLEDOWN : MOUSEEVENTF_MIDDLEUP;
    break;
  case MouseButton::Right:
    in.mi.dwFlags |= pressed ? MOUSEEVENTF_RIGHTDOWN : MOUSEEVENTF_RIGHTUP;
    break;
  }
  return SendInput(1, &in, sizeof(INPUT)) == 1;
}

bool Win32Capability::send_key_event(
    const std::string &key, bool pressed,
    const std::vector<std::string> &modifiers) {
  const auto &keys = vk_keys();
  auto it = keys.find(key);
  if (it == keys.end())
    return false;

  std::vector<INPUT> inputs;
  if (pressed) {
    for (const auto &m : modifiers)
      inputs.push_back(key_input(keys.at(m), true));
    inputs.push_back(key_input(it->second, true));
  } else {
    inputs.push_back(key_input(it->second, false));
    for (auto m = modifiers.rbegin(); m != modifiers.rend(); ++m)
      inputs.push_back(key_input(keys.at(*m), false));
  }
  return SendInput((UINT)inputs.size(), inputs.data(), sizeof(INPUT)) ==
         inputs.size();
}

std::vector<DisplayInfo> Win32Capability::list_displays() {
  std::vector<DisplayInfo> out;
  EnumDisplayMonitors(nullptr, nullptr, collect_monitor,
                      reinterpret_cast<LPARAM>(&out));
  return out;
}

std::optional<std::string> Win32Capability::get_clipboard() {
  std::lock_guard<std::mutex> lk(mu_);
  if (!OpenClipboard(nullptr))
    return std::nullopt;
  std::optional<std::string> out;
  HANDLE h = GetClipboardData(CF_UNICODETEXT);
  if (h) {
    const wchar_t *w = static_cast<const wchar_t *>(GlobalLock(h));
    if (w) {
      int len = WideCharToMultiByte(CP_UTF8, 0, w, -1, nullptr, 0, nullptr,
                                    nullptr);
      std::string s(len > 0 ? len - 1 : 0, '\0');
      if (len > 1)
        WideCharToMultiByte(CP_UTF8, 0, w, -1, s.data(), len, nullptr,
                            nullptr);
      out = std::move(s);
      GlobalUnlock(h);
    }
  } else {
    out = std::string();
  }
  CloseClipboard();
  return out;
}

bool Win32Capability::set_clipboard(const std::string &text) {
  int wlen = MultiByteToWideChar(CP_UTF8, 0, text.c_str(), -1, nullptr, 0);
  if (wlen <= 0)
    return false;
  HGLOBAL mem = GlobalAlloc(GMEM_MOVEABLE, (SIZE_T)wlen * sizeof(wchar_t));
  if (!mem)
    return false;
  wchar_t *dst = static_cast<wchar_t *>(GlobalLock(mem));
  MultiByteToWideChar(CP_UTF8, 0, text.c_str(), -1, dst, wlen);
  GlobalUnlock(mem);

  std::lock_guard<std::mutex> lk(mu_);
  if (!OpenClipboard(nullptr)) {
    GlobalFree(mem);
    return false;
  }
  EmptyClipboard();
  bool ok = SetClipboardData(CF_UNICODETEXT, mem) != nullptr;
  if (!ok)
    GlobalFree(mem);
  CloseClipboard();
  return ok;
}

std::shared_ptr<ICapability> make_platform_capability() {
  return std::make_shared<Win32Capability>();
}

} // namespace rdesk
#endif
