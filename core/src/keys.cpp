#include "rdesk/capability.hpp"
#include <algorithm>

namespace rdesk {

static std::vector<std::string> build_key_names() {
  std::vector<std::string> k;
  for (char c = 'a'; c <= 'z'; ++c)
    k.emplace_back(1, c);
  for (char c = '0'; c <= '9'; ++c)
    k.emplace_back(1, c);
  for (int i = 1; i <= 12; ++i)
    k.push_back("f" + std::to_string(i));
  for (const char *n :
       {"enter", "escape", "tab", "space", "backspace", "delete", "insert",
        "home", "end", "pageup", "pagedown", "up", "down", "left", "right",
        "shift", "ctrl", "alt", "meta", "capslock", "minus", "equal",
        "leftbracket", "rightbracket", "backslash", "semicolon", "apostrophe",
        "grave", "comma", "period", "slash", "printscreen"})
    k.emplace_back(n);
  std::sort(k.begin(), k.end());
  return k;
}

const std::vector<std::string> &known_key_names() {
  static const std::vector<std::string> names = build_key_names();
  return names;
}

bool is_known_key(std::string_view name) {
  const auto &k = known_key_names();
  return std::binary_search(k.begin(), k.end(), name,
                            [](const auto &a, const auto &b) {
                              return std::string_view(a) < std::string_view(b);
                            });
}

bool is_known_modifier(std::string_view name) {
  return name == "ctrl" || name == "shift" || name == "alt" || name == "meta";
}

} // namespace rdesk
