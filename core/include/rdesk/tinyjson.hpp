#pragma once
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

// Small JSON reader/writer for the structured payloads (AUTH, KEY_EVENT,
// FILE_TRANSFER, INFO, ...) and for the users/config files.
namespace rdesk::json {

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;
using Null = std::monostate;

struct Value : std::variant<Null, bool, double, std::string, Array, Object> {
  using variant::variant;

  bool is_null() const { return std::holds_alternative<Null>(*this); }
  bool is_bool() const { return std::holds_alternative<bool>(*this); }
  bool is_num() const { return std::holds_alternative<double>(*this); }
  bool is_str() const { return std::holds_alternative<std::string>(*this); }
  bool is_arr() const { return std::holds_alternative<Array>(*this); }
  bool is_obj() const { return std::holds_alternative<Object>(*this); }

  const Object &as_obj() const { return std::get<Object>(*this); }
  const Array &as_arr() const { return std::get<Array>(*this); }
  const std::string &as_str() const { return std::get<std::string>(*this); }
  double as_num() const { return std::get<double>(*this); }
  bool as_bool() const { return std::get<bool>(*this); }

  Object &obj() { return std::get<Object>(*this); }
  Array &arr() { return std::get<Array>(*this); }
  std::string &str() { return std::get<std::string>(*this); }
};

class ParseError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class Parser {
public:
  // Payloads come from untrusted peers; nesting is bounded so a hostile
  // document cannot exhaust the stack.
  static constexpr int MAX_DEPTH = 64;

  explicit Parser(std::string_view s) : s_(s) {}

  Value parse() {
    skip_ws();
    Value v = parse_value(0);
    skip_ws();
    if (i_ != s_.size())
      throw ParseError("trailing characters");
    return v;
  }

private:
  std::string_view s_;
  size_t i_ = 0;

  void skip_ws() {
    while (i_ < s_.size() && std::isspace((unsigned char)s_[i_]))
      i_++;
  }

  char peek() const {
    if (i_ >= s_.size())
      return '\0';
    return s_[i_];
  }

  char get() {
    if (i_ >= s_.size())
      throw ParseError("unexpected end");
    return s_[i_++];
  }

  Value parse_value(int depth) {
    if (depth > MAX_DEPTH)
      throw ParseError("nesting too deep");
    char c = peek();
    if (c == '{')
      return parse_object(depth);
    if (c == '[')
      return parse_array(depth);
    if (c == '"')
      return parse_string();
    if (c == 't')
      return parse_literal("true", true);
    if (c == 'f')
      return parse_literal("false", false);
    if (c == 'n')
      return parse_literal("null", Null{});
    if (c == '-' || std::isdigit((unsigned char)c))
      return parse_number();
    throw ParseError("invalid value");
  }

  Value parse_object(int depth) {
    Object obj;
    get(); // {
    skip_ws();
    if (peek() == '}') {
      get();
      return obj;
    }
    while (true) {
      skip_ws();
      if (peek() != '"')
        throw ParseError("expected string key");
      std::string key = std::get<std::string>(parse_string());
      skip_ws();
      if (get() != ':')
        throw ParseError("expected ':'");
      skip_ws();
      obj.insert_or_assign(std::move(key), parse_value(depth + 1));
      skip_ws();
      char c = get();
      if (c == '}')
        break;
      if (c != ',')
        throw ParseError("expected ',' or '}'");
    }
    return obj;
  }

  Value parse_array(int depth) {
    Array arr;
    get(); // [
    skip_ws();
    if (peek() == ']') {
      get();
      return arr;
    }
    while (true) {
      skip_ws();
      arr.push_back(parse_value(depth + 1));
      skip_ws();
      char c = get();
      if (c == ']')
        break;
      if (c != ',')
        throw ParseError("expected ',' or ']'");
    }
    return arr;
  }

  static int hexval(char c) {
    if (c >= '0' && c <= '9')
      return c - '0';
    if (c >= 'a' && c <= 'f')
      return 10 + (c - 'a');
    if (c >= 'A' && c <= 'F')
      return 10 + (c - 'A');
    return -1;
  }

  static void append_utf8(std::string &out, uint32_t code) {
    if (code < 0x80) {
      out.push_back((char)code);
    } else if (code < 0x800) {
      out.push_back((char)(0xC0 | (code >> 6)));
      out.push_back((char)(0x80 | (code & 0x3F)));
    } else if (code < 0x10000) {
      out.push_back((char)(0xE0 | (code >> 12)));
      out.push_back((char)(0x80 | ((code >> 6) & 0x3F)));
      out.push_back((char)(0x80 | (code & 0x3F)));
    } else {
      out.push_back((char)(0xF0 | (code >> 18)));
      out.push_back((char)(0x80 | ((code >> 12) & 0x3F)));
      out.push_back((char)(0x80 | ((code >> 6) & 0x3F)));
      out.push_back((char)(0x80 | (code & 0x3F)));
    }
  }

  uint32_t parse_hex4() {
    int h1 = hexval(get()), h2 = hexval(get()), h3 = hexval(get()),
        h4 = hexval(get());
    if (h1 < 0 || h2 < 0 || h3 < 0 || h4 < 0)
      throw ParseError("bad unicode escape");
    return (uint32_t)((h1 << 12) | (h2 << 8) | (h3 << 4) | h4);
  }

  Value parse_string() {
    std::string out;
    if (get() != '"')
      throw ParseError("expected '\"'");
    while (true) {
      char c = get();
      if (c == '"')
        break;
      if ((unsigned char)c < 0x20)
        throw ParseError("control character in string");
      if (c != '\\') {
        out.push_back(c);
        continue;
      }
      char e = get();
      switch (e) {
      case '"': out.push_back('"'); break;
      case '\\': out.push_back('\\'); break;
      case '/': out.push_back('/'); break;
      case 'b': out.push_back('\b'); break;
      case 'f': out.push_back('\f'); break;
      case 'n': out.push_back('\n'); break;
      case 'r': out.push_back('\r'); break;
      case 't': out.push_back('\t'); break;
      case 'u': {
        uint32_t code = parse_hex4();
        if (code >= 0xD800 && code <= 0xDBFF) {
          if (get() != '\\' || get() != 'u')
            throw ParseError("unpaired surrogate");
          uint32_t low = parse_hex4();
          if (low < 0xDC00 || low > 0xDFFF)
            throw ParseError("bad surrogate pair");
          code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
        }
        append_utf8(out, code);
        break;
      }
      default:
        throw ParseError("bad escape");
      }
    }
    return out;
  }

  Value parse_literal(std::string_view word, Value v) {
    if (s_.substr(i_, word.size()) != word)
      throw ParseError("bad literal");
    i_ += word.size();
    return v;
  }

  Value parse_number() {
    size_t start = i_;
    if (peek() == '-')
      get();
    if (peek() == '0')
      get();
    else {
      if (!std::isdigit((unsigned char)peek()))
        throw ParseError("bad number");
      while (std::isdigit((unsigned char)peek()))
        get();
    }
    if (peek() == '.') {
      get();
      if (!std::isdigit((unsigned char)peek()))
        throw ParseError("bad number");
      while (std::isdigit((unsigned char)peek()))
        get();
    }
    if (peek() == 'e' || peek() == 'E') {
      get();
      if (peek() == '+' || peek() == '-')
        get();
      if (!std::isdigit((unsigned char)peek()))
        throw ParseError("bad number");
      while (std::isdigit((unsigned char)peek()))
        get();
    }
    return std::stod(std::string(s_.substr(start, i_ - start)));
  }
};

inline Value parse(std::string_view s) { return Parser(s).parse(); }

// Stable serializer: object keys sorted (std::map does that), minimal
// formatting. Integral numbers are written without a fraction.
inline void dump_string(std::string &out, const std::string &s) {
  out.push_back('"');
  for (unsigned char c : s) {
    switch (c) {
    case '"': out += "\\\""; break;
    case '\\': out += "\\\\"; break;
    case '\b': out += "\\b"; break;
    case '\f': out += "\\f"; break;
    case '\n': out += "\\n"; break;
    case '\r': out += "\\r"; break;
    case '\t': out += "\\t"; break;
    default:
      if (c < 0x20) {
        char buf[7];
        std::snprintf(buf, sizeof(buf), "\\u%04x", c);
        out += buf;
      } else
        out.push_back((char)c);
    }
  }
  out.push_back('"');
}

inline void dump_number(std::string &out, double d) {
  if (!std::isfinite(d)) {
    out += "null";
    return;
  }
  char buf[32];
  if (std::floor(d) == d && std::fabs(d) < 9007199254740992.0)
    std::snprintf(buf, sizeof(buf), "%lld", (long long)d);
  else
    std::snprintf(buf, sizeof(buf), "%.17g", d);
  out += buf;
}

inline void dump(std::string &out, const Value &v);

inline void dump_obj(std::string &out, const Object &o) {
  out.push_back('{');
  bool first = true;
  for (const auto &[k, val] : o) {
    if (!first)
      out.push_back(',');
    first = false;
    dump_string(out, k);
    out.push_back(':');
    dump(out, val);
  }
  out.push_back('}');
}

inline void dump_arr(std::string &out, const Array &a) {
  out.push_back('[');
  bool first = true;
  for (const auto &v : a) {
    if (!first)
      out.push_back(',');
    first = false;
    dump(out, v);
  }
  out.push_back(']');
}

inline void dump(std::string &out, const Value &v) {
  if (v.is_null())
    out += "null";
  else if (v.is_bool())
    out += (v.as_bool() ? "true" : "false");
  else if (v.is_num())
    dump_number(out, v.as_num());
  else if (v.is_str())
    dump_string(out, v.as_str());
  else if (v.is_arr())
    dump_arr(out, v.as_arr());
  else
    dump_obj(out, v.as_obj());
}

inline std::string dumps(const Value &v) {
  std::string out;
  dump(out, v);
  return out;
}

// Typed field lookups. A missing key or a value of the wrong type yields
// nullopt; callers decide whether the field is required.
inline std::optional<std::string> get_str(const Object &o, const std::string &k) {
  auto it = o.find(k);
  if (it == o.end() || !it->second.is_str())
    return std::nullopt;
  return it->second.as_str();
}

inline std::optional<bool> get_bool(const Object &o, const std::string &k) {
  auto it = o.find(k);
  if (it == o.end() || !it->second.is_bool())
    return std::nullopt;
  return it->second.as_bool();
}

inline std::optional<double> get_num(const Object &o, const std::string &k) {
  auto it = o.find(k);
  if (it == o.end() || !it->second.is_num())
    return std::nullopt;
  return it->second.as_num();
}

// Integral, non-negative numbers only (sizes, offsets, counters).
inline std::optional<std::uint64_t> get_u64(const Object &o,
                                            const std::string &k) {
  auto d = get_num(o, k);
  if (!d || *d < 0 || std::floor(*d) != *d || *d >= 9007199254740992.0)
    return std::nullopt;
  return (std::uint64_t)*d;
}

inline const Array *get_arr(const Object &o, const std::string &k) {
  auto it = o.find(k);
  if (it == o.end() || !it->second.is_arr())
    return nullptr;
  return &it->second.as_arr();
}

} // namespace rdesk::json
