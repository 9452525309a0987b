#include "rdesk/encoding.hpp"

namespace rdesk {

static const char *B64 =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::string base64_encode(const std::uint8_t *data, size_t len) {
  std::string out;
  out.reserve(((len + 2) / 3) * 4);
  unsigned val = 0;
  int valb = -6;
  for (size_t i = 0; i < len; ++i) {
    val = ((val << 8) + data[i]) & 0xFFFFFF;
    valb += 8;
    while (valb >= 0) {
      out.push_back(B64[(val >> valb) & 0x3F]);
      valb -= 6;
    }
  }
  if (valb > -6)
    out.push_back(B64[((val << 8) >> (valb + 8)) & 0x3F]);
  while (out.size() % 4)
    out.push_back('=');
  return out;
}

static int b64_index(char c) {
  if (c >= 'A' && c <= 'Z')
    return c - 'A';
  if (c >= 'a' && c <= 'z')
    return c - 'a' + 26;
  if (c >= '0' && c <= '9')
    return c - '0' + 52;
  if (c == '+')
    return 62;
  if (c == '/')
    return 63;
  return -1;
}

std::optional<Bytes> base64_decode(std::string_view in) {
  if (in.size() % 4 != 0)
    return std::nullopt;
  size_t pad = 0;
  if (!in.empty() && in.back() == '=')
    pad++;
  if (in.size() > 1 && in[in.size() - 2] == '=')
    pad++;

  Bytes out;
  out.reserve(in.size() / 4 * 3);
  int val = 0, valb = -8;
  for (size_t i = 0; i < in.size() - pad; ++i) {
    int d = b64_index(in[i]);
    if (d < 0)
      return std::nullopt;
    val = ((val << 6) + d) & 0xFFFFFF;
    valb += 6;
    if (valb >= 0) {
      out.push_back((std::uint8_t)((val >> valb) & 0xFF));
      valb -= 8;
    }
  }
  return out;
}

std::string hex_encode(const std::uint8_t *data, size_t len) {
  static const char *digits = "0123456789abcdef";
  std::string out;
  out.reserve(len * 2);
  for (size_t i = 0; i < len; ++i) {
    out.push_back(digits[data[i] >> 4]);
    out.push_back(digits[data[i] & 0x0F]);
  }
  return out;
}

static int hex_nibble(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

std::optional<Bytes> hex_decode(std::string_view in) {
  if (in.size() % 2 != 0)
    return std::nullopt;
  Bytes out(in.size() / 2);
  for (size_t i = 0; i < out.size(); ++i) {
    int hi = hex_nibble(in[2 * i]), lo = hex_nibble(in[2 * i + 1]);
    if (hi < 0 || lo < 0)
      return std::nullopt;
    out[i] = (std::uint8_t)((hi << 4) | lo);
  }
  return out;
}

} // namespace rdesk
