#pragma once
#include "types.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace rdesk {

std::string base64_encode(const std::uint8_t *data, size_t len);
inline std::string base64_encode(const Bytes &in) {
  return base64_encode(in.data(), in.size());
}
// Strict: rejects characters outside the alphabet and bad padding.
std::optional<Bytes> base64_decode(std::string_view in);

std::string hex_encode(const std::uint8_t *data, size_t len);
inline std::string hex_encode(const Bytes &in) {
  return hex_encode(in.data(), in.size());
}
std::optional<Bytes> hex_decode(std::string_view in);

// Big-endian helpers for the wire format.
inline void put_u32_be(std::uint8_t *p, std::uint32_t v) {
  p[0] = (std::uint8_t)(v >> 24);
  p[1] = (std::uint8_t)(v >> 16);
  p[2] = (std::uint8_t)(v >> 8);
  p[3] = (std::uint8_t)v;
}

inline std::uint32_t get_u32_be(const std::uint8_t *p) {
  return ((std::uint32_t)p[0] << 24) | ((std::uint32_t)p[1] << 16) |
         ((std::uint32_t)p[2] << 8) | (std::uint32_t)p[3];
}

inline void put_i16_be(std::uint8_t *p, std::int16_t v) {
  auto u = (std::uint16_t)v;
  p[0] = (std::uint8_t)(u >> 8);
  p[1] = (std::uint8_t)u;
}

inline std::int16_t get_i16_be(const std::uint8_t *p) {
  return (std::int16_t)(std::uint16_t)(((std::uint16_t)p[0] << 8) | p[1]);
}

inline Bytes to_bytes(std::string_view s) { return Bytes(s.begin(), s.end()); }
inline std::string to_string(const Bytes &b) {
  return std::string(b.begin(), b.end());
}

} // namespace rdesk
