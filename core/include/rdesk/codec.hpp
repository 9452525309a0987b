#pragma once
#include "types.hpp"
#include <cstddef>
#include <cstdint>

namespace rdesk {

inline constexpr size_t HEADER_SIZE = 8;
inline constexpr std::uint32_t DEFAULT_MAX_MESSAGE_SIZE = 16u * 1024 * 1024;

struct Message {
  MessageType type{};
  Bytes payload;
};

// Envelope: u32 BE type || u32 BE length || payload.
Bytes encode(MessageType type, const Bytes &payload);
inline Bytes encode(const Message &m) { return encode(m.type, m.payload); }

enum class DecodeStatus { Ok, Incomplete, MalformedHeader, OversizedMessage };

const char *to_string(DecodeStatus s);

struct DecodeResult {
  DecodeStatus status = DecodeStatus::Incomplete;
  Message message;
  size_t consumed = 0;
};

// Header checks run as soon as 8 bytes are present, before any payload
// buffer is allocated.
DecodeResult decode(const std::uint8_t *data, size_t len,
                    std::uint32_t max_message_size = DEFAULT_MAX_MESSAGE_SIZE);

// Accumulates partial reads from a stream and yields complete messages in
// arrival order. A header error is sticky: the stream cannot resync.
class FrameReader {
public:
  explicit FrameReader(std::uint32_t max_message_size = DEFAULT_MAX_MESSAGE_SIZE)
      : max_size_(max_message_size) {}

  void feed(const std::uint8_t *data, size_t len);
  DecodeResult next();
  size_t buffered() const { return buf_.size() - off_; }

private:
  std::uint32_t max_size_;
  Bytes buf_;
  size_t off_ = 0;
  DecodeStatus error_ = DecodeStatus::Ok;
};

} // namespace rdesk
