#include "rdesk/codec.hpp"
#include "rdesk/encoding.hpp"
#include <algorithm>

namespace rdesk {

Bytes encode(MessageType type, const Bytes &payload) {
  Bytes out(HEADER_SIZE + payload.size());
  put_u32_be(out.data(), (std::uint32_t)type);
  put_u32_be(out.data() + 4, (std::uint32_t)payload.size());
  std::copy(payload.begin(), payload.end(), out.begin() + HEADER_SIZE);
  return out;
}

const char *to_string(DecodeStatus s) {
  switch (s) {
  case DecodeStatus::Ok: return "Ok";
  case DecodeStatus::Incomplete: return "Incomplete";
  case DecodeStatus::MalformedHeader: return "MalformedHeader";
  case DecodeStatus::OversizedMessage: return "OversizedMessage";
  }
  return "Unknown";
}

DecodeResult decode(const std::uint8_t *data, size_t len,
                    std::uint32_t max_message_size) {
  DecodeResult r;
  if (len < HEADER_SIZE)
    return r;

  auto type = message_type_from_u32(get_u32_be(data));
  if (!type) {
    r.status = DecodeStatus::MalformedHeader;
    return r;
  }
  std::uint32_t plen = get_u32_be(data + 4);
  if (plen > max_message_size) {
    r.status = DecodeStatus::OversizedMessage;
    return r;
  }
  if (len - HEADER_SIZE < plen)
    return r;

  r.status = DecodeStatus::Ok;
  r.message.type = *type;
  r.message.payload.assign(data + HEADER_SIZE, data + HEADER_SIZE + plen);
  r.consumed = HEADER_SIZE + plen;
  return r;
}

void FrameReader::feed(const std::uint8_t *data, size_t len) {
  if (error_ != DecodeStatus::Ok)
    return;
  // Compact once the consumed prefix dominates the buffer.
  if (off_ > 0 && off_ >= buf_.size() / 2) {
    buf_.erase(buf_.begin(), buf_.begin() + (std::ptrdiff_t)off_);
    off_ = 0;
  }
  buf_.insert(buf_.end(), data, data + len);
}

DecodeResult FrameReader::next() {
  if (error_ != DecodeStatus::Ok) {
    DecodeResult r;
    r.status = error_;
    return r;
  }
  DecodeResult r = decode(buf_.data() + off_, buf_.size() - off_, max_size_);
  if (r.status == DecodeStatus::Ok) {
    off_ += r.consumed;
    if (off_ == buf_.size()) {
      buf_.clear();
      off_ = 0;
    }
  } else if (r.status != DecodeStatus::Incomplete) {
    error_ = r.status;
    buf_.clear();
    off_ = 0;
  }
  return r;
}

} // namespace rdesk
