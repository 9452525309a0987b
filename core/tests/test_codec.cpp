#include "doctest/doctest.h"
#include "rdesk/codec.hpp"
#include "rdesk/encoding.hpp"
#include "rdesk/payloads.hpp"

using namespace rdesk;

DOCTEST_TEST_CASE("Codec round-trips every message type") {
  for (std::uint32_t t = 0; t < MESSAGE_TYPE_COUNT; ++t) {
    Bytes payload = to_bytes("payload-" + std::to_string(t));
    Bytes wire = encode((MessageType)t, payload);
    DOCTEST_REQUIRE_EQ(wire.size(), HEADER_SIZE + payload.size());
    DOCTEST_REQUIRE_EQ(get_u32_be(wire.data()), t);
    DOCTEST_REQUIRE_EQ(get_u32_be(wire.data() + 4), (std::uint32_t)payload.size());

    auto r = decode(wire.data(), wire.size());
    DOCTEST_REQUIRE(r.status == DecodeStatus::Ok);
    DOCTEST_REQUIRE(r.message.type == (MessageType)t);
    DOCTEST_REQUIRE(r.message.payload == payload);
    DOCTEST_REQUIRE_EQ(r.consumed, wire.size());
  }
}

DOCTEST_TEST_CASE("Empty payload encodes to a bare header") {
  Bytes wire = encode(MessageType::DISCONNECT, {});
  DOCTEST_REQUIRE_EQ(wire.size(), HEADER_SIZE);
  auto r = decode(wire.data(), wire.size());
  DOCTEST_REQUIRE(r.status == DecodeStatus::Ok);
  DOCTEST_REQUIRE(r.message.payload.empty());
}

DOCTEST_TEST_CASE("Short buffers are incomplete") {
  Bytes wire = encode(MessageType::PING, to_bytes("abc"));
  for (size_t n = 0; n < wire.size(); ++n) {
    auto r = decode(wire.data(), n);
    DOCTEST_REQUIRE(r.status == DecodeStatus::Incomplete);
    DOCTEST_REQUIRE_EQ(r.consumed, 0u);
  }
}

DOCTEST_TEST_CASE("Unknown type is a malformed header") {
  std::uint8_t hdr[8];
  put_u32_be(hdr, 14);
  put_u32_be(hdr + 4, 0);
  DOCTEST_REQUIRE(decode(hdr, 8).status == DecodeStatus::MalformedHeader);
  put_u32_be(hdr, 0xFFFFFFFFu);
  DOCTEST_REQUIRE(decode(hdr, 8).status == DecodeStatus::MalformedHeader);
}

DOCTEST_TEST_CASE("Oversized length is rejected from the header alone") {
  std::uint8_t hdr[8];
  put_u32_be(hdr, (std::uint32_t)MessageType::FILE_TRANSFER);
  put_u32_be(hdr + 4, 0xFFFFFFF0u);
  auto r = decode(hdr, sizeof(hdr));
  DOCTEST_REQUIRE(r.status == DecodeStatus::OversizedMessage);
  DOCTEST_REQUIRE(r.message.payload.capacity() == 0);

  FrameReader reader(1024);
  reader.feed(hdr, sizeof(hdr));
  DOCTEST_REQUIRE(reader.next().status == DecodeStatus::OversizedMessage);
  DOCTEST_REQUIRE_EQ(reader.buffered(), 0u);

  // Exactly at the ceiling is fine.
  put_u32_be(hdr + 4, 1024);
  DOCTEST_REQUIRE(decode(hdr, sizeof(hdr), 1024).status ==
                  DecodeStatus::Incomplete);
}

DOCTEST_TEST_CASE("FrameReader yields messages in order from partial reads") {
  Bytes stream;
  for (int i = 0; i < 5; ++i) {
    Bytes m = encode(MessageType::PING, to_bytes(std::string(i * 7, 'a' + i)));
    stream.insert(stream.end(), m.begin(), m.end());
  }

  FrameReader reader;
  std::vector<Message> out;
  for (size_t i = 0; i < stream.size(); i += 3) {
    size_t n = std::min<size_t>(3, stream.size() - i);
    reader.feed(stream.data() + i, n);
    while (true) {
      auto r = reader.next();
      if (r.status != DecodeStatus::Ok)
        break;
      out.push_back(r.message);
    }
  }
  DOCTEST_REQUIRE_EQ(out.size(), 5u);
  for (int i = 0; i < 5; ++i)
    DOCTEST_REQUIRE_EQ(to_string(out[i].payload), std::string(i * 7, 'a' + i));
  DOCTEST_REQUIRE_EQ(reader.buffered(), 0u);
}

DOCTEST_TEST_CASE("FrameReader errors are sticky") {
  FrameReader reader;
  std::uint8_t bad[8] = {0, 0, 0, 99, 0, 0, 0, 0};
  reader.feed(bad, sizeof(bad));
  DOCTEST_REQUIRE(reader.next().status == DecodeStatus::MalformedHeader);
  Bytes good = encode(MessageType::PING, {});
  reader.feed(good.data(), good.size());
  DOCTEST_REQUIRE(reader.next().status == DecodeStatus::MalformedHeader);
}

DOCTEST_TEST_CASE("Mouse payloads use signed big-endian coordinates") {
  Bytes mv = build_mouse_move(-5, 300);
  DOCTEST_REQUIRE_EQ(mv.size(), 4u);
  auto req = parse_request(Message{MessageType::MOUSE_MOVE, mv});
  auto &m = std::get<MouseMove>(req);
  DOCTEST_REQUIRE_EQ(m.x, -5);
  DOCTEST_REQUIRE_EQ(m.y, 300);

  Bytes click = build_mouse_click(10, 20, MouseButton::Right, false);
  DOCTEST_REQUIRE_EQ(click.size(), 6u);
  auto c = std::get<MouseClick>(
      parse_request(Message{MessageType::MOUSE_CLICK, click}));
  DOCTEST_REQUIRE(c.button == MouseButton::Right);
  DOCTEST_REQUIRE(!c.pressed);

  click[4] = 7; // no such button
  DOCTEST_REQUIRE_THROWS_AS(
      parse_request(Message{MessageType::MOUSE_CLICK, click}), PayloadError);
  DOCTEST_REQUIRE_THROWS_AS(
      parse_request(Message{MessageType::MOUSE_MOVE, Bytes(3)}), PayloadError);
}

DOCTEST_TEST_CASE("Screenshot payload splits into metadata and data") {
  ScreenFrame f;
  f.seq = 7;
  f.width = 2;
  f.height = 1;
  f.format = "bgra32";
  f.encoding = "raw";
  f.raw_size = 8;
  f.content_hash = "abcd";
  f.bytes = {1, 2, 3, 4, 5, 6, 7, 8};
  ScreenFrame back = parse_screenshot(build_screenshot(f));
  DOCTEST_REQUIRE_EQ(back.seq, 7u);
  DOCTEST_REQUIRE_EQ(back.width, 2);
  DOCTEST_REQUIRE_EQ(back.encoding, "raw");
  DOCTEST_REQUIRE_EQ(back.content_hash, "abcd");
  DOCTEST_REQUIRE(back.bytes == f.bytes);
}

DOCTEST_TEST_CASE("Non-JSON structured payloads are InvalidInput") {
  try {
    parse_request(Message{MessageType::AUTH, to_bytes("{not json")});
    DOCTEST_FAIL("expected PayloadError");
  } catch (const PayloadError &e) {
    DOCTEST_REQUIRE(e.code() == ErrorCode::InvalidInput);
  }
}
