#include "doctest/doctest.h"
#include "rdesk/encoding.hpp"
#include "rdesk/tinyjson.hpp"

using namespace rdesk;

DOCTEST_TEST_CASE("JSON parses nested documents") {
  auto v = json::parse(R"({"op":"list","args":{"path":"docs","n":[1,2.5,-3e2]},"ok":true,"x":null})");
  DOCTEST_REQUIRE(v.is_obj());
  const auto &o = v.as_obj();
  DOCTEST_REQUIRE_EQ(*json::get_str(o, "op"), "list");
  DOCTEST_REQUIRE(*json::get_bool(o, "ok"));
  DOCTEST_REQUIRE(o.at("x").is_null());
  const auto &args = o.at("args").as_obj();
  const auto *n = json::get_arr(args, "n");
  DOCTEST_REQUIRE(n != nullptr);
  DOCTEST_REQUIRE_EQ(n->size(), 3u);
  DOCTEST_REQUIRE_EQ((*n)[2].as_num(), -300.0);
}

DOCTEST_TEST_CASE("JSON string escapes and unicode") {
  auto v = json::parse(R"("a\"b\\c\n\u00e9\ud83d\ude00")");
  DOCTEST_REQUIRE_EQ(v.as_str(), "a\"b\\c\n\xc3\xa9\xf0\x9f\x98\x80");
  DOCTEST_REQUIRE_EQ(json::dumps(std::string("tab\there")), "\"tab\\there\"");
}

DOCTEST_TEST_CASE("JSON rejects malformed input") {
  const char *bad[] = {"{", "[1,]", "{\"a\" 1}", "01", "1.", "tru",
                       "\"\\ud800\"", "{} x", "\"\x01\""};
  for (const char *s : bad)
    DOCTEST_REQUIRE_THROWS_AS(json::parse(s), json::ParseError);

  std::string deep(200, '[');
  deep += std::string(200, ']');
  DOCTEST_REQUIRE_THROWS_AS(json::parse(deep), json::ParseError);
}

DOCTEST_TEST_CASE("JSON dumps integers without a fraction and sorts keys") {
  json::Object o;
  o["size"] = 65536.0;
  o["ratio"] = 0.5;
  o["a"] = std::string("x");
  DOCTEST_REQUIRE_EQ(json::dumps(o), R"({"a":"x","ratio":0.5,"size":65536})");
}

DOCTEST_TEST_CASE("get_u64 accepts only non-negative integers") {
  auto o = json::parse(R"({"a":5,"b":-1,"c":1.5,"d":"5"})").as_obj();
  DOCTEST_REQUIRE_EQ(*json::get_u64(o, "a"), 5u);
  DOCTEST_REQUIRE(!json::get_u64(o, "b"));
  DOCTEST_REQUIRE(!json::get_u64(o, "c"));
  DOCTEST_REQUIRE(!json::get_u64(o, "d"));
  DOCTEST_REQUIRE(!json::get_u64(o, "missing"));
}

DOCTEST_TEST_CASE("Base64 and hex") {
  DOCTEST_REQUIRE_EQ(base64_encode(to_bytes("")), "");
  DOCTEST_REQUIRE_EQ(base64_encode(to_bytes("f")), "Zg==");
  DOCTEST_REQUIRE_EQ(base64_encode(to_bytes("fo")), "Zm8=");
  DOCTEST_REQUIRE_EQ(base64_encode(to_bytes("foobar")), "Zm9vYmFy");
  Bytes high = {0xff, 0xfe, 0xfd, 0x00};
  DOCTEST_REQUIRE(*base64_decode(base64_encode(high)) == high);
  DOCTEST_REQUIRE_EQ(to_string(*base64_decode("Zm9vYg==")), "foob");
  DOCTEST_REQUIRE(!base64_decode("Zm9"));
  DOCTEST_REQUIRE(!base64_decode("Zm9*"));

  DOCTEST_REQUIRE_EQ(hex_encode(high), "fffefd00");
  DOCTEST_REQUIRE(*hex_decode("FFfefd00") == high);
  DOCTEST_REQUIRE(!hex_decode("abc"));
  DOCTEST_REQUIRE(!hex_decode("zz"));
}
