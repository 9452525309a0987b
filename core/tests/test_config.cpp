#include "doctest/doctest.h"
#include "rdesk/config.hpp"
#include "test_util.hpp"

using namespace rdesk;
using namespace rdesk::test;

DOCTEST_TEST_CASE("Config defaults validate") {
  ServerConfig c;
  DOCTEST_REQUIRE_EQ(c.port, 5000);
  DOCTEST_REQUIRE_EQ(c.bind_address, "127.0.0.1");
  DOCTEST_REQUIRE_EQ(c.chunk_size, 65536u);
  DOCTEST_REQUIRE_EQ(c.kdf_iterations, 100000u);
  DOCTEST_REQUIRE_EQ(c.keepalive_timeout_ms, 30000);
  DOCTEST_REQUIRE_EQ(c.resume_ttl_sec, 86400);
  DOCTEST_REQUIRE_EQ(c.screen_formats.size(), 2u);
  DOCTEST_REQUIRE(!c.file_root.empty());
  c.validate();
}

DOCTEST_TEST_CASE("Config file overlays defaults") {
  TempDir dir;
  write_file(dir / "rdesk.json",
             R"({"port": 6000, "screen_formats": ["raw"], "log_level": "DEBUG",
                 "session_ttl_sec": 60, "resume_ttl_sec": 120})");
  ServerConfig c = load_config_file((dir / "rdesk.json").string());
  DOCTEST_REQUIRE_EQ(c.port, 6000);
  DOCTEST_REQUIRE_EQ(c.session_ttl_sec, 60);
  DOCTEST_REQUIRE_EQ(c.resume_ttl_sec, 120);
  DOCTEST_REQUIRE_EQ(c.screen_formats.size(), 1u);
  DOCTEST_REQUIRE_EQ(c.max_connections, 32);
  c.validate();
}

DOCTEST_TEST_CASE("Config rejects unknown keys and wrong types") {
  ServerConfig c;
  DOCTEST_REQUIRE_THROWS_AS(c.merge_json(json::parse(R"({"prot": 1})").as_obj()),
                            ConfigError);
  DOCTEST_REQUIRE_THROWS_AS(c.merge_json(json::parse(R"({"port": "1"})").as_obj()),
                            ConfigError);
  DOCTEST_REQUIRE_THROWS_AS(c.merge_json(json::parse(R"({"port": 1.5})").as_obj()),
                            ConfigError);
  DOCTEST_REQUIRE_THROWS_AS(load_config_file("/nonexistent/rdesk.json"),
                            ConfigError);
}

DOCTEST_TEST_CASE("Config validation catches unsafe settings") {
  auto expect_invalid = [](auto mutate) {
    ServerConfig c;
    mutate(c);
    DOCTEST_REQUIRE_THROWS_AS(c.validate(), ConfigError);
  };
  expect_invalid([](ServerConfig &c) { c.kdf_iterations = 99999; });
  expect_invalid([](ServerConfig &c) { c.keepalive_timeout_ms = 0; });
  expect_invalid([](ServerConfig &c) { c.screen_formats.clear(); });
  expect_invalid([](ServerConfig &c) { c.screen_formats = {"png"}; });
  expect_invalid([](ServerConfig &c) { c.port = 70000; });
  expect_invalid([](ServerConfig &c) { c.chunk_size = 16u * 1024 * 1024; });
  expect_invalid([](ServerConfig &c) { c.capture_backoff_max_ms = 10; });
  expect_invalid([](ServerConfig &c) { c.log_level = "LOUD"; });
  expect_invalid([](ServerConfig &c) { c.max_send_queue_bytes = 1; });
  expect_invalid([](ServerConfig &c) { c.resume_ttl_sec = 0; });
}
