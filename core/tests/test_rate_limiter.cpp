#include "doctest/doctest.h"
#include "rdesk/rate_limiter.hpp"
#include "test_util.hpp"

using namespace rdesk;
using namespace rdesk::test;
using std::chrono::milliseconds;

DOCTEST_TEST_CASE("Sliding window allows max events per window") {
  ManualClock clock;
  SlidingWindowLimiter lim(3, milliseconds(1000), clock.fn());
  for (int i = 0; i < 3; ++i) {
    DOCTEST_REQUIRE(lim.try_acquire("k"));
    clock.advance(milliseconds(100));
  }
  DOCTEST_REQUIRE(!lim.try_acquire("k"));
  DOCTEST_REQUIRE(lim.try_acquire("other"));

  // First event at t=0 leaves the window at t=1000.
  clock.advance(milliseconds(700));
  DOCTEST_REQUIRE(lim.try_acquire("k"));
  DOCTEST_REQUIRE(!lim.try_acquire("k"));
}

DOCTEST_TEST_CASE("is_allowed only checks; record only counts") {
  ManualClock clock;
  SlidingWindowLimiter lim(2, milliseconds(300000), clock.fn());
  DOCTEST_REQUIRE(lim.is_allowed("1.2.3.4"));
  lim.record("1.2.3.4");
  DOCTEST_REQUIRE(lim.is_allowed("1.2.3.4"));
  lim.record("1.2.3.4");
  DOCTEST_REQUIRE(!lim.is_allowed("1.2.3.4"));
  DOCTEST_REQUIRE_EQ(lim.count("1.2.3.4"), 2u);

  lim.reset("1.2.3.4");
  DOCTEST_REQUIRE(lim.is_allowed("1.2.3.4"));
  DOCTEST_REQUIRE_EQ(lim.count("1.2.3.4"), 0u);
}
