#include "doctest/doctest.h"
#include "rdesk/screen_pipeline.hpp"
#include "test_util.hpp"

#include <thread>

using namespace rdesk;
using namespace rdesk::test;
using std::chrono::milliseconds;

namespace {

ScreenPipelineOptions fast_options() {
  ScreenPipelineOptions o;
  o.capture_timeout_ms = 1000;
  o.backoff_base_ms = 500;
  o.backoff_max_ms = 2000;
  o.stream_max_fps = 10;
  return o;
}

} // namespace

DOCTEST_TEST_CASE("Identical frames produce one SCREENSHOT") {
  auto cap = std::make_shared<FakeCapability>(32, 16);
  ScreenPipeline p(cap, fast_options());
  ManualClock clock;

  auto first = p.request_frame(false, clock.get());
  DOCTEST_REQUIRE(first.outcome == FrameOutcome::Frame);
  DOCTEST_REQUIRE_EQ(first.frame.seq, 1u);
  DOCTEST_REQUIRE_EQ(first.frame.width, 32);
  DOCTEST_REQUIRE_EQ(first.frame.raw_size, 32u * 16 * 4);
  DOCTEST_REQUIRE_EQ(first.frame.encoding, "zlib");
  p.acknowledge();

  auto second = p.request_frame(false, clock.get());
  DOCTEST_REQUIRE(second.outcome == FrameOutcome::Unchanged);

  // force bypasses the hash check
  auto forced = p.request_frame(true, clock.get());
  DOCTEST_REQUIRE(forced.outcome == FrameOutcome::Frame);
  DOCTEST_REQUIRE_EQ(forced.frame.seq, 2u);
  DOCTEST_REQUIRE_EQ(forced.frame.content_hash, first.frame.content_hash);
  p.acknowledge();

  cap->set_frame_fill(0x7f);
  auto changed = p.request_frame(false, clock.get());
  DOCTEST_REQUIRE(changed.outcome == FrameOutcome::Frame);
  DOCTEST_REQUIRE(changed.frame.content_hash != first.frame.content_hash);
}

DOCTEST_TEST_CASE("Encoded frames decode to the captured pixels") {
  auto cap = std::make_shared<FakeCapability>(8, 4);
  cap->set_frame_fill(0x33);
  ScreenPipeline p(cap, fast_options());
  ManualClock clock;

  auto z = p.request_frame(true, clock.get());
  auto pixels = decode_frame(z.frame);
  DOCTEST_REQUIRE(pixels.has_value());
  DOCTEST_REQUIRE(*pixels == Bytes(8 * 4 * 4, 0x33));
  p.acknowledge();

  DOCTEST_REQUIRE(p.negotiate({"raw"}));
  auto r = p.request_frame(true, clock.get());
  DOCTEST_REQUIRE_EQ(r.frame.encoding, "raw");
  DOCTEST_REQUIRE(r.frame.bytes == Bytes(8 * 4 * 4, 0x33));
}

DOCTEST_TEST_CASE("Format negotiation") {
  ScreenPipeline p(std::make_shared<FakeCapability>(), fast_options());
  DOCTEST_REQUIRE_EQ(p.encoding(), "zlib");
  DOCTEST_REQUIRE(p.negotiate({"png", "raw"}));
  DOCTEST_REQUIRE_EQ(p.encoding(), "raw");
  DOCTEST_REQUIRE(p.negotiate({}));
  DOCTEST_REQUIRE_EQ(p.encoding(), "raw");
  DOCTEST_REQUIRE(!p.negotiate({"png", "jpeg"}));
  DOCTEST_REQUIRE_EQ(p.encoding(), "raw");
}

DOCTEST_TEST_CASE("Unacknowledged frames throttle further captures") {
  auto cap = std::make_shared<FakeCapability>();
  ScreenPipeline p(cap, fast_options());
  ManualClock clock;

  DOCTEST_REQUIRE(p.request_frame(true, clock.get()).outcome ==
                  FrameOutcome::Frame);
  DOCTEST_REQUIRE_EQ(p.in_flight(), 1);
  int calls = cap->capture_calls();
  DOCTEST_REQUIRE(p.request_frame(true, clock.get()).outcome ==
                  FrameOutcome::Throttled);
  DOCTEST_REQUIRE_EQ(cap->capture_calls(), calls);

  p.acknowledge();
  p.acknowledge(); // extra acks do not go negative
  DOCTEST_REQUIRE_EQ(p.in_flight(), 0);
  DOCTEST_REQUIRE(p.request_frame(true, clock.get()).outcome ==
                  FrameOutcome::Frame);
}

DOCTEST_TEST_CASE("Capture failure is reported once, then backs off") {
  auto cap = std::make_shared<FakeCapability>();
  cap->set_capture_fails(true);
  ScreenPipeline p(cap, fast_options());
  ManualClock clock;

  DOCTEST_REQUIRE(p.request_frame(false, clock.get()).outcome ==
                  FrameOutcome::CaptureFailed);
  DOCTEST_REQUIRE_EQ(p.consecutive_failures(), 1);
  DOCTEST_REQUIRE(p.backoff_until() == clock.get() + milliseconds(500));

  // Inside the window no capture is attempted.
  int calls = cap->capture_calls();
  clock.advance(milliseconds(499));
  DOCTEST_REQUIRE(p.request_frame(false, clock.get()).outcome ==
                  FrameOutcome::BackedOff);
  DOCTEST_REQUIRE_EQ(cap->capture_calls(), calls);

  // Retry fails again: silent, window doubles.
  clock.advance(milliseconds(1));
  DOCTEST_REQUIRE(p.request_frame(false, clock.get()).outcome ==
                  FrameOutcome::BackedOff);
  DOCTEST_REQUIRE_EQ(p.consecutive_failures(), 2);
  DOCTEST_REQUIRE(p.backoff_until() == clock.get() + milliseconds(1000));

  // Capped at backoff_max_ms.
  for (int i = 0; i < 4; ++i) {
    clock.advance(milliseconds(5000));
    p.request_frame(false, clock.get());
  }
  DOCTEST_REQUIRE(p.backoff_until() == clock.get() + milliseconds(2000));

  cap->set_capture_fails(false);
  clock.advance(milliseconds(2000));
  DOCTEST_REQUIRE(p.request_frame(false, clock.get()).outcome ==
                  FrameOutcome::Frame);
  DOCTEST_REQUIRE_EQ(p.consecutive_failures(), 0);
  DOCTEST_REQUIRE_EQ(p.bounds().width, 64);
}

DOCTEST_TEST_CASE("Hung capture times out as a failure") {
  auto cap = std::make_shared<FakeCapability>();
  cap->set_capture_delay(milliseconds(500));
  auto opts = fast_options();
  opts.capture_timeout_ms = 50;
  ScreenPipeline p(cap, opts);
  ManualClock clock;
  DOCTEST_REQUIRE(p.request_frame(true, clock.get()).outcome ==
                  FrameOutcome::CaptureFailed);
}

DOCTEST_TEST_CASE("A hung capture is not stacked with new ones") {
  auto cap = std::make_shared<FakeCapability>();
  cap->set_capture_delay(milliseconds(300));
  auto opts = fast_options();
  opts.capture_timeout_ms = 50;
  ScreenPipeline p(cap, opts);
  ManualClock clock;
  DOCTEST_REQUIRE(p.request_frame(true, clock.get()).outcome ==
                  FrameOutcome::CaptureFailed);
  cap->set_capture_delay(milliseconds(0));

  // Backoff over, but the first capture is still blocked.
  clock.advance(milliseconds(600));
  DOCTEST_REQUIRE(p.request_frame(true, clock.get()).outcome ==
                  FrameOutcome::BackedOff);
  DOCTEST_REQUIRE_EQ(cap->capture_calls(), 1);

  std::this_thread::sleep_for(milliseconds(400));
  clock.advance(milliseconds(2100));
  DOCTEST_REQUIRE(p.request_frame(true, clock.get()).outcome ==
                  FrameOutcome::Frame);
  DOCTEST_REQUIRE_EQ(cap->capture_calls(), 2);
}

DOCTEST_TEST_CASE("Stream mode paces frames and respects backpressure") {
  auto cap = std::make_shared<FakeCapability>();
  ScreenPipeline p(cap, fast_options());
  ManualClock clock;

  DOCTEST_REQUIRE(!p.on_tick(clock.get()).has_value());
  p.start_stream(1000, clock.get()); // clamped to stream_max_fps
  DOCTEST_REQUIRE(p.streaming());
  DOCTEST_REQUIRE_EQ(p.stream_fps(), 10);

  auto f = p.on_tick(clock.get());
  DOCTEST_REQUIRE(f.has_value());
  DOCTEST_REQUIRE(f->outcome == FrameOutcome::Frame);

  // Not due yet.
  clock.advance(milliseconds(50));
  DOCTEST_REQUIRE(!p.on_tick(clock.get()).has_value());

  // Due, but the previous frame is unacknowledged.
  cap->set_frame_fill(1);
  clock.advance(milliseconds(50));
  auto t = p.on_tick(clock.get());
  DOCTEST_REQUIRE(t.has_value());
  DOCTEST_REQUIRE(t->outcome == FrameOutcome::Throttled);

  p.acknowledge();
  clock.advance(milliseconds(100));
  auto g = p.on_tick(clock.get());
  DOCTEST_REQUIRE(g->outcome == FrameOutcome::Frame);

  p.stop_stream();
  clock.advance(milliseconds(1000));
  DOCTEST_REQUIRE(!p.on_tick(clock.get()).has_value());
}
