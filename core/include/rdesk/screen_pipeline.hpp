#pragma once
#include "capability.hpp"
#include "clock.hpp"
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rdesk {

struct ScreenPipelineOptions {
  std::vector<std::string> formats{"zlib", "raw"}; // server preference
  int max_frames_in_flight = 1;
  int capture_timeout_ms = 5000;
  int backoff_base_ms = 500;
  int backoff_max_ms = 30000;
  int stream_max_fps = 30;
};

enum class FrameOutcome { Frame, Unchanged, Throttled, CaptureFailed, BackedOff };

const char *to_string(FrameOutcome o);

struct FrameResult {
  FrameOutcome outcome = FrameOutcome::Unchanged;
  ScreenFrame frame; // set for Frame only
};

// Per-connection capture -> hash -> encode path with backpressure and
// failure backoff. Only the previous frame's hash is retained.
class ScreenPipeline {
public:
  ScreenPipeline(std::shared_ptr<ICapability> cap, ScreenPipelineOptions opts);

  // Chooses the first client format the server also offers. An empty list
  // keeps the current choice. Returns false when there is no overlap.
  bool negotiate(const std::vector<std::string> &client_formats);

  FrameResult request_frame(bool force, TimePoint now);

  void acknowledge();
  void force_next() { force_next_ = true; }

  void start_stream(int fps, TimePoint now);
  void stop_stream() { streaming_ = false; }
  bool streaming() const { return streaming_; }
  int stream_fps() const { return stream_fps_; }

  // Runs a streaming request when one is due.
  std::optional<FrameResult> on_tick(TimePoint now);

  ScreenBounds bounds() const { return bounds_; }
  int in_flight() const { return in_flight_; }
  const std::string &encoding() const { return encoding_; }
  int consecutive_failures() const { return failures_; }
  TimePoint backoff_until() const { return backoff_until_; }

private:
  std::optional<RawFrame> capture_with_timeout();
  static std::string frame_hash(const RawFrame &f);
  bool encode_into(const RawFrame &raw, ScreenFrame &out) const;
  FrameOutcome record_failure(TimePoint now);
  void record_success(const RawFrame &raw);

  std::shared_ptr<ICapability> cap_;
  ScreenPipelineOptions opts_;
  std::string encoding_;
  std::string last_hash_;
  std::uint64_t seq_ = 0;
  int in_flight_ = 0;
  bool force_next_ = false;
  int failures_ = 0;
  TimePoint backoff_until_{};
  bool streaming_ = false;
  int stream_fps_ = 0;
  TimePoint next_stream_at_{};
  ScreenBounds bounds_;
  std::future<std::optional<RawFrame>> stalled_;
};

// Client side: inflates a received frame back to its raw pixel bytes.
// nullopt when the encoding is unknown or the size does not match.
std::optional<Bytes> decode_frame(const ScreenFrame &frame);

} // namespace rdesk
