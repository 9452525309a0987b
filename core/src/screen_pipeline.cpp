#include "rdesk/screen_pipeline.hpp"
#include "rdesk/crypto.hpp"
#include "rdesk/logger.hpp"

#include <zlib.h>

#include <algorithm>
#include <future>
#include <thread>

namespace rdesk {

const char *to_string(FrameOutcome o) {
  switch (o) {
  case FrameOutcome::Frame: return "Frame";
  case FrameOutcome::Unchanged: return "Unchanged";
  case FrameOutcome::Throttled: return "Throttled";
  case FrameOutcome::CaptureFailed: return "CaptureFailed";
  case FrameOutcome::BackedOff: return "BackedOff";
  }
  return "Unknown";
}

ScreenPipeline::ScreenPipeline(std::shared_ptr<ICapability> cap,
                               ScreenPipelineOptions opts)
    : cap_(std::move(cap)), opts_(std::move(opts)) {
  if (!opts_.formats.empty())
    encoding_ = opts_.formats.front();
}

bool ScreenPipeline::negotiate(const std::vector<std::string> &client_formats) {
  if (client_formats.empty())
    return true;
  for (const auto &f : client_formats) {
    if (std::find(opts_.formats.begin(), opts_.formats.end(), f) !=
        opts_.formats.end()) {
      encoding_ = f;
      return true;
    }
  }
  return false;
}

void ScreenPipeline::acknowledge() {
  if (in_flight_ > 0)
    in_flight_--;
}

void ScreenPipeline::start_stream(int fps, TimePoint now) {
  if (fps <= 0 || fps > opts_.stream_max_fps)
    fps = opts_.stream_max_fps;
  stream_fps_ = fps;
  streaming_ = true;
  next_stream_at_ = now;
}

std::optional<FrameResult> ScreenPipeline::on_tick(TimePoint now) {
  if (!streaming_ || now < next_stream_at_)
    return std::nullopt;
  next_stream_at_ = now + std::chrono::milliseconds(1000 / stream_fps_);
  return request_frame(false, now);
}

std::optional<RawFrame> ScreenPipeline::capture_with_timeout() {
  // The worker owns a reference to the capability so a hung capture cannot
  // outlive it.
  auto cap = cap_;
  // At most one hung capture per pipeline; its late result is discarded.
  if (stalled_.valid()) {
    if (stalled_.wait_for(std::chrono::milliseconds(0)) !=
        std::future_status::ready) {
      LOG_DEBUG("Previous screen capture still running");
      return std::nullopt;
    }
    stalled_ = {};
  }

  std::packaged_task<std::optional<RawFrame>()> task(
      [cap] { return cap->capture_screen(); });
  auto fut = task.get_future();
  std::thread(std::move(task)).detach();

  if (fut.wait_for(std::chrono::milliseconds(opts_.capture_timeout_ms)) ==
      std::future_status::timeout) {
    LOG_WARN("Screen capture timed out after " +
             std::to_string(opts_.capture_timeout_ms) + "ms");
    stalled_ = std::move(fut);
    return std::nullopt;
  }
  try {
    return fut.get();
  } catch (const std::exception &e) {
    LOG_WARN(std::string("Screen capture threw: ") + e.what());
    return std::nullopt;
  }
}

std::string ScreenPipeline::frame_hash(const RawFrame &f) {
  crypto::Hasher h;
  h.update_u32((std::uint32_t)f.width);
  h.update_u32((std::uint32_t)f.height);
  h.update(f.format);
  h.update(f.bytes.data(), f.bytes.size());
  return h.hex_digest();
}

bool ScreenPipeline::encode_into(const RawFrame &raw, ScreenFrame &out) const {
  out.width = raw.width;
  out.height = raw.height;
  out.format = raw.format;
  out.raw_size = raw.bytes.size();
  if (encoding_ == "zlib") {
    uLongf dest_len = compressBound((uLong)raw.bytes.size());
    out.bytes.resize(dest_len);
    int rc = compress2(out.bytes.data(), &dest_len, raw.bytes.data(),
                       (uLong)raw.bytes.size(), Z_DEFAULT_COMPRESSION);
    if (rc != Z_OK) {
      LOG_ERROR("zlib compress2 failed: " + std::to_string(rc));
      out.bytes.clear();
      return false;
    }
    out.bytes.resize(dest_len);
    out.encoding = "zlib";
  } else {
    out.bytes = raw.bytes;
    out.encoding = "raw";
  }
  return true;
}

FrameResult ScreenPipeline::request_frame(bool force, TimePoint now) {
  FrameResult r;
  if (in_flight_ >= opts_.max_frames_in_flight) {
    r.outcome = FrameOutcome::Throttled;
    return r;
  }
  if (failures_ > 0 && now < backoff_until_) {
    r.outcome = FrameOutcome::BackedOff;
    return r;
  }

  std::optional<RawFrame> raw = capture_with_timeout();
  if (raw && (raw->width <= 0 || raw->height <= 0)) {
    LOG_WARN("Capture returned empty dimensions");
    raw.reset();
  }
  if (!raw) {
    r.outcome = record_failure(now);
    return r;
  }

  std::string hash = frame_hash(*raw);
  bool forced = force || force_next_;
  if (!forced && hash == last_hash_) {
    record_success(*raw);
    r.outcome = FrameOutcome::Unchanged;
    return r;
  }

  ScreenFrame frame;
  if (!encode_into(*raw, frame)) {
    r.outcome = record_failure(now);
    return r;
  }
  record_success(*raw);

  force_next_ = false;
  last_hash_ = hash;
  frame.seq = ++seq_;
  frame.content_hash = std::move(hash);
  in_flight_++;
  r.outcome = FrameOutcome::Frame;
  r.frame = std::move(frame);
  return r;
}

FrameOutcome ScreenPipeline::record_failure(TimePoint now) {
  failures_++;
  long long delay = opts_.backoff_base_ms;
  for (int i = 1; i < failures_ && delay < opts_.backoff_max_ms; ++i)
    delay *= 2;
  delay = std::min<long long>(delay, opts_.backoff_max_ms);
  backoff_until_ = now + std::chrono::milliseconds(delay);
  LOG_DEBUG("Capture failure #" + std::to_string(failures_) + ", backing off " +
            std::to_string(delay) + "ms");
  return failures_ == 1 ? FrameOutcome::CaptureFailed : FrameOutcome::BackedOff;
}

void ScreenPipeline::record_success(const RawFrame &raw) {
  if (failures_ > 0)
    LOG_INFO("Screen capture recovered after " + std::to_string(failures_) +
             " failure(s)");
  failures_ = 0;
  bounds_ = ScreenBounds{raw.width, raw.height};
}

std::optional<Bytes> decode_frame(const ScreenFrame &frame) {
  if (frame.encoding == "raw") {
    if (frame.bytes.size() != frame.raw_size)
      return std::nullopt;
    return frame.bytes;
  }
  if (frame.encoding != "zlib")
    return std::nullopt;
  Bytes out(frame.raw_size);
  uLongf dest_len = (uLongf)out.size();
  int rc = uncompress(out.data(), &dest_len, frame.bytes.data(),
                      (uLong)frame.bytes.size());
  if (rc != Z_OK || dest_len != out.size()) {
    LOG_WARN("zlib uncompress failed: " + std::to_string(rc));
    return std::nullopt;
  }
  return out;
}

} // namespace rdesk
