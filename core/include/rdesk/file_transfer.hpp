#pragma once
#include "clock.hpp"
#include "payloads.hpp"
#include "rate_limiter.hpp"
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace rdesk {

namespace fs = std::filesystem;

// Partial resumable uploads parked after a disconnect, abort or timeout.
// Process-wide; keyed by (identity, canonical target path). Also tracks
// which targets have a live upload so two connections never share one.
class ResumeRegistry {
public:
  struct Entry {
    fs::path temp_path;
    std::uint64_t offset = 0;
    std::uint64_t total_size = 0;
    TimePoint parked_at{};
  };

  explicit ResumeRegistry(ClockFn clock = system_clock_fn());

  // Stamps parked_at with the current time.
  void record(const std::string &identity, const fs::path &target, Entry e);
  std::optional<Entry> find(const std::string &identity,
                            const fs::path &target) const;
  void erase(const std::string &identity, const fs::path &target);
  size_t size() const;

  // Drops entries parked for at least `ttl` and deletes their temp files.
  size_t purge_expired(std::chrono::seconds ttl);

  // False when another upload to `target` is live.
  bool claim(const fs::path &target);
  void release(const fs::path &target);

private:
  static std::string key(const std::string &identity, const fs::path &target);

  ClockFn clock_;
  mutable std::mutex mu_;
  std::map<std::string, Entry> entries_;
  std::set<std::string> active_;
};

struct FileTransferOptions {
  std::string root;
  std::uint32_t chunk_size = 65536;
  int chunk_timeout_ms = 60000;
};

struct FileTransferOperation {
  enum class Kind { Upload, Download };

  Kind kind = Kind::Upload;
  fs::path path; // canonical, inside the root
  fs::path temp_path;
  std::uint64_t total_size = 0;
  std::uint64_t bytes_transferred = 0;
  bool resumable = false;
  TimePoint last_activity;
  std::ofstream out;
  std::ifstream in;
};

// Per-connection chunked upload/download plus list, delete and mkdir, all
// confined to the configured root.
class FileTransferManager {
public:
  FileTransferManager(FileTransferOptions opts, ResumeRegistry &registry,
                      SlidingWindowLimiter *chunk_limiter,
                      std::string limiter_key);
  ~FileTransferManager();

  FileTransferManager(const FileTransferManager &) = delete;
  FileTransferManager &operator=(const FileTransferManager &) = delete;

  void set_identity(const std::string &identity) { identity_ = identity; }

  // Returns the FILE_TRANSFER reply body (op, status, ...).
  json::Object handle(const FileTransferRequest &req, TimePoint now);

  // Stall check. Returns a TransferTimeout reply when the active transfer
  // was aborted.
  std::optional<json::Object> tick(TimePoint now);

  // Connection loss: deletes the temp file or parks a resumable upload.
  void on_disconnect();

  bool active() const { return op_ != nullptr; }
  const FileTransferOperation *operation() const { return op_.get(); }

  // Canonical path inside the root, or nullopt when it escapes.
  std::optional<fs::path> resolve(const std::string &client_path) const;
  const fs::path &root() const { return root_; }

  static constexpr const char *TEMP_SUFFIX = ".rdesk-part";

private:
  json::Object do_upload(const json::Object &a, TimePoint now);
  json::Object do_chunk(const json::Object &a, TimePoint now);
  json::Object do_complete(const json::Object &a);
  json::Object do_download(const json::Object &a, TimePoint now);
  json::Object do_abort();
  json::Object do_list(const json::Object &a);
  json::Object do_delete(const json::Object &a);
  json::Object do_mkdir(const json::Object &a);

  // Ends the active transfer; resumable uploads are parked when `park`.
  void finish(bool park);
  std::string relative(const fs::path &p) const;

  FileTransferOptions opts_;
  fs::path root_;
  ResumeRegistry &registry_;
  SlidingWindowLimiter *chunk_limiter_;
  std::string limiter_key_;
  std::string identity_;
  std::unique_ptr<FileTransferOperation> op_;
};

} // namespace rdesk
