#include "rdesk/file_transfer.hpp"
#include "rdesk/crypto.hpp"
#include "rdesk/encoding.hpp"
#include "rdesk/logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>

namespace rdesk {

// ---------------------------------------------------------------------------
// ResumeRegistry

ResumeRegistry::ResumeRegistry(ClockFn clock) : clock_(std::move(clock)) {}

std::string ResumeRegistry::key(const std::string &identity,
                                const fs::path &target) {
  return identity + '\n' + target.generic_string();
}

void ResumeRegistry::record(const std::string &identity,
                            const fs::path &target, Entry e) {
  e.parked_at = clock_();
  std::lock_guard<std::mutex> lk(mu_);
  entries_[key(identity, target)] = std::move(e);
}

std::optional<ResumeRegistry::Entry>
ResumeRegistry::find(const std::string &identity,
                     const fs::path &target) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = entries_.find(key(identity, target));
  if (it == entries_.end())
    return std::nullopt;
  return it->second;
}

void ResumeRegistry::erase(const std::string &identity,
                           const fs::path &target) {
  std::lock_guard<std::mutex> lk(mu_);
  entries_.erase(key(identity, target));
}

size_t ResumeRegistry::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return entries_.size();
}

size_t ResumeRegistry::purge_expired(std::chrono::seconds ttl) {
  TimePoint now = clock_();
  std::vector<fs::path> stale;
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (auto it = entries_.begin(); it != entries_.end();) {
      if (now - it->second.parked_at >= ttl) {
        stale.push_back(it->second.temp_path);
        it = entries_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (const auto &p : stale) {
    std::error_code ec;
    fs::remove(p, ec);
    if (ec)
      LOG_WARN("Could not remove stale upload " + p.string() + ": " +
               ec.message());
  }
  return stale.size();
}

bool ResumeRegistry::claim(const fs::path &target) {
  std::lock_guard<std::mutex> lk(mu_);
  return active_.insert(target.generic_string()).second;
}

void ResumeRegistry::release(const fs::path &target) {
  std::lock_guard<std::mutex> lk(mu_);
  active_.erase(target.generic_string());
}

// ---------------------------------------------------------------------------
// FileTransferManager

namespace {

json::Object ok_reply(const std::string &op) {
  json::Object o;
  o["op"] = op;
  o["status"] = std::string("ok");
  return o;
}

json::Object error_reply(const std::string &op, ErrorCode code,
                         const std::string &message) {
  json::Object o;
  o["op"] = op;
  o["status"] = std::string("error");
  o["error"] = std::string(to_string(code));
  o["message"] = message;
  return o;
}

[[noreturn]] void fail(ErrorCode code, const std::string &msg) {
  throw PayloadError(code, msg);
}

std::string require_path(const json::Object &a) {
  auto p = json::get_str(a, "path");
  if (!p || p->empty())
    fail(ErrorCode::InvalidInput, "missing 'path'");
  return *p;
}

bool opt_bool(const json::Object &a, const std::string &k) {
  return json::get_bool(a, k).value_or(false);
}

bool is_within(const fs::path &root, const fs::path &p) {
  auto r = root.begin();
  auto c = p.begin();
  for (; r != root.end(); ++r, ++c) {
    // A trailing empty element comes from a trailing separator.
    if (r->empty())
      continue;
    if (c == p.end() || *r != *c)
      return false;
  }
  return true;
}

std::int64_t unix_mtime(const fs::path &p) {
  std::error_code ec;
  auto ft = fs::last_write_time(p, ec);
  if (ec)
    return 0;
  auto sys = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
      ft - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
  return std::chrono::duration_cast<std::chrono::seconds>(
             sys.time_since_epoch())
      .count();
}

std::string hash_file(const fs::path &p) {
  std::ifstream f(p, std::ios::binary);
  if (!f)
    fail(ErrorCode::IoError, "cannot read back upload");
  crypto::Hasher h;
  std::vector<char> buf(65536);
  while (f) {
    f.read(buf.data(), (std::streamsize)buf.size());
    auto n = f.gcount();
    if (n > 0)
      h.update(reinterpret_cast<const std::uint8_t *>(buf.data()), (size_t)n);
  }
  if (f.bad())
    fail(ErrorCode::IoError, "read failed while hashing");
  return h.hex_digest();
}

} // namespace

FileTransferManager::FileTransferManager(FileTransferOptions opts,
                                         ResumeRegistry &registry,
                                         SlidingWindowLimiter *chunk_limiter,
                                         std::string limiter_key)
    : opts_(std::move(opts)), registry_(registry),
      chunk_limiter_(chunk_limiter), limiter_key_(std::move(limiter_key)) {
  std::error_code ec;
  root_ = fs::weakly_canonical(fs::absolute(opts_.root, ec), ec);
  if (ec) {
    LOG_WARN("File root " + opts_.root + " not resolvable: " + ec.message());
    root_ = fs::path(opts_.root).lexically_normal();
  }
}

FileTransferManager::~FileTransferManager() {
  if (op_)
    on_disconnect();
}

std::optional<fs::path>
FileTransferManager::resolve(const std::string &client_path) const {
  if (client_path.find('\0') != std::string::npos)
    return std::nullopt;
  fs::path p(client_path);
  fs::path joined = p.is_absolute() ? p : root_ / p;
  std::error_code ec;
  fs::path canon = fs::weakly_canonical(joined, ec);
  if (ec)
    return std::nullopt;
  canon = canon.lexically_normal();
  if (!is_within(root_, canon))
    return std::nullopt;
  return canon;
}

std::string FileTransferManager::relative(const fs::path &p) const {
  auto rel = p.lexically_relative(root_);
  auto s = rel.generic_string();
  return s.empty() ? "." : s;
}

json::Object FileTransferManager::handle(const FileTransferRequest &req,
                                         TimePoint now) {
  const std::string &op = req.op;
  try {
    if (op == "chunk")
      return do_chunk(req.args, now);
    if (op == "complete")
      return do_complete(req.args);
    if (op == "abort")
      return do_abort();

    bool known = op == "upload" || op == "download" || op == "list" ||
                 op == "delete" || op == "mkdir";
    if (!known)
      fail(ErrorCode::InvalidInput, "unknown file operation: " + op);
    if (op_)
      fail(ErrorCode::TransferInProgress,
           "a transfer is already active for " + relative(op_->path));

    if (op == "upload")
      return do_upload(req.args, now);
    if (op == "download")
      return do_download(req.args, now);
    if (op == "list")
      return do_list(req.args);
    if (op == "delete")
      return do_delete(req.args);
    return do_mkdir(req.args);
  } catch (const PayloadError &e) {
    LOG_DEBUG("File transfer " + op + " failed: " + e.what());
    return error_reply(op, e.code(), e.what());
  } catch (const fs::filesystem_error &e) {
    LOG_WARN("File transfer " + op + " I/O error: " + e.what());
    return error_reply(op, ErrorCode::IoError, e.what());
  }
}

json::Object FileTransferManager::do_upload(const json::Object &a,
                                            TimePoint now) {
  std::string client_path = require_path(a);
  auto total = json::get_u64(a, "total_size");
  if (!total)
    fail(ErrorCode::InvalidInput, "missing or invalid 'total_size'");
  bool overwrite = opt_bool(a, "overwrite");
  bool resumable = opt_bool(a, "resumable");
  std::optional<std::uint64_t> resume_offset;
  if (a.count("resume_offset")) {
    resume_offset = json::get_u64(a, "resume_offset");
    if (!resume_offset)
      fail(ErrorCode::InvalidInput, "invalid 'resume_offset'");
  }

  auto target = resolve(client_path);
  if (!target || *target == root_)
    fail(ErrorCode::PathNotAllowed, "path outside the file root");
  if (fs::is_directory(*target))
    fail(ErrorCode::AlreadyExists, "a directory exists at that path");
  if (fs::exists(*target) && !overwrite)
    fail(ErrorCode::AlreadyExists, "target exists and overwrite is false");
  if (!fs::is_directory(target->parent_path()))
    fail(ErrorCode::NotFound, "parent directory does not exist");

  auto parked = registry_.find(identity_, *target);
  if (resume_offset) {
    if (!parked)
      fail(ErrorCode::IntegrityError, "no resumable upload for that path");
    std::error_code ec;
    auto on_disk = fs::file_size(parked->temp_path, ec);
    if (ec || parked->offset != *resume_offset ||
        parked->total_size != *total || on_disk != parked->offset)
      fail(ErrorCode::IntegrityError,
           "resume offset does not match the recorded offset " +
               std::to_string(parked->offset));
  }
  if (!registry_.claim(*target))
    fail(ErrorCode::TransferInProgress,
         "another upload to " + relative(*target) + " is active");

  auto op = std::make_unique<FileTransferOperation>();
  op->kind = FileTransferOperation::Kind::Upload;
  op->path = *target;
  op->total_size = *total;
  op->resumable = resumable;
  op->last_activity = now;

  if (resume_offset) {
    // Another connection of this identity may have taken it meanwhile.
    auto still = registry_.find(identity_, *target);
    if (!still || still->temp_path != parked->temp_path) {
      registry_.release(*target);
      fail(ErrorCode::IntegrityError, "resumable upload is no longer parked");
    }
    registry_.erase(identity_, *target);
    op->temp_path = parked->temp_path;
    op->bytes_transferred = parked->offset;
    op->out.open(op->temp_path, std::ios::binary | std::ios::app);
  } else {
    if (parked) {
      std::error_code ec;
      fs::remove(parked->temp_path, ec);
      registry_.erase(identity_, *target);
    }
    // Hidden and unique per upload.
    op->temp_path = target->parent_path() /
                    ("." + target->filename().string() + "." +
                     hex_encode(crypto::random_bytes(8)) + TEMP_SUFFIX);
    op->out.open(op->temp_path, std::ios::binary | std::ios::trunc);
  }
  if (!op->out) {
    registry_.release(*target);
    fail(ErrorCode::IoError, "cannot open temp file");
  }

  op_ = std::move(op);
  LOG_INFO("Upload started: " + relative(op_->path) + " (" +
           std::to_string(op_->total_size) + " bytes, offset " +
           std::to_string(op_->bytes_transferred) + ")");

  json::Object r = ok_reply("upload");
  r["path"] = relative(op_->path);
  r["offset"] = (double)op_->bytes_transferred;
  r["chunk_size"] = (double)opts_.chunk_size;
  return r;
}

json::Object FileTransferManager::do_chunk(const json::Object &a,
                                           TimePoint now) {
  if (!op_)
    fail(ErrorCode::NoActiveTransfer, "no active transfer");
  if (chunk_limiter_ && !chunk_limiter_->try_acquire(limiter_key_))
    fail(ErrorCode::RateLimited, "chunk rate limit exceeded");
  op_->last_activity = now;

  if (op_->kind == FileTransferOperation::Kind::Download) {
    std::uint64_t remaining = op_->total_size - op_->bytes_transferred;
    size_t n = (size_t)std::min<std::uint64_t>(remaining, opts_.chunk_size);
    Bytes buf(n);
    if (n > 0) {
      op_->in.read(reinterpret_cast<char *>(buf.data()), (std::streamsize)n);
      if ((size_t)op_->in.gcount() != n) {
        finish(false);
        fail(ErrorCode::IoError, "short read; file changed during download");
      }
    }
    json::Object r = ok_reply("chunk");
    r["offset"] = (double)op_->bytes_transferred;
    r["data_b64"] = base64_encode(buf);
    op_->bytes_transferred += n;
    bool eof = op_->bytes_transferred >= op_->total_size;
    r["eof"] = eof;
    if (eof) {
      LOG_INFO("Download finished: " + relative(op_->path));
      finish(false);
    }
    return r;
  }

  auto offset = json::get_u64(a, "offset");
  auto data_b64 = json::get_str(a, "data_b64");
  if (!offset || !data_b64)
    fail(ErrorCode::InvalidInput, "chunk needs 'offset' and 'data_b64'");
  if (*offset != op_->bytes_transferred)
    fail(ErrorCode::IntegrityError,
         "out-of-order chunk: expected offset " +
             std::to_string(op_->bytes_transferred));
  auto data = base64_decode(*data_b64);
  if (!data)
    fail(ErrorCode::InvalidInput, "bad base64 in 'data_b64'");
  if (data->size() > op_->total_size - op_->bytes_transferred)
    fail(ErrorCode::IntegrityError, "chunk overruns total_size");

  op_->out.write(reinterpret_cast<const char *>(data->data()),
                 (std::streamsize)data->size());
  op_->out.flush();
  if (!op_->out) {
    finish(false);
    fail(ErrorCode::IoError, "write failed");
  }
  op_->bytes_transferred += data->size();

  json::Object r = ok_reply("chunk");
  r["offset"] = (double)op_->bytes_transferred;
  return r;
}

json::Object FileTransferManager::do_complete(const json::Object &a) {
  if (!op_ || op_->kind != FileTransferOperation::Kind::Upload)
    fail(ErrorCode::NoActiveTransfer, "no active upload");
  if (op_->bytes_transferred != op_->total_size)
    fail(ErrorCode::IntegrityError,
         "incomplete upload: " + std::to_string(op_->bytes_transferred) +
             " of " + std::to_string(op_->total_size) + " bytes");

  op_->out.close();
  if (op_->out.fail()) {
    finish(false);
    fail(ErrorCode::IoError, "closing temp file failed");
  }

  std::string digest = hash_file(op_->temp_path);
  if (auto expected = json::get_str(a, "hash")) {
    std::string lower = *expected;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });
    if (lower != digest) {
      finish(false);
      fail(ErrorCode::IntegrityError, "content hash mismatch");
    }
  }

  std::error_code ec;
#ifdef _WIN32
  if (fs::exists(op_->path))
    fs::remove(op_->path, ec);
#endif
  fs::rename(op_->temp_path, op_->path, ec);
  if (ec) {
    std::string msg = ec.message();
    finish(false);
    fail(ErrorCode::IoError, "rename failed: " + msg);
  }

  json::Object r = ok_reply("complete");
  r["path"] = relative(op_->path);
  r["size"] = (double)op_->total_size;
  r["hash"] = digest;
  LOG_INFO("Upload complete: " + relative(op_->path));
  registry_.erase(identity_, op_->path);
  registry_.release(op_->path);
  op_.reset();
  return r;
}

json::Object FileTransferManager::do_download(const json::Object &a,
                                              TimePoint now) {
  auto target = resolve(require_path(a));
  if (!target)
    fail(ErrorCode::PathNotAllowed, "path outside the file root");
  if (!fs::is_regular_file(*target))
    fail(ErrorCode::NotFound, "no such file");
  std::uint64_t size = fs::file_size(*target);
  std::uint64_t offset = 0;
  if (a.count("offset")) {
    auto o = json::get_u64(a, "offset");
    if (!o)
      fail(ErrorCode::InvalidInput, "invalid 'offset'");
    offset = *o;
  }
  if (offset > size)
    fail(ErrorCode::IntegrityError, "offset beyond end of file");

  auto op = std::make_unique<FileTransferOperation>();
  op->kind = FileTransferOperation::Kind::Download;
  op->path = *target;
  op->total_size = size;
  op->bytes_transferred = offset;
  op->last_activity = now;
  op->in.open(*target, std::ios::binary);
  if (!op->in)
    fail(ErrorCode::IoError, "cannot open file");
  op->in.seekg((std::streamoff)offset);
  op_ = std::move(op);

  json::Object r = ok_reply("download");
  r["path"] = relative(op_->path);
  r["total_size"] = (double)size;
  r["offset"] = (double)offset;
  r["chunk_size"] = (double)opts_.chunk_size;
  return r;
}

json::Object FileTransferManager::do_abort() {
  if (!op_)
    fail(ErrorCode::NoActiveTransfer, "no active transfer");
  LOG_INFO("Transfer aborted by client: " + relative(op_->path));
  finish(true);
  return ok_reply("abort");
}

json::Object FileTransferManager::do_list(const json::Object &a) {
  std::string client_path = json::get_str(a, "path").value_or(".");
  auto dir = resolve(client_path.empty() ? "." : client_path);
  if (!dir)
    fail(ErrorCode::PathNotAllowed, "path outside the file root");
  if (!fs::is_directory(*dir))
    fail(ErrorCode::NotFound, "no such directory");

  std::vector<json::Object> items;
  for (const auto &entry : fs::directory_iterator(*dir)) {
    std::string name = entry.path().filename().string();
    if (name.size() > std::char_traits<char>::length(TEMP_SUFFIX) &&
        name.compare(name.size() - std::char_traits<char>::length(TEMP_SUFFIX),
                     std::string::npos, TEMP_SUFFIX) == 0)
      continue;
    std::error_code ec;
    json::Object e;
    e["name"] = name;
    bool is_dir = entry.is_directory(ec);
    e["is_dir"] = is_dir;
    e["size"] = is_dir ? 0.0 : (double)entry.file_size(ec);
    e["modified"] = (double)unix_mtime(entry.path());
    items.push_back(std::move(e));
  }
  std::sort(items.begin(), items.end(),
            [](const json::Object &x, const json::Object &y) {
              return x.at("name").as_str() < y.at("name").as_str();
            });

  json::Array arr;
  for (auto &e : items)
    arr.push_back(std::move(e));
  json::Object r = ok_reply("list");
  r["path"] = relative(*dir);
  r["entries"] = std::move(arr);
  return r;
}

json::Object FileTransferManager::do_delete(const json::Object &a) {
  auto target = resolve(require_path(a));
  if (!target || *target == root_)
    fail(ErrorCode::PathNotAllowed, "path outside the file root");
  if (!fs::exists(fs::symlink_status(*target)))
    fail(ErrorCode::NotFound, "no such file or directory");
  auto n = fs::remove_all(*target);
  LOG_INFO("Deleted " + relative(*target) + " (" + std::to_string(n) +
           " entries)");
  json::Object r = ok_reply("delete");
  r["path"] = relative(*target);
  return r;
}

json::Object FileTransferManager::do_mkdir(const json::Object &a) {
  auto target = resolve(require_path(a));
  if (!target)
    fail(ErrorCode::PathNotAllowed, "path outside the file root");
  if (fs::exists(*target))
    fail(ErrorCode::AlreadyExists, "path already exists");
  fs::create_directories(*target);
  json::Object r = ok_reply("mkdir");
  r["path"] = relative(*target);
  return r;
}

std::optional<json::Object> FileTransferManager::tick(TimePoint now) {
  if (!op_ || ms_between(op_->last_activity, now) <= opts_.chunk_timeout_ms)
    return std::nullopt;
  std::string op_name =
      op_->kind == FileTransferOperation::Kind::Upload ? "upload" : "download";
  LOG_WARN("Transfer of " + relative(op_->path) + " stalled; aborting");
  finish(true);
  return error_reply(op_name, ErrorCode::TransferTimeout,
                     "no chunk within " +
                         std::to_string(opts_.chunk_timeout_ms) + "ms");
}

void FileTransferManager::on_disconnect() {
  if (!op_)
    return;
  LOG_INFO("Connection lost during transfer of " + relative(op_->path));
  finish(true);
}

void FileTransferManager::finish(bool park) {
  if (!op_)
    return;
  if (op_->kind == FileTransferOperation::Kind::Upload) {
    op_->out.close();
    if (park && op_->resumable) {
      registry_.record(identity_, op_->path,
                       ResumeRegistry::Entry{op_->temp_path,
                                             op_->bytes_transferred,
                                             op_->total_size});
      LOG_INFO("Parked resumable upload " + relative(op_->path) + " at " +
               std::to_string(op_->bytes_transferred));
    } else {
      std::error_code ec;
      fs::remove(op_->temp_path, ec);
      if (ec)
        LOG_WARN("Could not remove " + op_->temp_path.string() + ": " +
                 ec.message());
    }
    registry_.release(op_->path);
  } else {
    op_->in.close();
  }
  op_.reset();
}

} // namespace rdesk
