#pragma once
#include "codec.hpp"
#include "crypto.hpp"
#include "file_transfer.hpp"
#include "input_dispatcher.hpp"
#include "payloads.hpp"
#include "screen_pipeline.hpp"
#include "server_state.hpp"
#include "session.hpp"

#include <optional>
#include <string>
#include <vector>

namespace rdesk {

struct Outbound {
  MessageType type{};
  Bytes payload;
};

struct DispatchResult {
  std::vector<Outbound> replies;
  bool close = false;
  // Transport key for messages after these replies.
  std::optional<crypto::Key> new_key;
};

// Per-connection protocol state machine. Not thread-safe: driven only by
// its connection's reader.
class ProtocolDispatcher {
public:
  ProtocolDispatcher(ServerState &st, std::string peer_address,
                     std::uint64_t connection_id);
  ~ProtocolDispatcher();

  ProtocolDispatcher(const ProtocolDispatcher &) = delete;
  ProtocolDispatcher &operator=(const ProtocolDispatcher &) = delete;

  DispatchResult dispatch(const Message &m);
  // Periodic work: stream frames and transfer stall checks.
  DispatchResult tick();
  // Teardown: revokes the session, parks or discards the transfer and
  // resets per-connection limiter keys. Idempotent.
  void on_disconnect();

  SessionState state() const { return state_; }
  const std::string &identity() const { return identity_; }
  const std::string &token() const { return token_; }
  const std::string &connection_key() const { return conn_key_; }

  ScreenPipeline &pipeline() { return pipeline_; }
  FileTransferManager &files() { return files_; }

private:
  static bool allowed_before_auth(MessageType t);
  bool session_valid(DispatchResult &out);

  void on_auth(const AuthRequest &r, DispatchResult &out);
  void on_screenshot(const ScreenshotRequest &r, DispatchResult &out);
  void on_system_command(const SystemCommand &c, DispatchResult &out);
  void emit_frame(const FrameResult &fr, DispatchResult &out);
  void reply_error(DispatchResult &out, ErrorCode code,
                   const std::string &msg);
  void reply_input(DispatchResult &out, const InputOutcome &o);
  json::Object info_object();
  void end_session(SessionState next);

  ServerState &st_;
  std::string peer_;
  std::uint64_t conn_id_;
  std::string conn_key_;
  SessionState state_ = SessionState::Unauthenticated;
  std::string token_;
  std::string identity_;
  TimePoint expires_at_{};
  ScreenPipeline pipeline_;
  InputDispatcher input_;
  FileTransferManager files_;
  bool torn_down_ = false;
};

std::string host_name();
std::string platform_name();

} // namespace rdesk
