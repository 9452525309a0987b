#pragma once
#include "crypto.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

namespace rdesk {

class CredentialError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct CredentialRecord {
  std::string username;
  Bytes salt;
  std::uint32_t iterations = crypto::MIN_KDF_ITERATIONS;
  crypto::Key key{};
  bool is_admin = false;
  std::int64_t created_at = 0; // unix seconds
};

// Users file: {"users": {"<name>": {salt, iterations, key, admin, created_at}}}
// with salt and key hex-encoded. Only derived keys are stored.
class CredentialStore {
public:
  CredentialStore() = default;
  explicit CredentialStore(std::string path) : path_(std::move(path)) {}

  // Missing file is an empty store. Malformed content throws CredentialError.
  void load();
  void save() const;

  // Throws CredentialError if the user exists or the name is empty.
  CredentialRecord add_user(const std::string &username,
                            const std::string &password,
                            std::uint32_t iterations, bool is_admin = false);
  void put(const CredentialRecord &rec);
  bool remove_user(const std::string &username);
  bool has_user(const std::string &username) const;
  size_t size() const;

  // Derives from the supplied password and compares keys in constant time.
  // Unknown users still pay for one derivation.
  std::optional<CredentialRecord> verify(const std::string &username,
                                         const std::string &password) const;

  const std::string &path() const { return path_; }
  // Cost of the decoy derivation run for unknown users.
  void set_decoy_iterations(std::uint32_t n) { decoy_iterations_ = n; }

private:
  std::string path_;
  std::uint32_t decoy_iterations_ = crypto::MIN_KDF_ITERATIONS;
  mutable std::mutex mu_;
  std::map<std::string, CredentialRecord> users_;
};

} // namespace rdesk
