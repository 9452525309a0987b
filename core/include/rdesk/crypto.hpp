#pragma once
#include "types.hpp"
#include <array>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace rdesk::crypto {

inline constexpr size_t KEY_SIZE = 32;
inline constexpr size_t NONCE_SIZE = 24;
inline constexpr size_t MAC_SIZE = 16;
inline constexpr size_t SEAL_OVERHEAD = NONCE_SIZE + MAC_SIZE;
inline constexpr size_t TOKEN_SIZE = 32;
inline constexpr size_t SALT_SIZE = 16;
inline constexpr size_t HASH_SIZE = 32;
inline constexpr std::uint32_t MIN_KDF_ITERATIONS = 100000;
inline constexpr const char *CIPHER_NAME = "xchacha20-poly1305";

using Key = std::array<std::uint8_t, KEY_SIZE>;

class CryptoError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// OS CSPRNG. Throws CryptoError if the OS cannot supply entropy.
void random_bytes(std::uint8_t *out, size_t len);
Bytes random_bytes(size_t len);

// PBKDF2 with HMAC-SHA512 as the PRF.
Bytes pbkdf2_hmac_sha512(std::string_view password, const Bytes &salt,
                         std::uint32_t iterations, size_t key_len);
Key derive_key(std::string_view password, const Bytes &salt,
               std::uint32_t iterations);

// XChaCha20-Poly1305 with a fresh random nonce: nonce || mac || ciphertext.
Bytes encrypt(const Key &key, const std::uint8_t *plain, size_t len);
inline Bytes encrypt(const Key &key, const Bytes &plain) {
  return encrypt(key, plain.data(), plain.size());
}
std::optional<Bytes> decrypt(const Key &key, const Bytes &sealed);

bool constant_time_equal(const std::uint8_t *a, const std::uint8_t *b,
                         size_t len);
inline bool constant_time_equal(const Key &a, const Key &b) {
  return constant_time_equal(a.data(), b.data(), KEY_SIZE);
}

Bytes generate_token();

// Both peers can compute this after AUTH: the server from the stored
// credential key, the client from the password.
Key derive_transport_key(const Key &credential_key, const Bytes &session_nonce);

// Incremental BLAKE2b-256, hex digest.
class Hasher {
public:
  Hasher();
  ~Hasher();
  Hasher(const Hasher &) = delete;
  Hasher &operator=(const Hasher &) = delete;

  void update(const std::uint8_t *data, size_t len);
  void update(std::string_view s) {
    update(reinterpret_cast<const std::uint8_t *>(s.data()), s.size());
  }
  void update_u32(std::uint32_t v);
  std::string hex_digest();

private:
  struct State;
  State *st_;
  bool done_ = false;
};

std::string blake2b_hex(const std::uint8_t *data, size_t len);

// Per-connection transport cipher. Uninitialized until AUTH succeeds; while
// uninitialized, payloads pass through unchanged.
class CryptoSession {
public:
  CryptoSession() = default;
  ~CryptoSession();

  void set_key(const Key &key);
  void clear();
  bool is_initialized() const { return initialized_; }

  Bytes encrypt(const Bytes &plain) const;
  std::optional<Bytes> decrypt(const Bytes &sealed) const;

private:
  Key key_{};
  bool initialized_ = false;
};

} // namespace rdesk::crypto
