#include "rdesk/crypto.hpp"
#include "rdesk/encoding.hpp"

#include <monocypher-ed25519.h>
#include <monocypher.h>

#include <algorithm>
#include <cstring>

#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#include <windows.h>
#include <bcrypt.h>
#pragma comment(lib, "bcrypt.lib")
#else
#include <cerrno>
#include <sys/random.h>
#endif

namespace rdesk::crypto {

void random_bytes(std::uint8_t *out, size_t len) {
#ifdef _WIN32
  if (BCryptGenRandom(nullptr, out, (ULONG)len,
                      BCRYPT_USE_SYSTEM_PREFERRED_RNG) != 0)
    throw CryptoError("BCryptGenRandom failed");
#else
  size_t off = 0;
  while (off < len) {
    ssize_t r = getrandom(out + off, len - off, 0);
    if (r < 0) {
      if (errno == EINTR)
        continue;
      throw CryptoError("getrandom failed: " + std::string(strerror(errno)));
    }
    off += (size_t)r;
  }
#endif
}

Bytes random_bytes(size_t len) {
  Bytes out(len);
  random_bytes(out.data(), len);
  return out;
}

Bytes pbkdf2_hmac_sha512(std::string_view password, const Bytes &salt,
                         std::uint32_t iterations, size_t key_len) {
  if (iterations == 0)
    throw CryptoError("pbkdf2: iterations must be positive");

  const auto *pw = reinterpret_cast<const std::uint8_t *>(password.data());
  crypto_hmac_sha512_ctx keyed;
  crypto_hmac_sha512_init(&keyed, pw, password.size());

  Bytes out;
  out.reserve(key_len);
  std::uint8_t u[64], t[64], ctr[4];
  for (std::uint32_t block = 1; out.size() < key_len; ++block) {
    put_u32_be(ctr, block);
    crypto_hmac_sha512_ctx ctx = keyed;
    crypto_hmac_sha512_update(&ctx, salt.data(), salt.size());
    crypto_hmac_sha512_update(&ctx, ctr, sizeof(ctr));
    crypto_hmac_sha512_final(&ctx, u);
    std::memcpy(t, u, sizeof(t));
    for (std::uint32_t i = 1; i < iterations; ++i) {
      ctx = keyed;
      crypto_hmac_sha512_update(&ctx, u, sizeof(u));
      crypto_hmac_sha512_final(&ctx, u);
      for (size_t j = 0; j < sizeof(t); ++j)
        t[j] ^= u[j];
    }
    size_t take = std::min(sizeof(t), key_len - out.size());
    out.insert(out.end(), t, t + take);
  }
  crypto_wipe(&keyed, sizeof(keyed));
  crypto_wipe(u, sizeof(u));
  crypto_wipe(t, sizeof(t));
  return out;
}

Key derive_key(std::string_view password, const Bytes &salt,
               std::uint32_t iterations) {
  Bytes raw = pbkdf2_hmac_sha512(password, salt, iterations, KEY_SIZE);
  Key k;
  std::memcpy(k.data(), raw.data(), KEY_SIZE);
  crypto_wipe(raw.data(), raw.size());
  return k;
}

Bytes encrypt(const Key &key, const std::uint8_t *plain, size_t len) {
  Bytes out(SEAL_OVERHEAD + len);
  std::uint8_t *nonce = out.data();
  std::uint8_t *mac = out.data() + NONCE_SIZE;
  std::uint8_t *cipher = out.data() + SEAL_OVERHEAD;
  random_bytes(nonce, NONCE_SIZE);
  crypto_lock(mac, cipher, key.data(), nonce, plain, len);
  return out;
}

std::optional<Bytes> decrypt(const Key &key, const Bytes &sealed) {
  if (sealed.size() < SEAL_OVERHEAD)
    return std::nullopt;
  const std::uint8_t *nonce = sealed.data();
  const std::uint8_t *mac = sealed.data() + NONCE_SIZE;
  const std::uint8_t *cipher = sealed.data() + SEAL_OVERHEAD;
  size_t len = sealed.size() - SEAL_OVERHEAD;
  Bytes plain(len);
  if (crypto_unlock(plain.data(), key.data(), nonce, mac, cipher, len) != 0)
    return std::nullopt;
  return plain;
}

bool constant_time_equal(const std::uint8_t *a, const std::uint8_t *b,
                         size_t len) {
  if (len == 32)
    return crypto_verify32(a, b) == 0;
  std::uint8_t diff = 0;
  for (size_t i = 0; i < len; ++i)
    diff |= (std::uint8_t)(a[i] ^ b[i]);
  return diff == 0;
}

Bytes generate_token() { return random_bytes(TOKEN_SIZE); }

Key derive_transport_key(const Key &credential_key,
                         const Bytes &session_nonce) {
  static const char label[] = "rdesk-transport-v1";
  crypto_blake2b_ctx ctx;
  crypto_blake2b_general_init(&ctx, KEY_SIZE, credential_key.data(),
                              KEY_SIZE);
  crypto_blake2b_update(&ctx, reinterpret_cast<const std::uint8_t *>(label),
                        sizeof(label) - 1);
  crypto_blake2b_update(&ctx, session_nonce.data(), session_nonce.size());
  Key out;
  crypto_blake2b_final(&ctx, out.data());
  return out;
}

struct Hasher::State {
  crypto_blake2b_ctx ctx;
};

Hasher::Hasher() : st_(new State) {
  crypto_blake2b_general_init(&st_->ctx, HASH_SIZE, nullptr, 0);
}

Hasher::~Hasher() {
  crypto_wipe(st_, sizeof(State));
  delete st_;
}

void Hasher::update(const std::uint8_t *data, size_t len) {
  if (done_)
    throw CryptoError("hasher already finalized");
  crypto_blake2b_update(&st_->ctx, data, len);
}

void Hasher::update_u32(std::uint32_t v) {
  std::uint8_t b[4];
  put_u32_be(b, v);
  update(b, sizeof(b));
}

std::string Hasher::hex_digest() {
  if (done_)
    throw CryptoError("hasher already finalized");
  std::uint8_t h[HASH_SIZE];
  crypto_blake2b_final(&st_->ctx, h);
  done_ = true;
  return hex_encode(h, HASH_SIZE);
}

std::string blake2b_hex(const std::uint8_t *data, size_t len) {
  std::uint8_t h[HASH_SIZE];
  crypto_blake2b_general(h, HASH_SIZE, nullptr, 0, data, len);
  return hex_encode(h, HASH_SIZE);
}

CryptoSession::~CryptoSession() { crypto_wipe(key_.data(), key_.size()); }

void CryptoSession::set_key(const Key &key) {
  key_ = key;
  initialized_ = true;
}

void CryptoSession::clear() {
  crypto_wipe(key_.data(), key_.size());
  initialized_ = false;
}

Bytes CryptoSession::encrypt(const Bytes &plain) const {
  if (!initialized_)
    return plain;
  return crypto::encrypt(key_, plain);
}

std::optional<Bytes> CryptoSession::decrypt(const Bytes &sealed) const {
  if (!initialized_)
    return sealed;
  return crypto::decrypt(key_, sealed);
}

} // namespace rdesk::crypto
