#include "rdesk/credentials.hpp"
#include "rdesk/encoding.hpp"
#include "rdesk/logger.hpp"
#include "rdesk/tinyjson.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <sstream>

namespace rdesk {

namespace {

CredentialRecord record_from_json(const std::string &name,
                                  const json::Object &o) {
  CredentialRecord rec;
  rec.username = name;
  auto salt = json::get_str(o, "salt");
  auto key = json::get_str(o, "key");
  auto iters = json::get_u64(o, "iterations");
  if (!salt || !key || !iters || *iters == 0 || *iters > 0xFFFFFFFFull)
    throw CredentialError("users file: incomplete record for '" + name + "'");
  auto salt_b = hex_decode(*salt);
  auto key_b = hex_decode(*key);
  if (!salt_b || salt_b->empty() || !key_b || key_b->size() != crypto::KEY_SIZE)
    throw CredentialError("users file: bad salt or key for '" + name + "'");
  rec.salt = std::move(*salt_b);
  std::copy(key_b->begin(), key_b->end(), rec.key.begin());
  rec.iterations = (std::uint32_t)*iters;
  rec.is_admin = json::get_bool(o, "admin").value_or(false);
  rec.created_at = (std::int64_t)json::get_num(o, "created_at").value_or(0);
  return rec;
}

json::Object record_to_json(const CredentialRecord &rec) {
  json::Object o;
  o["salt"] = hex_encode(rec.salt);
  o["key"] = hex_encode(rec.key.data(), rec.key.size());
  o["iterations"] = (double)rec.iterations;
  o["admin"] = rec.is_admin;
  o["created_at"] = (double)rec.created_at;
  return o;
}

} // namespace

void CredentialStore::load() {
  std::ifstream f(path_, std::ios::binary);
  if (!f) {
    LOG_WARN("Users file not found: " + path_ + " (no accounts loaded)");
    std::lock_guard<std::mutex> lk(mu_);
    users_.clear();
    return;
  }
  std::stringstream ss;
  ss << f.rdbuf();

  json::Value doc;
  try {
    doc = json::parse(ss.str());
  } catch (const json::ParseError &e) {
    throw CredentialError("users file " + path_ + ": " + e.what());
  }
  if (!doc.is_obj())
    throw CredentialError("users file " + path_ + ": expected an object");
  auto it = doc.as_obj().find("users");
  if (it == doc.as_obj().end() || !it->second.is_obj())
    throw CredentialError("users file " + path_ + ": missing 'users'");

  std::map<std::string, CredentialRecord> loaded;
  for (const auto &[name, v] : it->second.as_obj()) {
    if (!v.is_obj())
      throw CredentialError("users file: record for '" + name +
                            "' is not an object");
    loaded[name] = record_from_json(name, v.as_obj());
  }

  std::lock_guard<std::mutex> lk(mu_);
  users_ = std::move(loaded);
  LOG_INFO("Loaded " + std::to_string(users_.size()) + " account(s) from " +
           path_);
}

void CredentialStore::save() const {
  if (path_.empty())
    throw CredentialError("credential store has no path");
  json::Object users;
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto &[name, rec] : users_)
      users[name] = record_to_json(rec);
  }
  json::Object doc;
  doc["users"] = std::move(users);

  std::string tmp = path_ + ".tmp";
  {
    std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
    if (!f)
      throw CredentialError("cannot write " + tmp);
    f << json::dumps(doc) << '\n';
    if (!f)
      throw CredentialError("write failed: " + tmp);
  }
  if (std::rename(tmp.c_str(), path_.c_str()) != 0) {
    std::remove(tmp.c_str());
    throw CredentialError("cannot replace " + path_);
  }
}

CredentialRecord CredentialStore::add_user(const std::string &username,
                                           const std::string &password,
                                           std::uint32_t iterations,
                                           bool is_admin) {
  if (username.empty())
    throw CredentialError("username must not be empty");
  if (has_user(username))
    throw CredentialError("user already exists: " + username);

  CredentialRecord rec;
  rec.username = username;
  rec.salt = crypto::random_bytes(crypto::SALT_SIZE);
  rec.iterations = iterations;
  rec.key = crypto::derive_key(password, rec.salt, iterations);
  rec.is_admin = is_admin;
  rec.created_at = std::chrono::duration_cast<std::chrono::seconds>(
                       std::chrono::system_clock::now().time_since_epoch())
                       .count();

  std::lock_guard<std::mutex> lk(mu_);
  if (!users_.emplace(username, rec).second)
    throw CredentialError("user already exists: " + username);
  return rec;
}

void CredentialStore::put(const CredentialRecord &rec) {
  std::lock_guard<std::mutex> lk(mu_);
  users_[rec.username] = rec;
}

bool CredentialStore::remove_user(const std::string &username) {
  std::lock_guard<std::mutex> lk(mu_);
  return users_.erase(username) > 0;
}

bool CredentialStore::has_user(const std::string &username) const {
  std::lock_guard<std::mutex> lk(mu_);
  return users_.count(username) > 0;
}

size_t CredentialStore::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return users_.size();
}

std::optional<CredentialRecord>
CredentialStore::verify(const std::string &username,
                        const std::string &password) const {
  std::optional<CredentialRecord> rec;
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = users_.find(username);
    if (it != users_.end())
      rec = it->second;
  }

  if (!rec) {
    static const Bytes dummy_salt(crypto::SALT_SIZE, 0);
    crypto::derive_key(password, dummy_salt, decoy_iterations_);
    return std::nullopt;
  }

  // Derivation runs outside the lock.
  crypto::Key candidate =
      crypto::derive_key(password, rec->salt, rec->iterations);
  if (!crypto::constant_time_equal(candidate, rec->key))
    return std::nullopt;
  return rec;
}

} // namespace rdesk
