#include "store/file_token_store.hpp"

#include <fstream>
#include <optional>
#include <sstream>
#include <system_error>
#include <utility>

#include "crypto/hash.hpp"
#include "nlohmann/json.hpp"
#include "util/atomic_file.hpp"
#include "util/logging.hpp"

namespace listenoracle::store {

namespace {

constexpr int kSnapshotVersion = 1;

}  // namespace

FileTokenStore::FileTokenStore(std::filesystem::path path) : path_(std::move(path)) {}

bool FileTokenStore::Load(std::string* error) {
  std::lock_guard<std::mutex> lock(mutex_);
  tokens_.clear();
  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) {
    return true;
  }
  std::ifstream in(path_, std::ios::binary);
  if (!in) {
    if (error) *error = "failed to open token store: " + path_.string();
    return false;
  }
  try {
    nlohmann::json snapshot;
    in >> snapshot;
    if (!snapshot.is_object() || snapshot.value("version", 0) != kSnapshotVersion ||
        !snapshot.contains("tokens") || !snapshot.at("tokens").is_object()) {
      if (error) *error = "unsupported token store format: " + path_.string();
      return false;
    }
    for (const auto& [digest, token] : snapshot.at("tokens").items()) {
      if (!token.is_string()) {
        if (error) *error = "corrupt token entry in " + path_.string();
        tokens_.clear();
        return false;
      }
      tokens_.emplace(digest, token.get<std::string>());
    }
  } catch (const nlohmann::json::exception& ex) {
    if (error) *error = "failed to parse token store " + path_.string() + ": " + ex.what();
    tokens_.clear();
    return false;
  }
  util::LogInfo("Loaded " + std::to_string(tokens_.size()) + " token(s) from " + path_.string());
  return true;
}

bool FileTokenStore::Get(const std::string& id, std::string* token, std::string* error) const {
  const auto digest = crypto::Sha3_256Hex(id);
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = tokens_.find(digest);
  if (it == tokens_.end()) {
    if (error) *error = kTokenNotFound;
    return false;
  }
  if (token) {
    *token = it->second;
  }
  return true;
}

bool FileTokenStore::Put(const std::string& id, const std::string& token, std::string* error) {
  const auto digest = crypto::Sha3_256Hex(id);
  std::lock_guard<std::mutex> lock(mutex_);
  std::optional<std::string> previous;
  if (const auto it = tokens_.find(digest); it != tokens_.end()) {
    previous = it->second;
  }
  tokens_[digest] = token;
  if (!PersistLocked(error)) {
    if (previous) {
      tokens_[digest] = *previous;
    } else {
      tokens_.erase(digest);
    }
    return false;
  }
  return true;
}

bool FileTokenStore::Delete(const std::string& id, std::string* error) {
  const auto digest = crypto::Sha3_256Hex(id);
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = tokens_.find(digest);
  if (it == tokens_.end()) {
    return true;
  }
  std::string previous = std::move(it->second);
  tokens_.erase(it);
  if (!PersistLocked(error)) {
    tokens_.emplace(digest, std::move(previous));
    return false;
  }
  return true;
}

std::size_t FileTokenStore::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tokens_.size();
}

bool FileTokenStore::PersistLocked(std::string* error) const {
  nlohmann::json entries = nlohmann::json::object();
  for (const auto& [digest, token] : tokens_) {
    entries[digest] = token;
  }
  const nlohmann::json snapshot = {{"version", kSnapshotVersion}, {"tokens", entries}};
  std::string write_error;
  if (!util::AtomicWriteFile(path_, snapshot.dump(), &write_error,
                            util::FileAccess::kOwnerOnly)) {
    util::LogError("Token store write failed (" + path_.string() + "): " + write_error);
    if (error) *error = "failed to persist token store: " + write_error;
    return false;
  }
  return true;
}

}  // namespace listenoracle::store
