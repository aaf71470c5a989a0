#pragma once

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <string>
#include <unordered_map>

#include "store/token_store.hpp"

namespace listenoracle::store {

// Token store persisted as a JSON snapshot:
//
//   {"version": 1, "tokens": {"<sha3-256(id) hex>": "<token>", ...}}
//
// Identifiers are kept only as digests. Every mutation rewrites the
// snapshot through util::AtomicWriteFile; if the write fails the in-memory
// state is rolled back and the error is returned to the caller.
class FileTokenStore : public TokenStore {
 public:
  explicit FileTokenStore(std::filesystem::path path);

  // Reads the snapshot if present. A missing file is an empty store.
  bool Load(std::string* error);

  bool Get(const std::string& id, std::string* token, std::string* error) const override;
  bool Put(const std::string& id, const std::string& token, std::string* error) override;
  bool Delete(const std::string& id, std::string* error) override;

  std::size_t Size() const;
  const std::filesystem::path& path() const noexcept { return path_; }

 private:
  bool PersistLocked(std::string* error) const;

  std::filesystem::path path_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::string> tokens_;  // digest hex -> token
};

}  // namespace listenoracle::store
