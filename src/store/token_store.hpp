#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>

namespace listenoracle::store {

inline constexpr const char* kTokenNotFound = "Token not found";

// Association of user identifiers to listening-history API tokens.
// Implementations serialize their own access; callers may invoke any
// method concurrently.
class TokenStore {
 public:
  virtual ~TokenStore() = default;

  // Fails with kTokenNotFound when `id` has no token.
  virtual bool Get(const std::string& id, std::string* token, std::string* error) const = 0;
  virtual bool Put(const std::string& id, const std::string& token, std::string* error) = 0;
  // Deleting an unknown identifier succeeds.
  virtual bool Delete(const std::string& id, std::string* error) = 0;
};

class MemoryTokenStore : public TokenStore {
 public:
  bool Get(const std::string& id, std::string* token, std::string* error) const override;
  bool Put(const std::string& id, const std::string& token, std::string* error) override;
  bool Delete(const std::string& id, std::string* error) override;

  std::size_t Size() const;

 private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::string> tokens_;
};

}  // namespace listenoracle::store
