#include "store/token_store.hpp"

namespace listenoracle::store {

bool MemoryTokenStore::Get(const std::string& id, std::string* token, std::string* error) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = tokens_.find(id);
  if (it == tokens_.end()) {
    if (error) *error = kTokenNotFound;
    return false;
  }
  if (token) {
    *token = it->second;
  }
  return true;
}

bool MemoryTokenStore::Put(const std::string& id, const std::string& token, std::string*) {
  std::lock_guard<std::mutex> lock(mutex_);
  tokens_[id] = token;
  return true;
}

bool MemoryTokenStore::Delete(const std::string& id, std::string*) {
  std::lock_guard<std::mutex> lock(mutex_);
  tokens_.erase(id);
  return true;
}

std::size_t MemoryTokenStore::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tokens_.size();
}

}  // namespace listenoracle::store
