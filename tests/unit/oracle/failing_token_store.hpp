#pragma once

#include <string>

#include "store/token_store.hpp"

namespace listenoracle::test {

// Token store whose operations fail with configurable messages. An empty
// `get_error` makes Get fail without setting any text.
class FailingTokenStore : public store::TokenStore {
 public:
  std::string get_error;
  std::string put_error{"disk full"};
  std::string delete_error{"read-only store"};
  int puts{0};
  int deletes{0};

  bool Get(const std::string&, std::string*, std::string* error) const override {
    if (error && !get_error.empty()) *error = get_error;
    return false;
  }

  bool Put(const std::string&, const std::string&, std::string* error) override {
    ++puts;
    if (error) *error = put_error;
    return false;
  }

  bool Delete(const std::string&, std::string* error) override {
    ++deletes;
    if (error) *error = delete_error;
    return false;
  }
};

}  // namespace listenoracle::test
