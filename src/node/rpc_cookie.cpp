#include "node/rpc_cookie.hpp"

#include <array>
#include <cerrno>
#include <cstdint>
#include <fstream>
#include <system_error>
#include <utility>

#ifdef _WIN32
#include <windows.h>
#include <bcrypt.h>
#elif defined(__linux__)
#include <sys/random.h>
#endif

#include "util/hex.hpp"

namespace listenoracle::node {

namespace {

constexpr std::size_t kCookieSecretBytes = 24;

bool FillCookieSecret(std::array<std::uint8_t, kCookieSecretBytes>* secret, std::string* error) {
#ifdef _WIN32
  if (BCryptGenRandom(nullptr, secret->data(), static_cast<ULONG>(secret->size()),
                      BCRYPT_USE_SYSTEM_PREFERRED_RNG) != 0) {
    if (error) *error = "BCryptGenRandom failed";
    return false;
  }
  return true;
#elif defined(__linux__)
  std::size_t filled = 0;
  while (filled < secret->size()) {
    const ssize_t n = getrandom(secret->data() + filled, secret->size() - filled, 0);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (error) *error = "getrandom failed: " + std::generic_category().message(errno);
      return false;
    }
    filled += static_cast<std::size_t>(n);
  }
  return true;
#else
  std::ifstream urandom("/dev/urandom", std::ios::binary);
  urandom.read(reinterpret_cast<char*>(secret->data()),
               static_cast<std::streamsize>(secret->size()));
  if (!urandom) {
    if (error) *error = "failed to read /dev/urandom";
    return false;
  }
  return true;
#endif
}

bool HardenCookieFile(const std::filesystem::path& path, std::string* warning) {
  std::error_code ec;
  std::filesystem::permissions(
      path, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
      std::filesystem::perm_options::replace, ec);
  if (ec) {
    if (warning) {
      *warning = "failed to set RPC cookie permissions on " + path.string();
    }
    return false;
  }
  return true;
}

}  // namespace

bool WriteRpcCookie(const std::filesystem::path& path, const std::string& user,
                    const std::string& password, std::string* warning, std::string* error) {
  if (warning) {
    warning->clear();
  }
  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream cookie(path, std::ios::trunc);
  if (!cookie) {
    if (error) *error = "unable to write RPC cookie at " + path.string();
    return false;
  }
  cookie << user << ":" << password << "\n";
  cookie.close();
  if (!cookie) {
    if (error) *error = "unable to write RPC cookie at " + path.string();
    return false;
  }
  HardenCookieFile(path, warning);
  return true;
}

bool GenerateRpcCookie(const std::filesystem::path& path, std::string* user,
                       std::string* password, std::string* warning, std::string* error) {
  std::array<std::uint8_t, kCookieSecretBytes> bytes{};
  if (!FillCookieSecret(&bytes, error)) {
    return false;
  }
  std::string secret = util::HexEncode(bytes);
  if (!WriteRpcCookie(path, kCookieUser, secret, warning, error)) {
    return false;
  }
  if (user) *user = kCookieUser;
  if (password) *password = std::move(secret);
  return true;
}

bool ReadRpcCookie(const std::filesystem::path& path, std::string* user, std::string* password,
                   std::string* error) {
  std::ifstream in(path);
  if (!in) {
    if (error) *error = "unable to read RPC cookie at " + path.string();
    return false;
  }
  std::string line;
  std::getline(in, line);
  while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
    line.pop_back();
  }
  const auto colon = line.find(':');
  if (colon == std::string::npos || colon == 0 || colon + 1 == line.size()) {
    if (error) *error = "malformed RPC cookie at " + path.string();
    return false;
  }
  if (user) *user = line.substr(0, colon);
  if (password) *password = line.substr(colon + 1);
  return true;
}

}  // namespace listenoracle::node
