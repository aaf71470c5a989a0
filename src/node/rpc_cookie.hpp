#pragma once

#include <filesystem>
#include <string>

namespace listenoracle::node {

inline constexpr const char* kCookieFileName = "rpc.cookie";
inline constexpr const char* kCookieUser = "__cookie__";

// Writes "user:password\n" to `path` with owner-only permissions. Failing
// to restrict the permissions is reported through `warning` but does not
// fail the call.
bool WriteRpcCookie(const std::filesystem::path& path, const std::string& user,
                    const std::string& password, std::string* warning, std::string* error);

// Generates a random password for kCookieUser and writes it to `path`.
bool GenerateRpcCookie(const std::filesystem::path& path, std::string* user,
                       std::string* password, std::string* warning, std::string* error);

// Parses the first line of a cookie file into user and password.
bool ReadRpcCookie(const std::filesystem::path& path, std::string* user, std::string* password,
                   std::string* error);

}  // namespace listenoracle::node
