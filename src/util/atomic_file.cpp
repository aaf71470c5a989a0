#include "util/atomic_file.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <system_error>

#ifdef _WIN32
#include <windows.h>
#endif

namespace listenoracle::util {

namespace {

std::atomic<std::uint64_t> g_temp_counter{0};

std::filesystem::path MakeTempPath(const std::filesystem::path& target) {
  const auto nonce = g_temp_counter.fetch_add(1, std::memory_order_relaxed);
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  return target.parent_path() / (target.filename().string() + ".tmp." + std::to_string(now) +
                                 "." + std::to_string(nonce));
}

void SetError(std::string* error, const std::string& message) {
  if (error) {
    *error = message;
  }
}

bool ReplaceFile(const std::filesystem::path& from, const std::filesystem::path& to,
                 std::string* error) {
#ifdef _WIN32
  if (!MoveFileExW(from.wstring().c_str(), to.wstring().c_str(),
                   MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH)) {
    SetError(error, "MoveFileExW failed");
    return false;
  }
  return true;
#else
  std::error_code ec;
  std::filesystem::rename(from, to, ec);
  if (ec) {
    SetError(error, "rename failed: " + ec.message());
    return false;
  }
  return true;
#endif
}

}  // namespace

bool AtomicWriteFile(const std::filesystem::path& path, std::string_view contents,
                     std::string* error, FileAccess access) {
  const auto parent = path.parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      SetError(error, "create_directories failed: " + ec.message());
      return false;
    }
  }

  const auto tmp_path = MakeTempPath(path);
  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      SetError(error, "failed to open temp file for write: " + tmp_path.string());
      return false;
    }
    if (access == FileAccess::kOwnerOnly) {
      std::error_code ec;
      std::filesystem::permissions(
          tmp_path, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
          std::filesystem::perm_options::replace, ec);
      if (ec) {
        out.close();
        std::filesystem::remove(tmp_path, ec);
        SetError(error, "failed to restrict permissions on " + tmp_path.string());
        return false;
      }
    }
    out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    out.flush();
    if (!out.good()) {
      out.close();
      std::error_code ec;
      std::filesystem::remove(tmp_path, ec);
      SetError(error, "write failed: " + tmp_path.string());
      return false;
    }
  }

  if (!ReplaceFile(tmp_path, path, error)) {
    std::error_code ec;
    std::filesystem::remove(tmp_path, ec);
    return false;
  }
  return true;
}

}  // namespace listenoracle::util
