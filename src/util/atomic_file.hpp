#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace listenoracle::util {

enum class FileAccess {
  kDefault,
  // Owner read/write only; for files holding credentials.
  kOwnerOnly,
};

// Atomically replace `path` with `contents`: the data is written to a temp
// file in the same directory which is then renamed over the target. Parent
// directories are created as needed. With kOwnerOnly the temp file is
// restricted before any data is written, and failing to restrict it fails
// the call.
bool AtomicWriteFile(const std::filesystem::path& path, std::string_view contents,
                     std::string* error = nullptr, FileAccess access = FileAccess::kDefault);

}  // namespace listenoracle::util
