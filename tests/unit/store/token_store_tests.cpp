#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include "crypto/hash.hpp"
#include "nlohmann/json.hpp"
#include "store/file_token_store.hpp"
#include "store/token_store.hpp"

#ifndef _WIN32
#include <sys/stat.h>
#endif

using listenoracle::store::FileTokenStore;
using listenoracle::store::MemoryTokenStore;
using listenoracle::store::TokenStore;

namespace {

std::filesystem::path TempDir(const std::string& name) {
  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  auto dir = std::filesystem::temp_directory_path() /
             ("listenoracle_" + name + "_" + std::to_string(stamp));
  std::filesystem::create_directories(dir);
  return dir;
}

bool ExerciseStore(TokenStore& store, const char* label) {
  std::string token;
  std::string error;
  if (store.Get("alice", &token, &error) || error != "Token not found") {
    std::cerr << label << ": expected Token not found for unknown id, got '" << error << "'\n";
    return false;
  }
  if (!store.Put("alice", "tok-1", &error) || !store.Get("alice", &token, &error) ||
      token != "tok-1") {
    std::cerr << label << ": put/get failed: " << error << "\n";
    return false;
  }
  if (!store.Put("alice", "tok-2", &error) || !store.Get("alice", &token, &error) ||
      token != "tok-2") {
    std::cerr << label << ": overwrite failed: " << error << "\n";
    return false;
  }
  if (!store.Delete("alice", &error) || store.Get("alice", &token, &error)) {
    std::cerr << label << ": delete failed\n";
    return false;
  }
  if (!store.Delete("never-stored", &error)) {
    std::cerr << label << ": deleting an unknown id must succeed\n";
    return false;
  }
  return true;
}

bool TestConcurrentPuts(TokenStore& store, const char* label) {
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&store, t]() {
      std::string error;
      for (int i = 0; i < 25; ++i) {
        store.Put("user-" + std::to_string(t) + "-" + std::to_string(i), "tok", &error);
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  std::string token;
  std::string error;
  for (int t = 0; t < 4; ++t) {
    for (int i = 0; i < 25; ++i) {
      if (!store.Get("user-" + std::to_string(t) + "-" + std::to_string(i), &token, &error)) {
        std::cerr << label << ": concurrent put lost an entry\n";
        return false;
      }
    }
  }
  return true;
}

bool TestFileStorePersistence() {
  const auto dir = TempDir("tokens");
  const auto path = dir / "tokens.json";
  std::string error;
  {
    FileTokenStore store(path);
    if (!store.Load(&error)) {
      std::cerr << "file store: load of missing file failed: " << error << "\n";
      return false;
    }
    if (!ExerciseStore(store, "file store")) {
      return false;
    }
    if (!store.Put("bob", "tok-bob", &error) || !store.Put("carol", "tok-carol", &error)) {
      std::cerr << "file store: put failed: " << error << "\n";
      return false;
    }
  }

  // Identifiers are written as digests only.
  std::ifstream in(path);
  std::stringstream raw;
  raw << in.rdbuf();
  if (raw.str().find("bob") != std::string::npos) {
    std::cerr << "file store: raw identifier leaked into snapshot\n";
    return false;
  }
  const auto snapshot = nlohmann::json::parse(raw.str());
  if (snapshot.value("version", 0) != 1 ||
      !snapshot["tokens"].contains(listenoracle::crypto::Sha3_256Hex("bob"))) {
    std::cerr << "file store: unexpected snapshot layout\n";
    return false;
  }

  FileTokenStore reopened(path);
  std::string token;
  if (!reopened.Load(&error) || reopened.Size() != 2 ||
      !reopened.Get("carol", &token, &error) || token != "tok-carol") {
    std::cerr << "file store: reload lost data: " << error << "\n";
    return false;
  }
  if (!TestConcurrentPuts(reopened, "file store")) {
    return false;
  }

  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
  return true;
}

bool TestFileStoreRejectsCorruptSnapshot() {
  const auto dir = TempDir("corrupt");
  const auto path = dir / "tokens.json";
  {
    std::ofstream out(path);
    out << "{not json";
  }
  FileTokenStore store(path);
  std::string error;
  if (store.Load(&error) || error.empty()) {
    std::cerr << "file store: corrupt snapshot accepted\n";
    return false;
  }
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
  return true;
}

bool TestFileStoreRollsBackFailedWrite() {
  const auto dir = TempDir("rollback");
  // The snapshot path is an existing directory, so every write fails.
  const auto path = dir / "blocked";
  std::filesystem::create_directories(path / "inner");
  FileTokenStore store(path);
  std::string error;
  if (store.Put("dave", "tok", &error)) {
    std::cerr << "file store: write into a directory path should fail\n";
    return false;
  }
  std::string token;
  std::string get_error;
  if (store.Get("dave", &token, &get_error) || store.Size() != 0) {
    std::cerr << "file store: failed put was not rolled back\n";
    return false;
  }
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
  return true;
}

bool TestFileStoreSnapshotIsOwnerOnly() {
#ifdef _WIN32
  return true;
#else
  const mode_t previous_mask = ::umask(022);
  const auto dir = TempDir("perms");
  const auto path = dir / "tokens.json";
  {
    // A snapshot left world-readable by an older build.
    std::ofstream legacy(path);
    legacy << R"({"version":1,"tokens":{}})";
  }
  std::filesystem::permissions(path, std::filesystem::perms::owner_read |
                                         std::filesystem::perms::owner_write |
                                         std::filesystem::perms::group_read |
                                         std::filesystem::perms::others_read);
  FileTokenStore store(path);
  std::string error;
  bool ok = store.Load(&error) && store.Put("erin", "tok", &error);
  if (!ok) {
    std::cerr << "file store: put failed: " << error << "\n";
  }
  const auto expected = std::filesystem::perms::owner_read | std::filesystem::perms::owner_write;
  auto perms = std::filesystem::status(path).permissions() & std::filesystem::perms::all;
  if (ok && perms != expected) {
    std::cerr << "file store: snapshot must be owner-only after put\n";
    ok = false;
  }
  if (ok && !store.Delete("erin", &error)) {
    std::cerr << "file store: delete failed: " << error << "\n";
    ok = false;
  }
  perms = std::filesystem::status(path).permissions() & std::filesystem::perms::all;
  if (ok && perms != expected) {
    std::cerr << "file store: snapshot must stay owner-only after delete\n";
    ok = false;
  }
  ::umask(previous_mask);
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
  return ok;
#endif
}

}  // namespace

int main() {
  try {
    MemoryTokenStore memory;
    if (!ExerciseStore(memory, "memory store") || !TestConcurrentPuts(memory, "memory store")) {
      return EXIT_FAILURE;
    }
    if (memory.Size() != 100) {
      std::cerr << "memory store: unexpected size " << memory.Size() << "\n";
      return EXIT_FAILURE;
    }
    if (!TestFileStorePersistence() || !TestFileStoreRejectsCorruptSnapshot() ||
        !TestFileStoreRollsBackFailedWrite() || !TestFileStoreSnapshotIsOwnerOnly()) {
      return EXIT_FAILURE;
    }
  } catch (const std::exception& ex) {
    std::cerr << "token_store_tests: unexpected exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
