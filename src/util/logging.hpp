#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>

namespace listenoracle::util {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

const char* LogLevelName(LogLevel level);

// Accepts debug, info, warn/warning and error (case-insensitive). Throws
// std::runtime_error for anything else.
LogLevel ParseLogLevel(const std::string& value);

std::string FormatTimestamp();

// Append-only file logger with optional size-based rotation. Until Enable()
// succeeds every Log() call is a no-op.
class Logger {
 public:
  void Enable(const std::string& path);
  void Configure(LogLevel level, std::uintmax_t max_bytes, std::size_t max_files);
  void Log(LogLevel level, const std::string& message);
  bool Enabled() const;

 private:
  void RotateLocked();

  mutable std::mutex mutex_;
  std::ofstream stream_;
  std::string path_;
  LogLevel level_threshold_{LogLevel::kDebug};
  std::uintmax_t max_bytes_{0};
  std::size_t max_files_{0};
  std::uintmax_t current_size_{0};
};

Logger& GlobalLogger();

void LogDebug(const std::string& message);
void LogInfo(const std::string& message);
void LogWarn(const std::string& message);
void LogError(const std::string& message);

}  // namespace listenoracle::util
