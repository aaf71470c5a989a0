#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace listenoracle::node {

inline constexpr std::uint16_t kDefaultRpcPort = 5555;
inline constexpr const char* kDefaultConfigFile = "listenoracle.conf";
inline constexpr const char* kEnvPrefix = "LISTENORACLE_";

struct Options {
  std::string data_dir;
  std::string rpc_bind{"127.0.0.1"};
  std::uint16_t rpc_port{kDefaultRpcPort};
  std::string rpc_user;
  std::string rpc_pass;
  std::string rpc_pass_env;
  std::vector<std::string> rpc_allow;
  bool rpc_require_auth{true};
  std::size_t rpc_threads{4};
  std::size_t rpc_max_body_bytes{1024 * 1024};
  std::string token_store{"file"};  // file | memory
  std::string token_store_path;
  std::string api_host{"127.0.0.1"};
  std::uint16_t api_port{80};
  std::string api_path_prefix{"/v1"};
  int api_timeout_ms{10000};
  bool strict_field_decoding{false};
  std::string debug_log_path;
  std::string log_level{"info"};
  std::size_t log_max_size_mb{0};
  std::size_t log_max_files{0};
  std::string config_path;
  bool disable_config_file{false};
  bool show_help{false};
};

std::string NormalizeKey(std::string key);

// Accepts 1/0, true/false, yes/no, on/off; empty means true. Throws on
// anything else.
bool ParseBool(const std::string& value);

// Applies one `key=value` setting. Keys are matched after NormalizeKey, so
// "rpc-port", "rpc_port" and "RPCPORT" are the same key. Unknown keys are
// reported on stderr and ignored.
void ApplyConfigOption(const std::string& raw_key, const std::string& value, Options* opts);

// Missing files are not an error. Throws with "<path>:<line>: ..." context
// on malformed values.
void LoadConfigFile(const std::filesystem::path& path, Options* opts);

// LISTENORACLE_<KEY> overrides, KEY being the option name upper-cased with
// '-' replaced by '_' (e.g. LISTENORACLE_RPC_PORT).
void ApplyEnvironmentOverrides(Options* opts);

// Defaults, then config file, then environment, then `args` (argv without
// the program name). Derived paths are filled in afterwards.
Options ParseOptions(const std::vector<std::string>& args);

void PrintUsage();

}  // namespace listenoracle::node
