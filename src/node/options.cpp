#include "node/options.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace listenoracle::node {

namespace {

std::string Trim(const std::string& input) {
  const std::string whitespace = " \t\r\n";
  const auto first = input.find_first_not_of(whitespace);
  if (first == std::string::npos) {
    return {};
  }
  const auto last = input.find_last_not_of(whitespace);
  return input.substr(first, last - first + 1);
}

std::optional<std::string> GetEnvValue(std::string_view name) {
  std::string key(name);
  const char* value = std::getenv(key.c_str());
  if (!value || value[0] == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

std::uint16_t ParsePort(const std::string& value) {
  unsigned long parsed = 0;
  try {
    parsed = std::stoul(value);
  } catch (const std::exception&) {
    throw std::runtime_error("invalid port '" + value + "' (expected 0-65535)");
  }
  if (parsed > 65535) {
    throw std::runtime_error("invalid port '" + value + "' (out of range)");
  }
  return static_cast<std::uint16_t>(parsed);
}

std::size_t ParseSize(const std::string& value) {
  try {
    return static_cast<std::size_t>(std::stoull(value));
  } catch (const std::exception&) {
    throw std::runtime_error("invalid number '" + value + "'");
  }
}

// Config/env keys that are recognised, in their canonical spelling.
constexpr std::string_view kKnownKeys[] = {
    "data-dir",        "rpc-bind",          "rpc-port",
    "rpc-user",        "rpc-pass",          "rpc-pass-env",
    "rpc-allow-ip",    "rpc-require-auth",  "rpc-threads",
    "rpc-max-body-bytes", "token-store",    "token-store-path",
    "api-host",        "api-port",          "api-path-prefix",
    "api-timeout-ms",  "strict-field-decoding", "debug-log",
    "log-level",       "log-max-size-mb",   "log-max-files",
};

}  // namespace

std::string NormalizeKey(std::string key) {
  std::string out;
  out.reserve(key.size());
  for (char c : key) {
    if (c == '-' || c == '_') {
      continue;
    }
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

bool ParseBool(const std::string& value) {
  std::string lower;
  lower.reserve(value.size());
  for (char c : value) {
    lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (lower.empty()) {
    return true;
  }
  if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
    return true;
  }
  if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
    return false;
  }
  throw std::runtime_error("invalid boolean value: " + value);
}

void ApplyConfigOption(const std::string& raw_key, const std::string& value, Options* opts) {
  const std::string key = NormalizeKey(raw_key);
  if (key == "datadir") {
    opts->data_dir = value;
  } else if (key == "rpcbind") {
    opts->rpc_bind = value;
  } else if (key == "rpcport") {
    opts->rpc_port = ParsePort(value);
  } else if (key == "rpcuser") {
    opts->rpc_user = value;
  } else if (key == "rpcpassword" || key == "rpcpass") {
    opts->rpc_pass = value;
  } else if (key == "rpcpassenv") {
    opts->rpc_pass_env = value;
  } else if (key == "rpcallowip") {
    opts->rpc_allow.push_back(value);
  } else if (key == "rpcrequireauth") {
    opts->rpc_require_auth = ParseBool(value);
  } else if (key == "rpcthreads") {
    opts->rpc_threads = ParseSize(value);
  } else if (key == "rpcmaxbodybytes") {
    opts->rpc_max_body_bytes = ParseSize(value);
  } else if (key == "tokenstore") {
    if (value != "file" && value != "memory") {
      throw std::runtime_error("invalid token-store '" + value + "' (expected file or memory)");
    }
    opts->token_store = value;
  } else if (key == "tokenstorepath") {
    opts->token_store_path = value;
  } else if (key == "apihost") {
    opts->api_host = value;
  } else if (key == "apiport") {
    opts->api_port = ParsePort(value);
  } else if (key == "apipathprefix") {
    opts->api_path_prefix = value;
  } else if (key == "apitimeoutms") {
    opts->api_timeout_ms = static_cast<int>(ParseSize(value));
  } else if (key == "strictfielddecoding") {
    opts->strict_field_decoding = ParseBool(value);
  } else if (key == "debuglog") {
    opts->debug_log_path = value;
  } else if (key == "loglevel") {
    opts->log_level = value;
  } else if (key == "logmaxsizemb") {
    opts->log_max_size_mb = ParseSize(value);
  } else if (key == "logmaxfiles") {
    opts->log_max_files = ParseSize(value);
  } else if (key == "config" || key == "conf") {
    opts->config_path = value;
  } else {
    std::cerr << "[listenoracled] warn: unknown config key '" << raw_key << "'\n";
  }
}

void LoadConfigFile(const std::filesystem::path& path, Options* opts) {
  if (path.empty()) {
    return;
  }
  if (!std::filesystem::exists(path)) {
    return;
  }
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("failed to open config file: " + path.string());
  }
  std::string line;
  std::size_t lineno = 0;
  while (std::getline(in, line)) {
    ++lineno;
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.resize(comment_pos);
    }
    line = Trim(line);
    if (line.empty()) {
      continue;
    }
    std::string key;
    std::string value;
    const auto eq_pos = line.find_first_of("= ");
    if (eq_pos == std::string::npos) {
      key = line;
      value = "1";
    } else {
      key = Trim(line.substr(0, eq_pos));
      value = Trim(line.substr(eq_pos + 1));
      if (!value.empty() && value.front() == '=') {
        value = Trim(value.substr(1));
      }
      if (value.empty()) {
        value = "1";
      }
    }
    try {
      ApplyConfigOption(key, value, opts);
    } catch (const std::exception& ex) {
      throw std::runtime_error(path.string() + ":" + std::to_string(lineno) + ": " + ex.what());
    }
  }
}

void ApplyEnvironmentOverrides(Options* opts) {
  for (const auto key : kKnownKeys) {
    std::string env_name(kEnvPrefix);
    for (char c : key) {
      env_name.push_back(c == '-' ? '_'
                                  : static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    if (auto value = GetEnvValue(env_name)) {
      try {
        if (key == "rpc-allow-ip") {
          // Comma separated list replaces anything from the config file.
          opts->rpc_allow.clear();
          std::size_t start = 0;
          while (start <= value->size()) {
            const auto comma = value->find(',', start);
            const auto item = Trim(value->substr(start, comma == std::string::npos
                                                            ? std::string::npos
                                                            : comma - start));
            if (!item.empty()) {
              opts->rpc_allow.push_back(item);
            }
            if (comma == std::string::npos) {
              break;
            }
            start = comma + 1;
          }
        } else {
          ApplyConfigOption(std::string(key), *value, opts);
        }
      } catch (const std::exception& ex) {
        throw std::runtime_error(env_name + ": " + ex.what());
      }
    }
  }
}

Options ParseOptions(const std::vector<std::string>& argv) {
  Options opts;
  std::vector<std::string> args;
  args.reserve(argv.size());
  for (const auto& token : argv) {
    auto eq_pos = token.find('=');
    if (eq_pos != std::string::npos && token.rfind("--", 0) == 0) {
      args.push_back(token.substr(0, eq_pos));
      args.push_back(token.substr(eq_pos + 1));
    } else {
      args.push_back(token);
    }
  }
  auto ensure_value = [&](std::size_t& idx) -> std::string {
    if (idx + 1 >= args.size()) {
      throw std::runtime_error("missing value for argument " + args[idx]);
    }
    return args[++idx];
  };

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];
    if (arg == "--help" || arg == "-h") {
      opts.show_help = true;
      return opts;
    }
    if (arg == "--conf") {
      opts.config_path = ensure_value(i);
    } else if (arg == "--no-conf") {
      opts.disable_config_file = true;
    }
  }

  if (!opts.disable_config_file) {
    std::filesystem::path config_path =
        opts.config_path.empty() ? std::filesystem::path(kDefaultConfigFile)
                                 : std::filesystem::path(opts.config_path);
    LoadConfigFile(config_path, &opts);
  }

  ApplyEnvironmentOverrides(&opts);

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string arg = args[i];
    if (arg == "--data-dir") {
      opts.data_dir = ensure_value(i);
    } else if (arg == "--rpc-bind") {
      opts.rpc_bind = ensure_value(i);
    } else if (arg == "--rpc-port") {
      opts.rpc_port = ParsePort(ensure_value(i));
    } else if (arg == "--rpc-user") {
      opts.rpc_user = ensure_value(i);
    } else if (arg == "--rpc-pass") {
      opts.rpc_pass = ensure_value(i);
    } else if (arg == "--rpc-pass-env") {
      opts.rpc_pass_env = ensure_value(i);
    } else if (arg == "--rpc-allow-ip") {
      opts.rpc_allow.push_back(ensure_value(i));
    } else if (arg == "--rpc-require-auth") {
      opts.rpc_require_auth = true;
    } else if (arg == "--no-rpc-require-auth") {
      opts.rpc_require_auth = false;
    } else if (arg == "--rpc-threads") {
      opts.rpc_threads = ParseSize(ensure_value(i));
    } else if (arg == "--rpc-max-body-bytes") {
      opts.rpc_max_body_bytes = ParseSize(ensure_value(i));
    } else if (arg == "--token-store") {
      ApplyConfigOption("token-store", ensure_value(i), &opts);
    } else if (arg == "--token-store-path") {
      opts.token_store_path = ensure_value(i);
    } else if (arg == "--api-host") {
      opts.api_host = ensure_value(i);
    } else if (arg == "--api-port") {
      opts.api_port = ParsePort(ensure_value(i));
    } else if (arg == "--api-path-prefix") {
      opts.api_path_prefix = ensure_value(i);
    } else if (arg == "--api-timeout-ms") {
      opts.api_timeout_ms = static_cast<int>(ParseSize(ensure_value(i)));
    } else if (arg == "--strict-field-decoding") {
      opts.strict_field_decoding = true;
    } else if (arg == "--log-level") {
      opts.log_level = ensure_value(i);
    } else if (arg == "--log-max-size-mb") {
      opts.log_max_size_mb = ParseSize(ensure_value(i));
    } else if (arg == "--log-max-files") {
      opts.log_max_files = ParseSize(ensure_value(i));
    } else if (arg == "--debug-log") {
      opts.debug_log_path = ensure_value(i);
    } else if (arg == "--conf") {
      // already handled
      ++i;
    } else if (arg == "--no-conf") {
      continue;
    } else {
      throw std::runtime_error("unknown option: " + arg);
    }
  }

  if (opts.data_dir.empty()) {
    std::filesystem::path base;
    if (const char* xdg_data = std::getenv("XDG_DATA_HOME")) {
      base = std::filesystem::path(xdg_data) / "listenoracle";
    } else if (const char* home = std::getenv("HOME")) {
      base = std::filesystem::path(home) / ".listenoracle";
    } else {
      base = std::filesystem::path("data");
    }
    opts.data_dir = base.string();
  }
  if (opts.token_store_path.empty()) {
    opts.token_store_path = (std::filesystem::path(opts.data_dir) / "tokens.json").string();
  }
  if (opts.rpc_pass.empty() && !opts.rpc_pass_env.empty()) {
    if (auto env = GetEnvValue(opts.rpc_pass_env)) {
      opts.rpc_pass = std::move(*env);
    }
  }
  return opts;
}

void PrintUsage() {
  std::cout << "listenoracled options:\n"
            << "  --data-dir <path>          Base data directory (default: ~/.listenoracle)\n"
            << "  --rpc-bind <addr>          RPC bind address (default: 127.0.0.1)\n"
            << "  --rpc-port <port>          RPC port (default: 5555)\n"
            << "  --rpc-user <name>          RPC basic auth user\n"
            << "  --rpc-pass <secret>        RPC basic auth password (prefer --rpc-pass-env)\n"
            << "  --rpc-pass-env <name>      Env var containing the RPC password\n"
            << "  --rpc-allow-ip <addr>      Allow specific client IP (repeatable). Default: loopback only\n"
            << "  --rpc-require-auth         Require HTTP basic auth for RPC (default: on)\n"
            << "  --no-rpc-require-auth      Accept unauthenticated RPC from allowed hosts\n"
            << "  --rpc-threads <n>          RPC worker threads (default: 4)\n"
            << "  --rpc-max-body-bytes <n>   Maximum request body size (default: 1048576)\n"
            << "  --token-store <kind>       file or memory (default: file)\n"
            << "  --token-store-path <path>  Token snapshot path (default: <data>/tokens.json)\n"
            << "  --api-host <host>          Listening-history API host or egress proxy\n"
            << "  --api-port <port>          Listening-history API port (default: 80)\n"
            << "  --api-path-prefix <path>   API path prefix (default: /v1)\n"
            << "  --api-timeout-ms <ms>      API socket timeout (default: 10000)\n"
            << "  --strict-field-decoding    Reject malformed field elements instead of zeroing them\n"
            << "  --debug-log <path>         Append logs to the given file\n"
            << "  --log-level <lvl>          Log level: debug, info, warn, error (default: info)\n"
            << "  --log-max-size-mb <mb>     Rotate the log after approximately <mb> megabytes (0=disable)\n"
            << "  --log-max-files <n>        Number of rotated log files to keep (default: 0)\n"
            << "  --conf <path>              Load options from the given file (default: ./listenoracle.conf)\n"
            << "  --no-conf                  Disable config file loading\n";
}

}  // namespace listenoracle::node
