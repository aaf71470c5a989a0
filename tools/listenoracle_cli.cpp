#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#ifndef _WIN32
#include <termios.h>
#include <unistd.h>
#endif

#include "net/http.hpp"
#include "net/socket.hpp"
#include "nlohmann/json.hpp"
#include "node/options.hpp"
#include "node/rpc_cookie.hpp"
#include "util/base64.hpp"

namespace {

struct CliOptions {
  std::string rpc_host{"127.0.0.1"};
  std::uint16_t rpc_port{listenoracle::node::kDefaultRpcPort};
  std::string data_dir;
  std::string rpc_user;
  std::string rpc_pass;
  int timeout_ms{30000};
  bool raw{false};
  bool token_stdin{false};
  std::vector<std::string> args;
};

std::optional<std::string> GetEnvValue(std::string_view name) {
  std::string key(name);
  const char* value = std::getenv(key.c_str());
  if (!value || value[0] == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

std::string DefaultDataDir() {
  if (auto value = GetEnvValue("LISTENORACLE_DATA_DIR")) {
    return *value;
  }
  if (auto xdg = GetEnvValue("XDG_DATA_HOME")) {
    return (std::filesystem::path(*xdg) / "listenoracle").string();
  }
  if (auto home = GetEnvValue("HOME")) {
    return (std::filesystem::path(*home) / ".listenoracle").string();
  }
  return "data";
}

void PrintUsage() {
  std::cout << "Usage: listenoracle-cli [options] <command> [params]\n"
            << "Commands:\n"
            << "  store_key <identifier> [token]   Store a token (prompted when omitted)\n"
            << "  delete_key <identifier>          Remove the token for an identifier\n"
            << "  <method> [json-params]           Send any method with raw JSON params\n"
            << "Options:\n"
            << "  --rpc-host <host>   RPC host (default 127.0.0.1)\n"
            << "  --rpc-port <port>   RPC port (default 5555)\n"
            << "  --data-dir <path>   Read credentials from <path>/rpc.cookie\n"
            << "  --rpc-user <user>   RPC basic auth user\n"
            << "  --rpc-pass <pass>   RPC basic auth password\n"
            << "  --timeout-ms <ms>   Socket timeout (default 30000)\n"
            << "  --token-stdin       Read the store_key token from stdin\n"
            << "  --raw               Print the full JSON-RPC response\n";
}

std::string TrimTrailingNewlines(std::string input) {
  while (!input.empty() && (input.back() == '\n' || input.back() == '\r')) {
    input.pop_back();
  }
  return input;
}

std::string ReadLineFromStdin(std::string_view label) {
  std::string line;
  if (!std::getline(std::cin, line)) {
    throw std::runtime_error("failed to read " + std::string(label) + " from stdin");
  }
  return TrimTrailingNewlines(std::move(line));
}

std::string PromptHidden(std::string_view prompt) {
#ifndef _WIN32
  if (isatty(fileno(stdin)) == 0) {
    throw std::runtime_error("stdin is not interactive; use --token-stdin");
  }
#endif
  std::cerr << prompt;
  std::string line;
#ifndef _WIN32
  termios original{};
  bool have_termios = false;
  if (tcgetattr(STDIN_FILENO, &original) == 0) {
    have_termios = true;
    termios updated = original;
    updated.c_lflag &= static_cast<tcflag_t>(~ECHO);
    (void)tcsetattr(STDIN_FILENO, TCSAFLUSH, &updated);
  }
  std::getline(std::cin, line);
  if (have_termios) {
    (void)tcsetattr(STDIN_FILENO, TCSAFLUSH, &original);
    std::cerr << "\n";
  }
#else
  std::getline(std::cin, line);
#endif
  return TrimTrailingNewlines(std::move(line));
}

CliOptions ParseOptions(int argc, char** argv) {
  CliOptions opts;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--rpc-host") {
      if (++i >= argc) throw std::runtime_error("missing value for --rpc-host");
      opts.rpc_host = argv[i];
    } else if (arg == "--rpc-port") {
      if (++i >= argc) throw std::runtime_error("missing value for --rpc-port");
      const unsigned long parsed = std::stoul(argv[i]);
      if (parsed == 0 || parsed > 65535) {
        throw std::runtime_error("--rpc-port out of range");
      }
      opts.rpc_port = static_cast<std::uint16_t>(parsed);
    } else if (arg == "--data-dir") {
      if (++i >= argc) throw std::runtime_error("missing value for --data-dir");
      opts.data_dir = argv[i];
    } else if (arg == "--rpc-user") {
      if (++i >= argc) throw std::runtime_error("missing value for --rpc-user");
      opts.rpc_user = argv[i];
    } else if (arg == "--rpc-pass") {
      if (++i >= argc) throw std::runtime_error("missing value for --rpc-pass");
      opts.rpc_pass = argv[i];
    } else if (arg == "--timeout-ms") {
      if (++i >= argc) throw std::runtime_error("missing value for --timeout-ms");
      opts.timeout_ms = std::stoi(argv[i]);
    } else if (arg == "--token-stdin") {
      opts.token_stdin = true;
    } else if (arg == "--raw") {
      opts.raw = true;
    } else if (arg == "--help" || arg == "-h") {
      PrintUsage();
      std::exit(0);
    } else {
      opts.args.emplace_back(arg);
    }
  }
  if (opts.data_dir.empty()) {
    opts.data_dir = DefaultDataDir();
  }
  return opts;
}

std::optional<std::string> ResolveBasicAuth(const CliOptions& opts) {
  if (!opts.rpc_user.empty() || !opts.rpc_pass.empty()) {
    if (opts.rpc_user.empty() || opts.rpc_pass.empty()) {
      throw std::runtime_error("--rpc-user and --rpc-pass must be set together");
    }
    return listenoracle::util::Base64Encode(opts.rpc_user + ":" + opts.rpc_pass);
  }
  const auto cookie_path =
      std::filesystem::path(opts.data_dir) / listenoracle::node::kCookieFileName;
  std::error_code ec;
  if (!std::filesystem::exists(cookie_path, ec)) {
    return std::nullopt;
  }
  std::string user;
  std::string pass;
  std::string error;
  if (!listenoracle::node::ReadRpcCookie(cookie_path, &user, &pass, &error)) {
    throw std::runtime_error(error + " (run as the daemon's user or pass --rpc-user/--rpc-pass)");
  }
  return listenoracle::util::Base64Encode(user + ":" + pass);
}

nlohmann::json BuildRequest(const CliOptions& opts) {
  if (opts.args.empty()) {
    throw std::runtime_error("missing command");
  }
  const auto& method = opts.args.front();
  nlohmann::json params;
  if (method == "store_key") {
    if (opts.args.size() < 2 || opts.args.size() > 3) {
      throw std::runtime_error("store_key requires <identifier> [token]");
    }
    std::string token;
    if (opts.args.size() == 3) {
      std::cerr << "warning: passing the token on the command line exposes it via process "
                   "listings; prefer --token-stdin\n";
      token = opts.args[2];
    } else if (opts.token_stdin) {
      token = ReadLineFromStdin("token");
    } else {
      token = PromptHidden("Enter token: ");
    }
    params = nlohmann::json::array({opts.args[1], token});
  } else if (method == "delete_key") {
    if (opts.args.size() != 2) {
      throw std::runtime_error("delete_key requires <identifier>");
    }
    params = nlohmann::json::array({opts.args[1]});
  } else if (opts.args.size() == 1) {
    params = nlohmann::json::array();
  } else if (opts.args.size() == 2) {
    params = nlohmann::json::parse(opts.args[1]);
  } else {
    throw std::runtime_error(method + " takes a single JSON params argument");
  }
  return nlohmann::json{{"jsonrpc", "2.0"}, {"id", "cli-1"}, {"method", method}, {"params", params}};
}

nlohmann::json CallRpc(const CliOptions& opts, const nlohmann::json& request) {
  listenoracle::net::HttpClient::Options http_opts;
  http_opts.host = opts.rpc_host;
  http_opts.port = opts.rpc_port;
  http_opts.timeout_ms = opts.timeout_ms;
  listenoracle::net::HttpClient client(http_opts);

  listenoracle::net::HttpRequest http;
  http.method = "POST";
  http.target = "/";
  http.headers.emplace_back("Content-Type", "application/json");
  if (const auto auth = ResolveBasicAuth(opts)) {
    http.headers.emplace_back("Authorization", "Basic " + *auth);
  }
  http.body = request.dump();

  listenoracle::net::HttpResponse response;
  std::string error;
  if (!client.Send(http, &response, &error)) {
    throw std::runtime_error("RPC request failed: " + error);
  }
  if (response.status == 401) {
    throw std::runtime_error("RPC authentication failed");
  }
  return nlohmann::json::parse(response.body);
}

// Returns false when the response carries an error.
bool PrintResponse(const CliOptions& opts, const nlohmann::json& response) {
  if (opts.raw) {
    std::cout << response.dump(2) << "\n";
    return !response.contains("error");
  }
  if (response.contains("error") && !response["error"].is_null()) {
    const auto& error = response["error"];
    std::cerr << "error " << error.value("code", 0) << ": "
              << error.value("message", std::string{"unknown error"}) << "\n";
    return false;
  }
  const auto& result = response.at("result");
  if (result.is_string()) {
    std::cout << result.get<std::string>() << "\n";
  } else {
    std::cout << result.dump(2) << "\n";
  }
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  try {
    auto opts = ParseOptions(argc, argv);
    if (!listenoracle::net::InitializeSockets()) {
      throw std::runtime_error("socket initialization failed");
    }
    const auto request = BuildRequest(opts);
    const auto response = CallRpc(opts, request);
    if (!PrintResponse(opts, response)) {
      return 1;
    }
  } catch (const std::exception& ex) {
    std::cerr << "listenoracle-cli: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
