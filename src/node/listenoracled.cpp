#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "config/build_info.hpp"
#include "evaluator/web_api_evaluator.hpp"
#include "net/socket.hpp"
#include "node/options.hpp"
#include "node/rpc/http_server.hpp"
#include "node/rpc/server.hpp"
#include "node/rpc_cookie.hpp"
#include "oracle/foreign_call.hpp"
#include "store/file_token_store.hpp"
#include "store/token_store.hpp"
#include "util/logging.hpp"

namespace {

using listenoracle::node::Options;
namespace util = listenoracle::util;

std::atomic<bool> g_shutdown_requested{false};

void HandleSignal(int) {
  // Keep signal handler minimal and async-signal-safe.
  g_shutdown_requested.store(true);
}

void InstallSignalHandlers() {
  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);
}

bool IsLoopbackAddress(const std::string& host) {
  return host == "localhost" || host == "::1" || host.rfind("127.", 0) == 0;
}

void ConfigureLogging(const Options& opts) {
  if (opts.debug_log_path.empty()) {
    return;
  }
  util::LogLevel level = util::LogLevel::kInfo;
  try {
    level = util::ParseLogLevel(opts.log_level);
  } catch (const std::exception& ex) {
    std::cerr << "[listenoracled] warn: " << ex.what() << " (falling back to info level)\n";
  }
  std::uintmax_t max_bytes = 0;
  if (opts.log_max_size_mb > 0) {
    max_bytes = static_cast<std::uintmax_t>(opts.log_max_size_mb) * 1024ULL * 1024ULL;
  }
  util::GlobalLogger().Configure(level, max_bytes, opts.log_max_files);
  util::GlobalLogger().Enable(opts.debug_log_path);
  util::LogInfo("Log enabled at " + opts.debug_log_path);
}

// Fills in the RPC credentials, generating a cookie when none are set.
bool PrepareRpcAuth(Options* opts) {
  if (!opts->rpc_require_auth) {
    std::cerr << "[listenoracled] warn: RPC authentication disabled\n";
    return true;
  }
  const bool has_user = !opts->rpc_user.empty();
  const bool has_pass = !opts->rpc_pass.empty();
  if (has_user != has_pass) {
    std::cerr << "[listenoracled] fatal: --rpc-user and --rpc-pass must be set together\n";
    return false;
  }
  const auto cookie_path =
      std::filesystem::path(opts->data_dir) / listenoracle::node::kCookieFileName;
  std::string warning;
  std::string error;
  if (!has_user) {
    if (!listenoracle::node::GenerateRpcCookie(cookie_path, &opts->rpc_user, &opts->rpc_pass,
                                               &warning, &error)) {
      std::cerr << "[listenoracled] fatal: " << error << "\n";
      return false;
    }
    std::cout << "[listenoracled] RPC auth cookie: " << cookie_path.string() << "\n";
    util::LogInfo("RPC auth cookie written to " + cookie_path.string());
  } else if (!listenoracle::node::WriteRpcCookie(cookie_path, opts->rpc_user, opts->rpc_pass,
                                                 &warning, &error)) {
    std::cerr << "[listenoracled] warn: " << error
              << " (local tooling may require --rpc-user/--rpc-pass)\n";
  }
  if (!warning.empty()) {
    std::cerr << "[listenoracled] warn: " << warning << "\n";
  }
  return true;
}

std::unique_ptr<listenoracle::store::TokenStore> OpenTokenStore(const Options& opts) {
  if (opts.token_store == "memory") {
    util::LogWarn("Using in-memory token store; tokens are lost on shutdown");
    return std::make_unique<listenoracle::store::MemoryTokenStore>();
  }
  auto store = std::make_unique<listenoracle::store::FileTokenStore>(opts.token_store_path);
  std::string error;
  if (!store->Load(&error)) {
    throw std::runtime_error(error);
  }
  return store;
}

}  // namespace

int main(int argc, char** argv) {
  try {
    Options opts = listenoracle::node::ParseOptions(std::vector<std::string>(argv + 1, argv + argc));
    if (opts.show_help) {
      listenoracle::node::PrintUsage();
      return 0;
    }
    ConfigureLogging(opts);
    InstallSignalHandlers();

    if (!IsLoopbackAddress(opts.rpc_bind) && opts.rpc_allow.empty()) {
      std::cerr << "[listenoracled] fatal: non-loopback RPC bind requires at least one "
                   "--rpc-allow-ip entry\n";
      return 1;
    }
    if (!listenoracle::net::InitializeSockets()) {
      std::cerr << "[listenoracled] fatal: socket initialization failed\n";
      return 1;
    }
    if (!PrepareRpcAuth(&opts)) {
      return 1;
    }

    util::LogInfo(std::string(listenoracle::config::kDaemonName) + " " +
                  listenoracle::config::kVersion + " starting: data_dir=" + opts.data_dir +
                  ", rpc=" + opts.rpc_bind + ":" + std::to_string(opts.rpc_port) +
                  ", token_store=" + opts.token_store + ", api=" + opts.api_host + ":" +
                  std::to_string(opts.api_port) + opts.api_path_prefix +
                  (opts.strict_field_decoding ? ", strict decoding" : ""));

    auto tokens = OpenTokenStore(opts);

    listenoracle::evaluator::WebApiEvaluator::Options api_opts;
    api_opts.http.host = opts.api_host;
    api_opts.http.port = opts.api_port;
    api_opts.http.timeout_ms = opts.api_timeout_ms;
    api_opts.path_prefix = opts.api_path_prefix;
    listenoracle::evaluator::WebApiEvaluator evaluator(std::move(api_opts));

    listenoracle::oracle::ForeignCallResolver::Options resolver_opts;
    resolver_opts.strict_decoding = opts.strict_field_decoding;
    listenoracle::oracle::ForeignCallResolver resolver(*tokens, evaluator, resolver_opts);
    listenoracle::rpc::RpcServer rpc(resolver);

    listenoracle::rpc::HttpServer::Options http_opts;
    http_opts.bind_address = opts.rpc_bind;
    http_opts.port = opts.rpc_port;
    http_opts.rpc_user = opts.rpc_user;
    http_opts.rpc_password = opts.rpc_pass;
    http_opts.require_auth = opts.rpc_require_auth;
    http_opts.allowed_hosts = opts.rpc_allow;
    http_opts.max_body_bytes = opts.rpc_max_body_bytes;
    http_opts.worker_threads = opts.rpc_threads;
    listenoracle::rpc::HttpServer http(
        std::move(http_opts),
        [&rpc](const nlohmann::json& request) { return rpc.Handle(request); });
    http.Start();
    std::cout << "[listenoracled] listening on " << opts.rpc_bind << ":" << http.Port() << "\n";

    while (!g_shutdown_requested.load()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    util::LogInfo("Shutdown requested");
    http.Stop();
    util::LogInfo("Shutdown complete");
  } catch (const std::exception& ex) {
    util::LogError(std::string("fatal exception: ") + ex.what());
    std::cerr << "[listenoracled] fatal: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
