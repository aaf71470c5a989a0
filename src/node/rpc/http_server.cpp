#include "node/rpc/http_server.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <utility>

#include "crypto/hash.hpp"
#include "net/http.hpp"
#include "node/rpc/rpc_error.hpp"
#include "util/base64.hpp"
#include "util/logging.hpp"

namespace listenoracle::rpc {

namespace {

constexpr std::size_t kMaxHeaderSize = 64 * 1024;
constexpr std::size_t kDefaultMaxBodySize = 1024 * 1024;

bool IsJsonContentType(std::string_view value) {
  auto sep = value.find(';');
  if (sep != std::string_view::npos) {
    value = value.substr(0, sep);
  }
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
    value.remove_suffix(1);
  }
  constexpr std::string_view kJson = "application/json";
  if (value.size() != kJson.size()) {
    return false;
  }
  for (std::size_t i = 0; i < kJson.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(value[i])) != kJson[i]) {
      return false;
    }
  }
  return true;
}

// "user:password" from a Basic Authorization header, or nothing.
std::optional<std::string> BasicCredentials(const std::string& headers) {
  const auto value = net::FindHeaderValue(headers, "Authorization");
  if (!value) {
    return std::nullopt;
  }
  constexpr std::string_view kBasic = "Basic ";
  if (!value->starts_with(kBasic)) {
    return std::nullopt;
  }
  return util::Base64Decode(value->substr(kBasic.size()));
}

std::string ErrorBody(int code, const std::string& message) {
  nlohmann::json error = {
      {"jsonrpc", "2.0"},
      {"error", {{"code", code}, {"message", message}}},
      {"id", nullptr},
  };
  return error.dump();
}

const char* StatusText(int status) {
  switch (status) {
    case 200:
      return "OK";
    case 400:
      return "Bad Request";
    case 401:
      return "Unauthorized";
    case 403:
      return "Forbidden";
    case 405:
      return "Method Not Allowed";
    case 413:
      return "Payload Too Large";
    case 415:
      return "Unsupported Media Type";
    case 503:
      return "Service Unavailable";
    default:
      return "Error";
  }
}

}  // namespace

HttpServer::HttpServer(Options options, Handler handler)
    : options_(std::move(options)), handler_(std::move(handler)) {
  if (options_.max_body_bytes == 0) {
    options_.max_body_bytes = kDefaultMaxBodySize;
  }
  if (options_.worker_threads == 0) {
    options_.worker_threads = 1;
  }
  if (options_.max_pending_connections == 0) {
    options_.max_pending_connections = 1;
  }
}

HttpServer::~HttpServer() { Stop(); }

void HttpServer::Start() {
  bool expected = false;
  if (!running_.compare_exchange_strong(expected, true)) {
    return;
  }
  if (!listener_.BindAndListen(options_.bind_address, options_.port)) {
    running_.store(false);
    throw std::runtime_error("failed to bind RPC port " + options_.bind_address + ":" +
                             std::to_string(options_.port));
  }
  workers_.reserve(options_.worker_threads);
  for (std::size_t i = 0; i < options_.worker_threads; ++i) {
    workers_.emplace_back([this]() { WorkerLoop(); });
  }
  acceptor_ = std::thread([this]() { AcceptLoop(); });
  util::LogInfo("RPC server listening on " + options_.bind_address + ":" +
                std::to_string(Port()) + " with " + std::to_string(options_.worker_threads) +
                " worker(s)");
}

void HttpServer::Stop() {
  bool expected = true;
  if (!running_.compare_exchange_strong(expected, false)) {
    return;
  }
  listener_.Close();
  if (acceptor_.joinable()) {
    acceptor_.join();
  }
  {
    // Workers test running_ under this mutex before they block.
    std::lock_guard<std::mutex> lock(queue_mutex_);
  }
  queue_cv_.notify_all();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();
  std::lock_guard<std::mutex> lock(queue_mutex_);
  pending_.clear();
}

std::uint16_t HttpServer::Port() const { return listener_.LocalPort(); }

void HttpServer::AcceptLoop() {
  while (running_) {
    auto client = listener_.AcceptWithTimeout(200);
    if (!client.IsValid()) {
      continue;
    }
    if (options_.socket_timeout_ms > 0) {
      client.SetTimeout(options_.socket_timeout_ms);
    }
    std::unique_lock<std::mutex> lock(queue_mutex_);
    if (pending_.size() >= options_.max_pending_connections) {
      lock.unlock();
      util::LogWarn("RPC queue full; rejecting connection from " + client.PeerAddress());
      SendResponse(client, 503, ErrorBody(kInternalError, "server busy"));
      continue;
    }
    pending_.push_back(std::move(client));
    lock.unlock();
    queue_cv_.notify_one();
  }
}

void HttpServer::WorkerLoop() {
  while (true) {
    net::TcpSocket client;
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      queue_cv_.wait(lock, [this]() { return !running_ || !pending_.empty(); });
      if (pending_.empty()) {
        return;
      }
      client = std::move(pending_.front());
      pending_.pop_front();
    }
    HandleClient(std::move(client));
  }
}

void HttpServer::HandleClient(net::TcpSocket client) {
  std::string body;
  int status = 200;
  if (!ReadRequest(client, &body, &status)) {
    std::string error_json = ErrorBody(kParseError, "parse error");
    if (status == 401) {
      error_json = ErrorBody(kUnauthorized, "unauthorized");
    } else if (status == 403) {
      error_json = ErrorBody(kUnauthorized, "forbidden");
    } else if (status == 405) {
      error_json = ErrorBody(kInvalidRequest, "only POST is supported");
    } else if (status == 415) {
      error_json = ErrorBody(kInvalidRequest, "unsupported media type");
    } else if (status == 413) {
      error_json = ErrorBody(kRequestTooLarge, "request too large");
    }
    SendResponse(client, status, error_json);
    return;
  }
  nlohmann::json payload = nlohmann::json::parse(body, nullptr, false);
  if (payload.is_discarded()) {
    SendResponse(client, 400, ErrorBody(kParseError, "invalid JSON"));
    return;
  }
  try {
    auto response = handler_(payload);
    SendResponse(client, 200, response.dump());
  } catch (const std::exception& ex) {
    util::LogError(std::string("RPC handler failed: ") + ex.what());
    SendResponse(client, 200, ErrorBody(kInternalError, ex.what()));
  }
}

bool HttpServer::ReadRequest(net::TcpSocket& client, std::string* body, int* status) {
  std::string buffer;
  buffer.reserve(1024);
  std::array<std::uint8_t, 2048> chunk{};
  std::ptrdiff_t bytes = 0;
  std::size_t header_end = std::string::npos;
  const std::string peer = client.PeerAddress();
  if (!HostAllowed(peer)) {
    util::LogWarn("RPC connection from disallowed host " + peer);
    *status = 403;
    return false;
  }
  while (buffer.size() < kMaxHeaderSize) {
    bytes = client.Recv(chunk.data(), chunk.size());
    if (bytes <= 0) {
      *status = 400;
      return false;
    }
    buffer.append(reinterpret_cast<const char*>(chunk.data()), static_cast<std::size_t>(bytes));
    header_end = buffer.find("\r\n\r\n");
    if (header_end != std::string::npos) {
      break;
    }
  }
  if (header_end == std::string::npos) {
    *status = 413;
    return false;
  }
  const std::string headers = buffer.substr(0, header_end);
  const auto first_line_end = headers.find("\r\n");
  const std::string_view request_line =
      std::string_view(headers).substr(0, first_line_end == std::string::npos ? headers.size()
                                                                              : first_line_end);
  if (!request_line.starts_with("POST ")) {
    *status = 405;
    return false;
  }
  const auto content_type = net::FindHeaderValue(headers, "Content-Type");
  if (!content_type || !IsJsonContentType(*content_type)) {
    *status = 415;
    return false;
  }
  if (!Authorized(headers)) {
    util::LogWarn("RPC authentication failed from " + peer);
    *status = 401;
    return false;
  }
  long long content_length = net::ParseContentLength(headers);
  if (content_length < 0) {
    content_length = 0;
  }
  if (static_cast<unsigned long long>(content_length) > options_.max_body_bytes) {
    *status = 413;
    return false;
  }
  const auto expected = static_cast<std::size_t>(content_length);
  std::string payload = buffer.substr(header_end + 4);
  while (payload.size() < expected) {
    bytes = client.Recv(chunk.data(), chunk.size());
    if (bytes <= 0) {
      *status = 400;
      return false;
    }
    payload.append(reinterpret_cast<const char*>(chunk.data()), static_cast<std::size_t>(bytes));
    if (payload.size() > options_.max_body_bytes) {
      *status = 413;
      return false;
    }
  }
  if (expected > 0 && payload.size() > expected) {
    payload.resize(expected);
  }
  *body = std::move(payload);
  return true;
}

bool HttpServer::Authorized(const std::string& headers) const {
  if (!options_.require_auth) {
    return true;
  }
  if (options_.rpc_user.empty() || options_.rpc_password.empty()) {
    return false;
  }
  const auto presented = BasicCredentials(headers);
  if (!presented) {
    return false;
  }
  return crypto::DigestsEqual(crypto::Sha3_256(*presented),
                              crypto::Sha3_256(options_.rpc_user + ":" + options_.rpc_password));
}

bool HttpServer::HostAllowed(const std::string& peer) const {
  if (peer.empty()) {
    return false;
  }
  if (options_.allowed_hosts.empty()) {
    // default allow loopback
    return peer == "::1" || peer.rfind("127.", 0) == 0;
  }
  return std::find(options_.allowed_hosts.begin(), options_.allowed_hosts.end(), peer) !=
         options_.allowed_hosts.end();
}

void HttpServer::SendResponse(net::TcpSocket& client, int status, const std::string& json_body) {
  std::ostringstream oss;
  oss << "HTTP/1.1 " << status << ' ' << StatusText(status) << "\r\n";
  oss << "Content-Type: application/json\r\n";
  if (status == 401) {
    oss << "WWW-Authenticate: Basic realm=\"listenoracle\"\r\n";
  }
  oss << "Content-Length: " << json_body.size() << "\r\n";
  oss << "Connection: close\r\n\r\n";
  oss << json_body;
  if (!client.SendAll(oss.str())) {
    util::LogDebug("RPC client disconnected before response was sent");
  }
  client.Close();
}

}  // namespace listenoracle::rpc
