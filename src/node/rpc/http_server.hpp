#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "nlohmann/json.hpp"

#include "net/socket.hpp"

namespace listenoracle::rpc {

// POST-only JSON-RPC transport. An accept thread hands connections to a
// fixed pool of workers through a bounded queue; each connection carries
// exactly one request.
class HttpServer {
 public:
  struct Options {
    std::string bind_address{"127.0.0.1"};
    std::uint16_t port{0};
    std::string rpc_user;
    std::string rpc_password;
    bool require_auth{true};
    std::vector<std::string> allowed_hosts;  // exact IP strings; empty -> allow loopback only.
    std::size_t max_body_bytes{1024 * 1024};
    int socket_timeout_ms{5000};
    std::size_t worker_threads{4};
    std::size_t max_pending_connections{64};
  };

  using Handler = std::function<nlohmann::json(const nlohmann::json&)>;

  HttpServer(Options options, Handler handler);
  ~HttpServer();

  // Binds the listen socket and spawns the accept and worker threads.
  // Throws std::runtime_error if the socket cannot be bound.
  void Start();

  // Closes the listener, drains the workers and joins every thread. Safe
  // to call more than once.
  void Stop();

  bool Running() const noexcept { return running_.load(); }

  // Port actually bound; useful when Options::port is 0.
  std::uint16_t Port() const;

 private:
  void AcceptLoop();
  void WorkerLoop();
  void HandleClient(net::TcpSocket client);
  bool ReadRequest(net::TcpSocket& client, std::string* body, int* status);
  bool Authorized(const std::string& headers) const;
  bool HostAllowed(const std::string& peer) const;
  void SendResponse(net::TcpSocket& client, int status, const std::string& json_body);

  Options options_;
  Handler handler_;
  std::atomic<bool> running_{false};
  net::TcpSocket listener_;
  std::thread acceptor_;
  std::vector<std::thread> workers_;

  std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  std::deque<net::TcpSocket> pending_;
};

}  // namespace listenoracle::rpc
