#pragma once

#include <array>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "net/socket.hpp"

namespace listenoracle::test {

// Single-threaded HTTP responder on an ephemeral loopback port. Each
// accepted connection consumes the next canned response; the raw request
// head is recorded for inspection.
class FakeUpstream {
 public:
  FakeUpstream() = default;
  FakeUpstream(const FakeUpstream&) = delete;
  FakeUpstream& operator=(const FakeUpstream&) = delete;
  ~FakeUpstream() { Stop(); }

  bool Start() {
    if (!listener_.BindAndListen("127.0.0.1", 0)) {
      return false;
    }
    running_ = true;
    thread_ = std::thread([this]() { Loop(); });
    return true;
  }

  void Stop() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!running_) {
        return;
      }
      running_ = false;
    }
    listener_.Close();
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  std::uint16_t Port() const { return listener_.LocalPort(); }

  void Enqueue(std::string raw_response) {
    std::lock_guard<std::mutex> lock(mutex_);
    responses_.push_back(std::move(raw_response));
  }

  // Helper for the common "status + JSON body" reply.
  void EnqueueJson(int status, const std::string& body) {
    Enqueue("HTTP/1.1 " + std::to_string(status) + " X\r\nContent-Type: application/json\r\n" +
            "Content-Length: " + std::to_string(body.size()) + "\r\nConnection: close\r\n\r\n" +
            body);
  }

  std::vector<std::string> Requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
  }

 private:
  bool IsRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
  }

  void Loop() {
    while (IsRunning()) {
      auto client = listener_.AcceptWithTimeout(100);
      if (!client.IsValid()) {
        continue;
      }
      client.SetTimeout(2000);
      std::string head;
      std::array<std::uint8_t, 1024> chunk{};
      while (head.find("\r\n\r\n") == std::string::npos) {
        const auto bytes = client.Recv(chunk.data(), chunk.size());
        if (bytes <= 0) {
          break;
        }
        head.append(reinterpret_cast<const char*>(chunk.data()), static_cast<std::size_t>(bytes));
      }
      std::string reply;
      {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(head);
        if (!responses_.empty()) {
          reply = std::move(responses_.front());
          responses_.pop_front();
        } else {
          reply = "HTTP/1.1 500 X\r\nContent-Length: 0\r\nConnection: close\r\n\r\n";
        }
      }
      client.SendAll(reply);
      client.Close();
    }
  }

  net::TcpSocket listener_;
  std::thread thread_;
  mutable std::mutex mutex_;
  bool running_{false};
  std::deque<std::string> responses_;
  std::vector<std::string> requests_;
};

}  // namespace listenoracle::test
