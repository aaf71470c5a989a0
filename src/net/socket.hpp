#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace listenoracle::net {

class TcpSocket {
 public:
  TcpSocket();
  explicit TcpSocket(std::intptr_t handle);
  TcpSocket(const TcpSocket&) = delete;
  TcpSocket& operator=(const TcpSocket&) = delete;
  TcpSocket(TcpSocket&& other) noexcept;
  TcpSocket& operator=(TcpSocket&& other) noexcept;
  ~TcpSocket();

  bool Connect(const std::string& host, std::uint16_t port, int timeout_ms = 5000,
               bool quiet = false);
  // Port 0 binds an ephemeral port; LocalPort() reports the one chosen.
  bool BindAndListen(const std::string& address, std::uint16_t port, int backlog = 16);
  // Returns an invalid socket when nothing arrived within `timeout_ms`; a
  // negative timeout blocks until a client connects.
  TcpSocket AcceptWithTimeout(int timeout_ms) const;
  std::ptrdiff_t Send(const std::uint8_t* data, std::size_t length) const;
  // Loops over partial writes. False if the peer went away first.
  bool SendAll(std::string_view data) const;
  std::ptrdiff_t Recv(std::uint8_t* data, std::size_t length) const;
  bool SetTimeout(int milliseconds);
  std::string PeerAddress() const;
  std::uint16_t LocalPort() const;
  void Close();
  bool IsValid() const noexcept;

 private:
  std::intptr_t handle_{-1};
};

bool InitializeSockets();

}  // namespace listenoracle::net
