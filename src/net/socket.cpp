#include "net/socket.hpp"

#include <cerrno>
#include <iostream>
#include <stdexcept>

#ifdef _WIN32
#include <WS2tcpip.h>
#include <winsock2.h>
#ifdef _MSC_VER
#pragma comment(lib, "Ws2_32.lib")
#endif
using socket_handle = SOCKET;
constexpr socket_handle kInvalidSocket = INVALID_SOCKET;
#else
#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>
using socket_handle = int;
constexpr socket_handle kInvalidSocket = -1;
#endif

namespace listenoracle::net {

namespace {

class WinsockInitializer {
 public:
  WinsockInitializer() {
#ifdef _WIN32
    WSADATA wsa_data{};
    if (WSAStartup(MAKEWORD(2, 2), &wsa_data) != 0) {
      throw std::runtime_error("WSAStartup failed");
    }
#endif
  }

  ~WinsockInitializer() {
#ifdef _WIN32
    WSACleanup();
#endif
  }
};

WinsockInitializer& GetInitializer() {
  static WinsockInitializer init{};
  return init;
}

void CloseHandle(socket_handle handle) {
  if (handle == kInvalidSocket) {
    return;
  }
#ifdef _WIN32
  closesocket(handle);
#else
  close(handle);
#endif
}

void SetNonBlocking(socket_handle handle, bool enabled) {
#ifdef _WIN32
  u_long mode = enabled ? 1 : 0;
  (void)::ioctlsocket(handle, FIONBIO, &mode);
#else
  const int flags = fcntl(handle, F_GETFL, 0);
  if (flags < 0) {
    return;
  }
  (void)fcntl(handle, F_SETFL, enabled ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK));
#endif
}

int LastSocketError() {
#ifdef _WIN32
  return WSAGetLastError();
#else
  return errno;
#endif
}

bool ConnectInProgress(int err) {
#ifdef _WIN32
  return err == WSAEWOULDBLOCK || err == WSAEINPROGRESS;
#else
  return err == EINPROGRESS;
#endif
}

// Non-blocking connect bounded by select(); the socket is restored to
// blocking mode before returning.
bool ConnectWithTimeout(socket_handle fd, const sockaddr* addr, socklen_t addr_len,
                        int timeout_ms) {
  SetNonBlocking(fd, true);
  if (::connect(fd, addr, addr_len) == 0) {
    SetNonBlocking(fd, false);
    return true;
  }
  if (!ConnectInProgress(LastSocketError())) {
    SetNonBlocking(fd, false);
    return false;
  }
  fd_set write_fds;
  FD_ZERO(&write_fds);
  FD_SET(fd, &write_fds);
  timeval tv{timeout_ms / 1000, (timeout_ms % 1000) * 1000};
  const int ready = ::select(static_cast<int>(fd + 1), nullptr, &write_fds, nullptr, &tv);
  int so_error = 0;
  socklen_t so_error_len = sizeof(so_error);
  const int so_rc = ::getsockopt(fd, SOL_SOCKET, SO_ERROR,
                                 reinterpret_cast<char*>(&so_error), &so_error_len);
  SetNonBlocking(fd, false);
  return ready > 0 && so_rc == 0 && so_error == 0;
}

}  // namespace

bool InitializeSockets() {
  try {
    GetInitializer();
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

TcpSocket::TcpSocket() {
  InitializeSockets();
  handle_ = static_cast<std::intptr_t>(kInvalidSocket);
}

TcpSocket::TcpSocket(std::intptr_t handle) : handle_(handle) { InitializeSockets(); }

TcpSocket::TcpSocket(TcpSocket&& other) noexcept : handle_(other.handle_) {
  other.handle_ = static_cast<std::intptr_t>(kInvalidSocket);
}

TcpSocket& TcpSocket::operator=(TcpSocket&& other) noexcept {
  if (this != &other) {
    Close();
    handle_ = other.handle_;
    other.handle_ = static_cast<std::intptr_t>(kInvalidSocket);
  }
  return *this;
}

TcpSocket::~TcpSocket() { Close(); }

bool TcpSocket::Connect(const std::string& host, std::uint16_t port, int timeout_ms,
                        bool quiet) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_protocol = IPPROTO_TCP;

  addrinfo* result = nullptr;
  const std::string port_str = std::to_string(port);
  if (getaddrinfo(host.c_str(), port_str.c_str(), &hints, &result) != 0 || result == nullptr) {
    if (!quiet) {
      std::cerr << "[socket] resolve(" << host << ":" << port << ") failed\n";
    }
    if (result) {
      freeaddrinfo(result);
    }
    return false;
  }

  for (auto* entry = result; entry != nullptr; entry = entry->ai_next) {
    socket_handle sock = ::socket(entry->ai_family, SOCK_STREAM, IPPROTO_TCP);
    if (sock == kInvalidSocket) {
      continue;
    }
    if (ConnectWithTimeout(sock, entry->ai_addr, static_cast<socklen_t>(entry->ai_addrlen),
                           timeout_ms)) {
      Close();
      handle_ = static_cast<std::intptr_t>(sock);
      freeaddrinfo(result);
      return true;
    }
    CloseHandle(sock);
  }

  freeaddrinfo(result);
  if (!quiet) {
    std::cerr << "[socket] connect(" << host << ":" << port << ") failed\n";
  }
  return false;
}

bool TcpSocket::BindAndListen(const std::string& address, std::uint16_t port, int backlog) {
  addrinfo hints{};
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_protocol = IPPROTO_TCP;
  hints.ai_flags = AI_PASSIVE;

  const bool wants_v4_any = address.empty() || address == "0.0.0.0";
  const bool wants_v6_any = address == "::";
  if (wants_v4_any) {
    hints.ai_family = AF_INET;
  } else if (wants_v6_any) {
    hints.ai_family = AF_INET6;
  } else {
    hints.ai_family = AF_UNSPEC;
  }

  addrinfo* result = nullptr;
  const std::string port_str = std::to_string(port);
  const char* node = (wants_v4_any || wants_v6_any) ? nullptr : address.c_str();
  if (getaddrinfo(node, port_str.c_str(), &hints, &result) != 0 || result == nullptr) {
    if (result) {
      freeaddrinfo(result);
    }
    return false;
  }

  for (auto* entry = result; entry != nullptr; entry = entry->ai_next) {
    socket_handle sock = ::socket(entry->ai_family, SOCK_STREAM, IPPROTO_TCP);
    if (sock == kInvalidSocket) {
      continue;
    }
    int opt = 1;
    (void)setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, reinterpret_cast<const char*>(&opt),
                     sizeof(opt));
    if (::bind(sock, entry->ai_addr, static_cast<socklen_t>(entry->ai_addrlen)) != 0 ||
        ::listen(sock, backlog) != 0) {
      CloseHandle(sock);
      continue;
    }
    Close();
    handle_ = static_cast<std::intptr_t>(sock);
    freeaddrinfo(result);
    return true;
  }

  freeaddrinfo(result);
  return false;
}

TcpSocket TcpSocket::AcceptWithTimeout(int timeout_ms) const {
  if (!IsValid()) return TcpSocket(static_cast<std::intptr_t>(kInvalidSocket));
  const auto fd = static_cast<socket_handle>(handle_);
  fd_set read_fds;
  FD_ZERO(&read_fds);
  FD_SET(fd, &read_fds);
  timeval tv{timeout_ms / 1000, (timeout_ms % 1000) * 1000};
  // Negative timeouts wait indefinitely.
  const int ready = ::select(static_cast<int>(fd + 1), &read_fds, nullptr, nullptr,
                             timeout_ms < 0 ? nullptr : &tv);
  if (ready <= 0) {
    return TcpSocket(static_cast<std::intptr_t>(kInvalidSocket));
  }
  const socket_handle client = ::accept(fd, nullptr, nullptr);
  return TcpSocket(static_cast<std::intptr_t>(client));
}

std::ptrdiff_t TcpSocket::Send(const std::uint8_t* data, std::size_t length) const {
  if (!IsValid()) return -1;
#ifdef _WIN32
  return ::send(static_cast<socket_handle>(handle_), reinterpret_cast<const char*>(data),
                static_cast<int>(length), 0);
#else
  return ::send(static_cast<socket_handle>(handle_), data, length, MSG_NOSIGNAL);
#endif
}

bool TcpSocket::SendAll(std::string_view data) const {
  const auto* cursor = reinterpret_cast<const std::uint8_t*>(data.data());
  std::size_t remaining = data.size();
  while (remaining > 0) {
    const auto sent = Send(cursor, remaining);
    if (sent <= 0) {
      return false;
    }
    cursor += sent;
    remaining -= static_cast<std::size_t>(sent);
  }
  return true;
}

std::ptrdiff_t TcpSocket::Recv(std::uint8_t* data, std::size_t length) const {
  if (!IsValid()) return -1;
#ifdef _WIN32
  return ::recv(static_cast<socket_handle>(handle_), reinterpret_cast<char*>(data),
                static_cast<int>(length), 0);
#else
  return ::recv(static_cast<socket_handle>(handle_), data, length, 0);
#endif
}

bool TcpSocket::SetTimeout(int milliseconds) {
  if (!IsValid()) return false;
  const auto fd = static_cast<socket_handle>(handle_);
#ifdef _WIN32
  DWORD timeout = static_cast<DWORD>(milliseconds);
  return ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, reinterpret_cast<const char*>(&timeout),
                      sizeof(timeout)) == 0 &&
         ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, reinterpret_cast<const char*>(&timeout),
                      sizeof(timeout)) == 0;
#else
  timeval tv{milliseconds / 1000, (milliseconds % 1000) * 1000};
  return ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0 &&
         ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == 0;
#endif
}

std::string TcpSocket::PeerAddress() const {
  if (!IsValid()) return {};
  sockaddr_storage addr{};
  socklen_t len = static_cast<socklen_t>(sizeof(addr));
  if (::getpeername(static_cast<socket_handle>(handle_), reinterpret_cast<sockaddr*>(&addr),
                    &len) != 0) {
    return {};
  }
  char hostbuf[NI_MAXHOST]{};
  if (getnameinfo(reinterpret_cast<sockaddr*>(&addr), len, hostbuf, sizeof(hostbuf), nullptr, 0,
                  NI_NUMERICHOST) != 0) {
    return {};
  }
  std::string peer(hostbuf);
  // IPv4 clients of a dual-stack listener show up as ::ffff:a.b.c.d.
  constexpr std::string_view kMappedPrefix = "::ffff:";
  if (peer.starts_with(kMappedPrefix) && peer.find('.') != std::string::npos) {
    peer.erase(0, kMappedPrefix.size());
  }
  return peer;
}

std::uint16_t TcpSocket::LocalPort() const {
  if (!IsValid()) return 0;
  sockaddr_storage addr{};
  socklen_t len = static_cast<socklen_t>(sizeof(addr));
  if (::getsockname(static_cast<socket_handle>(handle_), reinterpret_cast<sockaddr*>(&addr),
                    &len) != 0) {
    return 0;
  }
  if (addr.ss_family == AF_INET) {
    return ntohs(reinterpret_cast<const sockaddr_in*>(&addr)->sin_port);
  }
  if (addr.ss_family == AF_INET6) {
    return ntohs(reinterpret_cast<const sockaddr_in6*>(&addr)->sin6_port);
  }
  return 0;
}

void TcpSocket::Close() {
  const auto invalid = static_cast<std::intptr_t>(kInvalidSocket);
  if (handle_ != invalid) {
    CloseHandle(static_cast<socket_handle>(handle_));
    handle_ = invalid;
  }
}

bool TcpSocket::IsValid() const noexcept {
  return handle_ != static_cast<std::intptr_t>(kInvalidSocket);
}

}  // namespace listenoracle::net
