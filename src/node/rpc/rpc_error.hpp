#pragma once

#include <stdexcept>
#include <string>

namespace listenoracle::rpc {

// JSON-RPC 2.0 error codes used by this server.
inline constexpr int kParseError = -32700;
inline constexpr int kInvalidRequest = -32600;
inline constexpr int kMethodNotFound = -32601;
inline constexpr int kInvalidParams = -32602;
inline constexpr int kInternalError = -32603;
inline constexpr int kUnauthorized = -32651;
inline constexpr int kRequestTooLarge = -32000;

// Lightweight RPC exception that carries a structured error code in
// addition to the human-readable message.
struct RpcError : public std::runtime_error {
  int code;
  RpcError(int c, const std::string& msg) : std::runtime_error(msg), code(c) {}
};

[[noreturn]] inline void ThrowRpcError(int code, const std::string& msg) {
  throw RpcError(code, msg);
}

[[noreturn]] inline void ThrowInvalidParams(const std::string& msg) {
  throw RpcError(kInvalidParams, msg);
}

}  // namespace listenoracle::rpc
