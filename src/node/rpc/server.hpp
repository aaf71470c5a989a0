#pragma once

#include <string>

#include "nlohmann/json.hpp"
#include "oracle/foreign_call.hpp"

namespace listenoracle::rpc {

// JSON-RPC 2.0 envelope around the oracle methods. Handle() never throws;
// failures become the response's "error" member.
class RpcServer {
 public:
  explicit RpcServer(oracle::ForeignCallResolver& resolver);

  // Accepts a single request object or a batch array.
  nlohmann::json Handle(const nlohmann::json& request);

 private:
  nlohmann::json HandleSingle(const nlohmann::json& request);

  oracle::ForeignCallResolver& resolver_;
};

}  // namespace listenoracle::rpc
