#include "node/rpc/server.hpp"

#include <stdexcept>

#include "node/rpc/rpc_error.hpp"
#include "util/logging.hpp"

namespace listenoracle::rpc {

RpcServer::RpcServer(oracle::ForeignCallResolver& resolver) : resolver_(resolver) {}

nlohmann::json RpcServer::Handle(const nlohmann::json& request) {
  if (!request.is_array()) {
    return HandleSingle(request);
  }
  if (request.empty()) {
    return nlohmann::json{{"jsonrpc", "2.0"},
                          {"id", nullptr},
                          {"error", {{"code", kInvalidRequest}, {"message", "invalid request"}}}};
  }
  nlohmann::json responses = nlohmann::json::array();
  for (const auto& entry : request) {
    responses.push_back(HandleSingle(entry));
  }
  return responses;
}

nlohmann::json RpcServer::HandleSingle(const nlohmann::json& request) {
  nlohmann::json response;
  response["jsonrpc"] = "2.0";
  if (request.is_object() && request.contains("id")) {
    response["id"] = request["id"];
  } else {
    response["id"] = nullptr;
  }
  try {
    if (!request.is_object()) {
      ThrowRpcError(kInvalidRequest, "invalid request");
    }
    const auto method = request.at("method").get<std::string>();
    const nlohmann::json params =
        request.contains("params") ? request.at("params") : nlohmann::json::array();
    util::LogDebug("RPC " + method);

    if (method == "resolve_foreign_call") {
      response["result"] = resolver_.ResolveForeignCall(params);
    } else if (method == "store_key") {
      response["result"] = resolver_.StoreKey(params);
    } else if (method == "delete_key") {
      response["result"] = resolver_.DeleteKey(params);
    } else {
      response["error"] = {{"code", kMethodNotFound}, {"message", "unknown method"}};
    }
  } catch (const RpcError& ex) {
    response["error"] = {{"code", ex.code}, {"message", ex.what()}};
  } catch (const nlohmann::json::exception&) {
    response["error"] = {{"code", kInvalidRequest}, {"message", "invalid request"}};
  } catch (const std::exception& ex) {
    util::LogError(std::string("RPC internal error: ") + ex.what());
    response["error"] = {{"code", kInternalError}, {"message", ex.what()}};
  }
  return response;
}

}  // namespace listenoracle::rpc
