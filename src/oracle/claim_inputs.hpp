#pragma once

#include "nlohmann/json.hpp"

namespace listenoracle::oracle {

// The four positional input arrays of a foreign call. References point into
// the request document and are valid only while it is alive.
struct ClaimInputs {
  const nlohmann::json& key;
  const nlohmann::json& track;
  const nlohmann::json& range_a;
  const nlohmann::json& range_b;
};

// Validates `params.inputs` as exactly four arrays. Throws rpc::RpcError
// (invalid params) naming the failing slot otherwise.
ClaimInputs ExtractClaimInputs(const nlohmann::json& params);

}  // namespace listenoracle::oracle
