#include "oracle/claim_inputs.hpp"

#include <array>
#include <string>

#include "node/rpc/rpc_error.hpp"

namespace listenoracle::oracle {

namespace {

constexpr std::array<const char*, 4> kSlotNames = {"First", "Second", "Third", "Fourth"};

}  // namespace

ClaimInputs ExtractClaimInputs(const nlohmann::json& params) {
  if (!params.is_object()) {
    rpc::ThrowInvalidParams("Missing or invalid 'inputs'");
  }
  const auto it = params.find("inputs");
  if (it == params.end() || !it->is_array()) {
    rpc::ThrowInvalidParams("Missing or invalid 'inputs'");
  }
  const auto& inputs = *it;
  if (inputs.size() != kSlotNames.size()) {
    rpc::ThrowInvalidParams("Invalid input; requires 4 distinct inputs");
  }
  for (std::size_t slot = 0; slot < kSlotNames.size(); ++slot) {
    if (!inputs[slot].is_array()) {
      rpc::ThrowInvalidParams(std::string(kSlotNames[slot]) + " input must be an array");
    }
  }
  return ClaimInputs{inputs[0], inputs[1], inputs[2], inputs[3]};
}

}  // namespace listenoracle::oracle
