#pragma once

#include "evaluator/claim_evaluator.hpp"
#include "nlohmann/json.hpp"
#include "oracle/claims.hpp"
#include "store/token_store.hpp"

namespace listenoracle::oracle {

// Request validation and dispatch for the oracle's RPC methods. The
// resolver owns no state besides references to its collaborators, so one
// instance may serve concurrent calls as long as the store and evaluator
// tolerate it. All failures are thrown as rpc::RpcError with the invalid
// params code.
class ForeignCallResolver {
 public:
  struct Options {
    // Reject malformed wire scalars instead of decoding them to sentinels.
    bool strict_decoding{false};
  };

  ForeignCallResolver(store::TokenStore& tokens, evaluator::ClaimEvaluator& evaluator);
  ForeignCallResolver(store::TokenStore& tokens, evaluator::ClaimEvaluator& evaluator,
                      Options options);

  // params: [{"function": "<literal>", "inputs": [key, track, a, b]}]
  // result: {"values": [<bool>]}
  nlohmann::json ResolveForeignCall(const nlohmann::json& params);

  // params: [identifier, token]; result: identifier.
  nlohmann::json StoreKey(const nlohmann::json& params);

  // params: identifier or [identifier]; result: identifier.
  nlohmann::json DeleteKey(const nlohmann::json& params);

 private:
  // `kind` is kTopTracks or kTopArtists.
  nlohmann::json HandleTopList(ClaimKind kind, const nlohmann::json& request);
  nlohmann::json HandleRecentlyPlayed(const nlohmann::json& request);
  std::string LookupToken(const std::string& key);

  store::TokenStore& tokens_;
  evaluator::ClaimEvaluator& evaluator_;
  Options options_;
};

}  // namespace listenoracle::oracle
