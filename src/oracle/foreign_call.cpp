#include "oracle/foreign_call.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "crypto/hash.hpp"
#include "node/rpc/rpc_error.hpp"
#include "oracle/claim_inputs.hpp"
#include "oracle/field_decoder.hpp"
#include "util/logging.hpp"

namespace listenoracle::oracle {

namespace {

void RequireWellFormed(const ClaimInputs& inputs, bool u64_range_a) {
  if (!AllCodePointsWellFormed(inputs.key)) {
    rpc::ThrowInvalidParams("Malformed field element in First input");
  }
  if (!AllCodePointsWellFormed(inputs.track)) {
    rpc::ThrowInvalidParams("Malformed field element in Second input");
  }
  const bool range_a_ok =
      u64_range_a ? AllU64sWellFormed(inputs.range_a) : AllBytesWellFormed(inputs.range_a);
  if (!range_a_ok) {
    rpc::ThrowInvalidParams("Malformed field element in Third input");
  }
  if (!AllBytesWellFormed(inputs.range_b)) {
    rpc::ThrowInvalidParams("Malformed field element in Fourth input");
  }
}

bool HasControlCharacter(const std::string& text) {
  for (unsigned char c : text) {
    if (c < 0x20 || c == 0x7F) {
      return true;
    }
  }
  return false;
}

// Short digest prefix so identifiers never appear in logs verbatim.
std::string LogId(const std::string& id) { return crypto::Sha3_256Hex(id).substr(0, 12); }

}  // namespace

ForeignCallResolver::ForeignCallResolver(store::TokenStore& tokens,
                                         evaluator::ClaimEvaluator& evaluator)
    : ForeignCallResolver(tokens, evaluator, Options{}) {}

ForeignCallResolver::ForeignCallResolver(store::TokenStore& tokens,
                                         evaluator::ClaimEvaluator& evaluator, Options options)
    : tokens_(tokens), evaluator_(evaluator), options_(options) {}

nlohmann::json ForeignCallResolver::ResolveForeignCall(const nlohmann::json& params) {
  if (!params.is_array() || params.size() != 1) {
    rpc::ThrowInvalidParams("Invalid params; expected a single-item array");
  }
  const auto& request = params[0];
  if (!request.is_object()) {
    rpc::ThrowInvalidParams("Invalid params; expected an object");
  }
  const auto function = request.find("function");
  if (function == request.end()) {
    rpc::ThrowInvalidParams("Missing 'function' field");
  }
  std::optional<ClaimKind> kind;
  if (function->is_string()) {
    kind = ClaimKindFromFunction(function->get_ref<const std::string&>());
  }
  if (!kind) {
    rpc::ThrowInvalidParams("Invalid method");
  }
  switch (*kind) {
    case ClaimKind::kTopTracks:
    case ClaimKind::kTopArtists:
      return HandleTopList(*kind, request);
    case ClaimKind::kRecentlyPlayedTrack:
      return HandleRecentlyPlayed(request);
  }
  rpc::ThrowInvalidParams("Invalid method");
}

nlohmann::json ForeignCallResolver::HandleTopList(ClaimKind kind, const nlohmann::json& request) {
  const ClaimInputs inputs = ExtractClaimInputs(request);
  if (options_.strict_decoding) {
    RequireWellFormed(inputs, /*u64_range_a=*/false);
  }
  const std::string key = DecodeString(inputs.key);
  const std::string subject = DecodeString(inputs.track);
  const std::vector<std::uint8_t> time_ranges = DecodeBytes(inputs.range_a);
  const std::vector<std::uint8_t> list_ranges = DecodeBytes(inputs.range_b);
  if (time_ranges.empty() || list_ranges.empty()) {
    rpc::ThrowInvalidParams("Time range or list range is empty");
  }

  std::string error;
  const auto range = TimeRangeFromByte(time_ranges.front(), &error);
  if (!range) {
    rpc::ThrowInvalidParams(error);
  }
  const std::uint8_t limit = list_ranges.front();
  const std::string token = LookupToken(key);

  bool verdict = false;
  const bool ok =
      kind == ClaimKind::kTopArtists
          ? evaluator_.CanClaimTopArtist(token, subject, *range, limit, &verdict, &error)
          : evaluator_.CanClaimTopTracks(token, subject, *range, limit, &verdict, &error);
  if (!ok) {
    util::LogDebug(std::string(ClaimKindFunction(kind)) + " for " + LogId(key) +
                   " failed: " + error);
    rpc::ThrowInvalidParams(error);
  }
  util::LogDebug(std::string(ClaimKindFunction(kind)) + " for " + LogId(key) + " -> " +
                 (verdict ? "true" : "false"));
  return nlohmann::json{{"values", nlohmann::json::array({verdict})}};
}

nlohmann::json ForeignCallResolver::HandleRecentlyPlayed(const nlohmann::json& request) {
  const ClaimInputs inputs = ExtractClaimInputs(request);
  if (options_.strict_decoding) {
    RequireWellFormed(inputs, /*u64_range_a=*/true);
  }
  const std::string key = DecodeString(inputs.key);
  const std::string track = DecodeString(inputs.track);
  const std::vector<std::uint64_t> after = DecodeU64s(inputs.range_a);
  const std::vector<std::uint8_t> list_ranges = DecodeBytes(inputs.range_b);
  if (after.empty() || list_ranges.empty()) {
    rpc::ThrowInvalidParams("Time range or list range is empty");
  }

  const std::string token = LookupToken(key);
  bool verdict = false;
  std::string error;
  if (!evaluator_.CanClaimRecentlyPlayedTrack(token, track, after.front(), list_ranges.front(),
                                              &verdict, &error)) {
    util::LogDebug(std::string(kCanClaimRecentlyPlayedTrack) + " for " + LogId(key) +
                   " failed: " + error);
    rpc::ThrowInvalidParams(error);
  }
  util::LogDebug(std::string(kCanClaimRecentlyPlayedTrack) + " for " + LogId(key) + " -> " +
                 (verdict ? "true" : "false"));
  return nlohmann::json{{"values", nlohmann::json::array({verdict})}};
}

std::string ForeignCallResolver::LookupToken(const std::string& key) {
  std::string token;
  std::string error;
  if (!tokens_.Get(key, &token, &error)) {
    rpc::ThrowInvalidParams(error.empty() ? std::string(store::kTokenNotFound) : error);
  }
  return token;
}

nlohmann::json ForeignCallResolver::StoreKey(const nlohmann::json& params) {
  if (!params.is_array() || params.size() != 2 || !params[0].is_string() ||
      !params[1].is_string()) {
    rpc::ThrowInvalidParams("Invalid params: expected [identifier, token]");
  }
  const auto& id = params[0].get_ref<const std::string&>();
  const auto& token = params[1].get_ref<const std::string&>();
  if (id.empty() || token.empty()) {
    rpc::ThrowInvalidParams("ID or token cannot be empty");
  }
  if (HasControlCharacter(id) || HasControlCharacter(token)) {
    rpc::ThrowInvalidParams("ID or token contains control characters");
  }
  std::string error;
  if (!tokens_.Put(id, token, &error)) {
    rpc::ThrowInvalidParams(error);
  }
  util::LogInfo("Stored token for " + LogId(id));
  return id;
}

nlohmann::json ForeignCallResolver::DeleteKey(const nlohmann::json& params) {
  const nlohmann::json* value = &params;
  if (params.is_array() && params.size() == 1) {
    value = &params[0];
  }
  if (!value->is_string()) {
    rpc::ThrowInvalidParams("Invalid params: expected identifier string");
  }
  const auto& id = value->get_ref<const std::string&>();
  if (id.empty()) {
    rpc::ThrowInvalidParams("ID cannot be empty");
  }
  std::string error;
  if (!tokens_.Delete(id, &error)) {
    rpc::ThrowInvalidParams(error);
  }
  util::LogInfo("Deleted token for " + LogId(id));
  return id;
}

}  // namespace listenoracle::oracle
