#include <cstdlib>
#include <functional>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>

#include "nlohmann/json.hpp"
#include "node/rpc/rpc_error.hpp"
#include "oracle/claims.hpp"
#include "oracle/foreign_call.hpp"
#include "store/token_store.hpp"
#include "tests/unit/oracle/failing_token_store.hpp"
#include "tests/unit/oracle/fake_evaluator.hpp"

using nlohmann::json;
using listenoracle::oracle::ForeignCallResolver;
using listenoracle::oracle::TimeRange;
using listenoracle::rpc::RpcError;
using listenoracle::store::MemoryTokenStore;
using listenoracle::test::FailingTokenStore;
using listenoracle::test::FakeEvaluator;

namespace {

json Call(std::string_view function, json inputs) {
  return json::array({json{{"function", std::string(function)}, {"inputs", std::move(inputs)}}});
}

json Inputs(json key, json track, json a, json b) {
  return json::array({std::move(key), std::move(track), std::move(a), std::move(b)});
}

// Runs `fn` and returns the invalid-params message it threw, or "<none>".
std::string ErrorOf(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const RpcError& ex) {
    if (ex.code != listenoracle::rpc::kInvalidParams) {
      return "<wrong code " + std::to_string(ex.code) + ">";
    }
    return ex.what();
  }
  return "<none>";
}

bool Check(bool condition, const std::string& what) {
  if (!condition) {
    std::cerr << "foreign_call_tests: " << what << "\n";
  }
  return condition;
}

bool ExpectMessage(const std::function<void()>& fn, const std::string& expected,
                   const std::string& label) {
  const auto got = ErrorOf(fn);
  return Check(got == expected, label + ": got '" + got + "', expected '" + expected + "'");
}

bool TestTopTracksScenario() {
  MemoryTokenStore tokens;
  FakeEvaluator evaluator;
  ForeignCallResolver resolver(tokens, evaluator);
  std::string error;
  tokens.Put("A", "tok123", &error);

  const auto result = resolver.ResolveForeignCall(
      Call(listenoracle::oracle::kCanClaimTopTracks,
           Inputs({"0x41"}, {"0x42"}, {"0x00"}, {"0x05"})));
  bool ok = true;
  ok &= Check(result == json{{"values", json::array({true})}}, "result envelope");
  ok &= Check(evaluator.calls == 1, "evaluator called once");
  ok &= Check(evaluator.last.method == "top_tracks", "top tracks evaluator used");
  ok &= Check(evaluator.last.token == "tok123", "stored token forwarded");
  ok &= Check(evaluator.last.subject == "B", "track decoded");
  ok &= Check(evaluator.last.range == TimeRange::kShortTerm, "time range 0 -> short_term");
  ok &= Check(evaluator.last.limit == 5, "list range forwarded");
  return ok;
}

bool TestTopArtistsAndRecentlyPlayed() {
  MemoryTokenStore tokens;
  FakeEvaluator evaluator;
  evaluator.verdict = false;
  ForeignCallResolver resolver(tokens, evaluator);
  std::string error;
  tokens.Put("AB", "tok", &error);

  bool ok = true;
  auto result = resolver.ResolveForeignCall(
      Call(listenoracle::oracle::kCanClaimTopArtists,
           Inputs({"0x41", "0x42"}, {"0x5a"}, {"0x02", "0x01"}, {"0xc8"})));
  ok &= Check(result == json{{"values", json::array({false})}}, "top artists verdict");
  ok &= Check(evaluator.last.method == "top_artists", "top artists evaluator used");
  ok &= Check(evaluator.last.range == TimeRange::kLongTerm, "first range byte used");
  ok &= Check(evaluator.last.limit == 200, "list range passthrough beyond 50");

  evaluator.verdict = true;
  result = resolver.ResolveForeignCall(
      Call(listenoracle::oracle::kCanClaimRecentlyPlayedTrack,
           Inputs({"0x41", "0x42"}, {"0x74"}, {"0x18f3b7c2a00"}, {"0x0a"})));
  ok &= Check(result == json{{"values", json::array({true})}}, "recently played verdict");
  ok &= Check(evaluator.last.method == "recently_played", "recently played evaluator used");
  ok &= Check(evaluator.last.after == 0x18f3b7c2a00ULL, "after timestamp decoded as u64");
  ok &= Check(evaluator.last.limit == 10, "recently played limit");

  // No time-range validation on the "after" slot.
  result = resolver.ResolveForeignCall(
      Call(listenoracle::oracle::kCanClaimRecentlyPlayedTrack,
           Inputs({"0x41", "0x42"}, {"0x74"}, {"0x09"}, {"0x01"})));
  ok &= Check(evaluator.last.after == 9, "after value 9 accepted");
  return ok;
}

bool TestDispatchErrors() {
  MemoryTokenStore tokens;
  FakeEvaluator evaluator;
  ForeignCallResolver resolver(tokens, evaluator);
  const auto four = Inputs({"0x41"}, {"0x42"}, {"0x00"}, {"0x05"});
  bool ok = true;

  ok &= ExpectMessage([&] { resolver.ResolveForeignCall(json::object()); },
                      "Invalid params; expected a single-item array", "object params");
  ok &= ExpectMessage([&] { resolver.ResolveForeignCall(json::array()); },
                      "Invalid params; expected a single-item array", "empty params");
  ok &= ExpectMessage(
      [&] { resolver.ResolveForeignCall(json::array({json::object(), json::object()})); },
      "Invalid params; expected a single-item array", "two params");
  ok &= ExpectMessage([&] { resolver.ResolveForeignCall(json::array({"x"})); },
                      "Invalid params; expected an object", "non-object element");
  ok &= ExpectMessage(
      [&] { resolver.ResolveForeignCall(json::array({json{{"inputs", four}}})); },
      "Missing 'function' field", "missing function");
  ok &= ExpectMessage([&] { resolver.ResolveForeignCall(Call("can_claim_everything", four)); },
                      "Invalid method", "unknown function");
  ok &= ExpectMessage(
      [&] {
        resolver.ResolveForeignCall(json::array({json{{"function", 7}, {"inputs", four}}}));
      },
      "Invalid method", "non-string function");

  // Wrong arity fails for every function value.
  const auto three = json::array({json::array({"0x41"}), json::array({"0x42"}),
                                  json::array({"0x00"})});
  for (const auto function : {listenoracle::oracle::kCanClaimTopTracks,
                              listenoracle::oracle::kCanClaimTopArtists,
                              listenoracle::oracle::kCanClaimRecentlyPlayedTrack}) {
    ok &= ExpectMessage([&] { resolver.ResolveForeignCall(Call(function, three)); },
                        "Invalid input; requires 4 distinct inputs", "three inputs");
  }
  ok &= Check(evaluator.calls == 0, "no evaluator call on dispatch errors");
  return ok;
}

bool TestHandlerErrors() {
  MemoryTokenStore tokens;
  FakeEvaluator evaluator;
  ForeignCallResolver resolver(tokens, evaluator);
  std::string error;
  tokens.Put("A", "tok123", &error);
  bool ok = true;

  ok &= ExpectMessage(
      [&] {
        resolver.ResolveForeignCall(Call(listenoracle::oracle::kCanClaimTopTracks,
                                         Inputs({"0x41"}, {"0x42"}, json::array(), {"0x05"})));
      },
      "Time range or list range is empty", "empty time range");
  ok &= ExpectMessage(
      [&] {
        resolver.ResolveForeignCall(
            Call(listenoracle::oracle::kCanClaimRecentlyPlayedTrack,
                 Inputs({"0x41"}, {"0x42"}, {"0x01"}, json::array())));
      },
      "Time range or list range is empty", "empty list range");
  ok &= ExpectMessage(
      [&] {
        resolver.ResolveForeignCall(Call(listenoracle::oracle::kCanClaimTopTracks,
                                         Inputs({"0x41"}, {"0x42"}, {"0x03"}, {"0x05"})));
      },
      "Invalid time range: 3", "unknown time range");
  ok &= ExpectMessage(
      [&] {
        resolver.ResolveForeignCall(Call(listenoracle::oracle::kCanClaimTopArtists,
                                         Inputs({"0x5a"}, {"0x42"}, {"0x07"}, {"0x05"})));
      },
      "Invalid time range: 7", "time range checked before token lookup");
  ok &= Check(evaluator.calls == 0, "no evaluator call before time range validation");

  ok &= ExpectMessage(
      [&] {
        resolver.ResolveForeignCall(Call(listenoracle::oracle::kCanClaimTopTracks,
                                         Inputs({"0x5a"}, {"0x42"}, {"0x00"}, {"0x05"})));
      },
      "Token not found", "unknown key");

  evaluator.fail_with = "API request failed with status 401";
  ok &= ExpectMessage(
      [&] {
        resolver.ResolveForeignCall(Call(listenoracle::oracle::kCanClaimTopTracks,
                                         Inputs({"0x41"}, {"0x42"}, {"0x00"}, {"0x05"})));
      },
      "API request failed with status 401", "evaluator failure surfaced");

  // Lenient decoding: a malformed time-range element decodes to 0.
  evaluator.fail_with.clear();
  const auto result = resolver.ResolveForeignCall(
      Call(listenoracle::oracle::kCanClaimTopTracks,
           Inputs({"0x41"}, {"0x42"}, {"0xZZ"}, {"0x05"})));
  ok &= Check(result["values"][0] == true, "malformed range element tolerated");
  ok &= Check(evaluator.last.range == TimeRange::kShortTerm, "malformed range decoded as 0");
  return ok;
}

bool TestStrictDecoding() {
  MemoryTokenStore tokens;
  FakeEvaluator evaluator;
  ForeignCallResolver::Options options;
  options.strict_decoding = true;
  ForeignCallResolver resolver(tokens, evaluator, options);
  std::string error;
  tokens.Put("A", "tok123", &error);
  bool ok = true;
  ok &= ExpectMessage(
      [&] {
        resolver.ResolveForeignCall(Call(listenoracle::oracle::kCanClaimTopTracks,
                                         Inputs({"0xZZ"}, {"0x42"}, {"0x00"}, {"0x05"})));
      },
      "Malformed field element in First input", "strict key");
  ok &= ExpectMessage(
      [&] {
        resolver.ResolveForeignCall(Call(listenoracle::oracle::kCanClaimTopTracks,
                                         Inputs({"0x41"}, {"0x42"}, {"0x100"}, {"0x05"})));
      },
      "Malformed field element in Third input", "strict byte overflow");
  ok &= ExpectMessage(
      [&] {
        resolver.ResolveForeignCall(
            Call(listenoracle::oracle::kCanClaimRecentlyPlayedTrack,
                 Inputs({"0x41"}, {"0x42"}, {"0x100"}, {"0xq"})));
      },
      "Malformed field element in Fourth input", "strict list range");
  ok &= Check(evaluator.calls == 0, "strict failures stop before evaluation");
  const auto result = resolver.ResolveForeignCall(
      Call(listenoracle::oracle::kCanClaimRecentlyPlayedTrack,
           Inputs({"0x41"}, {"0x42"}, {"0x100"}, {"0x01"})));
  ok &= Check(result["values"][0] == true, "strict accepts well-formed u64 after");
  return ok;
}

bool TestTokenAdmin() {
  MemoryTokenStore tokens;
  FakeEvaluator evaluator;
  ForeignCallResolver resolver(tokens, evaluator);
  bool ok = true;

  ok &= Check(resolver.StoreKey(json::array({"A", "tok123"})) == "A", "store_key echoes id");
  std::string token;
  std::string error;
  ok &= Check(tokens.Get("A", &token, &error) && token == "tok123", "store_key persisted");

  // Store then claim with the same identifier uses the stored token.
  resolver.ResolveForeignCall(Call(listenoracle::oracle::kCanClaimTopTracks,
                                   Inputs({"0x41"}, {"0x42"}, {"0x01"}, {"0x05"})));
  ok &= Check(evaluator.last.token == "tok123", "round trip through the store");

  ok &= ExpectMessage([&] { resolver.StoreKey(json::array({"", "tok"})); },
                      "ID or token cannot be empty", "empty id");
  ok &= ExpectMessage([&] { resolver.StoreKey(json::array({"A", ""})); },
                      "ID or token cannot be empty", "empty token");
  ok &= ExpectMessage([&] { resolver.StoreKey(json::array({"A"})); },
                      "Invalid params: expected [identifier, token]", "one element");
  ok &= ExpectMessage([&] { resolver.StoreKey(json::array({"A", 5})); },
                      "Invalid params: expected [identifier, token]", "non-string token");

  ok &= ExpectMessage([&] { resolver.StoreKey(json::array({"A", "tok\r\nX-Injected: evil"})); },
                      "ID or token contains control characters", "CRLF in token");
  ok &= ExpectMessage([&] { resolver.StoreKey(json::array({std::string("A\0B", 3), "tok"})); },
                      "ID or token contains control characters", "NUL in id");
  ok &= ExpectMessage([&] { resolver.StoreKey(json::array({"A", "tok\x7f"})); },
                      "ID or token contains control characters", "DEL in token");
  ok &= Check(tokens.Get("A", &token, &error) && token == "tok123",
              "rejected store_key left the previous token alone");
  ok &= Check(resolver.StoreKey(json::array({"user \xC3\xA9", "tok-utf8"})) == "user \xC3\xA9",
              "non-ASCII identifiers are accepted");

  ok &= Check(resolver.DeleteKey(json("A")) == "A", "delete_key bare string");
  ok &= Check(!tokens.Get("A", &token, &error), "delete_key removed token");
  ok &= Check(resolver.DeleteKey(json::array({"never-stored"})) == "never-stored",
              "delete_key idempotent");
  ok &= ExpectMessage([&] { resolver.DeleteKey(json("")); }, "ID cannot be empty", "empty delete");
  ok &= ExpectMessage([&] { resolver.DeleteKey(json::array({1})); },
                      "Invalid params: expected identifier string", "non-string delete");
  ok &= ExpectMessage([&] { resolver.DeleteKey(json::array({"a", "b"})); },
                      "Invalid params: expected identifier string", "two element delete");
  return ok;
}

bool TestStoreFailures() {
  FailingTokenStore tokens;
  FakeEvaluator evaluator;
  ForeignCallResolver resolver(tokens, evaluator);
  bool ok = true;

  ok &= ExpectMessage([&] { resolver.StoreKey(json::array({"A", "tok"})); }, "disk full",
                      "store_key surfaces the store's write error");
  ok &= Check(tokens.puts == 1, "store_key reached the store");
  ok &= ExpectMessage([&] { resolver.DeleteKey(json("A")); }, "read-only store",
                      "delete_key surfaces the store's delete error");
  ok &= Check(tokens.deletes == 1, "delete_key reached the store");

  const auto claim = Call(listenoracle::oracle::kCanClaimTopTracks,
                          Inputs({"0x41"}, {"0x42"}, {"0x00"}, {"0x05"}));
  ok &= ExpectMessage([&] { resolver.ResolveForeignCall(claim); }, "Token not found",
                      "lookup failure without text");
  tokens.get_error = "store offline";
  ok &= ExpectMessage([&] { resolver.ResolveForeignCall(claim); }, "store offline",
                      "lookup failure keeps the store's text");
  ok &= Check(evaluator.calls == 0, "evaluator must not run without a token");
  return ok;
}

}  // namespace

int main() {
  try {
    if (!TestTopTracksScenario() || !TestTopArtistsAndRecentlyPlayed() ||
        !TestDispatchErrors() || !TestHandlerErrors() || !TestStrictDecoding() ||
        !TestTokenAdmin() || !TestStoreFailures()) {
      return EXIT_FAILURE;
    }
  } catch (const std::exception& ex) {
    std::cerr << "foreign_call_tests: unexpected exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
