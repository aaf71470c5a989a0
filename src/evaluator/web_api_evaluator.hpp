#pragma once

#include <string>

#include "evaluator/claim_evaluator.hpp"
#include "net/http.hpp"
#include "nlohmann/json.hpp"

namespace listenoracle::evaluator {

// Evaluates claims against a Spotify-compatible Web API:
//
//   top tracks       GET {prefix}/me/top/tracks?time_range=<tr>&limit=<n>
//   top artists      GET {prefix}/me/top/artists?time_range=<tr>&limit=<n>
//   recently played  GET {prefix}/me/player/recently-played?after=<ms>&limit=<n>
//
// The verdict is whether the requested id appears in the returned items.
// Requests are plain HTTP/1.1; TLS, if any, is handled by an egress proxy.
class WebApiEvaluator : public ClaimEvaluator {
 public:
  struct Options {
    net::HttpClient::Options http;
    std::string path_prefix{"/v1"};
  };

  explicit WebApiEvaluator(Options options);

  bool CanClaimTopTracks(const std::string& token, const std::string& track,
                         oracle::TimeRange range, std::uint8_t limit, bool* out,
                         std::string* error) override;
  bool CanClaimTopArtist(const std::string& token, const std::string& artist,
                         oracle::TimeRange range, std::uint8_t limit, bool* out,
                         std::string* error) override;
  bool CanClaimRecentlyPlayedTrack(const std::string& token, const std::string& track,
                                   std::uint64_t after_ms, std::uint8_t limit, bool* out,
                                   std::string* error) override;

 private:
  bool FetchJson(const std::string& token, const std::string& target, nlohmann::json* out,
                 std::string* error) const;

  net::HttpClient client_;
  std::string path_prefix_;
};

}  // namespace listenoracle::evaluator
