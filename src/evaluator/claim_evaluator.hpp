#pragma once

#include <cstdint>
#include <string>

#include "oracle/claims.hpp"

namespace listenoracle::evaluator {

// Answers listening-history claims on behalf of a token holder. Each call
// reports its verdict through `out`; on failure it returns false and sets a
// displayable message in `error`. `limit` is forwarded to the upstream
// service without range checks.
class ClaimEvaluator {
 public:
  virtual ~ClaimEvaluator() = default;

  virtual bool CanClaimTopTracks(const std::string& token, const std::string& track,
                                 oracle::TimeRange range, std::uint8_t limit, bool* out,
                                 std::string* error) = 0;
  virtual bool CanClaimTopArtist(const std::string& token, const std::string& artist,
                                 oracle::TimeRange range, std::uint8_t limit, bool* out,
                                 std::string* error) = 0;
  // `after_ms` is a Unix timestamp in milliseconds.
  virtual bool CanClaimRecentlyPlayedTrack(const std::string& token, const std::string& track,
                                           std::uint64_t after_ms, std::uint8_t limit, bool* out,
                                           std::string* error) = 0;
};

}  // namespace listenoracle::evaluator
