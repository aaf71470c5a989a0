#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace listenoracle::oracle {

// `function` discriminators sent by the calling circuit. These literals are
// part of the oracle's external contract and must not change.
inline constexpr std::string_view kCanClaimTopTracks = "can_claim_top_tracks";
inline constexpr std::string_view kCanClaimTopArtists = "can_claim_top_artists";
inline constexpr std::string_view kCanClaimRecentlyPlayedTrack = "can_claim_recently_played_track";

enum class ClaimKind {
  kTopTracks,
  kTopArtists,
  kRecentlyPlayedTrack,
};

std::optional<ClaimKind> ClaimKindFromFunction(std::string_view function);
std::string_view ClaimKindFunction(ClaimKind kind);

// Historical window of a top-N query.
enum class TimeRange : std::uint8_t {
  kShortTerm = 0,
  kMediumTerm = 1,
  kLongTerm = 2,
};

// Closed mapping; every byte outside 0..2 is rejected with `error` set to
// "Invalid time range: <n>".
std::optional<TimeRange> TimeRangeFromByte(std::uint8_t value, std::string* error);

// Query parameter spelling: short_term, medium_term, long_term.
std::string_view TimeRangeName(TimeRange range);

}  // namespace listenoracle::oracle
