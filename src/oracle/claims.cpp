#include "oracle/claims.hpp"

namespace listenoracle::oracle {

std::optional<ClaimKind> ClaimKindFromFunction(std::string_view function) {
  if (function == kCanClaimTopTracks) {
    return ClaimKind::kTopTracks;
  }
  if (function == kCanClaimTopArtists) {
    return ClaimKind::kTopArtists;
  }
  if (function == kCanClaimRecentlyPlayedTrack) {
    return ClaimKind::kRecentlyPlayedTrack;
  }
  return std::nullopt;
}

std::string_view ClaimKindFunction(ClaimKind kind) {
  switch (kind) {
    case ClaimKind::kTopTracks:
      return kCanClaimTopTracks;
    case ClaimKind::kTopArtists:
      return kCanClaimTopArtists;
    case ClaimKind::kRecentlyPlayedTrack:
      return kCanClaimRecentlyPlayedTrack;
  }
  return {};
}

std::optional<TimeRange> TimeRangeFromByte(std::uint8_t value, std::string* error) {
  switch (value) {
    case 0:
      return TimeRange::kShortTerm;
    case 1:
      return TimeRange::kMediumTerm;
    case 2:
      return TimeRange::kLongTerm;
    default:
      break;
  }
  if (error) {
    *error = "Invalid time range: " + std::to_string(value);
  }
  return std::nullopt;
}

std::string_view TimeRangeName(TimeRange range) {
  switch (range) {
    case TimeRange::kShortTerm:
      return "short_term";
    case TimeRange::kMediumTerm:
      return "medium_term";
    case TimeRange::kLongTerm:
      return "long_term";
  }
  return "medium_term";
}

}  // namespace listenoracle::oracle
