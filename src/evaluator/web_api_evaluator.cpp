#include "evaluator/web_api_evaluator.hpp"

#include <utility>

#include "util/logging.hpp"

namespace listenoracle::evaluator {

namespace {

std::string NormalizePrefix(std::string prefix) {
  while (!prefix.empty() && prefix.back() == '/') {
    prefix.pop_back();
  }
  if (!prefix.empty() && prefix.front() != '/') {
    prefix.insert(prefix.begin(), '/');
  }
  return prefix;
}

// items[].id for top lists, items[].track.id for play history.
bool ItemsContain(const nlohmann::json& doc, const std::string& id, bool nested_track) {
  if (!doc.is_object()) {
    return false;
  }
  const auto items = doc.find("items");
  if (items == doc.end() || !items->is_array()) {
    return false;
  }
  for (const auto& item : *items) {
    const nlohmann::json* subject = &item;
    if (nested_track) {
      if (!item.is_object() || !item.contains("track")) {
        continue;
      }
      subject = &item.at("track");
    }
    if (!subject->is_object()) {
      continue;
    }
    const auto found = subject->find("id");
    if (found != subject->end() && found->is_string() && found->get<std::string>() == id) {
      return true;
    }
  }
  return false;
}

}  // namespace

WebApiEvaluator::WebApiEvaluator(Options options)
    : client_(std::move(options.http)), path_prefix_(NormalizePrefix(std::move(options.path_prefix))) {}

bool WebApiEvaluator::CanClaimTopTracks(const std::string& token, const std::string& track,
                                        oracle::TimeRange range, std::uint8_t limit, bool* out,
                                        std::string* error) {
  const std::string target = path_prefix_ + "/me/top/tracks?time_range=" +
                             std::string(oracle::TimeRangeName(range)) +
                             "&limit=" + std::to_string(limit);
  nlohmann::json doc;
  if (!FetchJson(token, target, &doc, error)) {
    return false;
  }
  if (out) *out = ItemsContain(doc, track, false);
  return true;
}

bool WebApiEvaluator::CanClaimTopArtist(const std::string& token, const std::string& artist,
                                        oracle::TimeRange range, std::uint8_t limit, bool* out,
                                        std::string* error) {
  const std::string target = path_prefix_ + "/me/top/artists?time_range=" +
                             std::string(oracle::TimeRangeName(range)) +
                             "&limit=" + std::to_string(limit);
  nlohmann::json doc;
  if (!FetchJson(token, target, &doc, error)) {
    return false;
  }
  if (out) *out = ItemsContain(doc, artist, false);
  return true;
}

bool WebApiEvaluator::CanClaimRecentlyPlayedTrack(const std::string& token,
                                                  const std::string& track,
                                                  std::uint64_t after_ms, std::uint8_t limit,
                                                  bool* out, std::string* error) {
  const std::string target = path_prefix_ + "/me/player/recently-played?after=" +
                             std::to_string(after_ms) + "&limit=" + std::to_string(limit);
  nlohmann::json doc;
  if (!FetchJson(token, target, &doc, error)) {
    return false;
  }
  if (out) *out = ItemsContain(doc, track, true);
  return true;
}

bool WebApiEvaluator::FetchJson(const std::string& token, const std::string& target,
                                nlohmann::json* out, std::string* error) const {
  net::HttpRequest request;
  request.method = "GET";
  request.target = target;
  request.headers.emplace_back("Authorization", "Bearer " + token);
  request.headers.emplace_back("Accept", "application/json");

  net::HttpResponse response;
  std::string transport_error;
  if (!client_.Send(request, &response, &transport_error)) {
    util::LogWarn("Listening API request to " + target + " failed: " + transport_error);
    if (error) *error = "API request failed: " + transport_error;
    return false;
  }

  nlohmann::json doc = nlohmann::json::parse(response.body, nullptr, false);
  if (response.status < 200 || response.status >= 300) {
    std::string message = "API request failed with status " + std::to_string(response.status);
    if (!doc.is_discarded() && doc.is_object() && doc.contains("error") &&
        doc.at("error").is_object()) {
      const auto& api_error = doc.at("error");
      const auto msg = api_error.find("message");
      if (msg != api_error.end() && msg->is_string()) {
        message += ": " + msg->get<std::string>();
      }
    }
    util::LogDebug("Listening API " + target + " -> " + std::to_string(response.status));
    if (error) *error = message;
    return false;
  }
  if (doc.is_discarded()) {
    if (error) *error = "API returned malformed JSON";
    return false;
  }
  if (out) *out = std::move(doc);
  return true;
}

}  // namespace listenoracle::evaluator
