#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace listenoracle::util {

std::string Base64Encode(std::string_view input);

// Rejects non-base64 characters and data after padding; ASCII whitespace is
// skipped.
std::optional<std::string> Base64Decode(std::string_view input);

}  // namespace listenoracle::util
