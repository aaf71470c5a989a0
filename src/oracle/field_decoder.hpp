#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace listenoracle::oracle {

// Wire scalars are JSON strings of the form "0x<hex>", one field element of
// the calling proof system each. They carry no type tag; the consumer picks
// the target width.
//
// The Parse* functions report any malformed element as std::nullopt. The
// Decode* functions are lenient and map failures to a sentinel: 0 for
// integers, U+0000 for characters.
//
// Accepted digits: an optional '+', then one or more hex digits. Leading
// zeros are fine (field elements are commonly zero-padded to 64 digits) but
// the value must fit the target type.

std::optional<std::uint8_t> ParseByte(const nlohmann::json& scalar);
std::optional<std::uint64_t> ParseU64(const nlohmann::json& scalar);
// Requires the literal "0x" prefix and a Unicode scalar value (no
// surrogates, nothing above U+10FFFF).
std::optional<char32_t> ParseCodePoint(const nlohmann::json& scalar);

std::uint8_t DecodeByte(const nlohmann::json& scalar);
std::uint64_t DecodeU64(const nlohmann::json& scalar);
char32_t DecodeCodePoint(const nlohmann::json& scalar);

// One code point per array element, UTF-8 encoded. Non-array input decodes
// to the empty string.
std::string DecodeString(const nlohmann::json& scalars);
std::optional<std::string> ParseString(const nlohmann::json& scalars);

// Element-wise decoders for the trailing range arrays.
std::vector<std::uint8_t> DecodeBytes(const nlohmann::json& scalars);
std::vector<std::uint64_t> DecodeU64s(const nlohmann::json& scalars);

// True when `scalars` is an array whose every element passes the strict
// parser of that width.
bool AllBytesWellFormed(const nlohmann::json& scalars);
bool AllU64sWellFormed(const nlohmann::json& scalars);
bool AllCodePointsWellFormed(const nlohmann::json& scalars);

void AppendUtf8(char32_t code_point, std::string* out);

}  // namespace listenoracle::oracle
