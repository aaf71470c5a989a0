#include "oracle/field_decoder.hpp"

#include <limits>
#include <string_view>

#include "util/hex.hpp"

namespace listenoracle::oracle {

namespace {

// Radix-16 parse of `digits` into a value no larger than `max`.
std::optional<std::uint64_t> ParseHexDigits(std::string_view digits, std::uint64_t max) {
  if (!digits.empty() && digits.front() == '+') {
    digits.remove_prefix(1);
  }
  if (digits.empty()) {
    return std::nullopt;
  }
  std::uint64_t value = 0;
  for (char c : digits) {
    const int digit = util::HexDigitValue(c);
    if (digit < 0) {
      return std::nullopt;
    }
    if (value > (max >> 4)) {
      return std::nullopt;
    }
    value = (value << 4) | static_cast<std::uint64_t>(digit);
    if (value > max) {
      return std::nullopt;
    }
  }
  return value;
}

// Byte and integer scalars are not checked for the "0x" prefix; the first
// two characters are skipped whatever they are.
std::optional<std::uint64_t> ParseUnprefixed(const nlohmann::json& scalar, std::uint64_t max) {
  if (!scalar.is_string()) {
    return std::nullopt;
  }
  const auto& text = scalar.get_ref<const std::string&>();
  if (text.size() < 2) {
    return std::nullopt;
  }
  return ParseHexDigits(std::string_view(text).substr(2), max);
}

bool IsScalarValue(std::uint64_t value) {
  return value <= 0x10FFFF && (value < 0xD800 || value > 0xDFFF);
}

}  // namespace

std::optional<std::uint8_t> ParseByte(const nlohmann::json& scalar) {
  const auto value = ParseUnprefixed(scalar, std::numeric_limits<std::uint8_t>::max());
  if (!value) {
    return std::nullopt;
  }
  return static_cast<std::uint8_t>(*value);
}

std::optional<std::uint64_t> ParseU64(const nlohmann::json& scalar) {
  return ParseUnprefixed(scalar, std::numeric_limits<std::uint64_t>::max());
}

std::optional<char32_t> ParseCodePoint(const nlohmann::json& scalar) {
  if (!scalar.is_string()) {
    return std::nullopt;
  }
  const std::string_view text = scalar.get_ref<const std::string&>();
  if (!text.starts_with("0x")) {
    return std::nullopt;
  }
  const auto value = ParseHexDigits(text.substr(2), std::numeric_limits<std::uint32_t>::max());
  if (!value || !IsScalarValue(*value)) {
    return std::nullopt;
  }
  return static_cast<char32_t>(*value);
}

std::uint8_t DecodeByte(const nlohmann::json& scalar) { return ParseByte(scalar).value_or(0); }

std::uint64_t DecodeU64(const nlohmann::json& scalar) { return ParseU64(scalar).value_or(0); }

char32_t DecodeCodePoint(const nlohmann::json& scalar) {
  return ParseCodePoint(scalar).value_or(U'\0');
}

void AppendUtf8(char32_t code_point, std::string* out) {
  const auto cp = static_cast<std::uint32_t>(code_point);
  if (cp < 0x80) {
    out->push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out->push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out->push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out->push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out->push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out->push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

std::string DecodeString(const nlohmann::json& scalars) {
  std::string out;
  if (!scalars.is_array()) {
    return out;
  }
  out.reserve(scalars.size());
  for (const auto& scalar : scalars) {
    AppendUtf8(DecodeCodePoint(scalar), &out);
  }
  return out;
}

std::optional<std::string> ParseString(const nlohmann::json& scalars) {
  if (!scalars.is_array()) {
    return std::nullopt;
  }
  std::string out;
  out.reserve(scalars.size());
  for (const auto& scalar : scalars) {
    const auto cp = ParseCodePoint(scalar);
    if (!cp) {
      return std::nullopt;
    }
    AppendUtf8(*cp, &out);
  }
  return out;
}

std::vector<std::uint8_t> DecodeBytes(const nlohmann::json& scalars) {
  std::vector<std::uint8_t> out;
  if (!scalars.is_array()) {
    return out;
  }
  out.reserve(scalars.size());
  for (const auto& scalar : scalars) {
    out.push_back(DecodeByte(scalar));
  }
  return out;
}

std::vector<std::uint64_t> DecodeU64s(const nlohmann::json& scalars) {
  std::vector<std::uint64_t> out;
  if (!scalars.is_array()) {
    return out;
  }
  out.reserve(scalars.size());
  for (const auto& scalar : scalars) {
    out.push_back(DecodeU64(scalar));
  }
  return out;
}

bool AllBytesWellFormed(const nlohmann::json& scalars) {
  if (!scalars.is_array()) {
    return false;
  }
  for (const auto& scalar : scalars) {
    if (!ParseByte(scalar)) {
      return false;
    }
  }
  return true;
}

bool AllU64sWellFormed(const nlohmann::json& scalars) {
  if (!scalars.is_array()) {
    return false;
  }
  for (const auto& scalar : scalars) {
    if (!ParseU64(scalar)) {
      return false;
    }
  }
  return true;
}

bool AllCodePointsWellFormed(const nlohmann::json& scalars) {
  return ParseString(scalars).has_value();
}

}  // namespace listenoracle::oracle
