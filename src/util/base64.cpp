#include "util/base64.hpp"

#include <array>
#include <cctype>
#include <cstdint>

namespace listenoracle::util {

namespace {

constexpr std::string_view kAlphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
constexpr int kInvalid = -1;
constexpr int kPadding = -2;

constexpr std::array<int, 256> BuildDecodeTable() {
  std::array<int, 256> table{};
  table.fill(kInvalid);
  for (std::size_t i = 0; i < kAlphabet.size(); ++i) {
    table[static_cast<unsigned char>(kAlphabet[i])] = static_cast<int>(i);
  }
  table[static_cast<unsigned char>('=')] = kPadding;
  return table;
}

constexpr auto kDecodeTable = BuildDecodeTable();

}  // namespace

std::string Base64Encode(std::string_view input) {
  std::string encoded;
  encoded.reserve(((input.size() + 2) / 3) * 4);
  std::uint32_t val = 0;
  int valb = -6;
  for (unsigned char c : input) {
    val = (val << 8) | c;
    valb += 8;
    while (valb >= 0) {
      encoded.push_back(kAlphabet[(val >> valb) & 0x3f]);
      valb -= 6;
    }
  }
  if (valb > -6) {
    encoded.push_back(kAlphabet[((val << 8) >> (valb + 8)) & 0x3f]);
  }
  while (encoded.size() % 4) {
    encoded.push_back('=');
  }
  return encoded;
}

std::optional<std::string> Base64Decode(std::string_view input) {
  std::string decoded;
  decoded.reserve((input.size() * 3) / 4);
  std::uint32_t val = 0;
  int valb = -8;
  bool saw_padding = false;
  for (unsigned char c : input) {
    if (std::isspace(c)) {
      continue;
    }
    const int sextet = kDecodeTable[c];
    if (sextet == kInvalid) {
      return std::nullopt;
    }
    if (sextet == kPadding) {
      saw_padding = true;
      continue;
    }
    if (saw_padding) {
      return std::nullopt;
    }
    val = (val << 6) | static_cast<std::uint32_t>(sextet);
    valb += 6;
    if (valb >= 0) {
      decoded.push_back(static_cast<char>((val >> valb) & 0xff));
      valb -= 8;
    }
  }
  return decoded;
}

}  // namespace listenoracle::util
