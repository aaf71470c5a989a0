#include "crypto/hash.hpp"

#include <oqs/sha3.h>

#include "util/hex.hpp"

namespace listenoracle::crypto {

Sha3_256Hash Sha3_256(std::span<const std::uint8_t> data) {
  Sha3_256Hash out{};
  OQS_SHA3_sha3_256(out.data(), data.data(), data.size());
  return out;
}

Sha3_256Hash Sha3_256(std::string_view text) {
  return Sha3_256(std::span<const std::uint8_t>(
      reinterpret_cast<const std::uint8_t*>(text.data()), text.size()));
}

std::string Sha3_256Hex(std::string_view text) {
  const auto digest = Sha3_256(text);
  return util::HexEncode(std::span<const std::uint8_t>(digest.data(), digest.size()));
}

bool DigestsEqual(const Sha3_256Hash& a, const Sha3_256Hash& b) noexcept {
  std::uint8_t diff = 0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    diff |= static_cast<std::uint8_t>(a[i] ^ b[i]);
  }
  return diff == 0;
}

}  // namespace listenoracle::crypto
