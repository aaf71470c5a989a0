#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace listenoracle::crypto {

using Sha3_256Hash = std::array<std::uint8_t, 32>;

Sha3_256Hash Sha3_256(std::span<const std::uint8_t> data);
Sha3_256Hash Sha3_256(std::string_view text);

// Lowercase hex of SHA3-256(text).
std::string Sha3_256Hex(std::string_view text);

// Compares two digests without an early exit on the first mismatch.
bool DigestsEqual(const Sha3_256Hash& a, const Sha3_256Hash& b) noexcept;

}  // namespace listenoracle::crypto
