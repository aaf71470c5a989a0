#pragma once

#include <cstdint>
#include <span>
#include <string>

namespace listenoracle::util {

std::string HexEncode(std::span<const std::uint8_t> data);

// Value of a single hex digit, or -1 when `c` is not one.
int HexDigitValue(char c) noexcept;

}  // namespace listenoracle::util
