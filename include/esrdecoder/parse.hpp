#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace esrdecoder {

// Parses a decimal number, or a hexadecimal number if prefixed with "0x".
// Returns std::nullopt if the string is empty, contains invalid digits or does not fit in 64 bits.
std::optional<uint64_t> ParseNumber(std::string_view str);

} // namespace esrdecoder
