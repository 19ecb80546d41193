#pragma once

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <limits>

namespace bit {

// Extracts bits [start, end) from the value, shifted down to bit 0
constexpr uint64_t extract(uint64_t value, size_t start, size_t end) {
    assert(start < end && "Empty bit range");
    assert(end <= 64 && "Bit range exceeds capacity");

    const size_t length = end - start;
    const uint64_t mask = (length == 64) ? std::numeric_limits<uint64_t>::max() : ((uint64_t{1} << length) - 1);
    return (value >> start) & mask;
}

} // namespace bit
