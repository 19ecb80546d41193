#pragma once

#include "field_info.hpp"

#include <cstdint>
#include <vector>

namespace esrdecoder {

// Decodes the given Exception Syndrome Register value.
// The fields are returned from the most significant to the least significant: RES0, ISS2, EC, IL and ISS, with the
// ISS broken down into subfields according to the exception class.
Result<std::vector<FieldInfo>> Decode(uint64_t esr);

} // namespace esrdecoder
