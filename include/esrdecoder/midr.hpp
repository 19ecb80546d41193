#pragma once

#include "field_info.hpp"

#include <cstdint>
#include <vector>

namespace esrdecoder {

// Decodes the given Main ID Register value.
Result<std::vector<FieldInfo>> DecodeMIDR(uint64_t midr);

} // namespace esrdecoder
