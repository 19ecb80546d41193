#pragma once

#include "field_info.hpp"

#include <cstdint>
#include <vector>

namespace esrdecoder {

// Decodes the function ID of an SMC Calling Convention (ARM DEN 0028E v1.4) call.
// Only the lower 32 bits of the value are interpreted.
Result<std::vector<FieldInfo>> DecodeSMCCC(uint64_t smccc);

} // namespace esrdecoder
