#pragma once

#include <cstdint>
#include <string>

namespace esrdecoder {

// Returns the name of the AArch64 system register accessed by MSR/MRS with the given encoding, or "unknown" if the
// encoding does not match any known register.
std::string SystemRegisterName(uint64_t op0, uint64_t op1, uint64_t crn, uint64_t crm, uint64_t op2);

} // namespace esrdecoder
