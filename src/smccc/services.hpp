#pragma once

#include "esrdecoder/field_info.hpp"

#include <cstdint>
#include <optional>

// Function number decoders for each owning entity of fast calls.
// `smc64` is the Call Convention bit of the function ID.
namespace esrdecoder::smccc {

FieldInfo DecodeArmService(uint64_t smccc, bool smc64);
FieldInfo DecodeSecureService(uint64_t smccc, bool smc64);
FieldInfo DecodeHypervisorService(uint64_t smccc, bool smc64);
FieldInfo DecodeTrustedAppService(uint64_t smccc, bool smc64);
FieldInfo DecodeCommonService(uint64_t smccc, bool smc64);

// Function numbers 0xFF00..0xFFFF are reserved in every service; other unnamed numbers are described with an empty
// string
const char *DescribeReservedFunction(uint64_t function);

// General service queries shared by the 32-bit calls of most services
const char *DescribeGeneral32Query(uint64_t function);

// Firmware Framework for Arm function names
std::optional<const char *> FFA32FunctionName(uint64_t function);
std::optional<const char *> FFA64FunctionName(uint64_t function);

} // namespace esrdecoder::smccc
