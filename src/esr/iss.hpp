#pragma once

#include "esrdecoder/field_info.hpp"

#include <optional>
#include <string>
#include <vector>

// ISS decoders for each exception class.
// Each takes the 25-bit ISS value and returns its fields from the most significant to the least significant.
namespace esrdecoder::esr {

using Fields = std::vector<FieldInfo>;

// Result of decoding an ISS whose overall meaning can be summarized, e.g. as a disassembled instruction.
struct DescribedFields {
    Fields fields;
    std::optional<std::string> description;
};

// Classes with an ISS that is entirely RES0
Result<Fields> DecodeISSRes0(uint64_t iss);

// abort.cpp
Result<Fields> DecodeISSDataAbort(uint64_t iss);
Result<Fields> DecodeISSInstructionAbort(uint64_t iss);

// breakpoint.cpp
Result<Fields> DecodeISSBreakpointVectorCatch(uint64_t iss);
Result<Fields> DecodeISSSoftwareStep(uint64_t iss);
Result<Fields> DecodeISSWatchpoint(uint64_t iss);
Result<Fields> DecodeISSBreakpoint(uint64_t iss);

// Trapped instructions
Result<Fields> DecodeISSBTI(uint64_t iss);
Result<Fields> DecodeISSFP(uint64_t iss);
Result<Fields> DecodeISSHVC(uint64_t iss);
Result<Fields> DecodeISSLD64B(uint64_t iss);
Result<Fields> DecodeISSLDC(uint64_t iss);
Result<Fields> DecodeISSMCR(uint64_t iss);
Result<Fields> DecodeISSMCRR(uint64_t iss);
Result<DescribedFields> DecodeISSMSR(uint64_t iss);
Result<Fields> DecodeISSPAuth(uint64_t iss);
Result<Fields> DecodeISSSVE(uint64_t iss);
Result<Fields> DecodeISSWF(uint64_t iss);

// serror.cpp
Result<Fields> DecodeISSSError(uint64_t iss);

// Condition code valid bit shared by the trapped AArch32 instruction classes
const char *DescribeCV(bool cv);

} // namespace esrdecoder::esr
