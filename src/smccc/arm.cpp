#include "services.hpp"

namespace esrdecoder::smccc {

namespace {

    const char *DescribeArm32Function(uint64_t function) {
        switch (function) {
        case 0x0000: return "SMCCC_VERSION";
        case 0x0001: return "SMCCC_ARCH_FEATURES";
        case 0x0002: return "SMCCC_ARCH_SOC_ID";
        case 0x3FFF: return "SMCCC_ARCH_WORKAROUND_3";
        case 0x7FFF: return "SMCCC_ARCH_WORKAROUND_2";
        case 0x8000: return "SMCCC_ARCH_WORKAROUND_1";
        case 0xFF00: return "Call Count Query, deprecated from SMCCCv1.2";
        case 0xFF01: return "Call UUID Query, deprecated from SMCCCv1.2";
        case 0xFF03: return "Revision Query, deprecated from SMCCCv1.2";
        default: return DescribeReservedFunction(function);
        }
    }

} // namespace

FieldInfo DecodeArmService(uint64_t smccc, bool smc64) {
    return FieldInfo::Get(smccc, "Function Number", std::nullopt, 0, 16)
        .Describe(smc64 ? DescribeReservedFunction : DescribeArm32Function);
}

} // namespace esrdecoder::smccc
