#include "services.hpp"

namespace esrdecoder::smccc {

namespace {

    const char *DescribeHypervisor64Function(uint64_t function) {
        if (function >= 0x20 && function <= 0x3F) {
            return "PV Time 64-bit calls";
        }
        return "";
    }

} // namespace

FieldInfo DecodeHypervisorService(uint64_t smccc, bool smc64) {
    return FieldInfo::Get(smccc, "Function Number", std::nullopt, 0, 16)
        .Describe(smc64 ? DescribeHypervisor64Function : DescribeGeneral32Query);
}

} // namespace esrdecoder::smccc
