#include "services.hpp"

namespace esrdecoder::smccc {

namespace {

    FieldInfo GetFunctionNumber(uint64_t smccc) {
        return FieldInfo::Get(smccc, "Function Number", std::nullopt, 0, 16);
    }

} // namespace

const char *DescribeReservedFunction(uint64_t function) {
    if (function >= 0xFF00 && function <= 0xFFFF) {
        return "Reserved for future expansion";
    }
    return "";
}

const char *DescribeGeneral32Query(uint64_t function) {
    switch (function) {
    case 0xFF00: return "Call Count Query, deprecated from SMCCCv1.2";
    case 0xFF01: return "Call UUID Query";
    case 0xFF03: return "Revision Query";
    default: return DescribeReservedFunction(function);
    }
}

FieldInfo DecodeTrustedAppService(uint64_t smccc, bool smc64) {
    return GetFunctionNumber(smccc).Describe(smc64 ? DescribeReservedFunction : DescribeGeneral32Query);
}

FieldInfo DecodeCommonService(uint64_t smccc, bool smc64) {
    return GetFunctionNumber(smccc).Describe(smc64 ? DescribeReservedFunction : DescribeGeneral32Query);
}

} // namespace esrdecoder::smccc
