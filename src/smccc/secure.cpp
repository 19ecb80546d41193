#include "services.hpp"

namespace esrdecoder::smccc {

namespace {

    const char *DescribeSecureFunctionRange(uint64_t function) {
        if (function <= 0x01F) {
            return "PSCI Call (Power Secure Control Interface)";
        }
        if (function <= 0x03F) {
            return "SDEI Call (Software Delegated Exception Interface)";
        }
        if (function <= 0x04F) {
            return "MM Call (Management Mode)";
        }
        if (function <= 0x05F) {
            return "TRNG Call";
        }
        if (function <= 0x0EF) {
            return "Unknown FF-A Call";
        }
        if (function <= 0x10F) {
            return "Errata Call";
        }
        if (function >= 0x150 && function <= 0x1CF) {
            return "CCA Call";
        }
        return "";
    }

    const char *DescribeSecure32Function(uint64_t function) {
        if (auto name = FFA32FunctionName(function)) {
            return *name;
        }
        if (function <= 0x1CF) {
            return DescribeSecureFunctionRange(function);
        }
        return DescribeGeneral32Query(function);
    }

    const char *DescribeSecure64Function(uint64_t function) {
        if (auto name = FFA64FunctionName(function)) {
            return *name;
        }
        return DescribeSecureFunctionRange(function);
    }

} // namespace

FieldInfo DecodeSecureService(uint64_t smccc, bool smc64) {
    return FieldInfo::Get(smccc, "Function Number", std::nullopt, 0, 16)
        .Describe(smc64 ? DescribeSecure64Function : DescribeSecure32Function);
}

} // namespace esrdecoder::smccc
