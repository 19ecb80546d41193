#include "esrdecoder/smccc.hpp"
#include "services.hpp"

namespace esrdecoder {

namespace {

    const char *DescribeCallType(bool fastCall) {
        return fastCall ? "Fast Call" : "Yielding Call";
    }

    const char *DescribeCallConvention(bool smc64) {
        return smc64 ? "SMC64/HVC64" : "SMC32/HVC32";
    }

    const char *DescribeServiceCall(uint64_t service) {
        switch (service) {
        case 0x00: return "Arm Architecture Call";
        case 0x01: return "CPU Service Call";
        case 0x02: return "SiP Service Call";
        case 0x03: return "OEM Service Call";
        case 0x04: return "Standard Secure Service Call";
        case 0x05: return "Standard Hypervisor Service Call";
        case 0x06: return "Vendor Specific Hypervisor Service Call";
        }
        if (service <= 0x2F) {
            return "Reserved for future use";
        }
        if (service <= 0x31) {
            return "Trusted Application Call";
        }
        return "Trusted OS Call";
    }

    const char *DescribeYieldingService(uint64_t service) {
        if (service <= 0x0100FFFF) {
            return "Reserved for existing APIs (in use by the existing Armv7 devices)";
        }
        if (service >= 0x02000000 && service <= 0x1FFFFFFF) {
            return "Trusted OS Yielding Calls";
        }
        if (service >= 0x20000000 && service <= 0x7FFFFFFF) {
            return "Reserved for future expansion of Trusted OS Yielding Calls";
        }
        return "Unknown";
    }

    std::vector<FieldInfo> DecodeFastCall(uint64_t smccc) {
        auto callConvention =
            FieldInfo::GetBit(smccc, "Call Convention", std::nullopt, 30).DescribeBit(DescribeCallConvention);
        auto serviceCall = FieldInfo::Get(smccc, "Service Call", std::nullopt, 24, 30).Describe(DescribeServiceCall);
        auto mbz = FieldInfo::Get(smccc, "MBZ", "Some legacy Armv7 set this to 1", 17, 24);
        auto sve =
            FieldInfo::GetBit(smccc, "SVE live state", "No live state[1] From SMCCCv1.3, before SMCCCv1.3 MBZ", 16);

        const bool smc64 = callConvention.AsBit();
        FieldInfo functionNumber = [&] {
            switch (serviceCall.value) {
            case 0x00: return smccc::DecodeArmService(smccc, smc64);
            case 0x04: return smccc::DecodeSecureService(smccc, smc64);
            case 0x05: return smccc::DecodeHypervisorService(smccc, smc64);
            case 0x30:
            case 0x31: return smccc::DecodeTrustedAppService(smccc, smc64);
            default: return smccc::DecodeCommonService(smccc, smc64);
            }
        }();

        return {callConvention, serviceCall, mbz, sve, functionNumber};
    }

} // namespace

Result<std::vector<FieldInfo>> DecodeSMCCC(uint64_t smccc) {
    auto callType = FieldInfo::GetBit(smccc, "Call Type", std::nullopt, 31).DescribeBit(DescribeCallType);

    std::vector<FieldInfo> fields{callType};
    if (callType.AsBit()) {
        auto fastCall = DecodeFastCall(smccc);
        fields.insert(fields.end(), fastCall.begin(), fastCall.end());
    } else {
        fields.push_back(FieldInfo::Get(smccc, "Service Type", std::nullopt, 0, 31).Describe(DescribeYieldingService));
    }
    return fields;
}

} // namespace esrdecoder
