#include "iss.hpp"

namespace esrdecoder::esr {

namespace {

    // Asynchronous SError interrupt; the only DFSC for which IESB is defined
    constexpr uint64_t kDfscAsyncSError = 0b010001;

    const char *DescribeIDS(bool ids) {
        return ids ? "The rest of the ISS is encoded in an implementation-defined format"
                   : "The rest of the ISS is encoded according to the platform";
    }

    const char *DescribeIESB(bool iesb) {
        return iesb ? "The SError interrupt was synchronized by the implicit error synchronization event and taken "
                      "immediately."
                    : "The SError interrupt was not synchronized by the implicit error synchronization event or not "
                      "taken immediately.";
    }

    Result<const char *> DescribeAET(uint64_t aet) {
        switch (aet) {
        case 0b000: return "Uncontainable (UC)";
        case 0b001: return "Unrecoverable state (UEU)";
        case 0b010: return "Restartable state (UEO)";
        case 0b011: return "Recoverable state (UER)";
        case 0b110: return "Corrected (CE)";
        default: return DecodeError{DecodeErrorKind::InvalidAet, aet};
        }
    }

    Result<const char *> DescribeDFSC(uint64_t dfsc) {
        switch (dfsc) {
        case 0b000000: return "Uncategorized error";
        case kDfscAsyncSError: return "Asynchronous SError interrupt";
        default: return DecodeError{DecodeErrorKind::InvalidFsc, dfsc};
        }
    }

} // namespace

Result<Fields> DecodeISSSError(uint64_t iss) {
    auto ids = FieldInfo::GetBit(iss, "IDS", "Implementation Defined Syndrome", 24).DescribeBit(DescribeIDS);
    if (ids.AsBit()) {
        auto impdef = FieldInfo::Get(iss, "IMPDEF", "Implementation defined", 0, 24);
        return Fields{ids, impdef};
    }

    ESRDECODER_TRY(dfsc, FieldInfo::Get(iss, "DFSC", "Data Fault Status Code", 0, 6).Describe(DescribeDFSC));
    ESRDECODER_TRY(res0a, FieldInfo::Get(iss, "RES0", "Reserved", 14, 24).CheckRes0());

    auto iesb = FieldInfo::GetBit(iss, "IESB", "Implicit Error Synchronisation event", 13).DescribeBit(DescribeIESB);
    if (dfsc.value != kDfscAsyncSError) {
        ESRDECODER_TRY(res0iesb, FieldInfo::GetBit(iss, "RES0", "Reserved for this DFSC value", 13).CheckRes0());
        iesb = res0iesb;
    }

    ESRDECODER_TRY(aet, FieldInfo::Get(iss, "AET", "Asynchronous Error Type", 10, 13).Describe(DescribeAET));
    auto ea = FieldInfo::GetBit(iss, "EA", "External Abort type", 9);
    ESRDECODER_TRY(res0b, FieldInfo::Get(iss, "RES0", "Reserved", 6, 9).CheckRes0());

    return Fields{ids, res0a, iesb, aet, ea, res0b, dfsc};
}

} // namespace esrdecoder::esr
