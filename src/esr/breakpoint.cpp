#include "iss.hpp"

namespace esrdecoder::esr {

namespace {

    // Debug exceptions always report the same fault status code
    Result<const char *> DescribeDebugFSC(uint64_t fsc) {
        if (fsc == 0b100010) {
            return "Debug exception";
        }
        return DecodeError{DecodeErrorKind::InvalidFsc, fsc};
    }

    const char *DescribeISV(bool isv) {
        return isv ? "EX bit is valid" : "EX bit is RES0";
    }

    const char *DescribeEX(bool ex) {
        return ex ? "A Load-Exclusive instruction was stepped"
                  : "Some instruction other than a Load-Exclusive was stepped";
    }

    const char *DescribeWnR(bool wnr) {
        return wnr ? "Watchpoint caused by writing to memory" : "Watchpoint caused by reading from memory";
    }

} // namespace

Result<Fields> DecodeISSBreakpointVectorCatch(uint64_t iss) {
    ESRDECODER_TRY(res0, FieldInfo::Get(iss, "RES0", "Reserved", 6, 25).CheckRes0());
    ESRDECODER_TRY(ifsc,
                   FieldInfo::Get(iss, "IFSC", "Instruction Fault Status Code", 0, 6).Describe(DescribeDebugFSC));

    return Fields{res0, ifsc};
}

Result<Fields> DecodeISSSoftwareStep(uint64_t iss) {
    auto isv = FieldInfo::GetBit(iss, "ISV", "Instruction Syndrome Valid", 24).DescribeBit(DescribeISV);
    ESRDECODER_TRY(res0, FieldInfo::Get(iss, "RES0", "Reserved", 7, 24).CheckRes0());

    auto ex = FieldInfo::GetBit(iss, "EX", "Exclusive operation", 6).DescribeBit(DescribeEX);
    if (!isv.AsBit()) {
        ESRDECODER_TRY(res0ex, FieldInfo::GetBit(iss, "RES0", "Reserved because ISV is false", 6).CheckRes0());
        ex = res0ex;
    }

    ESRDECODER_TRY(ifsc,
                   FieldInfo::Get(iss, "IFSC", "Instruction Fault Status Code", 0, 6).Describe(DescribeDebugFSC));

    return Fields{isv, res0, ex, ifsc};
}

Result<Fields> DecodeISSWatchpoint(uint64_t iss) {
    ESRDECODER_TRY(res0a, FieldInfo::Get(iss, "RES0", "Reserved", 15, 25).CheckRes0());
    ESRDECODER_TRY(res0b, FieldInfo::GetBit(iss, "RES0", "Reserved", 14).CheckRes0());
    auto vncr = FieldInfo::GetBit(iss, "VNCR", std::nullopt, 13);
    ESRDECODER_TRY(res0c, FieldInfo::Get(iss, "RES0", "Reserved", 9, 13).CheckRes0());
    auto cm = FieldInfo::GetBit(iss, "CM", "Cache Maintenance", 8);
    ESRDECODER_TRY(res0d, FieldInfo::GetBit(iss, "RES0", "Reserved", 7).CheckRes0());
    auto wnr = FieldInfo::GetBit(iss, "WnR", "Write not Read", 6).DescribeBit(DescribeWnR);
    ESRDECODER_TRY(dfsc, FieldInfo::Get(iss, "DFSC", "Data Fault Status Code", 0, 6).Describe(DescribeDebugFSC));

    return Fields{res0a, res0b, vncr, res0c, cm, res0d, wnr, dfsc};
}

Result<Fields> DecodeISSBreakpoint(uint64_t iss) {
    ESRDECODER_TRY(res0, FieldInfo::Get(iss, "RES0", "Reserved", 16, 25).CheckRes0());
    auto comment = FieldInfo::Get(iss, "Comment", "Instruction comment field or immediate field", 0, 16);

    return Fields{res0, comment};
}

} // namespace esrdecoder::esr
