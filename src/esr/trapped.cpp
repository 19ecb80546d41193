#include "iss.hpp"

namespace esrdecoder::esr {

namespace {

    Result<const char *> DescribeLD64BISS(uint64_t iss) {
        switch (iss) {
        case 0b00: return "ST64BV trapped";
        case 0b01: return "ST64BV0 trapped";
        case 0b10: return "LD64B or ST64B trapped";
        default: return DecodeError{DecodeErrorKind::InvalidLd64bIss, iss};
        }
    }

    const char *DescribeInstructionOrData(bool instructionOrData) {
        return instructionOrData ? "Data Key" : "Instruction Key";
    }

    const char *DescribeAOrB(bool aOrB) {
        return aOrB ? "B Key" : "A Key";
    }

} // namespace

Result<Fields> DecodeISSBTI(uint64_t iss) {
    ESRDECODER_TRY(res0, FieldInfo::Get(iss, "RES0", "Reserved", 2, 25).CheckRes0());
    auto btype = FieldInfo::Get(iss, "BTYPE", "PSTATE.BTYPE value", 0, 2);

    return Fields{res0, btype};
}

// SVC, HVC and SMC
Result<Fields> DecodeISSHVC(uint64_t iss) {
    ESRDECODER_TRY(res0, FieldInfo::Get(iss, "RES0", "Reserved", 16, 25).CheckRes0());
    auto imm16 =
        FieldInfo::Get(iss, "imm16", "Value of the immediate field from the HVC or SVC instruction", 0, 16);

    return Fields{res0, imm16};
}

Result<Fields> DecodeISSLD64B(uint64_t iss) {
    ESRDECODER_TRY(field, FieldInfo::Get(iss, "ISS", std::nullopt, 0, 25).Describe(DescribeLD64BISS));
    return Fields{field};
}

Result<Fields> DecodeISSPAuth(uint64_t iss) {
    ESRDECODER_TRY(res0, FieldInfo::Get(iss, "RES0", "Reserved", 2, 25).CheckRes0());
    auto instructionOrData = FieldInfo::GetBit(iss, "IorD", "Instruction key or Data key", 1)
                                 .DescribeBit(DescribeInstructionOrData);
    auto aOrB = FieldInfo::GetBit(iss, "AorB", "A key or B key", 0).DescribeBit(DescribeAOrB);

    return Fields{res0, instructionOrData, aOrB};
}

} // namespace esrdecoder::esr
