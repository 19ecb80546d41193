#include "iss.hpp"

// Traps of instructions that may carry a condition code: WF*, coprocessor moves, LDC/STC and SVE/SIMD/FP accesses.
// All of them start with the CV and COND fields.

namespace esrdecoder::esr {

namespace {

    FieldInfo GetCV(uint64_t iss) {
        return FieldInfo::GetBit(iss, "CV", "Condition code valid", 24).DescribeBit(DescribeCV);
    }

    FieldInfo GetCOND(uint64_t iss) {
        return FieldInfo::Get(iss, "COND", "Condition code of the trapped instruction", 20, 24);
    }

    FieldInfo GetDirection(uint64_t iss, FieldInfo::BitDescriber describer) {
        return FieldInfo::GetBit(iss, "Direction", "Direction of the trapped instruction", 0).DescribeBit(describer);
    }

    const char *DescribeRV(bool rv) {
        return rv ? "RN is valid" : "RN is not valid";
    }

    const char *DescribeTI(uint64_t ti) {
        static constexpr const char *names[] = {"WFI trapped", "WFE trapped", "WFIT trapped", "WFET trapped"};
        return names[ti];
    }

    const char *DescribeMCRDirection(bool direction) {
        return direction ? "Read from system register (MRC or VMRS)" : "Write to system register (MCR)";
    }

    const char *DescribeOffset(bool offset) {
        return offset ? "Add offset" : "Subtract offset";
    }

    Result<const char *> DescribeAM(uint64_t am) {
        switch (am) {
        case 0b000: return "Immediate unindexed";
        case 0b001: return "Immediate post-indexed";
        case 0b010: return "Immediate offset";
        case 0b011: return "Immediate pre-indexed";
        case 0b100: return "Reserved for trapped STR or T32 LDC";
        case 0b110: return "Reserved for trapped STC";
        default: return DecodeError{DecodeErrorKind::InvalidAm, am};
        }
    }

    const char *DescribeLDCDirection(bool direction) {
        return direction ? "Read from memory (LDC)" : "Write to memory (STC)";
    }

} // namespace

Result<Fields> DecodeISSWF(uint64_t iss) {
    auto cv = GetCV(iss);
    auto cond = GetCOND(iss);
    ESRDECODER_TRY(res0a, FieldInfo::Get(iss, "RES0", "Reserved", 10, 20).CheckRes0());
    auto rn = FieldInfo::Get(iss, "RN", "Register Number", 5, 10);
    ESRDECODER_TRY(res0b, FieldInfo::Get(iss, "RES0", "Reserved", 3, 5).CheckRes0());
    auto rv = FieldInfo::GetBit(iss, "RV", "Register Valid", 2).DescribeBit(DescribeRV);
    auto ti = FieldInfo::Get(iss, "TI", "Trapped Instruction", 0, 2).Describe(DescribeTI);

    return Fields{cv, cond, res0a, rn, res0b, rv, ti};
}

Result<Fields> DecodeISSMCR(uint64_t iss) {
    auto cv = GetCV(iss);
    auto cond = GetCOND(iss);
    auto opc2 = FieldInfo::Get(iss, "Opc2", std::nullopt, 17, 20);
    auto opc1 = FieldInfo::Get(iss, "Opc1", std::nullopt, 14, 17);
    auto crn = FieldInfo::Get(iss, "CRn", std::nullopt, 10, 14);
    auto rt = FieldInfo::Get(iss, "Rt", std::nullopt, 5, 10);
    auto crm = FieldInfo::Get(iss, "CRm", std::nullopt, 1, 5);
    auto direction = GetDirection(iss, DescribeMCRDirection);

    return Fields{cv, cond, opc2, opc1, crn, rt, crm, direction};
}

Result<Fields> DecodeISSMCRR(uint64_t iss) {
    auto cv = GetCV(iss);
    auto cond = GetCOND(iss);
    auto opc1 = FieldInfo::Get(iss, "Opc1", std::nullopt, 16, 20);
    ESRDECODER_TRY(res0, FieldInfo::GetBit(iss, "RES0", "Reserved", 15).CheckRes0());
    auto rt2 = FieldInfo::Get(iss, "Rt2", std::nullopt, 10, 15);
    auto rt = FieldInfo::Get(iss, "Rt", std::nullopt, 5, 10);
    auto crm = FieldInfo::Get(iss, "CRm", std::nullopt, 1, 5);
    auto direction = GetDirection(iss, DescribeMCRDirection);

    return Fields{cv, cond, opc1, res0, rt2, rt, crm, direction};
}

Result<Fields> DecodeISSLDC(uint64_t iss) {
    auto cv = GetCV(iss);
    auto cond = GetCOND(iss);
    auto imm8 = FieldInfo::Get(iss, "imm8", "Immediate value of the trapped instruction", 12, 20);
    ESRDECODER_TRY(res0, FieldInfo::Get(iss, "RES0", "Reserved", 10, 12).CheckRes0());
    auto rn = FieldInfo::Get(iss, "Rn", "General-purpose register number of the trapped instruction", 5, 10);
    auto offset =
        FieldInfo::GetBit(iss, "Offset", "Whether the offset is added or subtracted", 4).DescribeBit(DescribeOffset);
    ESRDECODER_TRY(am, FieldInfo::Get(iss, "AM", "Addressing Mode", 1, 4).Describe(DescribeAM));
    auto direction = GetDirection(iss, DescribeLDCDirection);

    return Fields{cv, cond, imm8, res0, rn, offset, am, direction};
}

Result<Fields> DecodeISSSVE(uint64_t iss) {
    auto cv = GetCV(iss);
    auto cond = GetCOND(iss);
    ESRDECODER_TRY(res0, FieldInfo::Get(iss, "RES0", "Reserved", 0, 20).CheckRes0());

    return Fields{cv, cond, res0};
}

} // namespace esrdecoder::esr
