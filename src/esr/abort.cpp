#include "iss.hpp"

#include <algorithm>
#include <array>

namespace esrdecoder::esr {

namespace {

    struct FaultStatusCode {
        uint64_t code;
        const char *description;
    };

    // Fault status codes shared by DFSC and IFSC.
    constexpr std::array<FaultStatusCode, 37> kFaultStatusCodes{{
        {0b000000, "Address size fault, level 0 of translation or translation table base register."},
        {0b000001, "Address size fault, level 1."},
        {0b000010, "Address size fault, level 2."},
        {0b000011, "Address size fault, level 3."},
        {0b000100, "Translation fault, level 0."},
        {0b000101, "Translation fault, level 1."},
        {0b000110, "Translation fault, level 2."},
        {0b000111, "Translation fault, level 3."},
        {0b001000, "Access flag fault, level 0."},
        {0b001001, "Access flag fault, level 1."},
        {0b001010, "Access flag fault, level 2."},
        {0b001011, "Access flag fault, level 3."},
        {0b001100, "Permission fault, level 0."},
        {0b001101, "Permission fault, level 1."},
        {0b001110, "Permission fault, level 2."},
        {0b001111, "Permission fault, level 3."},
        {0b010000, "Synchronous External abort, not on translation table walk or hardware update of translation "
                   "table."},
        {0b010001, "Synchronous Tag Check Fault."},
        {0b010011, "Synchronous External abort on translation table walk or hardware update of translation table, "
                   "level -1."},
        {0b010100, "Synchronous External abort on translation table walk or hardware update of translation table, "
                   "level 0."},
        {0b010101, "Synchronous External abort on translation table walk or hardware update of translation table, "
                   "level 1."},
        {0b010110, "Synchronous External abort on translation table walk or hardware update of translation table, "
                   "level 2."},
        {0b010111, "Synchronous External abort on translation table walk or hardware update of translation table, "
                   "level 3."},
        {0b011000, "Synchronous parity or ECC error on memory access, not on translation table walk."},
        {0b011011, "Synchronous parity or ECC error on memory access on translation table walk or hardware update "
                   "of translation table, level -1."},
        {0b011100, "Synchronous parity or ECC error on memory access on translation table walk or hardware update "
                   "of translation table, level 0."},
        {0b011101, "Synchronous parity or ECC error on memory access on translation table walk or hardware update "
                   "of translation table, level 1."},
        {0b011110, "Synchronous parity or ECC error on memory access on translation table walk or hardware update "
                   "of translation table, level 2."},
        {0b011111, "Synchronous parity or ECC error on memory access on translation table walk or hardware update "
                   "of translation table, level 3."},
        {0b100001, "Alignment fault."},
        {0b101001, "Address size fault, level -1."},
        {0b101011, "Translation fault, level -1."},
        {0b110000, "TLB conflict abort."},
        {0b110001, "Unsupported atomic hardware update fault."},
        {0b110100, "IMPLEMENTATION DEFINED fault (Lockdown)."},
        {0b110101, "IMPLEMENTATION DEFINED fault (Unsupported Exclusive or Atomic access)."},
    }};

    // Synchronous External abort, not on translation table walk; the only FSC for which SET is meaningful
    constexpr uint64_t kFscSyncExternalAbort = 0b010000;

    Result<const char *> DescribeFSC(uint64_t fsc) {
        auto it = std::find_if(kFaultStatusCodes.begin(), kFaultStatusCodes.end(),
                               [fsc](const FaultStatusCode &entry) { return entry.code == fsc; });
        if (it == kFaultStatusCodes.end()) {
            return DecodeError{DecodeErrorKind::InvalidFsc, fsc};
        }
        return it->description;
    }

    Result<const char *> DescribeSET(uint64_t set) {
        switch (set) {
        case 0b00: return "Recoverable state (UER)";
        case 0b10: return "Uncontainable (UC)";
        case 0b11: return "Restartable state (UEO)";
        default: return DecodeError{DecodeErrorKind::InvalidSet, set};
        }
    }

    const char *DescribeSAS(uint64_t sas) {
        static constexpr const char *names[] = {"byte", "halfword", "word", "doubleword"};
        return names[sas];
    }

    const char *DescribeISV(bool isv) {
        return isv ? "Valid instruction syndrome" : "No valid instruction syndrome";
    }

    const char *DescribeSF(bool sf) {
        return sf ? "64-bit wide register" : "32-bit wide register";
    }

    const char *DescribeAR(bool ar) {
        return ar ? "Acquire/release semantics" : "No acquire/release semantics";
    }

    const char *DescribeFnV(bool fnv) {
        return fnv ? "FAR is not valid, it holds an unknown value" : "FAR is valid";
    }

    const char *DescribeWnR(bool wnr) {
        return wnr ? "Abort caused by writing to memory" : "Abort caused by reading from memory";
    }

    // SET is only defined for synchronous external aborts. For any other fault status code the bits are reported as
    // reserved but not validated.
    Result<FieldInfo> GetSET(uint64_t iss, uint64_t fsc) {
        if (fsc == kFscSyncExternalAbort) {
            return FieldInfo::Get(iss, "SET", "Synchronous Error Type", 11, 13).Describe(DescribeSET);
        }
        return FieldInfo::Get(iss, "RES0", "Reserved", 11, 13);
    }

} // namespace

Result<Fields> DecodeISSInstructionAbort(uint64_t iss) {
    ESRDECODER_TRY(res0a, FieldInfo::Get(iss, "RES0", "Reserved", 13, 25).CheckRes0());
    auto fnv = FieldInfo::GetBit(iss, "FnV", "FAR not Valid", 10).DescribeBit(DescribeFnV);
    auto ea = FieldInfo::GetBit(iss, "EA", "External abort type", 9);
    ESRDECODER_TRY(res0b, FieldInfo::GetBit(iss, "RES0", "Reserved", 8).CheckRes0());
    auto s1ptw = FieldInfo::GetBit(iss, "S1PTW", "Stage-1 translation table walk", 7);
    ESRDECODER_TRY(res0c, FieldInfo::GetBit(iss, "RES0", "Reserved", 6).CheckRes0());
    ESRDECODER_TRY(ifsc, FieldInfo::Get(iss, "IFSC", "Instruction Fault Status Code", 0, 6).Describe(DescribeFSC));
    ESRDECODER_TRY(set, GetSET(iss, ifsc.value));

    return Fields{res0a, set, fnv, ea, res0b, s1ptw, res0c, ifsc};
}

Result<Fields> DecodeISSDataAbort(uint64_t iss) {
    auto isv = FieldInfo::GetBit(iss, "ISV", "Instruction Syndrome Valid", 24).DescribeBit(DescribeISV);

    Fields fields{isv};
    if (isv.AsBit()) {
        // The instruction syndrome is only valid if ISV is set
        auto sas = FieldInfo::Get(iss, "SAS", "Syndrome Access Size", 22, 24).Describe(DescribeSAS);
        auto sse = FieldInfo::GetBit(iss, "SSE", "Syndrome Sign Extend", 21);
        auto srt = FieldInfo::Get(iss, "SRT", "Syndrome Register Transfer", 16, 21);
        auto sf = FieldInfo::GetBit(iss, "SF", "Sixty-Four", 15).DescribeBit(DescribeSF);
        auto ar = FieldInfo::GetBit(iss, "AR", "Acquire/Release", 14).DescribeBit(DescribeAR);
        fields.insert(fields.end(), {sas, sse, srt, sf, ar});
    } else {
        ESRDECODER_TRY(res0, FieldInfo::Get(iss, "RES0", "Reserved", 14, 24).CheckRes0());
        fields.push_back(res0);
    }

    auto vncr = FieldInfo::GetBit(iss, "VNCR", std::nullopt, 13);
    auto fnv = FieldInfo::GetBit(iss, "FnV", "FAR not Valid", 10).DescribeBit(DescribeFnV);
    auto ea = FieldInfo::GetBit(iss, "EA", "External abort type", 9);
    auto cm = FieldInfo::GetBit(iss, "CM", "Cache Maintenance", 8);
    auto s1ptw = FieldInfo::GetBit(iss, "S1PTW", "Stage-1 translation table walk", 7);
    auto wnr = FieldInfo::GetBit(iss, "WnR", "Write not Read", 6).DescribeBit(DescribeWnR);
    ESRDECODER_TRY(dfsc, FieldInfo::Get(iss, "DFSC", "Data Fault Status Code", 0, 6).Describe(DescribeFSC));
    ESRDECODER_TRY(set, GetSET(iss, dfsc.value));

    fields.insert(fields.end(), {vncr, set, fnv, ea, cm, s1ptw, wnr, dfsc});
    return fields;
}

} // namespace esrdecoder::esr
