#include "esrdecoder/esr.hpp"
#include "iss.hpp"

#include <optional>
#include <utility>

namespace esrdecoder {

namespace {

    using ISSDecoder = Result<esr::DescribedFields> (*)(uint64_t iss);

    // Adapts an ISS decoder that does not summarize the ISS
    template <Result<esr::Fields> (*decoder)(uint64_t)>
    Result<esr::DescribedFields> Undescribed(uint64_t iss) {
        ESRDECODER_TRY(fields, decoder(iss));
        return esr::DescribedFields{.fields = std::move(fields)};
    }

    struct ExceptionClass {
        const char *description;
        ISSDecoder decoder;
    };

    std::optional<ExceptionClass> LookupExceptionClass(uint64_t ec) {
        using namespace esr;

        switch (ec) {
        case 0b000000: return ExceptionClass{"Unknown reason", Undescribed<DecodeISSRes0>};
        case 0b000001: return ExceptionClass{"Wrapped WF* instruction execution", Undescribed<DecodeISSWF>};
        case 0b000011:
            return ExceptionClass{"Trapped MCR or MRC access with coproc=0b1111", Undescribed<DecodeISSMCR>};
        case 0b000100:
            return ExceptionClass{"Trapped MCRR or MRRC access with coproc=0b1111", Undescribed<DecodeISSMCRR>};
        case 0b000101:
            return ExceptionClass{"Trapped MCR or MRC access with coproc=0b1110", Undescribed<DecodeISSMCR>};
        case 0b000110: return ExceptionClass{"Trapped LDC or STC access", Undescribed<DecodeISSLDC>};
        case 0b000111:
            return ExceptionClass{"Trapped access to SVE, Advanced SIMD or floating point", Undescribed<DecodeISSSVE>};
        case 0b001010:
            return ExceptionClass{"Trapped execution of an LD64B, ST64B, ST64BV, or ST64BV0 instruction",
                                  Undescribed<DecodeISSLD64B>};
        case 0b001100:
            return ExceptionClass{"Trapped MRRC access with (coproc==0b1110)", Undescribed<DecodeISSMCRR>};
        case 0b001101: return ExceptionClass{"Branch Target Exception", Undescribed<DecodeISSBTI>};
        case 0b001110: return ExceptionClass{"Illegal Execution state", Undescribed<DecodeISSRes0>};
        case 0b010001:
            return ExceptionClass{"SVC instruction execution in AArch32 state", Undescribed<DecodeISSHVC>};
        case 0b010101:
            return ExceptionClass{"SVC instruction execution in AArch64 state", Undescribed<DecodeISSHVC>};
        case 0b010110:
            return ExceptionClass{"HVC instruction execution in AArch64 state", Undescribed<DecodeISSHVC>};
        case 0b010111:
            return ExceptionClass{"SMC instruction execution in AArch64 state", Undescribed<DecodeISSHVC>};
        case 0b011000:
            return ExceptionClass{"Trapped MSR, MRS or System instruction execution in AArch64 state",
                                  DecodeISSMSR};
        case 0b011001:
            return ExceptionClass{"Access to SVE functionality trapped as a result of CPACR_EL1.ZEN, CPTR_EL2.ZEN, "
                                  "CPTR_EL2.TZ, or CPTR_EL3.EZ",
                                  Undescribed<DecodeISSRes0>};
        case 0b011100:
            return ExceptionClass{"Exception from a Pointer Authentication instruction authentication failure",
                                  Undescribed<DecodeISSPAuth>};
        case 0b100000:
            return ExceptionClass{"Instruction Abort from a lower Exception level",
                                  Undescribed<DecodeISSInstructionAbort>};
        case 0b100001:
            return ExceptionClass{"Instruction Abort taken without a change in Exception level",
                                  Undescribed<DecodeISSInstructionAbort>};
        case 0b100010: return ExceptionClass{"PC alignment fault exception", Undescribed<DecodeISSRes0>};
        case 0b100100:
            return ExceptionClass{"Data Abort from a lower Exception level", Undescribed<DecodeISSDataAbort>};
        case 0b100101:
            return ExceptionClass{"Data Abort taken without a change in Exception level",
                                  Undescribed<DecodeISSDataAbort>};
        case 0b100110: return ExceptionClass{"SP alignment fault exception", Undescribed<DecodeISSRes0>};
        case 0b101000:
            return ExceptionClass{"Trapped floating-point exception taken from AArch32 state",
                                  Undescribed<DecodeISSFP>};
        case 0b101100:
            return ExceptionClass{"Trapped floating-point exception taken from AArch64 state",
                                  Undescribed<DecodeISSFP>};
        case 0b101111: return ExceptionClass{"SError interrupt", Undescribed<DecodeISSSError>};
        case 0b110000:
            return ExceptionClass{"Breakpoint exception from a lower Exception level",
                                  Undescribed<DecodeISSBreakpointVectorCatch>};
        case 0b110001:
            return ExceptionClass{"Breakpoint exception taken without a change in Exception level",
                                  Undescribed<DecodeISSBreakpointVectorCatch>};
        case 0b110010:
            return ExceptionClass{"Software Step exception from a lower Exception level",
                                  Undescribed<DecodeISSSoftwareStep>};
        case 0b110011:
            return ExceptionClass{"Software Step exception taken without a change in Exception level",
                                  Undescribed<DecodeISSSoftwareStep>};
        case 0b110100:
            return ExceptionClass{"Watchpoint exception from a lower Exception level",
                                  Undescribed<DecodeISSWatchpoint>};
        case 0b110101:
            return ExceptionClass{"Watchpoint exception taken without a change in Exception level",
                                  Undescribed<DecodeISSWatchpoint>};
        case 0b111000:
            return ExceptionClass{"BKPT instruction execution in AArch32 state", Undescribed<DecodeISSBreakpoint>};
        case 0b111100:
            return ExceptionClass{"BRK instruction execution in AArch64 state", Undescribed<DecodeISSBreakpoint>};
        default: return std::nullopt;
        }
    }

    const char *DescribeIL(bool il) {
        return il ? "32-bit instruction trapped" : "16-bit instruction trapped";
    }

} // namespace

Result<std::vector<FieldInfo>> Decode(uint64_t esr) {
    ESRDECODER_TRY(res0, FieldInfo::Get(esr, "RES0", "Reserved", 37, 64).CheckRes0());
    auto iss2 = FieldInfo::Get(esr, "ISS2", std::nullopt, 32, 37);
    auto ec = FieldInfo::Get(esr, "EC", "Exception Class", 26, 32);
    auto il = FieldInfo::GetBit(esr, "IL", "Instruction Length", 25).DescribeBit(DescribeIL);
    auto iss = FieldInfo::Get(esr, "ISS", "Instruction Specific Syndrome", 0, 25);

    const auto exceptionClass = LookupExceptionClass(ec.value);
    if (!exceptionClass) {
        return DecodeError{DecodeErrorKind::InvalidEc, ec.value};
    }
    ESRDECODER_TRY(issFields, exceptionClass->decoder(iss.value));

    ec = ec.WithDescription(exceptionClass->description);
    iss = iss.WithSubfields(std::move(issFields.fields));
    if (issFields.description) {
        iss = iss.WithDescription(*issFields.description);
    }

    return std::vector<FieldInfo>{res0, iss2, ec, il, iss};
}

} // namespace esrdecoder
