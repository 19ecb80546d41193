#include "esrdecoder/sysreg.hpp"
#include "iss.hpp"

#include <sstream>

namespace esrdecoder::esr {

namespace {

    const char *DescribeDirection(bool direction) {
        return direction ? "Read from system register (MRS)" : "Write to system register (MSR)";
    }

} // namespace

Result<DescribedFields> DecodeISSMSR(uint64_t iss) {
    ESRDECODER_TRY(res0, FieldInfo::Get(iss, "RES0", "Reserved", 22, 25).CheckRes0());
    auto op0 = FieldInfo::Get(iss, "Op0", std::nullopt, 20, 22);
    auto op2 = FieldInfo::Get(iss, "Op2", std::nullopt, 17, 20);
    auto op1 = FieldInfo::Get(iss, "Op1", std::nullopt, 14, 17);
    auto crn = FieldInfo::Get(iss, "CRn", std::nullopt, 10, 14);
    auto rt = FieldInfo::Get(iss, "Rt", "General-purpose register number of the trapped instruction", 5, 10);
    auto crm = FieldInfo::Get(iss, "CRm", std::nullopt, 1, 5);
    auto direction = FieldInfo::GetBit(iss, "Direction", "Direction of the trapped instruction", 0)
                         .DescribeBit(DescribeDirection);

    // Disassemble the trapped instruction
    const auto name = SystemRegisterName(op0.value, op1.value, crn.value, crm.value, op2.value);
    std::ostringstream oss;
    if (direction.AsBit()) {
        oss << "MRS x" << rt.value << ", " << name;
    } else {
        oss << "MSR " << name << ", x" << rt.value;
    }

    return DescribedFields{
        .fields = {res0, op0, op2, op1, crn, rt, crm, direction},
        .description = oss.str(),
    };
}

} // namespace esrdecoder::esr
