#include "iss.hpp"

namespace esrdecoder::esr {

Result<Fields> DecodeISSRes0(uint64_t iss) {
    ESRDECODER_TRY(res0, FieldInfo::Get(iss, "RES0", "Reserved", 0, 25).CheckRes0());
    return Fields{res0.WithDescription("ISS is RES0")};
}

const char *DescribeCV(bool cv) {
    return cv ? "COND is valid" : "COND is not valid";
}

} // namespace esrdecoder::esr
