#include "iss.hpp"

namespace esrdecoder::esr {

namespace {

    const char *DescribeTFV(bool tfv) {
        return tfv ? "One or more floating-point exceptions occurred; IDF, IXF, UFF, OFF, DZF and IOF hold "
                     "information about what."
                   : "IDF, IXF, UFF, OFF, DZF and IOF do not hold valid information.";
    }

    const char *DescribeIDF(bool idf) {
        return idf ? "Input denormal floating-point exception occurred."
                   : "Input denormal floating-point exception did not occur.";
    }

    const char *DescribeIXF(bool ixf) {
        return ixf ? "Inexact floating-point exception occurred." : "Inexact floating-point exception did not occur.";
    }

    const char *DescribeUFF(bool uff) {
        return uff ? "Underflow floating-point exception occurred."
                   : "Underflow floating-point exception did not occur.";
    }

    const char *DescribeOFF(bool off) {
        return off ? "Overflow floating-point exception occurred." : "Overflow floating-point exception did not occur.";
    }

    const char *DescribeDZF(bool dzf) {
        return dzf ? "Divide by Zero floating-point exception occurred."
                   : "Divide by Zero floating-point exception did not occur.";
    }

    const char *DescribeIOF(bool iof) {
        return iof ? "Invalid Operation floating-point exception occurred."
                   : "Invalid Operation floating-point exception did not occur.";
    }

} // namespace

Result<Fields> DecodeISSFP(uint64_t iss) {
    ESRDECODER_TRY(res0a, FieldInfo::GetBit(iss, "RES0", "Reserved", 24).CheckRes0());
    auto tfv = FieldInfo::GetBit(iss, "TFV", "Trapped Fault Valid", 23).DescribeBit(DescribeTFV);
    ESRDECODER_TRY(res0b, FieldInfo::Get(iss, "RES0", "Reserved", 11, 23).CheckRes0());
    auto vecitr = FieldInfo::Get(iss, "VECITR", "RES1 or UNKNOWN", 8, 11);
    auto idf = FieldInfo::GetBit(iss, "IDF", "Input Denormal", 7).DescribeBit(DescribeIDF);
    ESRDECODER_TRY(res0c, FieldInfo::Get(iss, "RES0", "Reserved", 5, 7).CheckRes0());
    auto ixf = FieldInfo::GetBit(iss, "IXF", "Inexact", 4).DescribeBit(DescribeIXF);
    auto uff = FieldInfo::GetBit(iss, "UFF", "Underflow", 3).DescribeBit(DescribeUFF);
    auto off = FieldInfo::GetBit(iss, "OFF", "Overflow", 2).DescribeBit(DescribeOFF);
    auto dzf = FieldInfo::GetBit(iss, "DZF", "Divide by Zero", 1).DescribeBit(DescribeDZF);
    auto iof = FieldInfo::GetBit(iss, "IOF", "Invalid Operation", 0).DescribeBit(DescribeIOF);

    return Fields{res0a, tfv, res0b, vecitr, idf, res0c, ixf, uff, off, dzf, iof};
}

} // namespace esrdecoder::esr
