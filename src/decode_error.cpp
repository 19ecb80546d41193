#include "esrdecoder/decode_error.hpp"

#include <sstream>

namespace esrdecoder {

std::string DecodeError::ToString() const {
    std::ostringstream oss;
    switch (kind) {
    case DecodeErrorKind::InvalidRes0: oss << "Invalid ESR, res0 is 0x" << std::hex << value; break;
    case DecodeErrorKind::InvalidEc: oss << "Invalid EC 0x" << std::hex << value; break;
    case DecodeErrorKind::InvalidFsc: oss << "Invalid DFSC or IFSC 0x" << std::hex << value; break;
    case DecodeErrorKind::InvalidSet: oss << "Invalid SET 0x" << std::hex << value; break;
    case DecodeErrorKind::InvalidAet: oss << "Invalid AET 0x" << std::hex << value; break;
    case DecodeErrorKind::InvalidAm: oss << "Invalid AM 0x" << std::hex << value; break;
    case DecodeErrorKind::InvalidLd64bIss:
        oss << "Invalid ISS 0x" << std::hex << value << " for trapped LD64B or ST64B*";
        break;
    }
    return oss.str();
}

std::ostream &operator<<(std::ostream &os, const DecodeError &error) {
    return os << error.ToString();
}

} // namespace esrdecoder
