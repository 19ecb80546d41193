#pragma once

#include <cstdint>
#include <ostream>
#include <string>

namespace esrdecoder {

enum class DecodeErrorKind {
    InvalidRes0,     // A RES0 field was not zero
    InvalidEc,       // The EC field had an invalid value
    InvalidFsc,      // The DFSC or IFSC field had an invalid value
    InvalidSet,      // The SET field had an invalid value
    InvalidAet,      // The AET field had an invalid value
    InvalidAm,       // The AM field had an invalid value
    InvalidLd64bIss, // The ISS field had an invalid value for a trapped LD64B or ST64B* exception
};

// An error decoding a register value.
// `value` holds the offending field value.
struct DecodeError {
    DecodeErrorKind kind;
    uint64_t value;

    std::string ToString() const;

    bool operator==(const DecodeError &) const = default;
};

std::ostream &operator<<(std::ostream &os, const DecodeError &error);

} // namespace esrdecoder
