#include <esrdecoder/decode_error.hpp>

#include <gtest/gtest.h>

#include <sstream>

using namespace esrdecoder;

TEST(DecodeError, Messages) {
    EXPECT_EQ((DecodeError{DecodeErrorKind::InvalidRes0, 0}).ToString(), "Invalid ESR, res0 is 0x0");
    EXPECT_EQ((DecodeError{DecodeErrorKind::InvalidRes0, 0x7ffffff}).ToString(), "Invalid ESR, res0 is 0x7ffffff");
    EXPECT_EQ((DecodeError{DecodeErrorKind::InvalidEc, 0x3f}).ToString(), "Invalid EC 0x3f");
    EXPECT_EQ((DecodeError{DecodeErrorKind::InvalidFsc, 0x12}).ToString(), "Invalid DFSC or IFSC 0x12");
    EXPECT_EQ((DecodeError{DecodeErrorKind::InvalidSet, 1}).ToString(), "Invalid SET 0x1");
    EXPECT_EQ((DecodeError{DecodeErrorKind::InvalidAet, 4}).ToString(), "Invalid AET 0x4");
    EXPECT_EQ((DecodeError{DecodeErrorKind::InvalidAm, 5}).ToString(), "Invalid AM 0x5");
    EXPECT_EQ((DecodeError{DecodeErrorKind::InvalidLd64bIss, 3}).ToString(),
              "Invalid ISS 0x3 for trapped LD64B or ST64B*");
}

TEST(DecodeError, StreamOutput) {
    std::ostringstream oss;
    oss << DecodeError{DecodeErrorKind::InvalidEc, 0x2};
    EXPECT_EQ(oss.str(), "Invalid EC 0x2");
}
