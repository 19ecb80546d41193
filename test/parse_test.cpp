#include <esrdecoder/parse.hpp>

#include <gtest/gtest.h>

#include <limits>

using namespace esrdecoder;

TEST(ParseNumber, Decimal) {
    EXPECT_EQ(ParseNumber("12345"), 12345);
    EXPECT_EQ(ParseNumber("0"), 0);
    EXPECT_EQ(ParseNumber("18446744073709551615"), std::numeric_limits<uint64_t>::max());
}

TEST(ParseNumber, Hexadecimal) {
    EXPECT_EQ(ParseNumber("0x123abc"), 0x123abc);
    EXPECT_EQ(ParseNumber("0x96000050"), 0x96000050);
    EXPECT_EQ(ParseNumber("0xFFFFFFFFFFFFFFFF"), std::numeric_limits<uint64_t>::max());
}

TEST(ParseNumber, Invalid) {
    EXPECT_FALSE(ParseNumber("123abc").has_value());
    EXPECT_FALSE(ParseNumber("").has_value());
    EXPECT_FALSE(ParseNumber("0x").has_value());
    EXPECT_FALSE(ParseNumber("0xg").has_value());
    EXPECT_FALSE(ParseNumber("-1").has_value());
    EXPECT_FALSE(ParseNumber(" 1").has_value());
    EXPECT_FALSE(ParseNumber("1 ").has_value());
}

TEST(ParseNumber, Overflow) {
    EXPECT_FALSE(ParseNumber("18446744073709551616").has_value());
    EXPECT_FALSE(ParseNumber("0x10000000000000000").has_value());
}
