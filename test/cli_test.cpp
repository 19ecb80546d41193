#include "options.hpp"
#include "printer.hpp"

#include <esrdecoder/esr.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace esrdecoder;

namespace {

// Runs ParseOptions over the given arguments, with "esr-decoder" as the program name
std::optional<cli::Options> Parse(std::vector<std::string> args) {
    args.insert(args.begin(), "esr-decoder");
    std::vector<char *> argv;
    for (auto &arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);
    return cli::ParseOptions(static_cast<int>(args.size()), argv.data());
}

// Parses arguments that must be rejected and returns what was printed to stderr
std::string ParseError(std::vector<std::string> args) {
    testing::internal::CaptureStderr();
    auto options = Parse(std::move(args));
    auto output = testing::internal::GetCapturedStderr();
    EXPECT_FALSE(options.has_value());
    return output;
}

std::string Print(const std::vector<FieldInfo> &fields, bool verbose) {
    testing::internal::CaptureStdout();
    cli::PrintFields(fields, verbose);
    return testing::internal::GetCapturedStdout();
}

} // namespace

TEST(ParseOptions, Defaults) {
    auto options = Parse({"0x96000050"});
    ASSERT_TRUE(options.has_value());
    EXPECT_EQ(options->reg, cli::Options::Register::ESR);
    EXPECT_FALSE(options->verbose);
    EXPECT_FALSE(options->version);
    EXPECT_EQ(options->value, 0x96000050);
}

TEST(ParseOptions, Flags) {
    auto options = Parse({"-v", "--midr", "1234"});
    ASSERT_TRUE(options.has_value());
    EXPECT_TRUE(options->verbose);
    EXPECT_EQ(options->reg, cli::Options::Register::MIDR);
    EXPECT_EQ(options->value, 1234);

    options = Parse({"0x84000000", "--smccc", "--verbose"});
    ASSERT_TRUE(options.has_value());
    EXPECT_TRUE(options->verbose);
    EXPECT_EQ(options->reg, cli::Options::Register::SMCCC);
    EXPECT_EQ(options->value, 0x84000000);
}

TEST(ParseOptions, VersionNeedsNoValue) {
    auto options = Parse({"--version"});
    ASSERT_TRUE(options.has_value());
    EXPECT_TRUE(options->version);
}

TEST(ParseOptions, Errors) {
    EXPECT_EQ(ParseError({"--bogus", "0"}), "Unknown option: --bogus\n");
    EXPECT_EQ(ParseError({"1", "2"}), "Unexpected argument: 2\n");
    EXPECT_EQ(ParseError({}), "Missing register value\n");
    EXPECT_EQ(ParseError({"-v"}), "Missing register value\n");
    EXPECT_EQ(ParseError({"123abc"}), "Invalid number: 123abc\n");
    EXPECT_EQ(ParseError({"0x"}), "Invalid number: 0x\n");
}

TEST(PrintUsage, ListsEveryMode) {
    testing::internal::CaptureStderr();
    cli::PrintUsage("esr-decoder");
    auto output = testing::internal::GetCapturedStderr();
    EXPECT_EQ(output.rfind("Usage:\n", 0), 0);
    EXPECT_NE(output.find("esr-decoder [-v|--verbose] <ESR value>"), std::string::npos);
    EXPECT_NE(output.find("--midr <MIDR value>"), std::string::npos);
    EXPECT_NE(output.find("--smccc <SMCCC function ID>"), std::string::npos);
}

TEST(PrintFields, LineShapes) {
    auto child = FieldInfo::GetBit(0xAB, "C", "Child", 3);
    auto parent = FieldInfo::Get(0xAB, "P", "Parent", 0, 8).WithDescription("desc").WithSubfields({child});
    auto bit = FieldInfo::GetBit(1 << 9, "B", std::nullopt, 9);

    EXPECT_EQ(Print({bit, parent}, false), "09     B: true\n"
                                           "00..07 P: 0xab 0b10101011\n"
                                           "  # desc\n"
                                           "  03     C: true\n");
}

TEST(PrintFields, VerboseAppendsLongNames) {
    auto child = FieldInfo::GetBit(0xAB, "C", "Child", 3);
    auto parent = FieldInfo::Get(0xAB, "P", "Parent", 0, 8).WithSubfields({child});
    auto bit = FieldInfo::GetBit(0, "B", std::nullopt, 9);

    EXPECT_EQ(Print({bit, parent}, true), "09     B: false\n"
                                          "00..07 P: 0xab 0b10101011 (Parent)\n"
                                          "  03     C: true (Child)\n");
}

TEST(PrintFields, NestedIndentation) {
    auto leaf = FieldInfo::Get(0x3, "L", std::nullopt, 0, 2).WithDescription("leaf");
    auto middle = FieldInfo::Get(0x3, "M", std::nullopt, 0, 4).WithSubfields({leaf});
    auto top = FieldInfo::Get(0x30000, "T", std::nullopt, 16, 24).WithSubfields({middle});

    EXPECT_EQ(Print({top}, false), "16..23 T: 0x03 0b00000011\n"
                                   "  00..03 M: 0x3 0b0011\n"
                                   "    00..01 L: 0x3 0b11\n"
                                   "      # leaf\n");
}

TEST(PrintFields, DecodedESR) {
    auto decoded = Decode(0);
    ASSERT_TRUE(decoded.IsOk());

    EXPECT_EQ(Print(decoded.Value(), false), "37..63 RES0: 0x0000000 0b000000000000000000000000000\n"
                                             "32..36 ISS2: 0x00 0b00000\n"
                                             "26..31 EC: 0x00 0b000000\n"
                                             "  # Unknown reason\n"
                                             "25     IL: false\n"
                                             "  # 16-bit instruction trapped\n"
                                             "00..24 ISS: 0x0000000 0b0000000000000000000000000\n"
                                             "  00..24 RES0: 0x0000000 0b0000000000000000000000000\n"
                                             "    # ISS is RES0\n");
}
