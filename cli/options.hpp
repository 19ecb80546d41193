#pragma once

#include <cstdint>
#include <optional>

namespace esrdecoder::cli {

// Command line configuration of the decoder
struct Options {
    // Which kind of register value to decode.
    enum class Register { ESR, MIDR, SMCCC };
    Register reg = Register::ESR;

    // Print the long names of the fields.
    bool verbose = false;

    // Print the version and exit.
    bool version = false;

    // The value to decode.
    uint64_t value = 0;
};

// Parses the command line arguments.
// Returns std::nullopt and prints an error message if the arguments are invalid.
std::optional<Options> ParseOptions(int argc, char *argv[]);

void PrintUsage(const char *program);

} // namespace esrdecoder::cli
