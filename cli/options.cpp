#include "options.hpp"

#include <esrdecoder/parse.hpp>

#include <cstdio>
#include <string_view>

namespace esrdecoder::cli {

std::optional<Options> ParseOptions(int argc, char *argv[]) {
    Options options{};
    std::optional<std::string_view> valueArg;

    for (int i = 1; i < argc; i++) {
        const std::string_view arg = argv[i];
        if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "--midr") {
            options.reg = Options::Register::MIDR;
        } else if (arg == "--smccc") {
            options.reg = Options::Register::SMCCC;
        } else if (arg == "--version") {
            options.version = true;
        } else if (arg.starts_with("-")) {
            fprintf(stderr, "Unknown option: %s\n", argv[i]);
            return std::nullopt;
        } else if (valueArg) {
            fprintf(stderr, "Unexpected argument: %s\n", argv[i]);
            return std::nullopt;
        } else {
            valueArg = arg;
        }
    }

    if (options.version) {
        return options;
    }
    if (!valueArg) {
        fprintf(stderr, "Missing register value\n");
        return std::nullopt;
    }

    auto value = ParseNumber(*valueArg);
    if (!value) {
        fprintf(stderr, "Invalid number: %.*s\n", static_cast<int>(valueArg->size()), valueArg->data());
        return std::nullopt;
    }
    options.value = *value;
    return options;
}

void PrintUsage(const char *program) {
    fprintf(stderr, "Usage:\n");
    fprintf(stderr, "  %s [-v|--verbose] <ESR value>\n", program);
    fprintf(stderr, "  %s [-v|--verbose] --midr <MIDR value>\n", program);
    fprintf(stderr, "  %s [-v|--verbose] --smccc <SMCCC function ID>\n", program);
    fprintf(stderr, "  %s --version\n", program);
}

} // namespace esrdecoder::cli
