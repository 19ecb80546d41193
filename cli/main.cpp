#include <esrdecoder/esrdecoder.hpp>

#include <cinttypes>
#include <cstdio>

#include "options.hpp"
#include "printer.hpp"

using namespace esrdecoder;

int main(int argc, char *argv[]) {
    auto options = cli::ParseOptions(argc, argv);
    if (!options) {
        cli::PrintUsage(argv[0]);
        return 1;
    }
    if (options->version) {
        printf("esr-decoder %s\n", version::name);
        return 0;
    }

    const char *regName = nullptr;
    Result<std::vector<FieldInfo>> decoded = [&]() -> Result<std::vector<FieldInfo>> {
        switch (options->reg) {
        case cli::Options::Register::MIDR: regName = "MIDR"; return DecodeMIDR(options->value);
        case cli::Options::Register::SMCCC: regName = "SMCCC"; return DecodeSMCCC(options->value);
        default: regName = "ESR"; return Decode(options->value);
        }
    }();
    if (!decoded) {
        fprintf(stderr, "%s\n", decoded.Error().ToString().c_str());
        return 1;
    }

    printf("%s 0x%016" PRIx64 ":\n", regName, options->value);
    cli::PrintFields(decoded.Value(), options->verbose);
    return 0;
}
