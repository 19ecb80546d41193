#include "esrdecoder/midr.hpp"

namespace esrdecoder {

namespace {

    const char *DescribeImplementer(uint64_t implementer) {
        switch (implementer) {
        case 0x00: return "Reserved for software use";
        case 0x41: return "Arm Limited";
        case 0x42: return "Broadcom Corporation";
        case 0x43: return "Cavium Inc.";
        case 0x44: return "Digital Equipment Corporation";
        case 0x46: return "Fujitsu Ltd.";
        case 0x49: return "Infineon Technologies AG";
        case 0x4D: return "Motorola or Freescale Semiconductor Inc.";
        case 0x4E: return "NVIDIA Corporation";
        case 0x50: return "Applied Micro Circuits Corporation";
        case 0x51: return "Qualcomm Inc.";
        case 0x56: return "Marvell International Ltd.";
        case 0x69: return "Intel Corporation";
        case 0xC0: return "Ampere Computing";
        default: return "Unknown";
        }
    }

    const char *DescribeArchitecture(uint64_t architecture) {
        switch (architecture) {
        case 0b0001: return "Armv4";
        case 0b0010: return "Armv4T";
        case 0b0011: return "Armv5";
        case 0b0100: return "Armv5T";
        case 0b0101: return "Armv5TE";
        case 0b0110: return "Armv5TEJ";
        case 0b0111: return "Armv6";
        case 0b1111: return "Architectural features are individually identified";
        default: return "Reserved";
        }
    }

} // namespace

Result<std::vector<FieldInfo>> DecodeMIDR(uint64_t midr) {
    ESRDECODER_TRY(res0, FieldInfo::Get(midr, "RES0", "Reserved", 32, 64).CheckRes0());
    auto implementer = FieldInfo::Get(midr, "Implementer", std::nullopt, 24, 32).Describe(DescribeImplementer);
    auto variant = FieldInfo::Get(midr, "Variant", std::nullopt, 20, 24);
    auto architecture = FieldInfo::Get(midr, "Architecture", std::nullopt, 16, 20).Describe(DescribeArchitecture);
    auto partNum = FieldInfo::Get(midr, "PartNum", "Part number", 4, 16);
    auto revision = FieldInfo::Get(midr, "Revision", std::nullopt, 0, 4);

    return std::vector<FieldInfo>{res0, implementer, variant, architecture, partNum, revision};
}

} // namespace esrdecoder
