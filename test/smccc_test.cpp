#include <esrdecoder/smccc.hpp>

#include <gtest/gtest.h>

using namespace esrdecoder;

namespace {

// Indices of the fast call fields
constexpr size_t kCallType = 0;
constexpr size_t kCallConvention = 1;
constexpr size_t kServiceCall = 2;
constexpr size_t kMBZ = 3;
constexpr size_t kSVE = 4;
constexpr size_t kFunctionNumber = 5;

std::vector<FieldInfo> DecodeOk(uint64_t smccc) {
    auto result = DecodeSMCCC(smccc);
    EXPECT_TRUE(result.IsOk());
    if (!result) {
        return {};
    }
    return std::move(result).Value();
}

// Returns the description of the function number of a fast call
std::string FunctionName(uint64_t smccc) {
    auto fields = DecodeOk(smccc);
    EXPECT_EQ(fields.size(), 6);
    if (fields.size() != 6 || !fields[kFunctionNumber].description) {
        return "<none>";
    }
    return *fields[kFunctionNumber].description;
}

} // namespace

TEST(DecodeSMCCC, FastCallLayout) {
    // PSCI_VERSION
    auto fields = DecodeOk(0x84000000);
    ASSERT_EQ(fields.size(), 6);
    EXPECT_EQ(fields[kCallType].name, "Call Type");
    EXPECT_EQ(fields[kCallType].description, "Fast Call");
    EXPECT_EQ(fields[kCallConvention].name, "Call Convention");
    EXPECT_EQ(fields[kCallConvention].description, "SMC32/HVC32");
    EXPECT_EQ(fields[kServiceCall].name, "Service Call");
    EXPECT_EQ(fields[kServiceCall].value, 4);
    EXPECT_EQ(fields[kServiceCall].description, "Standard Secure Service Call");
    EXPECT_EQ(fields[kMBZ].name, "MBZ");
    EXPECT_EQ(fields[kSVE].name, "SVE live state");
    EXPECT_EQ(fields[kFunctionNumber].name, "Function Number");
    EXPECT_EQ(fields[kFunctionNumber].description, "PSCI Call (Power Secure Control Interface)");
}

TEST(DecodeSMCCC, MBZAndSVELiveState) {
    auto fields = DecodeOk(0x84FF0000);
    ASSERT_EQ(fields.size(), 6);
    EXPECT_EQ(fields[kMBZ].value, 0x7F);
    EXPECT_TRUE(fields[kSVE].AsBit());
}

TEST(DecodeSMCCC, ServiceCalls) {
    auto service = [](uint64_t smccc) { return *DecodeOk(smccc)[kServiceCall].description; };
    EXPECT_EQ(service(0x80000000), "Arm Architecture Call");
    EXPECT_EQ(service(0x81000000), "CPU Service Call");
    EXPECT_EQ(service(0x82000000), "SiP Service Call");
    EXPECT_EQ(service(0x83000000), "OEM Service Call");
    EXPECT_EQ(service(0x85000000), "Standard Hypervisor Service Call");
    EXPECT_EQ(service(0x86000000), "Vendor Specific Hypervisor Service Call");
    EXPECT_EQ(service(0x87000000), "Reserved for future use");
    EXPECT_EQ(service(0xAF000000), "Reserved for future use");
    EXPECT_EQ(service(0xB0000000), "Trusted Application Call");
    EXPECT_EQ(service(0xB1000000), "Trusted Application Call");
    EXPECT_EQ(service(0xB2000000), "Trusted OS Call");
    EXPECT_EQ(service(0xBF000000), "Trusted OS Call");
}

TEST(DecodeSMCCC, ArmArchitectureCalls) {
    EXPECT_EQ(FunctionName(0x80000000), "SMCCC_VERSION");
    EXPECT_EQ(FunctionName(0x80000001), "SMCCC_ARCH_FEATURES");
    EXPECT_EQ(FunctionName(0x80000002), "SMCCC_ARCH_SOC_ID");
    EXPECT_EQ(FunctionName(0x80003FFF), "SMCCC_ARCH_WORKAROUND_3");
    EXPECT_EQ(FunctionName(0x80007FFF), "SMCCC_ARCH_WORKAROUND_2");
    EXPECT_EQ(FunctionName(0x80008000), "SMCCC_ARCH_WORKAROUND_1");
    EXPECT_EQ(FunctionName(0x8000FF01), "Call UUID Query, deprecated from SMCCCv1.2");
    EXPECT_EQ(FunctionName(0x8000FF10), "Reserved for future expansion");
    EXPECT_EQ(FunctionName(0x80000010), "");

    // 64-bit calls only have the reserved range
    EXPECT_EQ(FunctionName(0xC0000000), "");
    EXPECT_EQ(FunctionName(0xC000FF00), "Reserved for future expansion");
}

TEST(DecodeSMCCC, SecureServiceCalls) {
    EXPECT_EQ(FunctionName(0x84000063), "FFA_VERSION_32");
    EXPECT_EQ(FunctionName(0x84000078), "FFA_MEM_OP_PAUSE");
    EXPECT_EQ(FunctionName(0xC4000066), "FFA_RXTX_MAP_64");
    EXPECT_EQ(FunctionName(0xC4000063), "Unknown FF-A Call");
    EXPECT_EQ(FunctionName(0x84000020), "SDEI Call (Software Delegated Exception Interface)");
    EXPECT_EQ(FunctionName(0x84000040), "MM Call (Management Mode)");
    EXPECT_EQ(FunctionName(0x84000050), "TRNG Call");
    EXPECT_EQ(FunctionName(0x840000F0), "Errata Call");
    EXPECT_EQ(FunctionName(0x84000110), "");
    EXPECT_EQ(FunctionName(0xC4000150), "CCA Call");
    EXPECT_EQ(FunctionName(0x8400FF01), "Call UUID Query");

    // General queries are only defined for 32-bit calls
    EXPECT_EQ(FunctionName(0xC400FF01), "");
}

TEST(DecodeSMCCC, HypervisorServiceCalls) {
    EXPECT_EQ(FunctionName(0xC5000020), "PV Time 64-bit calls");
    EXPECT_EQ(FunctionName(0xC500003F), "PV Time 64-bit calls");
    EXPECT_EQ(FunctionName(0xC5000040), "");
    EXPECT_EQ(FunctionName(0x8500FF00), "Call Count Query, deprecated from SMCCCv1.2");
    EXPECT_EQ(FunctionName(0x85000020), "");
}

TEST(DecodeSMCCC, OtherServiceCalls) {
    EXPECT_EQ(FunctionName(0xB000FF03), "Revision Query");
    EXPECT_EQ(FunctionName(0xF000FF03), "Reserved for future expansion");
    EXPECT_EQ(FunctionName(0x8200FF01), "Call UUID Query");
    EXPECT_EQ(FunctionName(0xC2000001), "");
}

TEST(DecodeSMCCC, YieldingCalls) {
    auto fields = DecodeOk(0x02000001);
    ASSERT_EQ(fields.size(), 2);
    EXPECT_EQ(fields[0].description, "Yielding Call");
    EXPECT_EQ(fields[1].name, "Service Type");
    EXPECT_EQ(fields[1].width, 31);
    EXPECT_EQ(fields[1].description, "Trusted OS Yielding Calls");

    EXPECT_EQ(DecodeOk(0x0100FFFF)[1].description,
              "Reserved for existing APIs (in use by the existing Armv7 devices)");
    EXPECT_EQ(DecodeOk(0x01010000)[1].description, "Unknown");
    EXPECT_EQ(DecodeOk(0x7FFFFFFF)[1].description, "Reserved for future expansion of Trusted OS Yielding Calls");
}
