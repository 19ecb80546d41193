#include <esrdecoder/sysreg.hpp>

#include <gtest/gtest.h>

using namespace esrdecoder;

TEST(SystemRegisterName, KnownRegisters) {
    EXPECT_EQ(SystemRegisterName(3, 0, 0, 0, 0), "MIDR_EL1");
    EXPECT_EQ(SystemRegisterName(3, 0, 1, 0, 0), "SCTLR_EL1");
    EXPECT_EQ(SystemRegisterName(3, 0, 4, 2, 2), "CurrentEL");
    EXPECT_EQ(SystemRegisterName(3, 3, 4, 2, 0), "NZCV");
    EXPECT_EQ(SystemRegisterName(3, 4, 1, 1, 0), "HCR_EL2");
    EXPECT_EQ(SystemRegisterName(3, 5, 1, 0, 0), "SCTLR_EL12");
    EXPECT_EQ(SystemRegisterName(3, 6, 1, 1, 0), "SCR_EL3");
    EXPECT_EQ(SystemRegisterName(3, 0, 12, 12, 0), "ICC_IAR1_EL1");
    EXPECT_EQ(SystemRegisterName(3, 3, 14, 0, 2), "CNTVCT_EL0");
    EXPECT_EQ(SystemRegisterName(2, 3, 0, 4, 0), "DBGDTR_EL0");
    EXPECT_EQ(SystemRegisterName(2, 0, 1, 0, 4), "OSLAR_EL1");
}

TEST(SystemRegisterName, DebugBreakpointsAndWatchpoints) {
    EXPECT_EQ(SystemRegisterName(2, 0, 0, 0, 4), "DBGBVR0_EL1");
    EXPECT_EQ(SystemRegisterName(2, 0, 0, 5, 5), "DBGBCR5_EL1");
    EXPECT_EQ(SystemRegisterName(2, 0, 0, 10, 6), "DBGWVR10_EL1");
    EXPECT_EQ(SystemRegisterName(2, 0, 0, 15, 7), "DBGWCR15_EL1");

    // Op2 = 2 in the same space is not banked
    EXPECT_EQ(SystemRegisterName(2, 0, 0, 2, 2), "MDSCR_EL1");
}

TEST(SystemRegisterName, PerformanceMonitorEventCounters) {
    EXPECT_EQ(SystemRegisterName(3, 3, 14, 8, 0), "PMEVCNTR0_EL0");
    EXPECT_EQ(SystemRegisterName(3, 3, 14, 9, 3), "PMEVCNTR11_EL0");
    EXPECT_EQ(SystemRegisterName(3, 3, 14, 11, 6), "PMEVCNTR30_EL0");
    EXPECT_EQ(SystemRegisterName(3, 3, 14, 12, 0), "PMEVTYPER0_EL0");
    EXPECT_EQ(SystemRegisterName(3, 3, 14, 15, 6), "PMEVTYPER30_EL0");
    EXPECT_EQ(SystemRegisterName(3, 3, 14, 15, 7), "PMCCFILTR_EL0");
    EXPECT_EQ(SystemRegisterName(3, 3, 14, 11, 7), "unknown");
}

TEST(SystemRegisterName, Unknown) {
    EXPECT_EQ(SystemRegisterName(3, 7, 15, 15, 7), "unknown");
    EXPECT_EQ(SystemRegisterName(1, 0, 0, 0, 0), "unknown");
    EXPECT_EQ(SystemRegisterName(0, 0, 0, 0, 0), "unknown");
}
