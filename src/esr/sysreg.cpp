#include "esrdecoder/sysreg.hpp"

#include <algorithm>
#include <iterator>
#include <string>

namespace esrdecoder {

namespace {

    struct SystemRegister {
        uint8_t op0;
        uint8_t op1;
        uint8_t crn;
        uint8_t crm;
        uint8_t op2;
        const char *name;
    };

    // AArch64 system registers accessible with MSR/MRS, ordered by encoding.
    // Registers numbered in banks (debug breakpoints/watchpoints, PMU event counters) are resolved separately.
    constexpr SystemRegister kSystemRegisters[] = {
        // op0 = 2: debug and trace registers
        {2, 0, 0, 0, 2, "OSDTRRX_EL1"},
        {2, 0, 0, 2, 0, "MDCCINT_EL1"},
        {2, 0, 0, 2, 2, "MDSCR_EL1"},
        {2, 0, 0, 3, 2, "OSDTRTX_EL1"},
        {2, 0, 0, 6, 2, "OSECCR_EL1"},
        {2, 0, 1, 0, 0, "MDRAR_EL1"},
        {2, 0, 1, 0, 4, "OSLAR_EL1"},
        {2, 0, 1, 1, 4, "OSLSR_EL1"},
        {2, 0, 1, 3, 4, "OSDLR_EL1"},
        {2, 0, 1, 4, 4, "DBGPRCR_EL1"},
        {2, 0, 7, 8, 6, "DBGCLAIMSET_EL1"},
        {2, 0, 7, 9, 6, "DBGCLAIMCLR_EL1"},
        {2, 0, 7, 14, 6, "DBGAUTHSTATUS_EL1"},
        {2, 3, 0, 1, 0, "MDCCSR_EL0"},
        {2, 3, 0, 4, 0, "DBGDTR_EL0"},
        {2, 3, 0, 5, 0, "DBGDTRRX_EL0"},
        {2, 4, 0, 7, 0, "DBGVCR32_EL2"},

        // op0 = 3, op1 = 0: EL1 registers
        {3, 0, 0, 0, 0, "MIDR_EL1"},
        {3, 0, 0, 0, 5, "MPIDR_EL1"},
        {3, 0, 0, 0, 6, "REVIDR_EL1"},
        {3, 0, 0, 1, 0, "ID_PFR0_EL1"},
        {3, 0, 0, 1, 1, "ID_PFR1_EL1"},
        {3, 0, 0, 1, 2, "ID_DFR0_EL1"},
        {3, 0, 0, 1, 3, "ID_AFR0_EL1"},
        {3, 0, 0, 1, 4, "ID_MMFR0_EL1"},
        {3, 0, 0, 1, 5, "ID_MMFR1_EL1"},
        {3, 0, 0, 1, 6, "ID_MMFR2_EL1"},
        {3, 0, 0, 1, 7, "ID_MMFR3_EL1"},
        {3, 0, 0, 2, 0, "ID_ISAR0_EL1"},
        {3, 0, 0, 2, 1, "ID_ISAR1_EL1"},
        {3, 0, 0, 2, 2, "ID_ISAR2_EL1"},
        {3, 0, 0, 2, 3, "ID_ISAR3_EL1"},
        {3, 0, 0, 2, 4, "ID_ISAR4_EL1"},
        {3, 0, 0, 2, 5, "ID_ISAR5_EL1"},
        {3, 0, 0, 2, 6, "ID_MMFR4_EL1"},
        {3, 0, 0, 2, 7, "ID_ISAR6_EL1"},
        {3, 0, 0, 3, 0, "MVFR0_EL1"},
        {3, 0, 0, 3, 1, "MVFR1_EL1"},
        {3, 0, 0, 3, 2, "MVFR2_EL1"},
        {3, 0, 0, 3, 4, "ID_PFR2_EL1"},
        {3, 0, 0, 3, 5, "ID_DFR1_EL1"},
        {3, 0, 0, 3, 6, "ID_MMFR5_EL1"},
        {3, 0, 0, 4, 0, "ID_AA64PFR0_EL1"},
        {3, 0, 0, 4, 1, "ID_AA64PFR1_EL1"},
        {3, 0, 0, 4, 4, "ID_AA64ZFR0_EL1"},
        {3, 0, 0, 4, 5, "ID_AA64SMFR0_EL1"},
        {3, 0, 0, 5, 0, "ID_AA64DFR0_EL1"},
        {3, 0, 0, 5, 1, "ID_AA64DFR1_EL1"},
        {3, 0, 0, 5, 4, "ID_AA64AFR0_EL1"},
        {3, 0, 0, 5, 5, "ID_AA64AFR1_EL1"},
        {3, 0, 0, 6, 0, "ID_AA64ISAR0_EL1"},
        {3, 0, 0, 6, 1, "ID_AA64ISAR1_EL1"},
        {3, 0, 0, 6, 2, "ID_AA64ISAR2_EL1"},
        {3, 0, 0, 7, 0, "ID_AA64MMFR0_EL1"},
        {3, 0, 0, 7, 1, "ID_AA64MMFR1_EL1"},
        {3, 0, 0, 7, 2, "ID_AA64MMFR2_EL1"},
        {3, 0, 1, 0, 0, "SCTLR_EL1"},
        {3, 0, 1, 0, 1, "ACTLR_EL1"},
        {3, 0, 1, 0, 2, "CPACR_EL1"},
        {3, 0, 1, 0, 5, "RGSR_EL1"},
        {3, 0, 1, 0, 6, "GCR_EL1"},
        {3, 0, 1, 2, 0, "ZCR_EL1"},
        {3, 0, 1, 2, 1, "TRFCR_EL1"},
        {3, 0, 1, 2, 4, "SMPRI_EL1"},
        {3, 0, 1, 2, 6, "SMCR_EL1"},
        {3, 0, 2, 0, 0, "TTBR0_EL1"},
        {3, 0, 2, 0, 1, "TTBR1_EL1"},
        {3, 0, 2, 0, 2, "TCR_EL1"},
        {3, 0, 2, 1, 0, "APIAKeyLo_EL1"},
        {3, 0, 2, 1, 1, "APIAKeyHi_EL1"},
        {3, 0, 2, 1, 2, "APIBKeyLo_EL1"},
        {3, 0, 2, 1, 3, "APIBKeyHi_EL1"},
        {3, 0, 2, 2, 0, "APDAKeyLo_EL1"},
        {3, 0, 2, 2, 1, "APDAKeyHi_EL1"},
        {3, 0, 2, 2, 2, "APDBKeyLo_EL1"},
        {3, 0, 2, 2, 3, "APDBKeyHi_EL1"},
        {3, 0, 2, 3, 0, "APGAKeyLo_EL1"},
        {3, 0, 2, 3, 1, "APGAKeyHi_EL1"},
        {3, 0, 4, 0, 0, "SPSR_EL1"},
        {3, 0, 4, 0, 1, "ELR_EL1"},
        {3, 0, 4, 1, 0, "SP_EL0"},
        {3, 0, 4, 2, 0, "SPSel"},
        {3, 0, 4, 2, 2, "CurrentEL"},
        {3, 0, 4, 2, 3, "PAN"},
        {3, 0, 4, 2, 4, "UAO"},
        {3, 0, 4, 6, 0, "ICC_PMR_EL1"},
        {3, 0, 5, 1, 0, "AFSR0_EL1"},
        {3, 0, 5, 1, 1, "AFSR1_EL1"},
        {3, 0, 5, 2, 0, "ESR_EL1"},
        {3, 0, 5, 3, 0, "ERRIDR_EL1"},
        {3, 0, 5, 3, 1, "ERRSELR_EL1"},
        {3, 0, 5, 6, 0, "TFSR_EL1"},
        {3, 0, 5, 6, 1, "TFSRE0_EL1"},
        {3, 0, 6, 0, 0, "FAR_EL1"},
        {3, 0, 7, 4, 0, "PAR_EL1"},
        {3, 0, 9, 14, 1, "PMINTENSET_EL1"},
        {3, 0, 9, 14, 2, "PMINTENCLR_EL1"},
        {3, 0, 10, 2, 0, "MAIR_EL1"},
        {3, 0, 10, 3, 0, "AMAIR_EL1"},
        {3, 0, 12, 0, 0, "VBAR_EL1"},
        {3, 0, 12, 1, 0, "ISR_EL1"},
        {3, 0, 12, 8, 0, "ICC_IAR0_EL1"},
        {3, 0, 12, 8, 1, "ICC_EOIR0_EL1"},
        {3, 0, 12, 8, 2, "ICC_HPPIR0_EL1"},
        {3, 0, 12, 8, 3, "ICC_BPR0_EL1"},
        {3, 0, 12, 11, 1, "ICC_DIR_EL1"},
        {3, 0, 12, 11, 3, "ICC_RPR_EL1"},
        {3, 0, 12, 11, 5, "ICC_SGI1R_EL1"},
        {3, 0, 12, 11, 6, "ICC_ASGI1R_EL1"},
        {3, 0, 12, 11, 7, "ICC_SGI0R_EL1"},
        {3, 0, 12, 12, 0, "ICC_IAR1_EL1"},
        {3, 0, 12, 12, 1, "ICC_EOIR1_EL1"},
        {3, 0, 12, 12, 2, "ICC_HPPIR1_EL1"},
        {3, 0, 12, 12, 3, "ICC_BPR1_EL1"},
        {3, 0, 12, 12, 4, "ICC_CTLR_EL1"},
        {3, 0, 12, 12, 5, "ICC_SRE_EL1"},
        {3, 0, 12, 12, 6, "ICC_IGRPEN0_EL1"},
        {3, 0, 12, 12, 7, "ICC_IGRPEN1_EL1"},
        {3, 0, 13, 0, 1, "CONTEXTIDR_EL1"},
        {3, 0, 13, 0, 4, "TPIDR_EL1"},
        {3, 0, 13, 0, 7, "SCXTNUM_EL1"},
        {3, 0, 14, 1, 0, "CNTKCTL_EL1"},

        // op0 = 3, op1 = 1..3: cache identification and EL0 registers
        {3, 1, 0, 0, 0, "CCSIDR_EL1"},
        {3, 1, 0, 0, 1, "CLIDR_EL1"},
        {3, 1, 0, 0, 2, "CCSIDR2_EL1"},
        {3, 1, 0, 0, 4, "GMID_EL1"},
        {3, 1, 0, 0, 7, "AIDR_EL1"},
        {3, 2, 0, 0, 0, "CSSELR_EL1"},
        {3, 3, 0, 0, 1, "CTR_EL0"},
        {3, 3, 0, 0, 7, "DCZID_EL0"},
        {3, 3, 2, 4, 0, "RNDR"},
        {3, 3, 2, 4, 1, "RNDRRS"},
        {3, 3, 4, 2, 0, "NZCV"},
        {3, 3, 4, 2, 1, "DAIF"},
        {3, 3, 4, 2, 2, "SVCR"},
        {3, 3, 4, 2, 5, "DIT"},
        {3, 3, 4, 2, 6, "SSBS"},
        {3, 3, 4, 2, 7, "TCO"},
        {3, 3, 4, 4, 0, "FPCR"},
        {3, 3, 4, 4, 1, "FPSR"},
        {3, 3, 4, 5, 0, "DSPSR_EL0"},
        {3, 3, 4, 5, 1, "DLR_EL0"},
        {3, 3, 9, 12, 0, "PMCR_EL0"},
        {3, 3, 9, 12, 1, "PMCNTENSET_EL0"},
        {3, 3, 9, 12, 2, "PMCNTENCLR_EL0"},
        {3, 3, 9, 12, 3, "PMOVSCLR_EL0"},
        {3, 3, 9, 12, 4, "PMSWINC_EL0"},
        {3, 3, 9, 12, 5, "PMSELR_EL0"},
        {3, 3, 9, 12, 6, "PMCEID0_EL0"},
        {3, 3, 9, 12, 7, "PMCEID1_EL0"},
        {3, 3, 9, 13, 0, "PMCCNTR_EL0"},
        {3, 3, 9, 13, 1, "PMXEVTYPER_EL0"},
        {3, 3, 9, 13, 2, "PMXEVCNTR_EL0"},
        {3, 3, 9, 14, 0, "PMUSERENR_EL0"},
        {3, 3, 9, 14, 3, "PMOVSSET_EL0"},
        {3, 3, 13, 0, 2, "TPIDR_EL0"},
        {3, 3, 13, 0, 3, "TPIDRRO_EL0"},
        {3, 3, 13, 0, 5, "TPIDR2_EL0"},
        {3, 3, 13, 0, 7, "SCXTNUM_EL0"},
        {3, 3, 14, 0, 0, "CNTFRQ_EL0"},
        {3, 3, 14, 0, 1, "CNTPCT_EL0"},
        {3, 3, 14, 0, 2, "CNTVCT_EL0"},
        {3, 3, 14, 0, 5, "CNTPCTSS_EL0"},
        {3, 3, 14, 0, 6, "CNTVCTSS_EL0"},
        {3, 3, 14, 2, 0, "CNTP_TVAL_EL0"},
        {3, 3, 14, 2, 1, "CNTP_CTL_EL0"},
        {3, 3, 14, 2, 2, "CNTP_CVAL_EL0"},
        {3, 3, 14, 3, 0, "CNTV_TVAL_EL0"},
        {3, 3, 14, 3, 1, "CNTV_CTL_EL0"},
        {3, 3, 14, 3, 2, "CNTV_CVAL_EL0"},
        {3, 3, 14, 15, 7, "PMCCFILTR_EL0"},

        // op0 = 3, op1 = 4: EL2 registers
        {3, 4, 0, 0, 0, "VPIDR_EL2"},
        {3, 4, 0, 0, 5, "VMPIDR_EL2"},
        {3, 4, 1, 0, 0, "SCTLR_EL2"},
        {3, 4, 1, 0, 1, "ACTLR_EL2"},
        {3, 4, 1, 1, 0, "HCR_EL2"},
        {3, 4, 1, 1, 1, "MDCR_EL2"},
        {3, 4, 1, 1, 2, "CPTR_EL2"},
        {3, 4, 1, 1, 3, "HSTR_EL2"},
        {3, 4, 1, 1, 4, "HFGRTR_EL2"},
        {3, 4, 1, 1, 5, "HFGWTR_EL2"},
        {3, 4, 1, 1, 6, "HFGITR_EL2"},
        {3, 4, 1, 1, 7, "HACR_EL2"},
        {3, 4, 1, 2, 0, "ZCR_EL2"},
        {3, 4, 1, 2, 1, "TRFCR_EL2"},
        {3, 4, 1, 2, 2, "HCRX_EL2"},
        {3, 4, 1, 3, 1, "SDER32_EL2"},
        {3, 4, 2, 0, 0, "TTBR0_EL2"},
        {3, 4, 2, 0, 1, "TTBR1_EL2"},
        {3, 4, 2, 0, 2, "TCR_EL2"},
        {3, 4, 2, 1, 0, "VTTBR_EL2"},
        {3, 4, 2, 1, 2, "VTCR_EL2"},
        {3, 4, 2, 2, 0, "VNCR_EL2"},
        {3, 4, 2, 6, 0, "VSTTBR_EL2"},
        {3, 4, 2, 6, 2, "VSTCR_EL2"},
        {3, 4, 3, 0, 0, "DACR32_EL2"},
        {3, 4, 3, 1, 4, "HDFGRTR_EL2"},
        {3, 4, 3, 1, 5, "HDFGWTR_EL2"},
        {3, 4, 4, 0, 0, "SPSR_EL2"},
        {3, 4, 4, 0, 1, "ELR_EL2"},
        {3, 4, 4, 1, 0, "SP_EL1"},
        {3, 4, 4, 3, 0, "SPSR_irq"},
        {3, 4, 4, 3, 1, "SPSR_abt"},
        {3, 4, 4, 3, 2, "SPSR_und"},
        {3, 4, 4, 3, 3, "SPSR_fiq"},
        {3, 4, 5, 0, 1, "IFSR32_EL2"},
        {3, 4, 5, 1, 0, "AFSR0_EL2"},
        {3, 4, 5, 1, 1, "AFSR1_EL2"},
        {3, 4, 5, 2, 0, "ESR_EL2"},
        {3, 4, 5, 2, 3, "VSESR_EL2"},
        {3, 4, 5, 3, 0, "FPEXC32_EL2"},
        {3, 4, 5, 6, 0, "TFSR_EL2"},
        {3, 4, 6, 0, 0, "FAR_EL2"},
        {3, 4, 6, 0, 4, "HPFAR_EL2"},
        {3, 4, 10, 2, 0, "MAIR_EL2"},
        {3, 4, 10, 3, 0, "AMAIR_EL2"},
        {3, 4, 12, 0, 0, "VBAR_EL2"},
        {3, 4, 12, 0, 1, "RVBAR_EL2"},
        {3, 4, 12, 0, 2, "RMR_EL2"},
        {3, 4, 12, 1, 1, "VDISR_EL2"},
        {3, 4, 12, 11, 0, "ICH_HCR_EL2"},
        {3, 4, 12, 11, 1, "ICH_VTR_EL2"},
        {3, 4, 12, 11, 2, "ICH_MISR_EL2"},
        {3, 4, 12, 11, 3, "ICH_EISR_EL2"},
        {3, 4, 12, 11, 5, "ICH_ELRSR_EL2"},
        {3, 4, 12, 11, 7, "ICH_VMCR_EL2"},
        {3, 4, 13, 0, 1, "CONTEXTIDR_EL2"},
        {3, 4, 13, 0, 2, "TPIDR_EL2"},
        {3, 4, 13, 0, 7, "SCXTNUM_EL2"},
        {3, 4, 14, 0, 3, "CNTVOFF_EL2"},
        {3, 4, 14, 0, 6, "CNTPOFF_EL2"},
        {3, 4, 14, 1, 0, "CNTHCTL_EL2"},
        {3, 4, 14, 2, 0, "CNTHP_TVAL_EL2"},
        {3, 4, 14, 2, 1, "CNTHP_CTL_EL2"},
        {3, 4, 14, 2, 2, "CNTHP_CVAL_EL2"},
        {3, 4, 14, 3, 0, "CNTHV_TVAL_EL2"},
        {3, 4, 14, 3, 1, "CNTHV_CTL_EL2"},
        {3, 4, 14, 3, 2, "CNTHV_CVAL_EL2"},

        // op0 = 3, op1 = 5: EL1 and EL0 registers accessed from EL2 with HCR_EL2.E2H set
        {3, 5, 1, 0, 0, "SCTLR_EL12"},
        {3, 5, 1, 0, 2, "CPACR_EL12"},
        {3, 5, 1, 2, 0, "ZCR_EL12"},
        {3, 5, 2, 0, 0, "TTBR0_EL12"},
        {3, 5, 2, 0, 1, "TTBR1_EL12"},
        {3, 5, 2, 0, 2, "TCR_EL12"},
        {3, 5, 4, 0, 0, "SPSR_EL12"},
        {3, 5, 4, 0, 1, "ELR_EL12"},
        {3, 5, 5, 1, 0, "AFSR0_EL12"},
        {3, 5, 5, 1, 1, "AFSR1_EL12"},
        {3, 5, 5, 2, 0, "ESR_EL12"},
        {3, 5, 6, 0, 0, "FAR_EL12"},
        {3, 5, 10, 2, 0, "MAIR_EL12"},
        {3, 5, 10, 3, 0, "AMAIR_EL12"},
        {3, 5, 12, 0, 0, "VBAR_EL12"},
        {3, 5, 13, 0, 1, "CONTEXTIDR_EL12"},
        {3, 5, 14, 1, 0, "CNTKCTL_EL12"},
        {3, 5, 14, 2, 0, "CNTP_TVAL_EL02"},
        {3, 5, 14, 2, 1, "CNTP_CTL_EL02"},
        {3, 5, 14, 2, 2, "CNTP_CVAL_EL02"},
        {3, 5, 14, 3, 0, "CNTV_TVAL_EL02"},
        {3, 5, 14, 3, 1, "CNTV_CTL_EL02"},
        {3, 5, 14, 3, 2, "CNTV_CVAL_EL02"},

        // op0 = 3, op1 = 6: EL3 registers
        {3, 6, 1, 0, 0, "SCTLR_EL3"},
        {3, 6, 1, 0, 1, "ACTLR_EL3"},
        {3, 6, 1, 1, 0, "SCR_EL3"},
        {3, 6, 1, 1, 1, "SDER32_EL3"},
        {3, 6, 1, 1, 2, "CPTR_EL3"},
        {3, 6, 1, 2, 0, "ZCR_EL3"},
        {3, 6, 1, 3, 1, "MDCR_EL3"},
        {3, 6, 2, 0, 0, "TTBR0_EL3"},
        {3, 6, 2, 0, 2, "TCR_EL3"},
        {3, 6, 4, 0, 0, "SPSR_EL3"},
        {3, 6, 4, 0, 1, "ELR_EL3"},
        {3, 6, 4, 1, 0, "SP_EL2"},
        {3, 6, 5, 1, 0, "AFSR0_EL3"},
        {3, 6, 5, 1, 1, "AFSR1_EL3"},
        {3, 6, 5, 2, 0, "ESR_EL3"},
        {3, 6, 6, 0, 0, "FAR_EL3"},
        {3, 6, 10, 2, 0, "MAIR_EL3"},
        {3, 6, 10, 3, 0, "AMAIR_EL3"},
        {3, 6, 12, 0, 0, "VBAR_EL3"},
        {3, 6, 12, 0, 1, "RVBAR_EL3"},
        {3, 6, 12, 0, 2, "RMR_EL3"},
        {3, 6, 12, 12, 4, "ICC_CTLR_EL3"},
        {3, 6, 12, 12, 5, "ICC_SRE_EL3"},
        {3, 6, 12, 12, 7, "ICC_IGRPEN1_EL3"},
        {3, 6, 13, 0, 2, "TPIDR_EL3"},

        // op0 = 3, op1 = 7: secure physical timer
        {3, 7, 14, 2, 0, "CNTPS_TVAL_EL1"},
        {3, 7, 14, 2, 1, "CNTPS_CTL_EL1"},
        {3, 7, 14, 2, 2, "CNTPS_CVAL_EL1"},
    };

    std::string BankedName(const char *prefix, uint64_t index, const char *suffix) {
        return prefix + std::to_string(index) + suffix;
    }

} // namespace

std::string SystemRegisterName(uint64_t op0, uint64_t op1, uint64_t crn, uint64_t crm, uint64_t op2) {
    // Breakpoint and watchpoint registers: DBG{B,W}{V,C}R<n>_EL1 = 2,0,C0,C<n>,{4,5,6,7}
    if (op0 == 2 && op1 == 0 && crn == 0 && op2 >= 4 && op2 <= 7) {
        static constexpr const char *prefixes[] = {"DBGBVR", "DBGBCR", "DBGWVR", "DBGWCR"};
        return BankedName(prefixes[op2 - 4], crm, "_EL1");
    }

    // PMU event counters: PMEVCNTR<n>_EL0 = 3,3,C14,C{8..11},<n % 8>
    //                     PMEVTYPER<n>_EL0 = 3,3,C14,C{12..15},<n % 8>
    // n = 31 in the last slot is PMCCFILTR_EL0, which is in the main table.
    if (op0 == 3 && op1 == 3 && crn == 14 && crm >= 8) {
        const uint64_t index = (crm & 3) * 8 + op2;
        if (index < 31) {
            return BankedName((crm < 12) ? "PMEVCNTR" : "PMEVTYPER", index, "_EL0");
        }
    }

    auto it = std::find_if(std::begin(kSystemRegisters), std::end(kSystemRegisters), [&](const SystemRegister &reg) {
        return reg.op0 == op0 && reg.op1 == op1 && reg.crn == crn && reg.crm == crm && reg.op2 == op2;
    });
    if (it == std::end(kSystemRegisters)) {
        return "unknown";
    }
    return it->name;
}

} // namespace esrdecoder
