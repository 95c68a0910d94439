#pragma once

// Fixed limits of the Si5351A (AN619 register model), frequencies in MHz
namespace synth {
    struct StageLimits {
        int minInt;
        int maxInt;
        int maxDenom;
    };

    const double REF_FREQ           = 25.0;
    const double VCO_MIN            = 600.0;
    const double VCO_MAX            = 900.0;
    const double OUT_MIN            = 0.004;
    const double OUT_MAX            = 200.0;
    const double DIVBY4_THRESHOLD   = 150.0;

    // Relative error a configuration must stay under to count as exact
    const double TOLERANCE          = 1e-6;

    // Errors closer than this are considered equal when ranking candidates
    const double ERROR_EPSILON      = 1e-12;

    const int FIELD_MAX_DENOM       = 1048575;  // 20 bit P3

    const StageLimits PLL_LIMITS    = { 15, 90, FIELD_MAX_DENOM };
    const StageLimits MS_LIMITS     = { 8, 2048, FIELD_MAX_DENOM };

    // Integer-only multisynth ratios below the fractional range
    const int MS_INT_DIVIDER        = 6;
    const int MS_DIVBY4_DIVIDER     = 4;

    const int R_DIV_MAX             = 128;

    // Spread spectrum
    const double SSC_MOD_RATE       = 31500.0;  // Hz
    const int SSC_P1_MAX            = 4095;     // 12 bits
    const int SSC_P2_MAX            = 32767;    // 15 bits
    const int SSC_UDP_MAX           = 4095;     // 12 bits
    const double SSC_DOWN_AMP_MIN   = 0.001;
    const double SSC_DOWN_AMP_MAX   = 0.025;
    const double SSC_CENTER_AMP_MIN = 0.002;
    const double SSC_CENTER_AMP_MAX = 0.030;
}
