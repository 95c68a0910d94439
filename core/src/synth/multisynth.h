#pragma once
#include "fraction.h"

namespace synth {
    struct MultisynthPlan {
        double target = 0.0;    // Requested output frequency
        double vco = 0.0;       // VCO frequency feeding the multisynth
        int rDiv = 1;
        Fraction divider;
        bool divBy4 = false;
        double achieved = 0.0;
        double error = 0.0;     // Signed, relative to target

        // Effective multisynth division ratio
        double ratio() const { return divBy4 ? (double)MS_DIVBY4_DIVIDER : divider.value(); }
    };

    /**
     * Pick the smallest R divider that brings the multisynth ratio back under its maximum.
     * @return R divider, or 0 if even the largest one isn't enough.
    */
    int selectRDivider(double fout, double vco);

    bool trySelectDivider(double fout, double vco, MultisynthPlan& plan);

    /**
     * Compute the multisynth and R divider producing an output frequency from a VCO frequency.
     * Outputs above 150MHz use DIVBY4 and need an exact even integer PLL multiplier.
     * @param fout Output frequency in MHz.
     * @param vco VCO frequency in MHz.
     * @return Plan with the achieved frequency and error. Throws DividerUnreachable on failure.
    */
    MultisynthPlan selectDivider(double fout, double vco);
}
