#pragma once
#include "fraction.h"
#include "multisynth.h"

namespace synth {
    struct VcoCandidate {
        double idealVco = 0.0;  // VCO the search aimed for
        double vco = 0.0;       // VCO actually produced by the PLL ratio
        Fraction pll;
        double error = 0.0;     // Relative error of vco versus idealVco
    };

    struct PllSelection {
        VcoCandidate vco;
        MultisynthPlan ms;
    };

    /**
     * Check that a frequency is one the chip can be asked for at all.
     * Throws FrequencyOutOfRange otherwise.
    */
    void checkOutputRange(double fout);

    /**
     * Turn a target VCO frequency into a PLL feedback ratio.
     * @return False if the PLL can't produce a VCO in the valid window.
    */
    bool tryMakeVcoCandidate(double idealVco, VcoCandidate& cand);

    /**
     * Search for the PLL and multisynth configuration closest to an output frequency.
     * @param fout Output frequency in MHz.
     * @return Best configuration found. Throws FrequencyOutOfRange or UnreachableFrequency.
    */
    PllSelection selectPllAndDivider(double fout);

    /**
     * Closest frequency above 150MHz that the DIVBY4 integer mode can produce.
    */
    double nearestDivBy4Frequency(double fout);
}
