#pragma once
#include "limits.h"

namespace synth {
    /**
     * Divider ratio in the a + b/c form used by the PLL and multisynth registers.
     * Always holds 0 <= b < c.
    */
    struct Fraction {
        int a = 0;
        int b = 0;
        int c = 1;

        double value() const { return (double)a + (double)b / (double)c; }
        bool isInteger() const { return b == 0; }

        bool operator==(const Fraction& other) const;
        bool operator!=(const Fraction& other) const { return !(*this == other); }
    };

    /**
     * Approximate a ratio with the largest denominator the stage allows.
     * @param ratio Ratio to approximate.
     * @param limits Integer range and denominator width of the stage.
     * @param frac Value to write the approximation to.
     * @return True on success, false if the integer part is out of range.
    */
    bool tryApproximate(double ratio, const StageLimits& limits, Fraction& frac);

    /**
     * Same as tryApproximate but throws RatioUnreachable on failure.
    */
    Fraction approximate(double ratio, const StageLimits& limits);
}
