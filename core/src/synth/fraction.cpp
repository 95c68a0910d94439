#include "fraction.h"
#include "errors.h"
#include <math.h>

namespace synth {
    bool Fraction::operator==(const Fraction& other) const {
        return a == other.a && b == other.b && c == other.c;
    }

    bool tryApproximate(double ratio, const StageLimits& limits, Fraction& frac) {
        if (!std::isfinite(ratio) || ratio <= 0.0) { return false; }

        // Split off the integer part and make sure the register can hold it
        double ip = floor(ratio);
        if (ip < limits.minInt || ip > limits.maxInt) { return false; }

        // Always use the widest denominator, reduced fractions only lose resolution
        int c = limits.maxDenom;
        long long b = llround((ratio - ip) * (double)c);
        if (b < 0) { b = 0; }
        if (b > c - 1) { b = c - 1; }

        frac.a = (int)ip;
        frac.b = (int)b;
        frac.c = b ? c : 1;
        return true;
    }

    Fraction approximate(double ratio, const StageLimits& limits) {
        Fraction frac;
        if (!tryApproximate(ratio, limits, frac)) {
            throw RatioUnreachable(ratio, limits.minInt, limits.maxInt);
        }
        return frac;
    }
}
