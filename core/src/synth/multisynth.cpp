#include "multisynth.h"
#include "errors.h"
#include <math.h>

namespace synth {
    int selectRDivider(double fout, double vco) {
        for (int r = 1; r <= R_DIV_MAX; r <<= 1) {
            if (vco / (fout * (double)r) <= (double)MS_LIMITS.maxInt) { return r; }
        }
        return 0;
    }

    bool selectDivBy4(double fout, double vco, MultisynthPlan& plan) {
        // The VCO must be exactly four times the output
        if (fabs(vco - (double)MS_DIVBY4_DIVIDER * fout) > TOLERANCE * vco) { return false; }

        // And the PLL must run in integer mode with an even multiplier
        double mult = vco / REF_FREQ;
        double nearest = round(mult);
        if (fabs(mult - nearest) > 1e-9 || ((long long)nearest) % 2) { return false; }

        plan.rDiv = 1;
        plan.divBy4 = true;
        plan.divider.a = MS_DIVBY4_DIVIDER;
        plan.divider.b = 0;
        plan.divider.c = 1;
        return true;
    }

    bool trySelectDivider(double fout, double vco, MultisynthPlan& plan) {
        if (!(fout > 0.0) || !(vco > 0.0)) { return false; }

        plan = MultisynthPlan();
        plan.target = fout;
        plan.vco = vco;

        if (fout > DIVBY4_THRESHOLD) {
            if (!selectDivBy4(fout, vco, plan)) { return false; }
        }
        else {
            // Pre-scale very low frequencies with the R divider
            int r = selectRDivider(fout, vco);
            if (!r) { return false; }
            plan.rDiv = r;
            double ratio = vco / (fout * (double)r);

            if (ratio < (double)MS_LIMITS.minInt) {
                // Below 8 only the integer ratio 6 is valid
                if (fabs(ratio - (double)MS_INT_DIVIDER) * (double)MS_LIMITS.maxDenom >= 0.5) { return false; }
                plan.divider.a = MS_INT_DIVIDER;
                plan.divider.b = 0;
                plan.divider.c = 1;
            }
            else {
                if (ratio > (double)MS_LIMITS.maxInt) { return false; }
                if (!tryApproximate(ratio, MS_LIMITS, plan.divider)) { return false; }
            }
        }

        // Back-substitute to get what the chip will actually output
        plan.achieved = vco / plan.ratio() / (double)plan.rDiv;
        plan.error = (plan.achieved - fout) / fout;
        return true;
    }

    MultisynthPlan selectDivider(double fout, double vco) {
        MultisynthPlan plan;
        if (!trySelectDivider(fout, vco, plan)) { throw DividerUnreachable(fout, vco); }
        return plan;
    }
}
