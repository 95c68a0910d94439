#include "pll.h"
#include "errors.h"
#include <spdlog/spdlog.h>
#include <math.h>
#include <vector>

namespace synth {
    void checkOutputRange(double fout) {
        if (!std::isfinite(fout) || fout < OUT_MIN || fout > OUT_MAX) {
            throw FrequencyOutOfRange(fout);
        }
    }

    bool tryMakeVcoCandidate(double idealVco, VcoCandidate& cand) {
        Fraction pll;
        if (!tryApproximate(idealVco / REF_FREQ, PLL_LIMITS, pll)) { return false; }
        double vco = REF_FREQ * pll.value();
        if (vco < VCO_MIN || vco > VCO_MAX) { return false; }

        cand.idealVco = idealVco;
        cand.vco = vco;
        cand.pll = pll;
        cand.error = (vco - idealVco) / idealVco;
        return true;
    }

    // True if a should be preferred over b
    bool isBetter(const PllSelection& a, const PllSelection& b) {
        double ea = fabs(a.ms.error);
        double eb = fabs(b.ms.error);
        if (fabs(ea - eb) > ERROR_EPSILON) { return ea < eb; }
        if (a.ms.divider.c != b.ms.divider.c) { return a.ms.divider.c < b.ms.divider.c; }
        return a.vco.pll.c < b.vco.pll.c;
    }

    std::vector<double> fractionalVcoCandidates(double fout) {
        std::vector<double> vcos;

        // Aim for integer multisynth ratios and let the PLL do the fractional work
        for (int r = 1; r <= R_DIV_MAX; r <<= 1) {
            double eff = fout * (double)r;
            int dMin = (int)ceil(VCO_MIN / eff);
            int dMax = (int)floor(VCO_MAX / eff);
            if (dMin < MS_INT_DIVIDER) { dMin = MS_INT_DIVIDER; }
            if (dMax > MS_LIMITS.maxInt) { dMax = MS_LIMITS.maxInt; }
            for (int d = dMin; d <= dMax; d++) {
                if (d > MS_INT_DIVIDER && d < MS_LIMITS.minInt) { continue; }
                double vco = eff * (double)d;

                // Skip if the multisynth stage would choose another R for this VCO
                if (selectRDivider(fout, vco) != r) { continue; }
                vcos.push_back(vco);
            }
        }

        // Integer mode PLL, the multisynth does the fractional work
        for (int a = (int)ceil(VCO_MIN / REF_FREQ); a <= (int)floor(VCO_MAX / REF_FREQ); a++) {
            vcos.push_back(REF_FREQ * (double)a);
        }

        return vcos;
    }

    PllSelection selectFractional(double fout) {
        PllSelection best;
        bool found = false;
        int evaluated = 0;

        for (double ideal : fractionalVcoCandidates(fout)) {
            PllSelection sel;
            if (!tryMakeVcoCandidate(ideal, sel.vco)) { continue; }
            if (!trySelectDivider(fout, sel.vco.vco, sel.ms)) { continue; }
            evaluated++;
            if (!found || isBetter(sel, best)) {
                best = sel;
                found = true;
            }
        }

        if (!found) { throw UnreachableFrequency(fout); }
        spdlog::debug("Evaluated {0} VCO candidates for {1} MHz, best VCO {2} MHz, error {3}", evaluated, fout, best.vco.vco, best.ms.error);
        return best;
    }

    double nearestDivBy4Frequency(double fout) {
        double nearest = 0.0;
        for (int m = (int)ceil(VCO_MIN / REF_FREQ); m <= (int)floor(VCO_MAX / REF_FREQ); m++) {
            if (m % 2) { continue; }
            double freq = REF_FREQ * (double)m / (double)MS_DIVBY4_DIVIDER;
            if (freq <= DIVBY4_THRESHOLD || freq > OUT_MAX) { continue; }
            if (nearest == 0.0 || fabs(freq - fout) < fabs(nearest - fout)) { nearest = freq; }
        }
        return nearest;
    }

    PllSelection selectDivBy4(double fout) {
        // Only even integer multipliers give a working output in DIVBY4 mode
        double nearest = nearestDivBy4Frequency(fout);
        if (nearest == 0.0 || fabs(nearest - fout) / fout > TOLERANCE) {
            throw UnreachableFrequency(fout, nearest);
        }

        PllSelection sel;
        double vco = nearest * (double)MS_DIVBY4_DIVIDER;
        sel.vco.idealVco = fout * (double)MS_DIVBY4_DIVIDER;
        sel.vco.pll.a = (int)round(vco / REF_FREQ);
        sel.vco.pll.b = 0;
        sel.vco.pll.c = 1;
        sel.vco.vco = REF_FREQ * sel.vco.pll.value();
        sel.vco.error = (sel.vco.vco - sel.vco.idealVco) / sel.vco.idealVco;
        if (!trySelectDivider(fout, sel.vco.vco, sel.ms)) { throw UnreachableFrequency(fout, nearest); }
        return sel;
    }

    PllSelection selectPllAndDivider(double fout) {
        checkOutputRange(fout);
        if (fout > DIVBY4_THRESHOLD) { return selectDivBy4(fout); }
        return selectFractional(fout);
    }
}
