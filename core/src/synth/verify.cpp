#include "verify.h"
#include "errors.h"
#include <spdlog/spdlog.h>
#include <math.h>

namespace synth {
    const Band TEST_BANDS[TEST_BAND_COUNT] = {
        { 100.0, 150.0 },
        { 10.0, 100.0 },
        { 1.0, 10.0 },
        { 0.1, 1.0 },
        { 0.01, 0.1 },
        { 0.004, 0.01 }
    };

    double recomputeOutput(const Fraction& pll, const MultisynthPlan& ms) {
        double vco = REF_FREQ * pll.value();
        double div = ms.divBy4 ? (double)MS_DIVBY4_DIVIDER : ms.divider.value();
        return vco / div / (double)ms.rDiv;
    }

    bool validFraction(const Fraction& frac, int maxDenom) {
        return frac.c >= 1 && frac.c <= maxDenom && frac.b >= 0 && frac.b < frac.c;
    }

    bool validateSelection(const PllSelection& sel, std::string& reason) {
        const Fraction& pll = sel.vco.pll;
        const MultisynthPlan& ms = sel.ms;

        if (pll.a < PLL_LIMITS.minInt || pll.a > PLL_LIMITS.maxInt) {
            reason = fmt::format("PLL integer part {} out of range", pll.a);
            return false;
        }
        if (!validFraction(pll, PLL_LIMITS.maxDenom)) {
            reason = fmt::format("PLL fraction {}/{} invalid", pll.b, pll.c);
            return false;
        }
        if (sel.vco.vco < VCO_MIN || sel.vco.vco > VCO_MAX) {
            reason = fmt::format("VCO {} MHz out of range", sel.vco.vco);
            return false;
        }
        if (ms.rDiv < 1 || ms.rDiv > R_DIV_MAX || (ms.rDiv & (ms.rDiv - 1))) {
            reason = fmt::format("R divider {} invalid", ms.rDiv);
            return false;
        }
        if (!validFraction(ms.divider, MS_LIMITS.maxDenom)) {
            reason = fmt::format("Multisynth fraction {}/{} invalid", ms.divider.b, ms.divider.c);
            return false;
        }

        if (ms.divBy4) {
            if (ms.divider.a != MS_DIVBY4_DIVIDER || !ms.divider.isInteger()) {
                reason = "DIVBY4 with a divider other than 4";
                return false;
            }
            if (!pll.isInteger() || pll.a % 2) {
                reason = "DIVBY4 without an even integer PLL multiplier";
                return false;
            }
        }
        else {
            double ratio = ms.divider.value();
            bool intOnly = (ms.divider.a == MS_INT_DIVIDER && ms.divider.isInteger());
            if (!intOnly && (ratio < (double)MS_LIMITS.minInt || ratio > (double)MS_LIMITS.maxInt)) {
                reason = fmt::format("Multisynth ratio {} out of range", ratio);
                return false;
            }
        }

        return true;
    }

    TestResult checkFrequency(double fout, double tolerance) {
        TestResult res;
        res.requested = fout;
        try {
            PllSelection sel = selectPllAndDivider(fout);
            if (!validateSelection(sel, res.reason)) { return res; }

            res.achieved = recomputeOutput(sel.vco.pll, sel.ms);
            res.error = fabs(res.achieved - fout) / fout;
            if (res.error >= tolerance) {
                res.reason = fmt::format("error {} above tolerance", res.error);
                return res;
            }
            res.success = true;
        }
        catch (const SynthError& e) {
            res.reason = e.what();
        }
        return res;
    }

    TestRun::TestRun(int iterations, uint64_t seed, double tolerance) : rng(seed) {
        if (iterations < 0) { throw std::runtime_error("Iteration count must not be negative"); }
        this->iterations = iterations;
        this->tolerance = tolerance;
    }

    bool TestRun::next(TestResult& result) {
        if (index >= iterations) {
            band++;
            index = 0;
        }
        if (band >= TEST_BAND_COUNT || !iterations) { return false; }

        std::uniform_real_distribution<double> dist(TEST_BANDS[band].min, TEST_BANDS[band].max);
        result = checkFrequency(dist(rng), tolerance);
        result.band = band;
        index++;
        return true;
    }

    TestReport summarize(TestRun& run) {
        TestReport report;
        for (int i = 0; i < TEST_BAND_COUNT; i++) {
            BandReport br;
            br.band = TEST_BANDS[i];
            report.bands.push_back(br);
        }

        TestResult res;
        while (run.next(res)) {
            BandReport& br = report.bands[res.band];
            br.tests++;
            report.tests++;
            if (res.success) {
                br.passes++;
                report.passes++;
            }
            else {
                br.failures++;
                report.failures++;
                spdlog::warn("Test failed for {0} MHz: {1}", res.requested, res.reason);
            }
            if (res.error > br.maxError) { br.maxError = res.error; }
            if (res.error > report.maxError) { report.maxError = res.error; }
        }

        return report;
    }

    TestReport runTest(int iterations, uint64_t seed) {
        TestRun run(iterations, seed);
        return summarize(run);
    }
}
