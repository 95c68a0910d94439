#pragma once
#include "pll.h"
#include <random>
#include <string>
#include <vector>
#include <stdint.h>

namespace synth {
    struct Band {
        double min;
        double max;
    };

    const int TEST_BAND_COUNT = 6;
    extern const Band TEST_BANDS[TEST_BAND_COUNT];

    struct TestResult {
        int band = 0;
        double requested = 0.0;
        bool success = false;
        double achieved = 0.0;
        double error = 0.0;     // Absolute relative error
        std::string reason;     // Empty on success
    };

    struct BandReport {
        Band band;
        int tests = 0;
        int passes = 0;
        int failures = 0;
        double maxError = 0.0;

        double successRate() const { return tests ? (double)passes / (double)tests : 0.0; }
        double failureRate() const { return tests ? (double)failures / (double)tests : 0.0; }
    };

    struct TestReport {
        int tests = 0;
        int passes = 0;
        int failures = 0;
        double maxError = 0.0;
        std::vector<BandReport> bands;

        double successRate() const { return tests ? (double)passes / (double)tests : 0.0; }
        double failureRate() const { return tests ? (double)failures / (double)tests : 0.0; }
    };

    /**
     * Recompute the output frequency from the register level parameters only.
    */
    double recomputeOutput(const Fraction& pll, const MultisynthPlan& ms);

    /**
     * Check every field of a selection against the chip limits.
     * @param reason Set to a description of the first violation.
     * @return True if all fields are valid.
    */
    bool validateSelection(const PllSelection& sel, std::string& reason);

    /**
     * Run the full pipeline on one frequency and classify the result.
    */
    TestResult checkFrequency(double fout, double tolerance = TOLERANCE);

    /**
     * Single pass sequence of randomized pipeline checks, band by band.
     * Results are generated on demand; a new run draws new frequencies.
    */
    class TestRun {
    public:
        TestRun(int iterations, uint64_t seed, double tolerance = TOLERANCE);

        /**
         * Produce the next result.
         * @param result Value to write the result to.
         * @return False once every band has been covered.
        */
        bool next(TestResult& result);

        int getIterations() { return iterations; }

    private:
        std::mt19937_64 rng;
        int iterations;
        double tolerance;
        int band = 0;
        int index = 0;
    };

    /**
     * Consume a run and aggregate its results.
    */
    TestReport summarize(TestRun& run);

    TestReport runTest(int iterations, uint64_t seed);
}
