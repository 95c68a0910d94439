#include <gtest/gtest.h>
#include <synth/pll.h>
#include <synth/errors.h>
#include <math.h>

using namespace synth;

TEST(Pll, OutOfRange) {
    EXPECT_THROW(selectPllAndDivider(0.003), FrequencyOutOfRange);
    EXPECT_THROW(selectPllAndDivider(200.1), FrequencyOutOfRange);
    EXPECT_THROW(selectPllAndDivider(0.0), FrequencyOutOfRange);
    EXPECT_THROW(selectPllAndDivider(-10.0), FrequencyOutOfRange);
    EXPECT_THROW(selectPllAndDivider(NAN), FrequencyOutOfRange);
    EXPECT_NO_THROW(checkOutputRange(OUT_MIN));
    EXPECT_NO_THROW(checkOutputRange(OUT_MAX));
}

TEST(Pll, VcoCandidate) {
    VcoCandidate cand;
    ASSERT_TRUE(tryMakeVcoCandidate(650.0, cand));
    EXPECT_EQ(cand.pll, (Fraction{ 26, 0, 1 }));
    EXPECT_EQ(cand.vco, 650.0);
    EXPECT_EQ(cand.error, 0.0);

    EXPECT_FALSE(tryMakeVcoCandidate(500.0, cand));
    EXPECT_FALSE(tryMakeVcoCandidate(950.0, cand));
}

TEST(Pll, ExactInteger) {
    PllSelection sel = selectPllAndDivider(100.0);
    EXPECT_TRUE(sel.vco.pll.isInteger());
    EXPECT_TRUE(sel.ms.divider.isInteger());
    EXPECT_FALSE(sel.ms.divBy4);
    EXPECT_EQ(sel.ms.error, 0.0);
    EXPECT_GE(sel.vco.vco, VCO_MIN);
    EXPECT_LE(sel.vco.vco, VCO_MAX);
}

TEST(Pll, PrefersSmallDenominators) {
    // 10 and 20 MHz can both be made from a 600MHz integer VCO
    PllSelection sel = selectPllAndDivider(10.0);
    EXPECT_EQ(sel.vco.pll, (Fraction{ 24, 0, 1 }));
    EXPECT_EQ(sel.ms.divider, (Fraction{ 60, 0, 1 }));

    sel = selectPllAndDivider(0.44);
    EXPECT_EQ(sel.vco.pll.c, 1);
    EXPECT_EQ(sel.ms.divider.c, 1);
    EXPECT_EQ(sel.ms.error, 0.0);
}

TEST(Pll, TopOfDivideBySixRange) {
    PllSelection sel = selectPllAndDivider(150.0);
    EXPECT_FALSE(sel.ms.divBy4);
    EXPECT_EQ(sel.ms.divider, (Fraction{ 6, 0, 1 }));
    EXPECT_EQ(sel.vco.pll, (Fraction{ 36, 0, 1 }));

    sel = selectPllAndDivider(112.6);
    EXPECT_EQ(sel.ms.divider, (Fraction{ 6, 0, 1 }));
    EXPECT_LT(fabs(sel.ms.error), 1e-6);
}

TEST(Pll, DivBy4Exact) {
    PllSelection sel = selectPllAndDivider(162.5);
    EXPECT_TRUE(sel.ms.divBy4);
    EXPECT_EQ(sel.vco.pll, (Fraction{ 26, 0, 1 }));
    EXPECT_EQ(sel.vco.vco, 650.0);
    EXPECT_EQ(sel.ms.achieved, 162.5);
    EXPECT_EQ(sel.ms.error, 0.0);

    const double freqs[] = { 175.0, 187.5, 200.0 };
    const int mults[] = { 28, 30, 32 };
    for (int i = 0; i < 3; i++) {
        sel = selectPllAndDivider(freqs[i]);
        EXPECT_TRUE(sel.ms.divBy4);
        EXPECT_EQ(sel.vco.pll.a, mults[i]);
        EXPECT_EQ(sel.ms.error, 0.0);
    }
}

TEST(Pll, DivBy4Unreachable) {
    try {
        selectPllAndDivider(160.0);
        FAIL() << "160 MHz should not be reachable";
    }
    catch (const UnreachableFrequency& e) {
        EXPECT_EQ(e.frequency, 160.0);
        EXPECT_EQ(e.nearest, 162.5);
    }

    EXPECT_THROW(selectPllAndDivider(199.0), UnreachableFrequency);
    EXPECT_THROW(selectPllAndDivider(150.5), UnreachableFrequency);
}

TEST(Pll, NearestDivBy4) {
    EXPECT_EQ(nearestDivBy4Frequency(160.0), 162.5);
    EXPECT_EQ(nearestDivBy4Frequency(151.0), 162.5);
    EXPECT_EQ(nearestDivBy4Frequency(190.0), 187.5);
    EXPECT_EQ(nearestDivBy4Frequency(199.0), 200.0);
}

TEST(Pll, ErrorWithinTolerance) {
    const double freqs[] = { 0.004, 0.0123456, 0.4395, 1.2345678, 10.1, 33.333333, 75.0, 112.5, 149.99 };
    for (double f : freqs) {
        PllSelection sel = selectPllAndDivider(f);
        EXPECT_LT(fabs(sel.ms.error), TOLERANCE) << f;
        EXPECT_GE(sel.vco.vco, VCO_MIN) << f;
        EXPECT_LE(sel.vco.vco, VCO_MAX) << f;
        EXPECT_GE(sel.vco.pll.a, PLL_LIMITS.minInt) << f;
        EXPECT_LE(sel.vco.pll.a, PLL_LIMITS.maxInt) << f;
    }
}
