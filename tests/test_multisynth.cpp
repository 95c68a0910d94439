#include <gtest/gtest.h>
#include <synth/multisynth.h>
#include <synth/errors.h>
#include <math.h>

using namespace synth;

TEST(Multisynth, RDivider) {
    EXPECT_EQ(selectRDivider(10.0, 800.0), 1);
    EXPECT_EQ(selectRDivider(0.3, 900.0), 2);
    EXPECT_EQ(selectRDivider(0.005, 640.0), 64);
    EXPECT_EQ(selectRDivider(0.004, 600.0), 128);
    EXPECT_EQ(selectRDivider(0.001, 900.0), 0);
}

TEST(Multisynth, IntegerRatio) {
    MultisynthPlan ms = selectDivider(100.0, 800.0);
    EXPECT_EQ(ms.divider, (Fraction{ 8, 0, 1 }));
    EXPECT_EQ(ms.rDiv, 1);
    EXPECT_FALSE(ms.divBy4);
    EXPECT_DOUBLE_EQ(ms.achieved, 100.0);
    EXPECT_EQ(ms.error, 0.0);
}

TEST(Multisynth, DivideBySix) {
    MultisynthPlan ms = selectDivider(120.0, 720.0);
    EXPECT_EQ(ms.divider, (Fraction{ 6, 0, 1 }));
    EXPECT_DOUBLE_EQ(ms.achieved, 120.0);
}

TEST(Multisynth, RatioBetweenSixAndEight) {
    EXPECT_THROW(selectDivider(100.0, 700.0), DividerUnreachable);
    EXPECT_THROW(selectDivider(140.0, 700.0), DividerUnreachable);
}

TEST(Multisynth, FractionalRatio) {
    MultisynthPlan ms = selectDivider(10.1, 800.0);
    EXPECT_EQ(ms.divider.a, 79);
    EXPECT_GT(ms.divider.b, 0);
    EXPECT_EQ(ms.divider.c, FIELD_MAX_DENOM);
    EXPECT_LT(fabs(ms.error), 1e-6);
}

TEST(Multisynth, LowFrequencyUsesRDivider) {
    MultisynthPlan ms = selectDivider(0.005, 640.0);
    EXPECT_EQ(ms.rDiv, 64);
    EXPECT_EQ(ms.divider, (Fraction{ 2000, 0, 1 }));
    EXPECT_DOUBLE_EQ(ms.achieved, 0.005);
}

TEST(Multisynth, DivBy4) {
    MultisynthPlan ms = selectDivider(162.5, 650.0);
    EXPECT_TRUE(ms.divBy4);
    EXPECT_EQ(ms.rDiv, 1);
    EXPECT_EQ(ms.divider, (Fraction{ 4, 0, 1 }));
    EXPECT_EQ(ms.achieved, 162.5);
    EXPECT_EQ(ms.error, 0.0);

    EXPECT_NO_THROW(selectDivider(200.0, 800.0));
}

TEST(Multisynth, DivBy4NeedsEvenIntegerMultiplier) {
    // 640 / 25 = 25.6
    EXPECT_THROW(selectDivider(160.0, 640.0), DividerUnreachable);
    // 675 / 25 = 27
    EXPECT_THROW(selectDivider(168.75, 675.0), DividerUnreachable);
    // VCO isn't 4 times the output
    EXPECT_THROW(selectDivider(175.0, 750.0), DividerUnreachable);
}

TEST(Multisynth, InvalidInput) {
    MultisynthPlan ms;
    EXPECT_FALSE(trySelectDivider(0.0, 800.0, ms));
    EXPECT_FALSE(trySelectDivider(10.0, -1.0, ms));
}
