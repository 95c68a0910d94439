#include <gtest/gtest.h>
#include <synth/ssc.h>
#include <synth/errors.h>
#include <math.h>

using namespace synth;

TEST(Ssc, DownSpread) {
    SscParameters ssc = computeSsc(0.015, SSC_MODE_DOWN, 24);
    EXPECT_TRUE(ssc.enabled);
    EXPECT_EQ(ssc.mode, SSC_MODE_DOWN);
    EXPECT_EQ(ssc.udp, 198);
    EXPECT_EQ(ssc.down.p1, 0);
    EXPECT_NEAR(ssc.down.p2, 3756, 1);
    EXPECT_EQ(ssc.down.p3, 32767);

    // Down spread doesn't use the up parameters
    EXPECT_EQ(ssc.up.p1, 0);
    EXPECT_EQ(ssc.up.p2, 0);
    EXPECT_EQ(ssc.up.p3, 1);
}

TEST(Ssc, CenterSpread) {
    SscParameters ssc = computeSsc(0.015, SSC_MODE_CENTER, 36);
    EXPECT_EQ(ssc.mode, SSC_MODE_CENTER);
    EXPECT_EQ(ssc.udp, 198);
    EXPECT_EQ(ssc.up.p1, 0);
    EXPECT_NEAR(ssc.up.p2, 5762, 1);
    EXPECT_EQ(ssc.up.p3, 32767);
    EXPECT_EQ(ssc.down.p1, 0);
    EXPECT_NEAR(ssc.down.p2, 5676, 1);
    EXPECT_EQ(ssc.down.p3, 32767);

    // Upward step is always the larger one
    EXPECT_GT(ssc.up.p2, ssc.down.p2);
}

TEST(Ssc, StepGrowsWithPllRatio) {
    SscParameters lo = computeSsc(0.025, SSC_MODE_DOWN, 24);
    SscParameters hi = computeSsc(0.025, SSC_MODE_DOWN, 90);
    EXPECT_GT(hi.down.p2, lo.down.p2);
    EXPECT_NEAR(hi.down.p2, 23249, 1);
}

TEST(Ssc, AmplitudeLimits) {
    EXPECT_NO_THROW(checkSscAmplitude(0.001, SSC_MODE_DOWN));
    EXPECT_NO_THROW(checkSscAmplitude(0.025, SSC_MODE_DOWN));
    EXPECT_THROW(checkSscAmplitude(0.03, SSC_MODE_DOWN), AmplitudeOutOfRange);
    EXPECT_THROW(checkSscAmplitude(0.0005, SSC_MODE_DOWN), AmplitudeOutOfRange);

    EXPECT_NO_THROW(checkSscAmplitude(0.03, SSC_MODE_CENTER));
    EXPECT_THROW(checkSscAmplitude(0.001, SSC_MODE_CENTER), AmplitudeOutOfRange);
    EXPECT_THROW(checkSscAmplitude(0.031, SSC_MODE_CENTER), AmplitudeOutOfRange);
    EXPECT_THROW(checkSscAmplitude(NAN, SSC_MODE_CENTER), AmplitudeOutOfRange);

    EXPECT_THROW(computeSsc(0.5, SSC_MODE_DOWN, 24), AmplitudeOutOfRange);
}

TEST(Ssc, ModeStrings) {
    SscMode mode = SSC_MODE_DOWN;
    EXPECT_TRUE(sscModeFromString("center", mode));
    EXPECT_EQ(mode, SSC_MODE_CENTER);
    EXPECT_TRUE(sscModeFromString("DOWN", mode));
    EXPECT_EQ(mode, SSC_MODE_DOWN);
    EXPECT_FALSE(sscModeFromString("up", mode));
    EXPECT_EQ(mode, SSC_MODE_DOWN);

    EXPECT_STREQ(sscModeToString(SSC_MODE_CENTER), "CENTER");
    EXPECT_STREQ(sscModeToString(SSC_MODE_DOWN), "DOWN");
}
