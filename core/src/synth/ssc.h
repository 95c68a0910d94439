#pragma once
#include <string>

namespace synth {
    enum SscMode {
        SSC_MODE_DOWN,
        SSC_MODE_CENTER
    };

    // Register fields of one spread direction (P1[11:0], P2[14:0], P3[14:0])
    struct SscFields {
        int p1 = 0;
        int p2 = 0;
        int p3 = 1;
    };

    struct SscParameters {
        bool enabled = false;
        SscMode mode = SSC_MODE_DOWN;
        double amplitude = 0.0;
        int udp = 0;        // Up/down modulation period
        SscFields down;
        SscFields up;
    };

    /**
     * Make sure an amplitude is within the limits of a spread mode.
     * Throws AmplitudeOutOfRange otherwise.
    */
    void checkSscAmplitude(double amplitude, SscMode mode);

    /**
     * Compute the spread spectrum register fields for PLL A.
     * @param amplitude Peak-to-peak spread as a fraction of the nominal frequency.
     * @param mode Down or center spread.
     * @param pllInt Integer part of the PLL A feedback ratio.
     * @return Enabled SSC parameters. Throws AmplitudeOutOfRange.
    */
    SscParameters computeSsc(double amplitude, SscMode mode, int pllInt);

    bool sscModeFromString(const std::string& str, SscMode& mode);
    const char* sscModeToString(SscMode mode);
}
