#pragma once
#include "pll.h"
#include "ssc.h"

namespace synth {
    enum Pll {
        PLL_A,
        PLL_B,
        _PLL_COUNT
    };

    enum DiffChannel {
        DIFF_NONE,
        DIFF_CH1,
        DIFF_CH2
    };

    const int CHANNEL_COUNT = 3;

    struct SscRequest {
        bool enabled = false;
        double amplitude = 0.015;
        SscMode mode = SSC_MODE_DOWN;
    };

    struct FrequencyRequest {
        double fout0 = 0.0;
        bool hasFout2 = false;
        double fout2 = 0.0;
        DiffChannel differential = DIFF_NONE;
        SscRequest ssc;
    };

    struct PllPlan {
        bool used = false;
        VcoCandidate vco;
    };

    struct OutputPlan {
        bool enabled = false;
        bool inverted = false;

        // Copy of another channel's multisynth, see source
        bool sharedMultisynth = false;
        int source = 0;

        Pll pll = PLL_A;
        MultisynthPlan ms;
    };

    struct ChannelPlan {
        PllPlan plls[_PLL_COUNT];
        OutputPlan outputs[CHANNEL_COUNT];
        SscParameters ssc;

        const Fraction& pllRatio(int channel) const { return plls[outputs[channel].pll].vco.pll; }
    };

    /**
     * Check the option combination of a request without doing any search.
     * Throws ConfigConflict, FrequencyOutOfRange or AmplitudeOutOfRange.
    */
    void validateRequest(const FrequencyRequest& req);

    /**
     * Map a request onto the PLLs, multisynths and outputs of the chip.
     * CH0 always runs from PLL A. An independent CH2 runs from PLL B, a differential
     * channel carries an inverted copy of CH0.
     * @param req Requested frequencies and options.
     * @return Complete plan. Throws any SynthError.
    */
    ChannelPlan planChannels(const FrequencyRequest& req);
}
