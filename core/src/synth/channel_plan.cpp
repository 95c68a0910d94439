#include "channel_plan.h"
#include "errors.h"
#include <spdlog/spdlog.h>

namespace synth {
    void validateRequest(const FrequencyRequest& req) {
        if (req.differential == DIFF_CH2 && req.hasFout2) {
            throw ConfigConflict("Channel 2 cannot be used for both a differential output and an independent frequency");
        }
        if (req.ssc.enabled && req.fout0 > DIVBY4_THRESHOLD) {
            // DIVBY4 needs PLL A in integer mode, spread spectrum makes it fractional
            throw ConfigConflict("Spread spectrum cannot be used with CH0 above 150 MHz");
        }
        checkOutputRange(req.fout0);
        if (req.hasFout2) { checkOutputRange(req.fout2); }
        if (req.ssc.enabled) { checkSscAmplitude(req.ssc.amplitude, req.ssc.mode); }
    }

    ChannelPlan planChannels(const FrequencyRequest& req) {
        // Reject bad combinations before spending time on the search
        validateRequest(req);

        ChannelPlan plan;

        // CH0 always comes from PLL A
        PllSelection sel0 = selectPllAndDivider(req.fout0);
        plan.plls[PLL_A].used = true;
        plan.plls[PLL_A].vco = sel0.vco;
        OutputPlan& out0 = plan.outputs[0];
        out0.enabled = true;
        out0.pll = PLL_A;
        out0.ms = sel0.ms;

        // Differential leg, same multisynth settings but inverted
        if (req.differential != DIFF_NONE) {
            int ch = (req.differential == DIFF_CH1) ? 1 : 2;
            OutputPlan& diff = plan.outputs[ch];
            diff = out0;
            diff.inverted = true;
            diff.sharedMultisynth = true;
            diff.source = 0;
        }

        // Independent CH2
        if (req.hasFout2) {
            PllSelection sel2 = selectPllAndDivider(req.fout2);
            OutputPlan& out2 = plan.outputs[2];
            out2.enabled = true;
            out2.source = 2;
            out2.ms = sel2.ms;

            // Spread spectrum only modulates PLL A, so only share it when disabled
            if (!req.ssc.enabled && sel2.vco.pll == sel0.vco.pll) {
                spdlog::debug("CH2 shares PLL A with CH0");
                out2.pll = PLL_A;
            }
            else {
                out2.pll = PLL_B;
                plan.plls[PLL_B].used = true;
                plan.plls[PLL_B].vco = sel2.vco;
            }
        }

        if (req.ssc.enabled) {
            plan.ssc = computeSsc(req.ssc.amplitude, req.ssc.mode, plan.plls[PLL_A].vco.pll.a);
        }

        return plan;
    }
}
