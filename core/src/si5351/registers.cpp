#include "registers.h"
#include <stdexcept>
#include <math.h>

namespace si5351 {
    SynthParams synthParams(const synth::Fraction& frac) {
        uint32_t a = frac.a;
        uint32_t b = frac.b;
        uint32_t c = frac.c;
        uint32_t f = (uint32_t)((128ull * b) / c);

        SynthParams p;
        p.p1 = 128 * a + f - 512;
        p.p2 = 128 * b - c * f;
        p.p3 = c;
        return p;
    }

    uint8_t rDivBits(int rDiv) {
        uint8_t bits = 0;
        while (rDiv > 1) {
            rDiv >>= 1;
            bits++;
        }
        if (bits > 7) { throw std::runtime_error("R divider out of range"); }
        return bits;
    }

    void packSynth(const SynthParams& params, int rDiv, bool divBy4, uint8_t* out) {
        out[0] = (params.p3 >> 8) & 0xFF;
        out[1] = params.p3 & 0xFF;
        out[2] = (rDivBits(rDiv) << 4) | (divBy4 ? 0x0C : 0x00) | ((params.p1 >> 16) & 0x03);
        out[3] = (params.p1 >> 8) & 0xFF;
        out[4] = params.p1 & 0xFF;
        out[5] = (((params.p3 >> 16) & 0x0F) << 4) | ((params.p2 >> 16) & 0x0F);
        out[6] = (params.p2 >> 8) & 0xFF;
        out[7] = params.p2 & 0xFF;
    }

    std::vector<uint8_t> packPll(const synth::Fraction& pll) {
        std::vector<uint8_t> data(SI5351_SYNTH_REG_COUNT);
        packSynth(synthParams(pll), 1, false, data.data());
        return data;
    }

    std::vector<uint8_t> packMultisynth(const synth::MultisynthPlan& ms) {
        std::vector<uint8_t> data(SI5351_SYNTH_REG_COUNT);

        // DIVBY4 ignores P1/P2 but expects them zeroed
        SynthParams params = { 0, 0, 1 };
        if (!ms.divBy4) { params = synthParams(ms.divider); }
        packSynth(params, ms.rDiv, ms.divBy4, data.data());
        return data;
    }

    uint8_t clockControl(bool powerDown, bool intMode, synth::Pll pll, bool invert, int driveStrength) {
        uint8_t drive;
        switch (driveStrength) {
        case 2: drive = 0; break;
        case 4: drive = 1; break;
        case 6: drive = 2; break;
        case 8: drive = 3; break;
        default:
            throw std::runtime_error("Drive strength must be 2, 4, 6 or 8 mA");
        }

        uint8_t val = SI5351_CLK_INPUT_MS | drive;
        if (powerDown) { val |= SI5351_CLK_POWER_DOWN; }
        if (intMode) { val |= SI5351_CLK_INT_MODE; }
        if (pll == synth::PLL_B) { val |= SI5351_CLK_SRC_PLLB; }
        if (invert) { val |= SI5351_CLK_INVERT; }
        return val;
    }

    bool pllIntMode(const synth::Fraction& pll, bool ssc) {
        return !ssc && pll.isInteger() && !(pll.a % 2);
    }

    bool multisynthIntMode(const synth::MultisynthPlan& ms) {
        return ms.divBy4 || (ms.divider.isInteger() && !(ms.divider.a % 2));
    }

    void pushUint16(std::vector<uint8_t>& data, int val) {
        data.push_back((val >> 8) & 0xFF);
        data.push_back(val & 0xFF);
    }

    std::vector<uint8_t> packSpreadSpectrum(const synth::SscParameters& ssc) {
        // Registers 149 to 161
        std::vector<uint8_t> data;
        data.reserve(SI5351_SSC_REG_COUNT);

        pushUint16(data, ssc.down.p2);
        data[0] = (data[0] & 0x7F) | (ssc.enabled ? SI5351_SSC_ENABLE : 0);
        pushUint16(data, ssc.down.p3);
        data[2] = (data[2] & 0x7F) | ((ssc.mode == synth::SSC_MODE_CENTER) ? SI5351_SSC_CENTER : 0);
        data.push_back(ssc.down.p1 & 0xFF);
        data.push_back((((ssc.udp >> 8) & 0x0F) << 4) | ((ssc.down.p1 >> 8) & 0x0F));
        data.push_back(ssc.udp & 0xFF);
        pushUint16(data, ssc.up.p2);
        pushUint16(data, ssc.up.p3);
        data.push_back(ssc.up.p1 & 0xFF);
        data.push_back((ssc.up.p1 >> 8) & 0x0F);

        return data;
    }

    uint8_t crystalLoadBits(int pf) {
        // Bits 5:0 are reserved and must be written as 010010
        switch (pf) {
        case 6: return (1 << 6) | 0x12;
        case 8: return (2 << 6) | 0x12;
        case 10: return (3 << 6) | 0x12;
        default:
            throw std::runtime_error("Crystal load must be 6, 8 or 10 pF");
        }
    }

    std::vector<RegisterWrite> formatPlan(const synth::ChannelPlan& plan, int driveStrength) {
        std::vector<RegisterWrite> writes;

        // PLL parameters
        const uint8_t pllRegs[synth::_PLL_COUNT] = { SI5351_REG_PLLA_PARAMS, SI5351_REG_PLLB_PARAMS };
        for (int i = 0; i < synth::_PLL_COUNT; i++) {
            if (!plan.plls[i].used) { continue; }
            writes.push_back({ pllRegs[i], packPll(plan.plls[i].vco.pll) });
        }

        // Clock control and multisynth for each output
        for (int ch = 0; ch < synth::CHANNEL_COUNT; ch++) {
            const synth::OutputPlan& out = plan.outputs[ch];
            uint8_t ctrl;
            if (out.enabled) {
                ctrl = clockControl(false, multisynthIntMode(out.ms), out.pll, out.inverted, driveStrength);
            }
            else {
                ctrl = SI5351_CLK_POWER_DOWN;
            }
            writes.push_back({ (uint8_t)(SI5351_REG_CLK0_CONTROL + ch), { ctrl } });
            if (!out.enabled) { continue; }
            writes.push_back({ (uint8_t)(SI5351_REG_MS0_PARAMS + ch * SI5351_SYNTH_REG_COUNT), packMultisynth(out.ms) });
        }

        if (plan.ssc.enabled) {
            writes.push_back({ SI5351_REG_SSC_PARAMS, packSpreadSpectrum(plan.ssc) });
        }

        return writes;
    }
}
