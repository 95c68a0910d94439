#pragma once
#include <synth/fraction.h>
#include <synth/channel_plan.h>
#include <stdint.h>
#include <vector>

// Register addresses, see Skyworks AN619
#define SI5351_REG_STATUS           0
#define SI5351_REG_INT_STATUS       1
#define SI5351_REG_OUTPUT_ENABLE    3
#define SI5351_REG_OEB_PIN          9
#define SI5351_REG_PLL_SOURCE       15
#define SI5351_REG_CLK0_CONTROL     16
#define SI5351_REG_CLK3_0_DISABLE   24
#define SI5351_REG_CLK7_4_DISABLE   25
#define SI5351_REG_PLLA_CONTROL     22
#define SI5351_REG_PLLB_CONTROL     23
#define SI5351_REG_PLLA_PARAMS      26
#define SI5351_REG_PLLB_PARAMS      34
#define SI5351_REG_MS0_PARAMS       42
#define SI5351_REG_SSC_PARAMS       149
#define SI5351_REG_CLK0_PHOFF       165
#define SI5351_REG_PLL_RESET        177
#define SI5351_REG_XTAL_LOAD        183
#define SI5351_REG_FANOUT           187

#define SI5351_SYNTH_REG_COUNT      8
#define SI5351_SSC_REG_COUNT        13
#define SI5351_CLOCK_COUNT          8

#define SI5351_CLK_POWER_DOWN       (1 << 7)
#define SI5351_CLK_INT_MODE         (1 << 6)
#define SI5351_CLK_SRC_PLLB         (1 << 5)
#define SI5351_CLK_INVERT           (1 << 4)
#define SI5351_CLK_INPUT_MS         (3 << 2)

#define SI5351_PLL_INT_MODE         (1 << 6)
#define SI5351_PLL_RESET_A          (1 << 5)
#define SI5351_PLL_RESET_B          (1 << 7)
#define SI5351_SSC_ENABLE           (1 << 7)
#define SI5351_SSC_CENTER           (1 << 7)

namespace si5351 {
    enum DisableState {
        DISABLE_LOW,
        DISABLE_HIGH,
        DISABLE_HIGH_IMPEDANCE,
        DISABLE_NEVER
    };

    // Raw P1/P2/P3 register values of a synth stage
    struct SynthParams {
        uint32_t p1;
        uint32_t p2;
        uint32_t p3;
    };

    struct RegisterWrite {
        uint8_t reg;
        std::vector<uint8_t> data;
    };

    SynthParams synthParams(const synth::Fraction& frac);

    /**
     * Pack P1/P2/P3 plus the R divider and DIVBY4 bits into the 8 byte register block.
     * @param rDiv R divider value (power of two, 1 to 128).
    */
    void packSynth(const SynthParams& params, int rDiv, bool divBy4, uint8_t* out);

    std::vector<uint8_t> packPll(const synth::Fraction& pll);
    std::vector<uint8_t> packMultisynth(const synth::MultisynthPlan& ms);

    // R divider value to its 3 bit register code
    uint8_t rDivBits(int rDiv);

    /**
     * Build a CLKx control register value.
     * @param driveStrength Output drive in mA, 2, 4, 6 or 8.
    */
    uint8_t clockControl(bool powerDown, bool intMode, synth::Pll pll, bool invert, int driveStrength);

    // The PLL can run in integer mode for an even integer multiplier without spread spectrum
    bool pllIntMode(const synth::Fraction& pll, bool ssc);

    // Multisynth integer mode is only allowed for even integer ratios
    bool multisynthIntMode(const synth::MultisynthPlan& ms);

    std::vector<uint8_t> packSpreadSpectrum(const synth::SscParameters& ssc);

    uint8_t crystalLoadBits(int pf);

    /**
     * Translate a channel plan into the register blocks it needs.
     * Shared registers (PLL integer mode bits, output enables) are not included,
     * they need a read-modify-write on the device.
    */
    std::vector<RegisterWrite> formatPlan(const synth::ChannelPlan& plan, int driveStrength);
}
