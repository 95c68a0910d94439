#include "device.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace si5351 {
    std::vector<ProbeResult> probeDevices(i2c::Bus* bus) {
        if (!bus) { throw std::runtime_error("Device search needs an I2C bus"); }
        const uint8_t addrs[] = { SI5351_DEFAULT_ADDR, SI5351_ALT_ADDR };
        std::vector<ProbeResult> results;
        for (uint8_t addr : addrs) {
            ProbeResult res = {};
            res.addr = addr;
            res.found = bus->probe(addr);
            if (res.found) { res.status = Device(bus, addr).status(); }
            results.push_back(res);
        }
        return results;
    }

    Device::Device(i2c::Bus* bus, uint8_t addr) {
        if (!bus) { throw std::runtime_error("Device needs an I2C bus"); }
        this->bus = bus;
        this->addr = addr;
    }

    void Device::init(int crystalLoad) {
        // Outputs off and not controlled by the OEB pin
        disableAllOutputs();
        writeByte(SI5351_REG_OEB_PIN, 0xFF);

        writeByte(SI5351_REG_XTAL_LOAD, crystalLoadBits(crystalLoad));

        // Both PLLs from the crystal at 600MHz, integer mode
        synth::Fraction pll = { 24, 0, 1 };
        writeByte(SI5351_REG_PLL_SOURCE, 0x00);
        write(SI5351_REG_PLLA_PARAMS, packPll(pll));
        write(SI5351_REG_PLLB_PARAMS, packPll(pll));
        setPllIntMode(synth::PLL_A, true);
        setPllIntMode(synth::PLL_B, true);

        // CLK0 and CLK1 on PLL A, CLK2 on PLL B, all at 125kHz (600MHz / 1200 / 4)
        synth::MultisynthPlan ms;
        ms.divider = { 1200, 0, 1 };
        ms.rDiv = 4;
        for (int ch = 0; ch < synth::CHANNEL_COUNT; ch++) {
            synth::Pll src = (ch == 2) ? synth::PLL_B : synth::PLL_A;
            writeByte(SI5351_REG_CLK0_CONTROL + ch, clockControl(false, true, src, false, 2));
            write(SI5351_REG_MS0_PARAMS + ch * SI5351_SYNTH_REG_COUNT, packMultisynth(ms));
        }
        resetPlls();

        // No fanout of the crystal, CLKIN or multisynths
        writeByte(SI5351_REG_FANOUT, 0x00);

        // Default spread spectrum, left disabled
        synth::SscParameters ssc = synth::computeSsc(0.015, synth::SSC_MODE_CENTER, pll.a);
        ssc.enabled = false;
        write(SI5351_REG_SSC_PARAMS, packSpreadSpectrum(ssc));

        for (int clk = 0; clk < SI5351_CLOCK_COUNT; clk++) {
            setDisableState(clk, DISABLE_HIGH_IMPEDANCE);
            writeByte(SI5351_REG_CLK0_PHOFF + clk, 0);
        }

        clearStatus();
        spdlog::debug("Si5351 at 0x{0:02X} initialized", addr);
    }

    void Device::apply(const synth::ChannelPlan& plan, int driveStrength) {
        // PLL mode bits need to be updated without touching the other bits
        bool ssc = plan.ssc.enabled;
        for (int i = 0; i < synth::_PLL_COUNT; i++) {
            if (!plan.plls[i].used) { continue; }
            setPllIntMode((synth::Pll)i, pllIntMode(plan.plls[i].vco.pll, ssc && i == synth::PLL_A));
        }

        for (const auto& w : formatPlan(plan, driveStrength)) {
            write(w.reg, w.data);
        }
        setSpreadSpectrumEnabled(ssc);

        resetPlls();

        int mask = 0;
        for (int ch = 0; ch < synth::CHANNEL_COUNT; ch++) {
            if (plan.outputs[ch].enabled) { mask |= (1 << ch); }
        }
        enableOutputs(mask, true);
    }

    DeviceStatus Device::status() {
        uint8_t val = readByte(SI5351_REG_STATUS);
        DeviceStatus st;
        st.sysInit = val & (1 << 7);
        st.pllBLol = val & (1 << 6);
        st.pllALol = val & (1 << 5);
        st.clkinLos = val & (1 << 4);
        st.revision = val & 0x03;
        return st;
    }

    void Device::clearStatus() {
        writeByte(SI5351_REG_INT_STATUS, 0x00);
    }

    void Device::disableAllOutputs(bool powerDown) {
        writeByte(SI5351_REG_OUTPUT_ENABLE, 0xFF);
        if (!powerDown) { return; }
        std::vector<uint8_t> off(SI5351_CLOCK_COUNT, SI5351_CLK_POWER_DOWN);
        write(SI5351_REG_CLK0_CONTROL, off);
    }

    void Device::enableOutputs(int mask, bool enable) {
        // Output enable register is active low
        uint8_t val = readByte(SI5351_REG_OUTPUT_ENABLE);
        if (enable) {
            val &= ~mask;
        }
        else {
            val |= mask;
        }
        writeByte(SI5351_REG_OUTPUT_ENABLE, val);
    }

    void Device::setPllIntMode(synth::Pll pll, bool intMode) {
        uint8_t reg = (pll == synth::PLL_A) ? SI5351_REG_PLLA_CONTROL : SI5351_REG_PLLB_CONTROL;
        uint8_t val = readByte(reg) & ~SI5351_PLL_INT_MODE;
        if (intMode) { val |= SI5351_PLL_INT_MODE; }
        writeByte(reg, val);
    }

    void Device::setSpreadSpectrumEnabled(bool enabled) {
        uint8_t val = readByte(SI5351_REG_SSC_PARAMS) & ~SI5351_SSC_ENABLE;
        if (enabled) { val |= SI5351_SSC_ENABLE; }
        writeByte(SI5351_REG_SSC_PARAMS, val);
    }

    void Device::setDisableState(int clk, DisableState state) {
        if (clk < 0 || clk >= SI5351_CLOCK_COUNT) { throw std::runtime_error("Invalid clock output"); }
        uint8_t reg = (clk < 4) ? SI5351_REG_CLK3_0_DISABLE : SI5351_REG_CLK7_4_DISABLE;
        int shift = (clk % 4) * 2;
        uint8_t val = readByte(reg);
        val = (val & ~(0x03 << shift)) | ((int)state << shift);
        writeByte(reg, val);
    }

    void Device::resetPlls() {
        writeByte(SI5351_REG_PLL_RESET, SI5351_PLL_RESET_A | SI5351_PLL_RESET_B);
    }

    void Device::write(uint8_t reg, const std::vector<uint8_t>& data) {
        bus->write(addr, reg, data.data(), data.size());
    }

    void Device::writeByte(uint8_t reg, uint8_t val) {
        bus->writeByte(addr, reg, val);
    }

    uint8_t Device::readByte(uint8_t reg) {
        return bus->readByte(addr, reg);
    }
}
