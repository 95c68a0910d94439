#pragma once
#include "registers.h"
#include <i2c/bus.h>

#define SI5351_DEFAULT_ADDR 0x60
#define SI5351_ALT_ADDR     0x61

namespace si5351 {
    struct DeviceStatus {
        bool sysInit;   // Device still initializing
        bool pllALol;   // PLL A lost lock
        bool pllBLol;   // PLL B lost lock
        bool clkinLos;  // CLKIN signal lost
        int revision;
    };

    struct ProbeResult {
        uint8_t addr;
        bool found;
        DeviceStatus status;
    };

    /**
     * Look for a chip at both addresses the ADDR pin can select.
     * @return One result per address, with the status register of the chips found.
    */
    std::vector<ProbeResult> probeDevices(i2c::Bus* bus);

    class Device {
    public:
        Device(i2c::Bus* bus, uint8_t addr = SI5351_DEFAULT_ADDR);

        /**
         * Bring the chip into a known state with every output off.
         * @param crystalLoad Crystal load capacitance in pF (6, 8 or 10).
        */
        void init(int crystalLoad = 8);

        /**
         * Write a channel plan, reset the PLLs and enable the planned outputs.
         * @param driveStrength Output drive strength in mA.
        */
        void apply(const synth::ChannelPlan& plan, int driveStrength = 8);

        DeviceStatus status();
        void clearStatus();

        void disableAllOutputs(bool powerDown = true);
        void enableOutputs(int mask, bool enable);
        void setPllIntMode(synth::Pll pll, bool intMode);
        void setSpreadSpectrumEnabled(bool enabled);
        void setDisableState(int clk, DisableState state);
        void resetPlls();

    private:
        void write(uint8_t reg, const std::vector<uint8_t>& data);
        void writeByte(uint8_t reg, uint8_t val);
        uint8_t readByte(uint8_t reg);

        i2c::Bus* bus;
        uint8_t addr;
    };
}
