#pragma once
#include "bus.h"
#include <vector>

namespace i2c {
    // In-memory register image standing in for a device, writes are logged.
    // Accesses to any other address fail like a missing acknowledge would.
    class DryRunBus : public Bus {
    public:
        DryRunBus(uint8_t addr = 0x60);

        void write(uint8_t addr, uint8_t reg, const uint8_t* data, int len);
        void read(uint8_t addr, uint8_t reg, uint8_t* data, int len);

        uint8_t reg(int reg) const { return regs[reg & 0xFF]; }
        void setReg(int reg, uint8_t val) { regs[reg & 0xFF] = val; }

        int getWriteCount() const { return writeCount; }
        uint8_t getAddress() const { return addr; }

    private:
        void checkAddress(uint8_t addr);

        uint8_t addr;
        uint8_t regs[256];
        int writeCount = 0;
    };
}
