#include "dry_run_bus.h"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string.h>

namespace i2c {
    DryRunBus::DryRunBus(uint8_t addr) {
        this->addr = addr;
        memset(regs, 0, sizeof(regs));
    }

    void DryRunBus::checkAddress(uint8_t addr) {
        if (addr != this->addr) {
            throw std::runtime_error(fmt::format("No device acknowledged address 0x{:02X}", addr));
        }
    }

    void DryRunBus::write(uint8_t addr, uint8_t reg, const uint8_t* data, int len) {
        checkAddress(addr);
        if (reg + len > 256) { throw std::runtime_error("Write past the end of the register map"); }

        std::string hex;
        for (int i = 0; i < len; i++) {
            regs[reg + i] = data[i];
            hex += fmt::format("{:02X} ", data[i]);
        }
        writeCount++;
        spdlog::debug("I2C 0x{0:02X} write reg {1}: {2}", addr, reg, hex);
    }

    void DryRunBus::read(uint8_t addr, uint8_t reg, uint8_t* data, int len) {
        checkAddress(addr);
        if (reg + len > 256) { throw std::runtime_error("Read past the end of the register map"); }
        memcpy(data, &regs[reg], len);
    }
}
