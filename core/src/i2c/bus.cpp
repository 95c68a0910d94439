#include "bus.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace i2c {
    bool Bus::probe(uint8_t addr) {
        try {
            readByte(addr, 0);
            return true;
        }
        catch (const std::runtime_error& e) {
            spdlog::debug("No answer from 0x{0:02X}: {1}", addr, e.what());
            return false;
        }
    }

    std::vector<uint8_t> scan(Bus* bus, uint8_t first, uint8_t last) {
        if (!bus) { throw std::runtime_error("Scanning needs an I2C bus"); }
        std::vector<uint8_t> found;
        for (int addr = first; addr <= last; addr++) {
            if (bus->probe(addr)) { found.push_back(addr); }
        }
        return found;
    }
}
