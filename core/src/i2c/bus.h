#pragma once
#include <stdint.h>
#include <vector>

#define I2C_SCAN_FIRST_ADDR 0x08
#define I2C_SCAN_LAST_ADDR  0x77

namespace i2c {
    // Register oriented I2C transport, throws std::runtime_error on failure
    class Bus {
    public:
        virtual ~Bus() {}

        virtual void write(uint8_t addr, uint8_t reg, const uint8_t* data, int len) = 0;
        virtual void read(uint8_t addr, uint8_t reg, uint8_t* data, int len) = 0;

        /**
         * Check if a device acknowledges its address.
         * @return True if a read of register 0 succeeded.
        */
        virtual bool probe(uint8_t addr);

        void writeByte(uint8_t addr, uint8_t reg, uint8_t val) {
            write(addr, reg, &val, 1);
        }

        uint8_t readByte(uint8_t addr, uint8_t reg) {
            uint8_t val = 0;
            read(addr, reg, &val, 1);
            return val;
        }
    };

    /**
     * Check every address of a range.
     * @return Addresses that answered.
    */
    std::vector<uint8_t> scan(Bus* bus, uint8_t first = I2C_SCAN_FIRST_ADDR, uint8_t last = I2C_SCAN_LAST_ADDR);
}
