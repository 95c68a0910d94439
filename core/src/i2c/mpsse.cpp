#include "mpsse.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace i2c {
    const uint8_t PINS_OUT = MPSSE_PIN_SCL | MPSSE_PIN_SDA_OUT;

    std::vector<uint8_t> mpsseSetupCommands(int clockHz) {
        if (clockHz <= 0) { throw std::runtime_error("Invalid I2C clock frequency"); }

        // Three phase clocking runs the clock at 2/3 of the divided base clock
        int div = MPSSE_BASE_CLOCK / (3 * clockHz) - 1;
        if (div < 0) { div = 0; }
        if (div > 0xFFFF) { div = 0xFFFF; }

        std::vector<uint8_t> cmd = {
            MPSSE_CLOCK_DIV5_DISABLE,
            MPSSE_ADAPTIVE_DISABLE,
            MPSSE_3PHASE_ENABLE,
            MPSSE_SET_CLOCK_DIVISOR, (uint8_t)(div & 0xFF), (uint8_t)(div >> 8),
            MPSSE_LOOPBACK_DISABLE,
            // Open drain emulation on SCL and SDA
            MPSSE_DRIVE_ZERO_ONLY, PINS_OUT | MPSSE_PIN_SDA_IN, 0x00,
            // Idle bus
            MPSSE_SET_BITS_LOW, PINS_OUT, PINS_OUT
        };
        return cmd;
    }

    void MpsseBus::setPins(std::vector<uint8_t>& cmd, uint8_t val, uint8_t dir) {
        cmd.push_back(MPSSE_SET_BITS_LOW);
        cmd.push_back(val);
        cmd.push_back(dir);
    }

    void MpsseBus::start(std::vector<uint8_t>& cmd) {
        // Repeat each step to stretch it to a full clock period
        for (int i = 0; i < 4; i++) { setPins(cmd, MPSSE_PIN_SCL | MPSSE_PIN_SDA_OUT, PINS_OUT); }
        for (int i = 0; i < 4; i++) { setPins(cmd, MPSSE_PIN_SCL, PINS_OUT); }
        setPins(cmd, 0, PINS_OUT);
    }

    void MpsseBus::stop(std::vector<uint8_t>& cmd) {
        for (int i = 0; i < 4; i++) { setPins(cmd, 0, PINS_OUT); }
        for (int i = 0; i < 4; i++) { setPins(cmd, MPSSE_PIN_SCL, PINS_OUT); }
        for (int i = 0; i < 4; i++) { setPins(cmd, MPSSE_PIN_SCL | MPSSE_PIN_SDA_OUT, PINS_OUT); }
    }

    void MpsseBus::putByte(std::vector<uint8_t>& cmd, uint8_t val) {
        cmd.push_back(MPSSE_WRITE_BYTES_NVE_MSB);
        cmd.push_back(0x00);
        cmd.push_back(0x00);
        cmd.push_back(val);

        // Release SDA and clock in the acknowledge bit
        setPins(cmd, 0, MPSSE_PIN_SCL);
        cmd.push_back(MPSSE_READ_BITS_PVE_MSB);
        cmd.push_back(0x00);
        setPins(cmd, MPSSE_PIN_SDA_OUT, PINS_OUT);
    }

    void MpsseBus::getByte(std::vector<uint8_t>& cmd, bool ack) {
        setPins(cmd, 0, MPSSE_PIN_SCL);
        cmd.push_back(MPSSE_READ_BYTES_PVE_MSB);
        cmd.push_back(0x00);
        cmd.push_back(0x00);

        // Acknowledge every byte but the last one
        setPins(cmd, 0, PINS_OUT);
        cmd.push_back(MPSSE_WRITE_BITS_NVE_MSB);
        cmd.push_back(0x00);
        cmd.push_back(ack ? 0x00 : 0xFF);
        setPins(cmd, MPSSE_PIN_SDA_OUT, PINS_OUT);
    }

    void MpsseBus::checkAcks(const uint8_t* resp, int count, uint8_t addr) {
        for (int i = 0; i < count; i++) {
            if (resp[i] & 0x01) {
                throw std::runtime_error(fmt::format("No acknowledge from 0x{:02X} on byte {}", addr, i));
            }
        }
    }

    void MpsseBus::write(uint8_t addr, uint8_t reg, const uint8_t* data, int len) {
        std::vector<uint8_t> cmd;
        start(cmd);
        putByte(cmd, addr << 1);
        putByte(cmd, reg);
        for (int i = 0; i < len; i++) { putByte(cmd, data[i]); }
        stop(cmd);
        cmd.push_back(MPSSE_SEND_IMMEDIATE);

        // One acknowledge per byte sent
        std::vector<uint8_t> resp(len + 2);
        transfer(cmd, resp.data(), resp.size());
        checkAcks(resp.data(), resp.size(), addr);
    }

    void MpsseBus::read(uint8_t addr, uint8_t reg, uint8_t* data, int len) {
        std::vector<uint8_t> cmd;
        start(cmd);
        putByte(cmd, addr << 1);
        putByte(cmd, reg);

        // Repeated start into the read
        start(cmd);
        putByte(cmd, (addr << 1) | 1);
        for (int i = 0; i < len; i++) { getByte(cmd, i < len - 1); }
        stop(cmd);
        cmd.push_back(MPSSE_SEND_IMMEDIATE);

        // Three acknowledges followed by the data
        std::vector<uint8_t> resp(len + 3);
        transfer(cmd, resp.data(), resp.size());
        checkAcks(resp.data(), 3, addr);
        for (int i = 0; i < len; i++) { data[i] = resp[3 + i]; }
    }
}
