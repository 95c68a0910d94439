#pragma once
#include "bus.h"
#include <vector>

// MPSSE opcodes, see FTDI AN_108
#define MPSSE_WRITE_BYTES_NVE_MSB   0x11
#define MPSSE_WRITE_BITS_NVE_MSB    0x13
#define MPSSE_READ_BYTES_PVE_MSB    0x20
#define MPSSE_READ_BITS_PVE_MSB     0x22
#define MPSSE_SET_BITS_LOW          0x80
#define MPSSE_LOOPBACK_DISABLE      0x85
#define MPSSE_SET_CLOCK_DIVISOR     0x86
#define MPSSE_SEND_IMMEDIATE        0x87
#define MPSSE_CLOCK_DIV5_DISABLE    0x8A
#define MPSSE_3PHASE_ENABLE         0x8C
#define MPSSE_ADAPTIVE_DISABLE      0x97
#define MPSSE_DRIVE_ZERO_ONLY       0x9E

// ADBUS0 is SCL, ADBUS1 drives SDA and ADBUS2 reads it back
#define MPSSE_PIN_SCL               (1 << 0)
#define MPSSE_PIN_SDA_OUT           (1 << 1)
#define MPSSE_PIN_SDA_IN            (1 << 2)

#define MPSSE_BASE_CLOCK            60000000
#define MPSSE_DEFAULT_I2C_CLOCK     100000

namespace i2c {
    /**
     * Build the commands that put an MPSSE engine in I2C mode.
     * @param clockHz I2C clock frequency.
    */
    std::vector<uint8_t> mpsseSetupCommands(int clockHz);

    /**
     * I2C master running on an FTDI MPSSE engine. Each transaction is encoded as one
     * command buffer, the acknowledge bits and read data come back in one response.
     * The USB side is left to subclasses.
    */
    class MpsseBus : public Bus {
    public:
        void write(uint8_t addr, uint8_t reg, const uint8_t* data, int len);
        void read(uint8_t addr, uint8_t reg, uint8_t* data, int len);

    protected:
        /**
         * Send a command buffer and read back its response.
         * @param cmd Commands, ending with a send immediate.
         * @param resp Buffer for the response.
         * @param respLen Number of response bytes to wait for.
        */
        virtual void transfer(const std::vector<uint8_t>& cmd, uint8_t* resp, int respLen) = 0;

    private:
        void start(std::vector<uint8_t>& cmd);
        void stop(std::vector<uint8_t>& cmd);
        void putByte(std::vector<uint8_t>& cmd, uint8_t val);
        void getByte(std::vector<uint8_t>& cmd, bool ack);
        void setPins(std::vector<uint8_t>& cmd, uint8_t val, uint8_t dir);
        void checkAcks(const uint8_t* resp, int count, uint8_t addr);
    };
}
