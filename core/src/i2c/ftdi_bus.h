#pragma once
#include "mpsse.h"
#include <string>

#define FTDI_VID        0x0403
#define FT232H_PID      0x6014

struct ftdi_context;

namespace i2c {
    /**
     * FT232H adapter driven through libftdi1, SCL on AD0 and SDA on AD1 and AD2.
    */
    class FtdiBus : public MpsseBus {
    public:
        /**
         * Open the adapter and switch it to MPSSE I2C mode.
         * @param serial Serial number of the adapter, empty for the first one found.
         * @param clockHz I2C clock frequency.
        */
        FtdiBus(const std::string& serial = "", int clockHz = MPSSE_DEFAULT_I2C_CLOCK);
        FtdiBus(const FtdiBus&) = delete;
        FtdiBus& operator=(const FtdiBus&) = delete;
        ~FtdiBus();

    protected:
        void transfer(const std::vector<uint8_t>& cmd, uint8_t* resp, int respLen);

    private:
        void send(const std::vector<uint8_t>& cmd);
        void receive(uint8_t* data, int len);
        void syncMpsse();
        void close();

        ftdi_context* ctx = NULL;
        bool opened = false;
    };
}
