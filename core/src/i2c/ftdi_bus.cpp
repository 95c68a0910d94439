#include "ftdi_bus.h"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <ftdi.h>

namespace i2c {
    const int READ_RETRIES = 100;

    FtdiBus::FtdiBus(const std::string& serial, int clockHz) {
        ctx = ftdi_new();
        if (!ctx) { throw std::runtime_error("Could not allocate FTDI context"); }

        try {
            if (ftdi_set_interface(ctx, INTERFACE_A) < 0) {
                throw std::runtime_error(std::string("Could not select FTDI interface: ") + ftdi_get_error_string(ctx));
            }
            if (ftdi_usb_open_desc(ctx, FTDI_VID, FT232H_PID, NULL, serial.empty() ? NULL : serial.c_str()) < 0) {
                throw std::runtime_error(std::string("Could not open FT232H: ") + ftdi_get_error_string(ctx));
            }
            opened = true;

            // Start from a clean MPSSE state
            if (ftdi_usb_reset(ctx) < 0 ||
                ftdi_usb_purge_buffers(ctx) < 0 ||
                ftdi_set_latency_timer(ctx, 1) < 0 ||
                ftdi_set_bitmode(ctx, 0, BITMODE_RESET) < 0 ||
                ftdi_set_bitmode(ctx, 0, BITMODE_MPSSE) < 0) {
                throw std::runtime_error(std::string("Could not set up FT232H: ") + ftdi_get_error_string(ctx));
            }

            syncMpsse();
            send(mpsseSetupCommands(clockHz));
        }
        catch (const std::runtime_error&) {
            close();
            throw;
        }

        spdlog::info("Opened FT232H{0}, I2C clock {1} Hz", serial.empty() ? "" : " " + serial, clockHz);
    }

    FtdiBus::~FtdiBus() {
        close();
    }

    void FtdiBus::close() {
        if (!ctx) { return; }
        if (opened) {
            ftdi_set_bitmode(ctx, 0, BITMODE_RESET);
            ftdi_usb_close(ctx);
            opened = false;
        }
        ftdi_free(ctx);
        ctx = NULL;
    }

    void FtdiBus::syncMpsse() {
        // An invalid opcode is answered with 0xFA followed by the opcode
        std::vector<uint8_t> bad = { 0xAA };
        send(bad);
        uint8_t resp[2];
        receive(resp, 2);
        if (resp[0] != 0xFA || resp[1] != 0xAA) {
            throw std::runtime_error("FT232H MPSSE engine did not synchronize");
        }
    }

    void FtdiBus::send(const std::vector<uint8_t>& cmd) {
        int ret = ftdi_write_data(ctx, cmd.data(), cmd.size());
        if (ret != (int)cmd.size()) {
            throw std::runtime_error(std::string("FT232H write failed: ") + ftdi_get_error_string(ctx));
        }
    }

    void FtdiBus::receive(uint8_t* data, int len) {
        int got = 0;
        for (int i = 0; i < READ_RETRIES && got < len; i++) {
            int ret = ftdi_read_data(ctx, data + got, len - got);
            if (ret < 0) {
                throw std::runtime_error(std::string("FT232H read failed: ") + ftdi_get_error_string(ctx));
            }
            got += ret;
        }
        if (got < len) {
            throw std::runtime_error("FT232H read timed out");
        }
    }

    void FtdiBus::transfer(const std::vector<uint8_t>& cmd, uint8_t* resp, int respLen) {
        send(cmd);
        receive(resp, respLen);
    }
}
