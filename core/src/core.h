#pragma once
#include <config.h>
#include <synth/channel_plan.h>
#include <synth/verify.h>
#include "command_args.h"
#include <i2c/bus.h>
#include <memory>

namespace core {
    extern ConfigManager configManager;
    extern CommandArgsParser args;

    json defaultConfig();

    /**
     * Build a frequency request from the command line, using the config for defaults.
     * @return False if an argument is invalid.
    */
    bool buildRequest(synth::FrequencyRequest& req);

    /**
     * Plan the channels of a request. If enabled, a frequency that DIVBY4 can't produce
     * is replaced by the nearest one that it can.
    */
    synth::ChannelPlan planWithFallback(synth::FrequencyRequest& req, bool useNearest);

    void showPlan(const synth::FrequencyRequest& req, const synth::ChannelPlan& plan);
    void showReport(const synth::TestReport& report);

    /**
     * Open the I2C transport selected by the command line and config.
     * @param addr Chip address, used by the dry run image.
    */
    std::unique_ptr<i2c::Bus> openBus(uint8_t addr);

    // Scan the bus and report any Si5351 at its two possible addresses
    void showDevices(i2c::Bus* bus);
};

int synthpp_main(int argc, char* argv[]);
