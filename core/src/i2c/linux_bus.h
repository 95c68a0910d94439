#pragma once
#include "bus.h"
#include <string>

namespace i2c {
    /**
     * Linux i2c-dev adapter. USB bridges such as the CP2112 show up as /dev/i2c-N
     * through their kernel driver and work through this class as well.
    */
    class LinuxBus : public Bus {
    public:
        LinuxBus(const std::string& path);
        LinuxBus(const LinuxBus&) = delete;
        LinuxBus& operator=(const LinuxBus&) = delete;
        ~LinuxBus();

        void write(uint8_t addr, uint8_t reg, const uint8_t* data, int len);
        void read(uint8_t addr, uint8_t reg, uint8_t* data, int len);

    private:
        void select(uint8_t addr);

        std::string path;
        int fd = -1;
        int selected = -1;
    };
}
