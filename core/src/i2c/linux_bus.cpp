#include "linux_bus.h"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <vector>
#include <string.h>
#include <errno.h>
#include <fcntl.h>
#include <unistd.h>
#include <sys/ioctl.h>
#include <linux/i2c-dev.h>

namespace i2c {
    LinuxBus::LinuxBus(const std::string& path) {
        this->path = path;
        fd = open(path.c_str(), O_RDWR);
        if (fd < 0) {
            throw std::runtime_error("Could not open I2C device " + path + ": " + strerror(errno));
        }
        spdlog::info("Opened I2C device {0}", path);
    }

    LinuxBus::~LinuxBus() {
        if (fd >= 0) { close(fd); }
    }

    void LinuxBus::select(uint8_t addr) {
        if (selected == addr) { return; }
        if (ioctl(fd, I2C_SLAVE, addr) < 0) {
            throw std::runtime_error("Could not select I2C address on " + path + ": " + strerror(errno));
        }
        selected = addr;
    }

    void LinuxBus::write(uint8_t addr, uint8_t reg, const uint8_t* data, int len) {
        select(addr);

        // The register address goes first, followed by the data
        std::vector<uint8_t> buf(len + 1);
        buf[0] = reg;
        memcpy(&buf[1], data, len);
        if (::write(fd, buf.data(), buf.size()) != (ssize_t)buf.size()) {
            throw std::runtime_error("I2C write to register " + std::to_string(reg) + " failed: " + strerror(errno));
        }
    }

    void LinuxBus::read(uint8_t addr, uint8_t reg, uint8_t* data, int len) {
        select(addr);
        if (::write(fd, &reg, 1) != 1) {
            throw std::runtime_error("I2C write of register address " + std::to_string(reg) + " failed: " + strerror(errno));
        }
        if (::read(fd, data, len) != len) {
            throw std::runtime_error("I2C read from register " + std::to_string(reg) + " failed: " + strerror(errno));
        }
    }
}
