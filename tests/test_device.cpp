#include <gtest/gtest.h>
#include <si5351/device.h>
#include <i2c/dry_run_bus.h>

using namespace si5351;

class DeviceTest : public ::testing::Test {
protected:
    void SetUp() override {
        dev = new Device(&bus);
        dev->init(8);
    }

    void TearDown() override {
        delete dev;
    }

    synth::ChannelPlan plan(double fout0, synth::DiffChannel diff = synth::DIFF_NONE, bool ssc = false) {
        synth::FrequencyRequest req;
        req.fout0 = fout0;
        req.differential = diff;
        req.ssc.enabled = ssc;
        return synth::planChannels(req);
    }

    i2c::DryRunBus bus;
    Device* dev = NULL;
};

TEST(Device, NeedsBus) {
    EXPECT_THROW({ Device dev(NULL); }, std::runtime_error);
}

TEST_F(DeviceTest, InitState) {
    EXPECT_EQ(bus.reg(SI5351_REG_OUTPUT_ENABLE), 0xFF);
    EXPECT_EQ(bus.reg(SI5351_REG_OEB_PIN), 0xFF);
    EXPECT_EQ(bus.reg(SI5351_REG_XTAL_LOAD), 0x92);
    EXPECT_EQ(bus.reg(SI5351_REG_PLL_SOURCE), 0x00);
    EXPECT_EQ(bus.reg(SI5351_REG_PLL_RESET), SI5351_PLL_RESET_A | SI5351_PLL_RESET_B);
    EXPECT_EQ(bus.reg(SI5351_REG_FANOUT), 0x00);

    // All clocks high impedance when disabled
    EXPECT_EQ(bus.reg(SI5351_REG_CLK3_0_DISABLE), 0xAA);
    EXPECT_EQ(bus.reg(SI5351_REG_CLK7_4_DISABLE), 0xAA);

    EXPECT_TRUE(bus.reg(SI5351_REG_PLLA_CONTROL) & SI5351_PLL_INT_MODE);
    EXPECT_TRUE(bus.reg(SI5351_REG_PLLB_CONTROL) & SI5351_PLL_INT_MODE);
    EXPECT_FALSE(bus.reg(SI5351_REG_SSC_PARAMS) & SI5351_SSC_ENABLE);

    EXPECT_EQ(bus.reg(SI5351_REG_CLK0_CONTROL), 0x4C);
    EXPECT_EQ(bus.reg(SI5351_REG_CLK0_CONTROL + 2), 0x6C);
    EXPECT_GT(bus.getWriteCount(), 0);
}

TEST_F(DeviceTest, ApplyDifferential) {
    dev->apply(plan(100.0, synth::DIFF_CH1), 8);

    // CLK0 and CLK1 enabled (active low), CLK2 off
    EXPECT_EQ(bus.reg(SI5351_REG_OUTPUT_ENABLE), 0xFC);
    EXPECT_EQ(bus.reg(SI5351_REG_CLK0_CONTROL), 0x4F);
    EXPECT_EQ(bus.reg(SI5351_REG_CLK0_CONTROL + 1), 0x4F | SI5351_CLK_INVERT);
    EXPECT_EQ(bus.reg(SI5351_REG_CLK0_CONTROL + 2), SI5351_CLK_POWER_DOWN);

    // Both legs carry the same multisynth settings
    for (int i = 0; i < SI5351_SYNTH_REG_COUNT; i++) {
        EXPECT_EQ(bus.reg(SI5351_REG_MS0_PARAMS + i), bus.reg(SI5351_REG_MS0_PARAMS + SI5351_SYNTH_REG_COUNT + i));
    }

    // 600MHz integer VCO
    const uint8_t pll[] = { 0x00, 0x01, 0x00, 0x0A, 0x00, 0x00, 0x00, 0x00 };
    for (int i = 0; i < SI5351_SYNTH_REG_COUNT; i++) {
        EXPECT_EQ(bus.reg(SI5351_REG_PLLA_PARAMS + i), pll[i]);
    }
    EXPECT_TRUE(bus.reg(SI5351_REG_PLLA_CONTROL) & SI5351_PLL_INT_MODE);
}

TEST_F(DeviceTest, ApplySpreadSpectrum) {
    dev->apply(plan(100.0, synth::DIFF_NONE, true), 8);
    EXPECT_TRUE(bus.reg(SI5351_REG_SSC_PARAMS) & SI5351_SSC_ENABLE);
    EXPECT_FALSE(bus.reg(SI5351_REG_PLLA_CONTROL) & SI5351_PLL_INT_MODE);
    EXPECT_EQ(bus.reg(SI5351_REG_OUTPUT_ENABLE), 0xFE);

    // Spread spectrum is turned back off by a plan without it
    dev->apply(plan(100.0), 8);
    EXPECT_FALSE(bus.reg(SI5351_REG_SSC_PARAMS) & SI5351_SSC_ENABLE);
    EXPECT_TRUE(bus.reg(SI5351_REG_PLLA_CONTROL) & SI5351_PLL_INT_MODE);
}

TEST_F(DeviceTest, FractionalPllLeavesIntegerMode) {
    dev->apply(plan(12.288), 8);
    EXPECT_TRUE(bus.reg(SI5351_REG_PLLA_CONTROL) & SI5351_PLL_INT_MODE);

    dev->apply(plan(7.3728), 8);
    EXPECT_FALSE(bus.reg(SI5351_REG_PLLA_CONTROL) & SI5351_PLL_INT_MODE);
}

TEST_F(DeviceTest, Status) {
    bus.setReg(SI5351_REG_STATUS, 0xA1);
    DeviceStatus st = dev->status();
    EXPECT_TRUE(st.sysInit);
    EXPECT_TRUE(st.pllALol);
    EXPECT_FALSE(st.pllBLol);
    EXPECT_FALSE(st.clkinLos);
    EXPECT_EQ(st.revision, 1);
}

TEST_F(DeviceTest, OutputControl) {
    dev->enableOutputs(0x05, true);
    EXPECT_EQ(bus.reg(SI5351_REG_OUTPUT_ENABLE), 0xFA);
    dev->enableOutputs(0x01, false);
    EXPECT_EQ(bus.reg(SI5351_REG_OUTPUT_ENABLE), 0xFB);

    dev->setDisableState(5, DISABLE_NEVER);
    EXPECT_EQ(bus.reg(SI5351_REG_CLK7_4_DISABLE), 0xAE);
    EXPECT_THROW(dev->setDisableState(8, DISABLE_LOW), std::runtime_error);

    dev->disableAllOutputs();
    EXPECT_EQ(bus.reg(SI5351_REG_OUTPUT_ENABLE), 0xFF);
    EXPECT_EQ(bus.reg(SI5351_REG_CLK0_CONTROL), SI5351_CLK_POWER_DOWN);
}

TEST(DryRunBus, Bounds) {
    i2c::DryRunBus bus;
    uint8_t data[10] = { 0 };
    EXPECT_THROW(bus.write(SI5351_DEFAULT_ADDR, 250, data, 10), std::runtime_error);
    EXPECT_THROW(bus.read(SI5351_DEFAULT_ADDR, 250, data, 10), std::runtime_error);

    bus.writeByte(SI5351_DEFAULT_ADDR, 10, 0x42);
    EXPECT_EQ(bus.readByte(SI5351_DEFAULT_ADDR, 10), 0x42);
    EXPECT_EQ(bus.getWriteCount(), 1);
}

TEST(DryRunBus, OtherAddress) {
    i2c::DryRunBus bus(SI5351_ALT_ADDR);
    EXPECT_EQ(bus.getAddress(), SI5351_ALT_ADDR);
    EXPECT_THROW(bus.writeByte(SI5351_DEFAULT_ADDR, 3, 0xFF), std::runtime_error);
    EXPECT_THROW(bus.readByte(SI5351_DEFAULT_ADDR, 0), std::runtime_error);
    EXPECT_FALSE(bus.probe(SI5351_DEFAULT_ADDR));
    EXPECT_TRUE(bus.probe(SI5351_ALT_ADDR));
    EXPECT_EQ(bus.getWriteCount(), 0);
}

TEST(Device, FindDevices) {
    EXPECT_THROW(probeDevices(NULL), std::runtime_error);

    i2c::DryRunBus bus(SI5351_ALT_ADDR);
    bus.setReg(SI5351_REG_STATUS, 0x41);

    std::vector<uint8_t> found = i2c::scan(&bus);
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0], SI5351_ALT_ADDR);

    std::vector<ProbeResult> res = probeDevices(&bus);
    ASSERT_EQ(res.size(), 2u);
    EXPECT_EQ(res[0].addr, SI5351_DEFAULT_ADDR);
    EXPECT_FALSE(res[0].found);
    EXPECT_EQ(res[1].addr, SI5351_ALT_ADDR);
    EXPECT_TRUE(res[1].found);
    EXPECT_TRUE(res[1].status.pllBLol);
    EXPECT_FALSE(res[1].status.pllALol);
    EXPECT_EQ(res[1].status.revision, 1);

    // Nothing is written while searching
    EXPECT_EQ(bus.getWriteCount(), 0);
}
