#include <core.h>
#include <version.h>
#include <synth/errors.h>
#include <si5351/device.h>
#include <i2c/linux_bus.h>
#include <i2c/dry_run_bus.h>
#include <i2c/mpsse.h>
#ifdef SYNTHPP_HAS_FTDI
#include <i2c/ftdi_bus.h>
#endif
#include <utils/hrfreq.h>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <memory>
#include <math.h>
#include <stdlib.h>

namespace core {
    ConfigManager configManager;
    CommandArgsParser args;

    json defaultConfig() {
        json def;
        def["adapter"] = "i2c-dev";
        def["i2cDevice"] = "/dev/i2c-1";
        def["ftdiSerial"] = "";
        def["i2cClock"] = MPSSE_DEFAULT_I2C_CLOCK;
        def["i2cAddress"] = SI5351_DEFAULT_ADDR;
        def["driveStrength"] = 8;
        def["crystalLoad"] = 8;
        def["sscAmplitude"] = 0.015;
        def["sscMode"] = "DOWN";
        def["testSeed"] = 0;
        return def;
    }

    std::string defaultRoot() {
        const char* home = getenv("HOME");
        std::string root = home ? std::string(home) + "/.config/synthpp" : ".";
        return std::filesystem::absolute(root).string();
    }

    bool buildRequest(synth::FrequencyRequest& req) {
        req = synth::FrequencyRequest();

        if (!hrfreq::fromString(args.positional("fout0"), req.fout0)) { return false; }
        if (args.hasPositional("fout2")) {
            if (!hrfreq::fromString(args.positional("fout2"), req.fout2)) { return false; }
            req.hasFout2 = true;
        }

        int diff = args["differential"].i();
        switch (diff) {
        case 0: req.differential = synth::DIFF_NONE; break;
        case 1: req.differential = synth::DIFF_CH1; break;
        case 2: req.differential = synth::DIFF_CH2; break;
        default:
            spdlog::error("Differential channel must be 1 or 2, got {0}", diff);
            return false;
        }

        // Spread spectrum settings default to the config
        req.ssc.enabled = args["ssc"].b();
        req.ssc.amplitude = args["amp"].provided() ? args["amp"].d() : configManager.conf["sscAmplitude"].get<double>();
        std::string mode = args["mode"].provided() ? args["mode"].s() : configManager.conf["sscMode"].get<std::string>();
        if (!synth::sscModeFromString(mode, req.ssc.mode)) {
            spdlog::error("Invalid spread spectrum mode '{0}', expected CENTER or DOWN", mode);
            return false;
        }

        return true;
    }

    synth::ChannelPlan planWithFallback(synth::FrequencyRequest& req, bool useNearest) {
        // Each of the two frequencies may need to be snapped once
        for (int attempt = 0;; attempt++) {
            try {
                return synth::planChannels(req);
            }
            catch (const synth::UnreachableFrequency& e) {
                if (!useNearest || e.nearest <= 0.0 || attempt >= 2) { throw; }
                spdlog::warn("{0} MHz is not achievable, using {1} MHz instead", e.frequency, e.nearest);
                if (e.frequency == req.fout0) {
                    req.fout0 = e.nearest;
                }
                else if (req.hasFout2 && e.frequency == req.fout2) {
                    req.fout2 = e.nearest;
                }
                else {
                    throw;
                }
            }
        }
    }

    void showOutput(int ch, double requested, const synth::OutputPlan& out, const synth::Fraction& pll) {
        const synth::MultisynthPlan& ms = out.ms;
        spdlog::debug("Clock {0}: PLL {1} a={2} b={3} c={4}, multisynth a={5} b={6} c={7}, rdiv={8}, divby4={9}",
                      ch, (out.pll == synth::PLL_A) ? 'A' : 'B', pll.a, pll.b, pll.c,
                      ms.divider.a, ms.divider.b, ms.divider.c, ms.rDiv, ms.divBy4);

        std::string suffix = out.inverted ? " Inverted (Differential)" : "";
        if (fabs(requested - ms.achieved) > 1e-6) {
            spdlog::warn("Clock {0}: {1}{2} (requested {3}, error {4:.3e})", ch, hrfreq::toString(ms.achieved), suffix, hrfreq::toString(requested), ms.error);
        }
        else {
            spdlog::info("Clock {0}: {1}{2}", ch, hrfreq::toString(ms.achieved), suffix);
        }
    }

    void showPlan(const synth::FrequencyRequest& req, const synth::ChannelPlan& plan) {
        for (int i = 0; i < synth::_PLL_COUNT; i++) {
            if (!plan.plls[i].used) { continue; }
            const synth::VcoCandidate& vco = plan.plls[i].vco;
            spdlog::info("PLL {0}: VCO {1} ({2}+{3}/{4})", (i == synth::PLL_A) ? 'A' : 'B', hrfreq::toString(vco.vco), vco.pll.a, vco.pll.b, vco.pll.c);
        }

        for (int ch = 0; ch < synth::CHANNEL_COUNT; ch++) {
            const synth::OutputPlan& out = plan.outputs[ch];
            if (!out.enabled) { continue; }
            double requested = (ch == 2 && !out.sharedMultisynth) ? req.fout2 : req.fout0;
            showOutput(ch, requested, out, plan.pllRatio(ch));
        }

        if (plan.ssc.enabled) {
            spdlog::info("SSC: amplitude = {0}, mode = {1}, PLL A ratio = {2}", plan.ssc.amplitude, synth::sscModeToString(plan.ssc.mode), plan.plls[synth::PLL_A].vco.pll.a);
        }
    }

    void showReport(const synth::TestReport& report) {
        spdlog::info("Total tests: {0}", report.tests);
        spdlog::info("Total pass: {0}", report.passes);
        spdlog::info("Total fail: {0}", report.failures);
        spdlog::info("Success rate: {0:.2f}%", report.successRate() * 100.0);
        spdlog::info("Failure rate: {0:.2f}%", report.failureRate() * 100.0);
        spdlog::info("Max error: {0:.6f}%", report.maxError * 100.0);
        for (const auto& br : report.bands) {
            if (!br.tests) { continue; }
            spdlog::info("{0}-{1} MHz: {2} pass, {3} fail ({4:.1f}% success, max error {5:.6f}%)",
                         br.band.min, br.band.max, br.passes, br.failures, br.successRate() * 100.0, br.maxError * 100.0);
        }
        if (report.failures) {
            spdlog::warn("{0} tests failed out of {1}", report.failures, report.tests);
        }
        else {
            spdlog::info("All tests passed");
        }
    }

    std::unique_ptr<i2c::Bus> openBus(uint8_t addr) {
        if (args["dry-run"].b()) {
            spdlog::info("Dry run, no hardware will be accessed");
            return std::make_unique<i2c::DryRunBus>(addr);
        }

        std::string adapter = args["adapter"].provided() ? args["adapter"].s() : configManager.conf["adapter"].get<std::string>();
        if (adapter == "i2c-dev") {
            std::string dev = args["device"].provided() ? args["device"].s() : configManager.conf["i2cDevice"].get<std::string>();
            return std::make_unique<i2c::LinuxBus>(dev);
        }
        if (adapter == "ftdi") {
#ifdef SYNTHPP_HAS_FTDI
            return std::make_unique<i2c::FtdiBus>(configManager.conf["ftdiSerial"].get<std::string>(), configManager.conf["i2cClock"].get<int>());
#else
            throw std::runtime_error("This build has no FT232H support (libftdi1 was not found)");
#endif
        }
        throw std::runtime_error("Unknown adapter '" + adapter + "', expected i2c-dev or ftdi");
    }

    void showDevices(i2c::Bus* bus) {
        std::vector<uint8_t> found = i2c::scan(bus);
        std::string list;
        for (uint8_t addr : found) { list += fmt::format(" 0x{:02X}", addr); }
        spdlog::info("{0} device(s) answered on the bus:{1}", found.size(), list);

        bool any = false;
        for (const auto& res : si5351::probeDevices(bus)) {
            if (!res.found) {
                spdlog::info("No Si5351 at 0x{0:02X}", res.addr);
                continue;
            }
            any = true;
            const si5351::DeviceStatus& st = res.status;
            spdlog::info("Si5351 at 0x{0:02X}: revision {1}, SYS_INIT={2}, LOL_A={3}, LOL_B={4}, LOS_CLKIN={5}",
                         res.addr, st.revision, st.sysInit, st.pllALol, st.pllBLol, st.clkinLos);
        }
        if (!any) {
            spdlog::warn("No Si5351 found at 0x{0:02X} or 0x{1:02X}, check power, crystal and the ADDR pin", SI5351_DEFAULT_ADDR, SI5351_ALT_ADDR);
        }
    }
};

int synthpp_main(int argc, char* argv[]) {
    // Define command line options and parse arguments
    core::args.defineAll();
    if (core::args.parse(argc, argv) < 0) { return -1; }

    // Show help and exit if requested
    if (core::args["help"].b()) {
        core::args.showHelp();
        return 0;
    }

    if (core::args["verbose"].b()) { spdlog::set_level(spdlog::level::debug); }
    spdlog::info("Synth++ v" VERSION_STR);

    // Check root directory
    std::string root = core::args["root"].provided() ? core::args["root"].s() : core::defaultRoot();
    if (!std::filesystem::exists(root)) {
        spdlog::warn("Root directory {0} does not exist, creating it", root);
        std::error_code ec;
        if (!std::filesystem::create_directories(root, ec)) {
            spdlog::error("Could not create root directory {0}", root);
            return -1;
        }
    }
    if (!std::filesystem::is_directory(root)) {
        spdlog::error("{0} is not a directory", root);
        return -1;
    }

    // Load config
    spdlog::debug("Loading config");
    core::configManager.setPath(root + "/config.json");
    if (!core::configManager.load(core::defaultConfig())) { return -1; }
    json& conf = core::configManager.conf;

    // Test mode only exercises the engine
    int iterations = core::args["test"].i();
    if (core::args["test"].provided()) {
        if (iterations <= 0) {
            spdlog::error("Test iteration count must be positive");
            return -1;
        }
        int seed = core::args["seed"].provided() ? core::args["seed"].i() : conf["testSeed"].get<int>();
        spdlog::info("Running parameter calculation test with {0} iterations per band (seed {1})", iterations, seed);
        synth::TestReport report = synth::runTest(iterations, (uint64_t)seed);
        core::showReport(report);
        return report.failures ? 1 : 0;
    }

    int addr = core::args["address"].provided() ? core::args["address"].i() : conf["i2cAddress"].get<int>();
    int drive = conf["driveStrength"].get<int>();
    int load = conf["crystalLoad"].get<int>();
    if (addr < 0 || addr > 0x7F) {
        spdlog::error("Invalid I2C address {0}", addr);
        return -1;
    }

    // Plan before touching the hardware so bad requests don't disturb the outputs
    synth::FrequencyRequest req;
    synth::ChannelPlan plan;
    bool hasFreq = core::args.hasPositional("fout0");
    if (hasFreq) {
        if (!core::buildRequest(req)) { return -1; }
        try {
            plan = core::planWithFallback(req, core::args["nearest"].b());
        }
        catch (const synth::SynthError& e) {
            spdlog::error("{0}", e.what());
            return -1;
        }
    }

    try {
        std::unique_ptr<i2c::Bus> bus = core::openBus(addr);
        if (core::args["probe"].b()) {
            core::showDevices(bus.get());
            return 0;
        }

        si5351::Device dev(bus.get(), addr);
        dev.init(load);
        if (!hasFreq) {
            spdlog::info("Si5351 initialized, no frequency configuration applied");
            return 0;
        }
        dev.apply(plan, drive);
    }
    catch (const std::runtime_error& e) {
        spdlog::error("{0}", e.what());
        return -1;
    }

    core::showPlan(req, plan);
    return 0;
}
