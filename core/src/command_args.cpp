#include "command_args.h"
#include <spdlog/spdlog.h>
#include <ctype.h>
#include <stdio.h>

void CommandArgsParser::defineAll() {
    define('h', "help", "Show help");
    define('r', "root", "Root directory, where the config file is stored", std::string(""));
    define('d', "differential", "Output an inverted copy of CH0 on channel 1 or 2", 0);
    define('s', "ssc", "Enable spread spectrum clocking on PLL A");
    define('a', "amp", "Spread spectrum peak-to-peak amplitude as a fraction", 0.015);
    define('m', "mode", "Spread spectrum mode (CENTER or DOWN)", "DOWN");
    define('t', "test", "Run the parameter test with the given number of iterations per band", 0);
    define(0, "seed", "Seed of the test frequency generator", 0);
    define('n', "dry-run", "Don't talk to hardware, log register writes instead");
    define(0, "adapter", "I2C adapter (i2c-dev or ftdi)", "i2c-dev");
    define(0, "device", "I2C device path for the i2c-dev adapter", "/dev/i2c-1");
    define(0, "address", "I2C address of the chip", 0x60);
    define(0, "nearest", "Use the nearest achievable frequency when a DIVBY4 frequency is unreachable");
    define(0, "probe", "Scan the bus and show the status of the Si5351");
    define('v', "verbose", "Show debug output");
    definePositional("fout0", "Output frequency of CH0 (MHz unless a unit is given)");
    definePositional("fout2", "Independent output frequency of CH2");
}

int CommandArgsParser::parse(int argc, char* argv[]) {
    positionals.clear();
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        // Anything not starting with a dash, or a negative number, is positional
        bool negNumber = (arg.size() > 1 && arg[0] == '-' && (isdigit(arg[1]) || arg[1] == '.'));
        if (arg.rfind("-", 0) || negNumber) {
            if (positionals.size() >= positionalNames.size()) {
                spdlog::error("Unexpected argument '{0}'", arg);
                showHelp();
                return -1;
            }
            positionals[positionalNames[positionals.size()]] = arg;
            continue;
        }

        // Check for long and short name arguments
        if (!arg.rfind("--", 0)) {
            arg = arg.substr(2);
        }
        else {
            if (arg.size() != 2 || aliases.find(arg[1]) == aliases.end()) {
                spdlog::error("Unknown argument '{0}'", arg);
                showHelp();
                return -1;
            }
            arg = aliases[arg[1]];
        }

        // Make sure the argument exists
        if (args.find(arg) == args.end()) {
            spdlog::error("Unknown argument '{0}'", arg);
            showHelp();
            return -1;
        }

        // Parse depending on type
        CLIArg& carg = args[arg];
        carg.set = true;

        // If not void, make sure an argument is available and retrieve it
        if (carg.type != CLI_ARG_TYPE_VOID && i + 1 >= argc) {
            spdlog::error("Missing value for argument '{0}'", arg);
            showHelp();
            return -1;
        }

        // Parse void since arg won't be needed
        if (carg.type == CLI_ARG_TYPE_VOID) {
            carg.bval = true;
            continue;
        }

        // Parse types that require parsing
        std::string val = argv[++i];
        if (carg.type == CLI_ARG_TYPE_BOOL) {
            // Enforce lower case
            for (size_t j = 0; j < val.size(); j++) { val[j] = tolower(val[j]); }

            if (val == "true" || val == "on" || val == "1") {
                carg.bval = true;
            }
            else if (val == "false" || val == "off" || val == "0") {
                carg.bval = false;
            }
            else {
                spdlog::error("Invalid value for '{0}', expected bool (true, false, on, off, 1, 0)", arg);
                showHelp();
                return -1;
            }
        }
        else if (carg.type == CLI_ARG_TYPE_INT) {
            try {
                size_t used = 0;
                carg.ival = std::stoi(val, &used, 0);
                if (used != val.size()) { throw std::invalid_argument(val); }
            }
            catch (const std::exception& e) {
                spdlog::error("Invalid value for '{0}', failed to parse integer", arg);
                showHelp();
                return -1;
            }
        }
        else if (carg.type == CLI_ARG_TYPE_FLOAT) {
            try {
                size_t used = 0;
                carg.fval = std::stod(val, &used);
                if (used != val.size()) { throw std::invalid_argument(val); }
            }
            catch (const std::exception& e) {
                spdlog::error("Invalid value for '{0}', failed to parse float", arg);
                showHelp();
                return -1;
            }
        }
        else if (carg.type == CLI_ARG_TYPE_STRING) {
            carg.sval = val;
        }
    }

    return 0;
}

void CommandArgsParser::showHelp() {
    printf("Usage: synthpp [options]");
    for (const auto& name : positionalNames) { printf(" [%s]", name.c_str()); }
    printf("\n\n");
    for (size_t i = 0; i < positionalNames.size(); i++) {
        printf("   \t%-16s%s\n", positionalNames[i].c_str(), positionalDescs[i].c_str());
    }
    for (auto const& [ln, arg] : args) {
        if (arg.alias) {
            printf("-%c\t--%-14s%s\n", arg.alias, ln.c_str(), arg.description.c_str());
        }
        else {
            printf("  \t--%-14s%s\n", ln.c_str(), arg.description.c_str());
        }
    }
}

bool CommandArgsParser::hasPositional(const std::string& name) const {
    return positionals.find(name) != positionals.end();
}

const std::string& CommandArgsParser::positional(const std::string& name) const {
    auto it = positionals.find(name);
    if (it == positionals.end()) { throw std::runtime_error("Positional argument " + name + " not given"); }
    return it->second;
}
