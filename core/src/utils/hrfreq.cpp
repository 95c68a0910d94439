#include "hrfreq.h"
#include <spdlog/spdlog.h>
#include <ctype.h>
#include <stdio.h>

namespace hrfreq {
    std::string toString(double freq, int maxDecimals) {
        // Determine the scale
        const char* suffix = "MHz";
        if (freq < 1.0) {
            freq *= 1e3;
            suffix = "kHz";
        }

        char numBuf[128];
        int numLen = snprintf(numBuf, sizeof(numBuf), "%0.*lf", maxDecimals, freq);

        // If there is a decimal point, remove the useless zeros
        if (maxDecimals) {
            for (int i = numLen - 1; i >= 0; i--) {
                bool dot = (numBuf[i] == '.');
                if (numBuf[i] != '0' && !dot) { break; }
                numBuf[i] = 0;
                if (dot) { break; }
            }
        }

        return std::string(numBuf) + " " + suffix;
    }

    bool isNumeric(char c) {
        return isdigit(c) || c == '+' || c == '-' || c == '.' || c == 'e' || c == 'E';
    }

    bool fromString(const std::string& str, double& freq) {
        // Skip leading whitespace
        size_t i = 0;
        while (i < str.size() && isspace(str[i])) { i++; }

        // Extract the numeric part, an exponent needs a digit after it
        std::string numeric;
        for (; i < str.size(); i++) {
            char c = str[i];
            if ((c == 'e' || c == 'E') && (i + 1 >= str.size() || !(isdigit(str[i + 1]) || str[i + 1] == '-' || str[i + 1] == '+'))) { break; }
            if (!isNumeric(c)) { break; }
            numeric += c;
        }

        // Attempt to parse the numeric part
        double num;
        try {
            size_t used = 0;
            num = std::stod(numeric, &used);
            if (used != numeric.size()) { throw std::invalid_argument("trailing characters"); }
        }
        catch (const std::exception& e) {
            spdlog::error("Failed to parse frequency: '{0}'", str);
            return false;
        }

        // Skip whitespace between the number and the unit
        while (i < str.size() && isspace(str[i])) { i++; }

        // No unit means MHz
        if (i == str.size()) {
            freq = num;
            return true;
        }

        // Scale the numeric value depending on the unit
        std::string unit;
        for (; i < str.size(); i++) { unit += (char)tolower(str[i]); }
        if (unit == "ghz" || unit == "g") {
            num *= 1e3;
        }
        else if (unit == "mhz" || unit == "m") {
            // Already in MHz
        }
        else if (unit == "khz" || unit == "k") {
            num *= 1e-3;
        }
        else if (unit == "hz") {
            num *= 1e-6;
        }
        else {
            spdlog::error("Unknown frequency unit: '{0}'", unit);
            return false;
        }

        freq = num;
        return true;
    }
}
