#pragma once
#include <string>

namespace hrfreq {
    /**
     * Convert a frequency to a human-readable string.
     * @param freq Frequency in MHz.
     * @param maxDecimals Maximum number of decimals in the chosen unit.
     * @return Human-readable representation of the frequency.
    */
    std::string toString(double freq, int maxDecimals = 7);

    /**
     * Convert a human-readable representation of a frequency to a frequency value.
     * A value without unit is taken as MHz.
     * @param str String containing the human-readable frequency.
     * @param freq Value to write the decoded frequency to, in MHz.
     * @return True on success, false otherwise.
    */
    bool fromString(const std::string& str, double& freq);
}
