#pragma once
#include <stdexcept>
#include <string>

namespace synth {
    class SynthError : public std::runtime_error {
    public:
        SynthError(const std::string& msg) : std::runtime_error(msg) {}
    };

    // Requested output frequency is outside what the chip can generate at all
    class FrequencyOutOfRange : public SynthError {
    public:
        FrequencyOutOfRange(double freq);
        double frequency;
    };

    // Mutually exclusive channel options were requested together
    class ConfigConflict : public SynthError {
    public:
        ConfigConflict(const std::string& msg) : SynthError(msg) {}
    };

    // Frequency is in range but no valid VCO/divider combination produces it
    class UnreachableFrequency : public SynthError {
    public:
        UnreachableFrequency(double freq, double nearest = 0.0);
        double frequency;

        // Closest frequency that can be produced, zero when unknown
        double nearest;
    };

    class RatioUnreachable : public SynthError {
    public:
        RatioUnreachable(double ratio, int minInt, int maxInt);
        double ratio;
    };

    class DividerUnreachable : public SynthError {
    public:
        DividerUnreachable(double freq, double vco);
        double frequency;
        double vco;
    };

    class AmplitudeOutOfRange : public SynthError {
    public:
        AmplitudeOutOfRange(double amplitude, const std::string& reason);
        double amplitude;
    };
}
