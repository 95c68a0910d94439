#include "errors.h"
#include <spdlog/fmt/fmt.h>

namespace synth {
    FrequencyOutOfRange::FrequencyOutOfRange(double freq) :
        SynthError(fmt::format("Frequency {} MHz is outside of the supported range", freq)),
        frequency(freq) {}

    UnreachableFrequency::UnreachableFrequency(double freq, double nearest) :
        SynthError(nearest > 0.0 ? fmt::format("Frequency {} MHz cannot be generated, nearest achievable is {} MHz", freq, nearest)
                                 : fmt::format("Frequency {} MHz cannot be generated", freq)),
        frequency(freq),
        nearest(nearest) {}

    RatioUnreachable::RatioUnreachable(double ratio, int minInt, int maxInt) :
        SynthError(fmt::format("Ratio {} is outside of the integer range [{}, {}]", ratio, minInt, maxInt)),
        ratio(ratio) {}

    DividerUnreachable::DividerUnreachable(double freq, double vco) :
        SynthError(fmt::format("No multisynth divider produces {} MHz from a {} MHz VCO", freq, vco)),
        frequency(freq),
        vco(vco) {}

    AmplitudeOutOfRange::AmplitudeOutOfRange(double amplitude, const std::string& reason) :
        SynthError(fmt::format("Spread spectrum amplitude {} is invalid: {}", amplitude, reason)),
        amplitude(amplitude) {}
}
