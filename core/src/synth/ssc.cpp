#include "ssc.h"
#include "errors.h"
#include "limits.h"
#include <math.h>
#include <ctype.h>

namespace synth {
    void checkSscAmplitude(double amplitude, SscMode mode) {
        double min = (mode == SSC_MODE_CENTER) ? SSC_CENTER_AMP_MIN : SSC_DOWN_AMP_MIN;
        double max = (mode == SSC_MODE_CENTER) ? SSC_CENTER_AMP_MAX : SSC_DOWN_AMP_MAX;
        if (!std::isfinite(amplitude) || amplitude < min || amplitude > max) {
            throw AmplitudeOutOfRange(amplitude, "outside of the supported spread range");
        }
    }

    SscFields splitSscValue(double amplitude, double value) {
        SscFields fields;
        fields.p1 = (int)floor(value);
        fields.p2 = (int)((double)SSC_P2_MAX * (value - (double)fields.p1));
        fields.p3 = SSC_P2_MAX;
        if (fields.p1 > SSC_P1_MAX) {
            throw AmplitudeOutOfRange(amplitude, "spread step does not fit the P1 register");
        }
        return fields;
    }

    SscParameters computeSsc(double amplitude, SscMode mode, int pllInt) {
        checkSscAmplitude(amplitude, mode);

        SscParameters ssc;
        ssc.enabled = true;
        ssc.mode = mode;
        ssc.amplitude = amplitude;
        ssc.udp = (int)floor((REF_FREQ * 1e6) / (4.0 * SSC_MOD_RATE));
        if (ssc.udp > SSC_UDP_MAX) {
            throw AmplitudeOutOfRange(amplitude, "modulation period does not fit the register");
        }

        double udp = (double)ssc.udp;
        double a = (double)pllInt;
        if (mode == SSC_MODE_CENTER) {
            // Amplitude is peak-to-peak, center spread goes half of it each way
            double half = amplitude / 2.0;
            ssc.up = splitSscValue(amplitude, 128.0 * a * half / ((1.0 - half) * udp));
            ssc.down = splitSscValue(amplitude, 128.0 * a * half / ((1.0 + half) * udp));
        }
        else {
            ssc.down = splitSscValue(amplitude, 64.0 * a * amplitude / ((1.0 + amplitude) * udp));
            ssc.up = SscFields();
        }

        return ssc;
    }

    bool sscModeFromString(const std::string& str, SscMode& mode) {
        std::string up;
        for (char c : str) { up += (char)toupper(c); }
        if (up == "DOWN") {
            mode = SSC_MODE_DOWN;
            return true;
        }
        if (up == "CENTER") {
            mode = SSC_MODE_CENTER;
            return true;
        }
        return false;
    }

    const char* sscModeToString(SscMode mode) {
        return (mode == SSC_MODE_CENTER) ? "CENTER" : "DOWN";
    }
}
