#include "../../include/tactus/dsp/Preprocessor.h"
#include <algorithm>
#include <cmath>

namespace tactus::dsp {

core::AudioSignal truncate(const core::AudioSignal& signal, double maxSeconds) {
    const int sr = signal.getSampleRate();
    if (sr <= 0 || maxSeconds <= 0.0) {
        return signal.head(0);
    }
    // sampleRate * maxSeconds may be fractional for non-integer windows
    const double limit = std::floor(static_cast<double>(sr) * maxSeconds);
    if (limit >= static_cast<double>(signal.size())) {
        return signal;
    }
    return signal.head(static_cast<size_t>(limit));
}

size_t decimationFactor(int sampleRate, int targetRate) {
    if (sampleRate <= 0 || targetRate <= 0) return 1;
    return std::max<size_t>(1, static_cast<size_t>(sampleRate / targetRate));
}

std::vector<float> decimate(const std::vector<float>& samples, size_t factor) {
    if (factor <= 1) return samples;

    std::vector<float> out;
    out.reserve(samples.size() / factor + 1);
    for (size_t i = 0; i < samples.size(); i += factor) {
        out.push_back(samples[i]);
    }
    return out;
}

std::vector<float> boxcarLowPass(const std::vector<float>& samples, size_t length) {
    if (length <= 1 || samples.empty()) return samples;

    std::vector<float> out(samples.size());
    double acc = 0.0;
    for (size_t i = 0; i < samples.size(); ++i) {
        acc += samples[i];
        if (i >= length) acc -= samples[i - length];
        const size_t n = std::min(i + 1, length);
        out[i] = static_cast<float>(acc / static_cast<double>(n));
    }
    return out;
}

std::vector<float> highPass(const std::vector<float>& samples, int sampleRate, double cutoffHz) {
    if (sampleRate <= 0 || cutoffHz <= 0.0) return samples;

    std::vector<float> filtered(samples.size());
    if (samples.empty()) return filtered;

    const double rc = 1.0 / (2.0 * M_PI * cutoffHz);
    const double dt = 1.0 / static_cast<double>(sampleRate);
    const double alpha = rc / (rc + dt);

    filtered[0] = samples[0];
    for (size_t i = 1; i < samples.size(); ++i) {
        // Stored as float after every step, the recursion reads back the rounded value
        filtered[i] = static_cast<float>(alpha * (static_cast<double>(filtered[i - 1])
                                                  + static_cast<double>(samples[i])
                                                  - static_cast<double>(samples[i - 1])));
    }
    return filtered;
}

} // namespace tactus::dsp
