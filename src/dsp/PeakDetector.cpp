#include "../../include/tactus/dsp/PeakDetector.h"
#include <algorithm>
#include <cmath>

namespace tactus::dsp {

std::vector<size_t> findPeaks(const std::vector<double>& signal, double minHeight) {
    std::vector<size_t> peaks;
    if (signal.size() < 3) return peaks;

    const double threshold = *std::max_element(signal.begin(), signal.end()) * minHeight;
    for (size_t i = 1; i + 1 < signal.size(); ++i) {
        if (signal[i] > threshold && signal[i] > signal[i - 1] && signal[i] > signal[i + 1]) {
            peaks.push_back(i);
        }
    }
    return peaks;
}

std::vector<size_t> detectOnsetPeaks(const std::vector<float>& samples, int sampleRate,
                                     const OnsetConfig& config) {
    std::vector<size_t> peaks;
    if (sampleRate <= 0 || !(config.windowSeconds > 0.0)) return peaks;

    // No full window pair fits once the window reaches the signal length
    const double spacing = static_cast<double>(sampleRate) * config.windowSeconds;
    if (!(spacing < static_cast<double>(samples.size()))) return peaks;
    const size_t w = std::max<size_t>(1, static_cast<size_t>(std::floor(spacing)));
    const size_t n = samples.size();

    for (size_t i = w; i + w < n; i += w) {
        double sum = 0.0;
        for (size_t j = i - w; j < i + w; ++j) {
            sum += std::abs(static_cast<double>(samples[j]));
        }
        const double energy = sum / static_cast<double>(2 * w);
        if (energy <= config.energyThreshold) continue;

        // Scan starts from the grid point itself, so it wins ties
        size_t maxIdx = i;
        double maxVal = std::abs(static_cast<double>(samples[i]));
        for (size_t j = i - w; j < i + w; ++j) {
            const double v = std::abs(static_cast<double>(samples[j]));
            if (v > maxVal) {
                maxVal = v;
                maxIdx = j;
            }
        }

        if (peaks.empty() || static_cast<double>(maxIdx) - static_cast<double>(peaks.back()) > spacing) {
            peaks.push_back(maxIdx);
        }
    }
    return peaks;
}

} // namespace tactus::dsp
