#ifndef TACTUS_DSP_PEAKDETECTOR_H
#define TACTUS_DSP_PEAKDETECTOR_H

#include <cstddef>
#include <vector>

namespace tactus::dsp {

/**
 * @brief Parameters of the energy-gated onset detector.
 */
struct OnsetConfig {
    /** @brief Grid step and half-width of the energy window, in seconds (default: 0.1). */
    double windowSeconds = 0.1;

    /** @brief Mean absolute amplitude a window must exceed to contribute an onset (default: 0.1). */
    double energyThreshold = 0.1;
};

/**
 * @brief Finds strict local maxima above a relative threshold.
 *
 * An interior index i is a peak if signal[i] > minHeight * max(signal) and
 * signal[i] is strictly greater than both neighbours. The first and last
 * elements are never peaks.
 *
 * @param signal The detection function (e.g. spectral flux per frame).
 * @param minHeight The threshold as a fraction of the global maximum.
 * @return Ascending indices of the peaks.
 */
std::vector<size_t> findPeaks(const std::vector<double>& signal, double minHeight = 0.1);

/**
 * @brief Detects onset positions in a time-domain signal.
 *
 * Grid points i = w, 2w, ... (w = floor(sampleRate * windowSeconds)) are
 * visited while i < n - w. When the mean |x| over [i - w, i + w) exceeds the
 * energy threshold, the position of the largest |x| in that range is an onset
 * candidate. A candidate closer than sampleRate * windowSeconds samples to the
 * previous onset is dropped.
 *
 * @param samples The (filtered) samples.
 * @param sampleRate The sample rate in Hz.
 * @param config Window and threshold parameters.
 * @return Ascending sample positions of the onsets.
 */
std::vector<size_t> detectOnsetPeaks(const std::vector<float>& samples, int sampleRate,
                                     const OnsetConfig& config = OnsetConfig());

} // namespace tactus::dsp

#endif // TACTUS_DSP_PEAKDETECTOR_H
