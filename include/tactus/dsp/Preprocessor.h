#ifndef TACTUS_DSP_PREPROCESSOR_H
#define TACTUS_DSP_PREPROCESSOR_H

#include <cstddef>
#include <vector>
#include "../core/AudioSignal.h"

namespace tactus::dsp {

/** @brief Default analysis window (seconds) shared by all estimators. */
constexpr double kDefaultAnalysisSeconds = 30.0;

/** @brief Rate the autocorrelation path decimates towards. */
constexpr int kDefaultTargetRate = 8000;

/** @brief Default high-pass cutoff isolating kick/bass transients. */
constexpr double kDefaultCutoffHz = 40.0;

/**
 * @brief Keeps at most the first maxSeconds of a signal.
 *
 * @param signal The input signal.
 * @param maxSeconds The analysis window length in seconds (default 30).
 * @return The first min(length, sampleRate * maxSeconds) samples.
 */
core::AudioSignal truncate(const core::AudioSignal& signal, double maxSeconds = kDefaultAnalysisSeconds);

/**
 * @brief Integer decimation factor that brings sampleRate down towards targetRate.
 *
 * @return floor(sampleRate / targetRate), clamped to at least 1.
 */
size_t decimationFactor(int sampleRate, int targetRate = kDefaultTargetRate);

/**
 * @brief Point decimation: keeps samples 0, factor, 2*factor, ...
 *
 * No anti-alias filtering is done; content above the new Nyquist frequency folds back.
 * @param samples The input samples.
 * @param factor The decimation factor (0 is treated as 1).
 * @return The decimated samples.
 */
std::vector<float> decimate(const std::vector<float>& samples, size_t factor);

/**
 * @brief Causal moving-average prefilter of the given length.
 *
 * Used as an optional anti-alias stage before decimate().
 * @param samples The input samples.
 * @param length The averaging length in samples (<= 1 returns the input unchanged).
 * @return The filtered samples, same length as the input.
 */
std::vector<float> boxcarLowPass(const std::vector<float>& samples, size_t length);

/**
 * @brief Single-pole IIR high-pass filter.
 *
 * y[0] = x[0], y[i] = a * (y[i-1] + x[i] - x[i-1]) with a = RC / (RC + dt),
 * RC = 1 / (2 pi cutoff) and dt = 1 / sampleRate.
 * @param samples The input samples.
 * @param sampleRate The sample rate in Hz.
 * @param cutoffHz The cutoff frequency in Hz.
 * @return The filtered samples, same length as the input.
 */
std::vector<float> highPass(const std::vector<float>& samples, int sampleRate, double cutoffHz = kDefaultCutoffHz);

} // namespace tactus::dsp

#endif // TACTUS_DSP_PREPROCESSOR_H
