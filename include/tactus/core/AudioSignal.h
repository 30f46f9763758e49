#pragma once

#include <vector>
#include <cstddef>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace tactus::core {

/**
 * @brief Mono audio signal with its sample rate.
 *
 * This is the only input the tempo estimators see. Estimators receive it by
 * const reference and never modify it.
 */
class AudioSignal {
public:
    /**
     * @brief Default constructor (empty signal, 44.1 kHz).
     */
    AudioSignal() = default;

    /**
     * @brief Constructs a signal from decoded samples.
     *
     * @param samples Mono samples, nominally in [-1, 1].
     * @param sampleRate The sample rate in Hz.
     */
    AudioSignal(std::vector<float> samples, int sampleRate);

    // Data access
    /**
     * @brief Gets the samples.
     * @return A const reference to the sample vector.
     */
    const std::vector<float>& samples() const { return m_samples; }

    // Properties
    /**
     * @brief Returns the number of samples.
     * @return The sample count.
     */
    size_t size() const { return m_samples.size(); }

    /**
     * @brief Checks whether the signal holds no samples.
     * @return true if empty.
     */
    bool empty() const { return m_samples.empty(); }

    /**
     * @brief Returns the sample rate in Hz.
     * @return The sample rate.
     */
    int getSampleRate() const { return m_sampleRate; }

    /**
     * @brief Calculates the duration of the signal in seconds.
     * @return The duration in seconds, 0 if the sample rate is not positive.
     */
    double getDuration() const {
        return m_sampleRate > 0 ? m_samples.size() / static_cast<double>(m_sampleRate) : 0.0;
    }

    // Slicing
    /**
     * @brief Creates a new signal holding at most the first maxSamples samples.
     *
     * @param maxSamples The maximum number of samples to keep.
     * @return A new AudioSignal with the same sample rate.
     */
    AudioSignal head(size_t maxSamples) const;

private:
    std::vector<float> m_samples;
    int m_sampleRate = 44100;
};

} // namespace tactus::core
