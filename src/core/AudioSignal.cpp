#include "../../include/tactus/core/AudioSignal.h"
#include <algorithm>
#include <cmath>
#include <utility>

namespace tactus::core {

// ============================================================================
// AudioSignal Implementation
// ============================================================================

/**
 * @brief Constructs a signal from decoded samples.
 * @param samples Mono samples, nominally in [-1, 1].
 * @param sampleRate The sample rate in Hz.
 */
AudioSignal::AudioSignal(std::vector<float> samples, int sampleRate)
    : m_samples(std::move(samples))
    , m_sampleRate(sampleRate) {
}

/**
 * @brief Creates a new signal holding at most the first maxSamples samples.
 * @param maxSamples The maximum number of samples to keep.
 * @return A copy of the leading samples with the same sample rate.
 */
AudioSignal AudioSignal::head(size_t maxSamples) const {
    const size_t n = std::min(maxSamples, m_samples.size());
    return AudioSignal(std::vector<float>(m_samples.begin(), m_samples.begin() + n), m_sampleRate);
}

} // namespace tactus::core
