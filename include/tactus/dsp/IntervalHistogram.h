#ifndef TACTUS_DSP_INTERVALHISTOGRAM_H
#define TACTUS_DSP_INTERVALHISTOGRAM_H

#include <cstddef>
#include <map>
#include <optional>

namespace tactus::dsp {

/**
 * @brief Histogram of quantized intervals (frames or 10 ms bins).
 *
 * Keeps, for each key, its count and the order in which the key was first
 * seen. mode() picks the highest count; among equal counts the key seen first
 * wins, independent of key magnitude.
 */
class IntervalHistogram {
public:
    /** @brief The winning bin of the histogram. */
    struct Mode {
        long long key = 0;
        size_t count = 0;
    };

    /**
     * @brief Adds one observation to the bin of the given key.
     * @param key The quantized interval.
     */
    void add(long long key);

    /**
     * @brief Returns the modal bin.
     * @return The mode, or std::nullopt if no value was added.
     */
    std::optional<Mode> mode() const;

    /** @brief Total number of observations. */
    size_t total() const { return m_total; }

    /** @brief Number of distinct keys. */
    size_t size() const { return m_bins.size(); }

    /**
     * @brief Count stored for a key.
     * @return The count, 0 if the key was never added.
     */
    size_t count(long long key) const;

private:
    struct Bin {
        size_t count = 0;
        size_t firstSeen = 0;
    };

    std::map<long long, Bin> m_bins;
    size_t m_total = 0;
};

} // namespace tactus::dsp

#endif // TACTUS_DSP_INTERVALHISTOGRAM_H
