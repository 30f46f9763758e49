#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace tactus::core {

/** @brief Slowest tempo the engine reports. */
constexpr int kMinBPM = 60;

/** @brief Fastest tempo the engine reports. */
constexpr int kMaxBPM = 200;

/**
 * @brief Checks whether a (possibly fractional) BPM lies in [kMinBPM, kMaxBPM].
 */
inline bool inTempoRange(double bpm) {
    return bpm >= kMinBPM && bpm <= kMaxBPM;
}

/**
 * @brief Result of one tempo estimation.
 *
 * Invariants: if bpm is set it lies in [kMinBPM, kMaxBPM]; confidence lies in
 * [0, 1]; an unset bpm always pairs with confidence 0.
 */
struct TempoEstimate {
    /** @brief Estimated tempo, unset when no usable estimate exists. */
    std::optional<int> bpm;

    /** @brief Confidence in [0, 1]. */
    double confidence = 0.0;

    /**
     * @brief The "no usable estimate" sentinel ({bpm: null, confidence: 0}).
     */
    static TempoEstimate none() { return {}; }

    /**
     * @brief Builds an estimate, returning none() when bpm is out of range.
     *
     * The confidence is clamped to [0, 1].
     * @param bpm The tempo in beats per minute.
     * @param confidence The raw confidence.
     */
    static TempoEstimate of(int bpm, double confidence);

    /** @brief True if a tempo is present. */
    bool hasTempo() const { return bpm.has_value(); }

    /**
     * @brief Checks the range invariants.
     * @return true if the estimate satisfies every invariant.
     */
    bool isValid() const;

    /**
     * @brief Serialises to {"bpm": int|null, "confidence": float}.
     */
    nlohmann::json toJson() const;

    bool operator==(const TempoEstimate& other) const {
        return bpm == other.bpm && confidence == other.confidence;
    }
    bool operator!=(const TempoEstimate& other) const { return !(*this == other); }
};

/**
 * @brief The closed set of estimation strategies a request may select.
 */
enum class TempoMethod {
    Autocorrelation,
    SpectralFlux,
    PeakPicking,
    Combined
};

/**
 * @brief Returns the wire name of a method ("autocorrelation", "spectral-flux", ...).
 */
std::string toString(TempoMethod method);

/**
 * @brief Parses a wire name.
 * @param name The method name from a request.
 * @return The method, or std::nullopt if the name is not recognised.
 */
std::optional<TempoMethod> parseTempoMethod(const std::string& name);

/**
 * @brief All methods in declaration order.
 */
const std::vector<TempoMethod>& allTempoMethods();

} // namespace tactus::core
