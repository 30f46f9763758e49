#pragma once

#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "TempoEstimate.h"

namespace tactus::core {

// Forward declarations
class AudioSignal;

/**
 * @brief Base interface for all tempo estimators.
 *
 * Each concrete estimator implements exactly one TempoMethod. After
 * initialize() an estimator only holds configuration, so estimate() is const
 * and a single instance may serve concurrent calls on different signals.
 */
class ITempoEstimator {
public:
    /** @brief Virtual destructor for proper inheritance cleanup. */
    virtual ~ITempoEstimator() = default;

    // Estimator metadata
    /**
     * @brief Returns the wire name of the estimator (e.g., "spectral-flux").
     * @return The estimator's name.
     */
    virtual std::string getName() const = 0;

    /**
     * @brief Returns the version string of the estimator.
     * @return The estimator's version.
     */
    virtual std::string getVersion() const = 0;

    /**
     * @brief Returns the method this estimator implements.
     */
    virtual TempoMethod getMethod() const = 0;

    // Lifecycle
    /**
     * @brief Applies estimator-specific configuration.
     *
     * Only keys present in the object are read; the rest keep their defaults.
     * @param config The configuration specific to this estimator.
     * @return true on success, false if a value is out of range.
     */
    virtual bool initialize(const nlohmann::json& config) = 0;

    // Processing
    /**
     * @brief Estimates the tempo of a signal.
     *
     * Insufficient data is reported as TempoEstimate::none(), never thrown.
     * @param signal The input signal (read only).
     * @return The estimate.
     */
    virtual TempoEstimate estimate(const AudioSignal& signal) const = 0;

    // Validation
    /**
     * @brief Validates an estimate against the range invariants.
     *
     * @param output The estimate produced by estimate().
     * @return true if the estimate is valid.
     */
    virtual bool validateOutput(const TempoEstimate& output) const {
        return output.isValid();
    }
};

} // namespace tactus::core
