#pragma once

#include "../core/ITempoEstimator.h"
#include "../core/AudioSignal.h"
#include "../core/TempoEstimate.h"
#include "AudioDecoder.h"
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace tactus::pipeline {

/**
 * @brief Request/response front of the tempo engine.
 *
 * Owns one configured estimator per TempoMethod and the audio decoder. Each
 * request is handled synchronously: decode (if the request carries a
 * container), run the selected estimator, validate, respond. handle() always
 * returns exactly one response and never throws.
 */
class TempoWorker {
public:
    /** @brief Engine version reported by the probe. */
    static constexpr const char* VERSION = "1.0.0";

    /**
     * @brief Constructs a worker with the default configuration.
     */
    TempoWorker();

    /**
     * @brief Constructs a worker and applies a configuration patch.
     * @param config Merge-patch applied over defaultConfig().
     * @throw std::runtime_error If an estimator rejects its configuration.
     */
    explicit TempoWorker(const nlohmann::json& config);

    ~TempoWorker();

    /**
     * @brief The full default configuration (every key with its default value).
     */
    static nlohmann::json defaultConfig();

    // Configuration
    /**
     * @brief Merges a patch into the current configuration and reconfigures every estimator.
     *
     * On failure the previous configuration stays in effect.
     * @param patch A JSON merge-patch (RFC 7386).
     * @throw std::runtime_error If a value is rejected ("Failed to initialize estimator: <name>").
     */
    void setConfig(const nlohmann::json& patch);

    /**
     * @brief Returns the configuration currently in effect.
     */
    const nlohmann::json& getConfig() const { return m_config; }

    /**
     * @brief Returns the wire names of the registered estimators.
     */
    std::vector<std::string> getEstimatorNames() const;

    // Processing
    /**
     * @brief Runs one estimator on a signal and validates the result.
     *
     * @param method The estimator to run.
     * @param signal The input signal.
     * @return The validated estimate.
     * @throw std::runtime_error If the estimator output breaks the range invariants.
     */
    core::TempoEstimate run(core::TempoMethod method, const core::AudioSignal& signal) const;

    /**
     * @brief Handles one request message.
     *
     * @param request The JSON request.
     * @return The success, failure or probe response.
     */
    nlohmann::json handle(const nlohmann::json& request) const;

    /**
     * @brief Builds the capability probe response, including each estimator's version.
     */
    nlohmann::json probe() const;

private:
    using EstimatorMap = std::map<core::TempoMethod, std::unique_ptr<core::ITempoEstimator>>;

    /**
     * @brief Builds and initializes a fresh estimator set for a configuration.
     * @throw std::runtime_error If an estimator rejects its configuration.
     */
    static EstimatorMap buildEstimators(const nlohmann::json& config);

    nlohmann::json m_config;
    EstimatorMap m_estimators;
    AudioDecoder m_decoder;
    core::TempoMethod m_defaultMethod = core::TempoMethod::Autocorrelation;
    bool m_debug = false;
};

} // namespace tactus::pipeline
