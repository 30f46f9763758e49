#include "../../include/tactus/pipeline/TempoWorker.h"
#include "../../include/tactus/core/Errors.h"
#include "../../include/tactus/core/JsonContract.h"
#include "../../include/tactus/estimators/Estimators.h"
#include <iostream>
#include <stdexcept>
#include <utility>

namespace tactus::pipeline {

// ============================================================================
// TempoWorker Implementation
// ============================================================================

TempoWorker::TempoWorker()
    : TempoWorker(nlohmann::json::object()) {
}

TempoWorker::TempoWorker(const nlohmann::json& config)
    : m_config(defaultConfig()) {
    setConfig(config);
}

TempoWorker::~TempoWorker() = default;

nlohmann::json TempoWorker::defaultConfig() {
    const estimators::AutocorrelationConfig ac;
    const estimators::SpectralFluxConfig sf;
    const estimators::PeakPickingConfig pp;
    const estimators::ConsensusConfig cc;
    const DecoderConfig dc;

    return {
        {"debug", false},
        {"defaultMethod", core::toString(core::TempoMethod::Autocorrelation)},
        {"decoder", {
            {"enabled", dc.enabled},
            {"maxFileBytes", dc.maxFileBytes}
        }},
        {"estimators", {
            {"autocorrelation", {
                {"analysisSeconds", ac.analysisSeconds},
                {"targetRate", ac.targetRate},
                {"correlationSeconds", ac.correlationSeconds},
                {"minCorrelation", ac.minCorrelation},
                {"correlation", "direct"},
                {"antiAlias", ac.antiAlias}
            }},
            {"spectral-flux", {
                {"analysisSeconds", sf.analysisSeconds},
                {"cutoffHz", sf.cutoffHz},
                {"windowSize", sf.windowSize},
                {"hopSize", sf.hopSize},
                {"minFrames", sf.minFrames},
                {"peakThreshold", sf.peakThreshold}
            }},
            {"peak-picking", {
                {"analysisSeconds", pp.analysisSeconds},
                {"cutoffHz", pp.cutoffHz},
                {"windowSeconds", pp.onset.windowSeconds},
                {"energyThreshold", pp.onset.energyThreshold},
                {"binSeconds", pp.binSeconds}
            }},
            {"combined", {
                {"toleranceBPM", cc.toleranceBPM},
                {"agreementWeight", cc.agreementWeight},
                {"clustering", estimators::toString(cc.clustering)}
            }}
        }}
    };
}

/**
 * @brief Creates one estimator per method and passes each its configuration.
 *
 * The combined estimator receives its own object plus the three leaf
 * configurations under their method names; keys nested inside the combined
 * object override the top-level leaf settings.
 */
TempoWorker::EstimatorMap TempoWorker::buildEstimators(const nlohmann::json& config) {
    const nlohmann::json estimatorsCfg = config.value("estimators", nlohmann::json::object());

    EstimatorMap out;
    for (core::TempoMethod method : core::allTempoMethods()) {
        const std::string name = core::toString(method);
        nlohmann::json cfg = estimatorsCfg.value(name, nlohmann::json::object());

        if (method == core::TempoMethod::Combined) {
            for (core::TempoMethod leaf : {core::TempoMethod::Autocorrelation, core::TempoMethod::SpectralFlux,
                                           core::TempoMethod::PeakPicking}) {
                const std::string leafName = core::toString(leaf);
                nlohmann::json leafCfg = estimatorsCfg.value(leafName, nlohmann::json::object());
                if (cfg.contains(leafName)) leafCfg.merge_patch(cfg[leafName]);
                cfg[leafName] = leafCfg;
            }
        }

        auto estimator = estimators::createEstimator(method);
        if (!estimator->initialize(cfg)) {
            throw std::runtime_error("Failed to initialize estimator: " + name);
        }
        out[method] = std::move(estimator);
    }
    return out;
}

/**
 * @brief Merges a configuration patch and rebuilds the estimators.
 * @param patch The JSON merge-patch.
 * @throw std::runtime_error If the merged configuration is rejected.
 */
void TempoWorker::setConfig(const nlohmann::json& patch) {
    nlohmann::json next = m_config;
    next.merge_patch(patch);

    const std::string defaultName = next.value("defaultMethod", std::string("autocorrelation"));
    auto defaultMethod = core::parseTempoMethod(defaultName);
    if (!defaultMethod) {
        throw std::runtime_error("Unknown default method: " + defaultName);
    }

    DecoderConfig decoderCfg;
    if (next.contains("decoder")) {
        const auto& d = next["decoder"];
        if (d.contains("enabled")) decoderCfg.enabled = d["enabled"].get<bool>();
        if (d.contains("maxFileBytes")) {
            const auto& limit = d["maxFileBytes"];
            if (!limit.is_number_integer() || (!limit.is_number_unsigned() && limit.get<long long>() < 0)) {
                throw std::runtime_error("Invalid decoder.maxFileBytes: " + limit.dump());
            }
            decoderCfg.maxFileBytes = limit.get<size_t>();
        }
    }

    EstimatorMap estimators = buildEstimators(next);

    // Commit only after everything was accepted
    m_estimators = std::move(estimators);
    m_decoder = AudioDecoder(decoderCfg);
    m_defaultMethod = *defaultMethod;
    m_debug = next.value("debug", false);
    m_config = std::move(next);

    if (m_debug) {
        std::cout << "[Worker] Configured " << m_estimators.size() << " estimators (default: "
                  << core::toString(m_defaultMethod) << ")" << std::endl;
    }
}

std::vector<std::string> TempoWorker::getEstimatorNames() const {
    std::vector<std::string> names;
    for (const auto& [method, estimator] : m_estimators) {
        names.push_back(estimator->getName());
    }
    return names;
}

/**
 * @brief Runs a single estimator and validates its output.
 * @param method The method to run.
 * @param signal The input signal.
 * @return The estimate.
 * @throw std::runtime_error if estimator output validation fails.
 */
core::TempoEstimate TempoWorker::run(core::TempoMethod method, const core::AudioSignal& signal) const {
    auto it = m_estimators.find(method);
    if (it == m_estimators.end()) {
        throw std::runtime_error("No estimator registered for method: " + core::toString(method));
    }
    const auto& estimator = it->second;

    if (m_debug) {
        std::cout << "[Worker] Executing: " << estimator->getName() << " (" << signal.size() << " samples @ "
                  << signal.getSampleRate() << " Hz)" << std::endl;
    }

    // Process
    core::TempoEstimate result = estimator->estimate(signal);

    // Validate
    if (!estimator->validateOutput(result)) {
        throw std::runtime_error("Estimator output validation failed: " + estimator->getName());
    }

    if (m_debug) {
        std::cout << "[Worker] " << estimator->getName() << " -> " << result.toJson().dump() << std::endl;
    }
    return result;
}

nlohmann::json TempoWorker::probe() const {
    nlohmann::json out = core::JsonContract::makeProbeResponse(m_decoder.isAvailable(),
                                                               m_decoder.supportedContainers(), VERSION);
    // Estimator versions, keyed by wire name
    nlohmann::json versions = nlohmann::json::object();
    for (const auto& [method, estimator] : m_estimators) {
        versions[estimator->getName()] = estimator->getVersion();
    }
    out["estimators"] = versions;
    return out;
}

/**
 * @brief Handles one request; every failure becomes a failure response.
 * @param request The JSON request.
 * @return Exactly one response.
 */
nlohmann::json TempoWorker::handle(const nlohmann::json& request) const {
    // The caller's method string is echoed as sent, even when it is not recognised
    std::string method = core::toString(m_defaultMethod);
    if (request.is_object() && request.contains("method") && request["method"].is_string()) {
        method = request["method"].get<std::string>();
    }

    try {
        core::TempoRequest req = core::JsonContract::parseRequest(request, m_defaultMethod);
        if (req.probe) {
            return probe();
        }
        if (!req.methodRecognised) {
            std::cerr << "[Worker] Unknown method '" << req.requestedMethod << "', using "
                      << core::toString(req.method) << std::endl;
        }

        core::AudioSignal signal;
        if (req.needsDecoding()) {
            signal = req.filePath ? m_decoder.decodeFile(*req.filePath) : m_decoder.decode(*req.fileBytes);
            if (m_debug) {
                std::cout << "[Worker] Decoded " << signal.getDuration() << " s @ " << signal.getSampleRate()
                          << " Hz" << std::endl;
            }
        } else {
            signal = core::AudioSignal(std::move(*req.channelData), req.sampleRate);
        }

        return core::JsonContract::makeResponse(run(req.method, signal), method);
    } catch (const core::EncodingError& e) {
        std::cerr << "[Worker] Encoding error: " << e.what() << std::endl;
        return core::JsonContract::makeErrorResponse(method, e.what(), true);
    } catch (const std::exception& e) {
        std::cerr << "[Worker] Request failed: " << e.what() << std::endl;
        return core::JsonContract::makeErrorResponse(method, e.what(), false);
    }
}

} // namespace tactus::pipeline
