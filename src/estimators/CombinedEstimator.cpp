#include "../../include/tactus/estimators/Estimators.h"
#include "../../include/tactus/estimators/Consensus.h"
#include "../../include/tactus/core/ITempoEstimator.h"
#include "../../include/tactus/core/AudioSignal.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace tactus::estimators {

bool configure(CombinedConfig& cfg, const nlohmann::json& config) {
    if (config.contains("toleranceBPM")) cfg.consensus.toleranceBPM = config["toleranceBPM"].get<double>();
    if (config.contains("agreementWeight")) cfg.consensus.agreementWeight = config["agreementWeight"].get<double>();
    if (config.contains("clustering")) {
        auto mode = parseClusteringMode(config["clustering"].get<std::string>());
        if (!mode) return false;
        cfg.consensus.clustering = *mode;
    }

    // Leaf estimators are configured from objects keyed by their method names
    const std::string ac = core::toString(core::TempoMethod::Autocorrelation);
    const std::string sf = core::toString(core::TempoMethod::SpectralFlux);
    const std::string pp = core::toString(core::TempoMethod::PeakPicking);
    if (config.contains(ac) && !configure(cfg.autocorrelation, config[ac])) return false;
    if (config.contains(sf) && !configure(cfg.spectralFlux, config[sf])) return false;
    if (config.contains(pp) && !configure(cfg.peakPicking, config[pp])) return false;

    return cfg.consensus.toleranceBPM >= 0.0 && cfg.consensus.agreementWeight >= 0.0;
}

core::TempoEstimate estimateCombined(const core::AudioSignal& signal, const CombinedConfig& cfg) {
    const std::vector<core::TempoEstimate> results = {
        estimateAutocorrelation(signal, cfg.autocorrelation),
        estimateSpectralFlux(signal, cfg.spectralFlux),
        estimatePeakPicking(signal, cfg.peakPicking)
    };
    return combineEstimates(results, cfg.consensus);
}

/**
 * @brief Consensus of the autocorrelation, spectral-flux and peak-picking estimators.
 */
class CombinedEstimator : public core::ITempoEstimator {
public:
    std::string getName() const override { return "combined"; }
    std::string getVersion() const override { return "1.0.0"; }
    core::TempoMethod getMethod() const override { return core::TempoMethod::Combined; }

    bool initialize(const nlohmann::json& config) override {
        CombinedConfig next = m_cfg;
        if (!configure(next, config)) return false;
        m_cfg = next;
        return true;
    }

    core::TempoEstimate estimate(const core::AudioSignal& signal) const override {
        return estimateCombined(signal, m_cfg);
    }

private:
    CombinedConfig m_cfg{};
};

std::unique_ptr<core::ITempoEstimator> createCombinedEstimator() {
    return std::make_unique<CombinedEstimator>();
}

std::unique_ptr<core::ITempoEstimator> createEstimator(core::TempoMethod method) {
    switch (method) {
        case core::TempoMethod::Autocorrelation: return createAutocorrelationEstimator();
        case core::TempoMethod::SpectralFlux:    return createSpectralFluxEstimator();
        case core::TempoMethod::PeakPicking:     return createPeakPickingEstimator();
        case core::TempoMethod::Combined:        return createCombinedEstimator();
    }
    return createAutocorrelationEstimator();
}

} // namespace tactus::estimators
