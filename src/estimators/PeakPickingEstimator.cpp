#include "../../include/tactus/estimators/Estimators.h"
#include "../../include/tactus/core/ITempoEstimator.h"
#include "../../include/tactus/core/AudioSignal.h"
#include "../../include/tactus/dsp/IntervalHistogram.h"
#include "../../include/tactus/dsp/PeakDetector.h"
#include "../../include/tactus/dsp/Preprocessor.h"
#include <nlohmann/json.hpp>
#include <cmath>
#include <string>
#include <vector>

namespace tactus::estimators {

bool configure(PeakPickingConfig& cfg, const nlohmann::json& config) {
    if (config.contains("analysisSeconds")) cfg.analysisSeconds = config["analysisSeconds"].get<double>();
    if (config.contains("cutoffHz")) cfg.cutoffHz = config["cutoffHz"].get<double>();
    if (config.contains("windowSeconds")) cfg.onset.windowSeconds = config["windowSeconds"].get<double>();
    if (config.contains("energyThreshold")) cfg.onset.energyThreshold = config["energyThreshold"].get<double>();
    if (config.contains("binSeconds")) cfg.binSeconds = config["binSeconds"].get<double>();
    return cfg.analysisSeconds > 0.0 && cfg.cutoffHz > 0.0 && cfg.onset.windowSeconds > 0.0
           && std::isfinite(cfg.onset.windowSeconds) && cfg.onset.energyThreshold >= 0.0
           && cfg.binSeconds >= kMinBinSeconds && std::isfinite(cfg.binSeconds);
}

core::TempoEstimate estimatePeakPicking(const core::AudioSignal& signal, const PeakPickingConfig& cfg) {
    const int sampleRate = signal.getSampleRate();
    if (sampleRate <= 0 || signal.empty()) return core::TempoEstimate::none();

    const core::AudioSignal head = dsp::truncate(signal, cfg.analysisSeconds);
    const std::vector<float> filtered = dsp::highPass(head.samples(), sampleRate, cfg.cutoffHz);

    const std::vector<size_t> onsets = dsp::detectOnsetPeaks(filtered, sampleRate, cfg.onset);
    if (onsets.size() < 2) return core::TempoEstimate::none();

    // IOIs quantized to bins of binSeconds
    const double binSamples = static_cast<double>(sampleRate) * cfg.binSeconds;
    dsp::IntervalHistogram histogram;
    for (size_t i = 1; i < onsets.size(); ++i) {
        const double ioi = static_cast<double>(onsets[i] - onsets[i - 1]);
        histogram.add(static_cast<long long>(std::round(ioi / binSamples)));
    }
    const auto mode = histogram.mode();
    if (!mode || mode->key == 0) return core::TempoEstimate::none();

    const double ioiSeconds = static_cast<double>(mode->key) * binSamples / sampleRate;
    int bpm = static_cast<int>(std::round(60.0 / ioiSeconds));

    // Fold one octave towards the range
    if (bpm < core::kMinBPM) {
        bpm *= 2;
    } else if (bpm > core::kMaxBPM) {
        bpm = static_cast<int>(std::round(bpm / 2.0));
    }
    if (!core::inTempoRange(bpm)) return core::TempoEstimate::none();

    const double confidence = static_cast<double>(mode->count) / static_cast<double>(histogram.total());
    return core::TempoEstimate::of(bpm, confidence);
}

/**
 * @brief Estimator wrapper around estimatePeakPicking().
 */
class PeakPickingEstimator : public core::ITempoEstimator {
public:
    std::string getName() const override { return "peak-picking"; }
    std::string getVersion() const override { return "1.0.0"; }
    core::TempoMethod getMethod() const override { return core::TempoMethod::PeakPicking; }

    bool initialize(const nlohmann::json& config) override {
        PeakPickingConfig next = m_cfg;
        if (!configure(next, config)) return false;
        m_cfg = next;
        return true;
    }

    core::TempoEstimate estimate(const core::AudioSignal& signal) const override {
        return estimatePeakPicking(signal, m_cfg);
    }

private:
    PeakPickingConfig m_cfg{};
};

std::unique_ptr<core::ITempoEstimator> createPeakPickingEstimator() {
    return std::make_unique<PeakPickingEstimator>();
}

} // namespace tactus::estimators
