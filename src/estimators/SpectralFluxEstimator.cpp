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

namespace {

/**
 * @brief Mean positive increase of |x| across one frame.
 *
 * The magnitude before the first sample is taken as 0, so the first sample's
 * magnitude always counts as an increase.
 */
double frameFlux(const float* frame, size_t size) {
    double flux = 0.0;
    double prevMagnitude = 0.0;
    for (size_t i = 0; i < size; ++i) {
        const double magnitude = std::abs(static_cast<double>(frame[i]));
        const double diff = magnitude - prevMagnitude;
        if (diff > 0.0) flux += diff;
        prevMagnitude = magnitude;
    }
    return flux / static_cast<double>(size);
}

/**
 * @brief Reads a non-negative integer count; negative or fractional values are rejected.
 */
bool readCount(const nlohmann::json& config, const char* key, size_t& out) {
    if (!config.contains(key)) return true;
    const auto& v = config[key];
    if (v.is_number_unsigned()) {
        out = v.get<size_t>();
        return true;
    }
    if (v.is_number_integer() && v.get<long long>() >= 0) {
        out = static_cast<size_t>(v.get<long long>());
        return true;
    }
    return false;
}

} // namespace

bool configure(SpectralFluxConfig& cfg, const nlohmann::json& config) {
    if (config.contains("analysisSeconds")) cfg.analysisSeconds = config["analysisSeconds"].get<double>();
    if (config.contains("cutoffHz")) cfg.cutoffHz = config["cutoffHz"].get<double>();
    if (!readCount(config, "windowSize", cfg.windowSize)) return false;
    if (!readCount(config, "hopSize", cfg.hopSize)) return false;
    if (!readCount(config, "minFrames", cfg.minFrames)) return false;
    if (config.contains("peakThreshold")) cfg.peakThreshold = config["peakThreshold"].get<double>();
    // A hop longer than the window would skip samples between frames
    return cfg.analysisSeconds > 0.0 && cfg.cutoffHz > 0.0 && cfg.windowSize > 0 && cfg.hopSize > 0
           && cfg.hopSize <= cfg.windowSize && cfg.peakThreshold >= 0.0 && std::isfinite(cfg.peakThreshold);
}

core::TempoEstimate estimateSpectralFlux(const core::AudioSignal& signal, const SpectralFluxConfig& cfg) {
    const int sampleRate = signal.getSampleRate();
    if (sampleRate <= 0 || signal.empty()) return core::TempoEstimate::none();

    const core::AudioSignal head = dsp::truncate(signal, cfg.analysisSeconds);
    const std::vector<float> filtered = dsp::highPass(head.samples(), sampleRate, cfg.cutoffHz);

    // Frames start every hop while a full window (plus one sample) remains
    std::vector<double> flux;
    const size_t N = cfg.windowSize;
    const size_t H = cfg.hopSize;
    for (size_t i = 0; i + N < filtered.size(); i += H) {
        flux.push_back(frameFlux(filtered.data() + i, N));
    }
    if (flux.size() < cfg.minFrames) return core::TempoEstimate::none();

    const std::vector<size_t> peaks = dsp::findPeaks(flux, cfg.peakThreshold);
    if (peaks.size() < 2) return core::TempoEstimate::none();

    dsp::IntervalHistogram histogram;
    for (size_t i = 1; i < peaks.size(); ++i) {
        histogram.add(static_cast<long long>(peaks[i] - peaks[i - 1]));
    }
    const auto mode = histogram.mode();
    if (!mode || mode->key == 0) return core::TempoEstimate::none();

    const double intervalSeconds = static_cast<double>(mode->key) * static_cast<double>(H) / sampleRate;
    const int bpm = static_cast<int>(std::round(60.0 / intervalSeconds));
    if (!core::inTempoRange(bpm)) return core::TempoEstimate::none();

    const double confidence = static_cast<double>(mode->count) / static_cast<double>(histogram.total());
    return core::TempoEstimate::of(bpm, confidence);
}

/**
 * @brief Estimator wrapper around estimateSpectralFlux().
 */
class SpectralFluxEstimator : public core::ITempoEstimator {
public:
    std::string getName() const override { return "spectral-flux"; }
    std::string getVersion() const override { return "1.0.0"; }
    core::TempoMethod getMethod() const override { return core::TempoMethod::SpectralFlux; }

    bool initialize(const nlohmann::json& config) override {
        SpectralFluxConfig next = m_cfg;
        if (!configure(next, config)) return false;
        m_cfg = next;
        return true;
    }

    core::TempoEstimate estimate(const core::AudioSignal& signal) const override {
        return estimateSpectralFlux(signal, m_cfg);
    }

private:
    SpectralFluxConfig m_cfg{};
};

std::unique_ptr<core::ITempoEstimator> createSpectralFluxEstimator() {
    return std::make_unique<SpectralFluxEstimator>();
}

} // namespace tactus::estimators
