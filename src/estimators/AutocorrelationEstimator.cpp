#include "../../include/tactus/estimators/Estimators.h"
#include "../../include/tactus/core/ITempoEstimator.h"
#include "../../include/tactus/core/AudioSignal.h"
#include "../../include/tactus/dsp/Preprocessor.h"
#include <nlohmann/json.hpp>
#include <fftw3.h>
#include <algorithm>
#include <cmath>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace tactus::estimators {

namespace {

struct CorrelationSample {
    size_t period;  // lag in decimated samples
    double value;   // mean |x[i] x[i+p]| divided by sqrt(p)
};

// The FFTW planner is not thread-safe; only fftw_execute may run concurrently
std::mutex& planMutex() {
    static std::mutex m;
    return m;
}

/**
 * @brief r[p] = sum_{i < n-p} a[i] a[i+p] for p in [0, maxLag], a = |x|.
 *
 * Zero-padded real FFT, power spectrum, inverse FFT. Round-off below
 * 1e-9 * r[0] is flushed to zero so lags without overlap compare equal.
 */
std::vector<double> fftAutocorrelation(const std::vector<float>& x, size_t n, size_t maxLag) {
    std::vector<double> r(maxLag + 1, 0.0);
    if (n == 0) return r;

    size_t N = 1;
    while (N < 2 * n) N <<= 1;
    const size_t bins = N / 2 + 1;

    double* buf = static_cast<double*>(fftw_malloc(sizeof(double) * N));
    if (!buf) throw std::runtime_error("fftw_malloc failed");
    fftw_complex* freq = static_cast<fftw_complex*>(fftw_malloc(sizeof(fftw_complex) * bins));
    if (!freq) {
        fftw_free(buf);
        throw std::runtime_error("fftw_malloc failed");
    }

    fftw_plan forward;
    fftw_plan inverse;
    {
        std::lock_guard<std::mutex> lock(planMutex());
        forward = fftw_plan_dft_r2c_1d(static_cast<int>(N), buf, freq, FFTW_ESTIMATE);
        inverse = fftw_plan_dft_c2r_1d(static_cast<int>(N), freq, buf, FFTW_ESTIMATE);
    }

    for (size_t i = 0; i < N; ++i) {
        buf[i] = i < n ? std::abs(static_cast<double>(x[i])) : 0.0;
    }
    fftw_execute(forward);
    for (size_t k = 0; k < bins; ++k) {
        const double re = freq[k][0];
        const double im = freq[k][1];
        freq[k][0] = re * re + im * im;
        freq[k][1] = 0.0;
    }
    fftw_execute(inverse);

    // FFTW's inverse is unnormalised
    const double scale = 1.0 / static_cast<double>(N);
    const double cutoff = std::abs(buf[0] * scale) * 1e-9;
    for (size_t p = 0; p <= maxLag && p < n; ++p) {
        const double v = buf[p] * scale;
        r[p] = v > cutoff ? v : 0.0;
    }

    {
        std::lock_guard<std::mutex> lock(planMutex());
        fftw_destroy_plan(forward);
        fftw_destroy_plan(inverse);
    }
    fftw_free(buf);
    fftw_free(freq);
    return r;
}

} // namespace

bool configure(AutocorrelationConfig& cfg, const nlohmann::json& config) {
    if (config.contains("analysisSeconds")) cfg.analysisSeconds = config["analysisSeconds"].get<double>();
    if (config.contains("targetRate")) cfg.targetRate = config["targetRate"].get<int>();
    if (config.contains("correlationSeconds")) cfg.correlationSeconds = config["correlationSeconds"].get<double>();
    if (config.contains("minCorrelation")) cfg.minCorrelation = config["minCorrelation"].get<double>();
    if (config.contains("antiAlias")) cfg.antiAlias = config["antiAlias"].get<bool>();
    if (config.contains("correlation")) {
        const std::string mode = config["correlation"].get<std::string>();
        if (mode == "direct") cfg.correlation = CorrelationMode::Direct;
        else if (mode == "fft") cfg.correlation = CorrelationMode::Fft;
        else return false;
    }
    return cfg.analysisSeconds > 0.0 && cfg.targetRate > 0 && cfg.correlationSeconds > 0.0
           && cfg.minCorrelation >= 0.0;
}

core::TempoEstimate estimateAutocorrelation(const core::AudioSignal& signal, const AutocorrelationConfig& cfg) {
    const int sampleRate = signal.getSampleRate();
    if (sampleRate <= 0 || signal.empty()) return core::TempoEstimate::none();

    // 1. Truncate and decimate
    const core::AudioSignal head = dsp::truncate(signal, cfg.analysisSeconds);
    const size_t factor = dsp::decimationFactor(sampleRate, cfg.targetRate);
    const std::vector<float> x = cfg.antiAlias
        ? dsp::decimate(dsp::boxcarLowPass(head.samples(), factor), factor)
        : dsp::decimate(head.samples(), factor);
    const double rate = static_cast<double>(sampleRate) / static_cast<double>(factor);

    // 2. Lag range and correlation window (the window may be fractional)
    const size_t minPeriod = static_cast<size_t>(std::floor(rate * 60.0 / core::kMaxBPM));
    const size_t maxPeriod = static_cast<size_t>(std::floor(rate * 60.0 / core::kMinBPM));
    const double window = std::min(static_cast<double>(x.size()), rate * cfg.correlationSeconds);
    const size_t span = static_cast<size_t>(std::ceil(window));

    std::vector<double> fftSums;
    if (cfg.correlation == CorrelationMode::Fft) {
        fftSums = fftAutocorrelation(x, span, maxPeriod);
    }

    // 3. Normalised correlation per lag
    std::vector<CorrelationSample> correlations;
    for (size_t period = std::max<size_t>(minPeriod, 1);
         period <= maxPeriod && static_cast<double>(period) < window; ++period) {
        const size_t count = span - period;
        double sum = 0.0;
        if (cfg.correlation == CorrelationMode::Fft) {
            sum = fftSums[period];
        } else {
            for (size_t i = 0; i < count; ++i) {
                sum += std::abs(static_cast<double>(x[i]) * static_cast<double>(x[i + period]));
            }
        }
        const double value = sum / static_cast<double>(count) / std::sqrt(static_cast<double>(period));
        correlations.push_back({period, value});
    }
    if (correlations.empty()) return core::TempoEstimate::none();

    // 4. Best and runner-up; equal values keep ascending lag order
    std::stable_sort(correlations.begin(), correlations.end(),
                     [](const CorrelationSample& a, const CorrelationSample& b) { return a.value > b.value; });
    const CorrelationSample& best = correlations[0];
    const double second = correlations.size() > 1 ? correlations[1].value : 0.0;
    if (!(best.value >= cfg.minCorrelation) || best.value <= 0.0) return core::TempoEstimate::none();

    // 5-6. Tempo with a single octave step
    int bpm = static_cast<int>(std::round(rate * 60.0 / static_cast<double>(best.period)));
    if (!core::inTempoRange(bpm)) {
        const int doubled = bpm * 2;
        const double halved = bpm / 2.0;
        if (core::inTempoRange(doubled)) {
            bpm = doubled;
        } else if (core::inTempoRange(halved)) {
            bpm = static_cast<int>(std::round(halved));
        } else {
            return core::TempoEstimate::none();
        }
    }

    // 7. Separation from the runner-up
    const double confidence = second > 0.0 ? std::min(1.0, best.value / (best.value + second)) : best.value;
    return core::TempoEstimate::of(bpm, confidence);
}

/**
 * @brief Estimator wrapper around estimateAutocorrelation().
 */
class AutocorrelationEstimator : public core::ITempoEstimator {
public:
    std::string getName() const override { return "autocorrelation"; }
    std::string getVersion() const override { return "1.0.0"; }
    core::TempoMethod getMethod() const override { return core::TempoMethod::Autocorrelation; }

    bool initialize(const nlohmann::json& config) override {
        AutocorrelationConfig next = m_cfg;
        if (!configure(next, config)) return false;
        m_cfg = next;
        return true;
    }

    core::TempoEstimate estimate(const core::AudioSignal& signal) const override {
        return estimateAutocorrelation(signal, m_cfg);
    }

private:
    AutocorrelationConfig m_cfg{};
};

// Factory function
std::unique_ptr<core::ITempoEstimator> createAutocorrelationEstimator() {
    return std::make_unique<AutocorrelationEstimator>();
}

} // namespace tactus::estimators
