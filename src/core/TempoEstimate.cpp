#include "../../include/tactus/core/TempoEstimate.h"
#include <algorithm>
#include <cmath>

namespace tactus::core {

TempoEstimate TempoEstimate::of(int bpm, double confidence) {
    if (!inTempoRange(bpm) || !std::isfinite(confidence)) {
        return none();
    }
    TempoEstimate e;
    e.bpm = bpm;
    e.confidence = std::min(1.0, std::max(0.0, confidence));
    return e;
}

bool TempoEstimate::isValid() const {
    if (!(confidence >= 0.0 && confidence <= 1.0)) return false;
    if (!bpm) return confidence == 0.0;
    return inTempoRange(*bpm);
}

nlohmann::json TempoEstimate::toJson() const {
    nlohmann::json j;
    j["bpm"] = bpm ? nlohmann::json(*bpm) : nlohmann::json(nullptr);
    j["confidence"] = confidence;
    return j;
}

std::string toString(TempoMethod method) {
    switch (method) {
        case TempoMethod::Autocorrelation: return "autocorrelation";
        case TempoMethod::SpectralFlux:    return "spectral-flux";
        case TempoMethod::PeakPicking:     return "peak-picking";
        case TempoMethod::Combined:        return "combined";
    }
    return "autocorrelation";
}

std::optional<TempoMethod> parseTempoMethod(const std::string& name) {
    for (TempoMethod m : allTempoMethods()) {
        if (toString(m) == name) return m;
    }
    return std::nullopt;
}

const std::vector<TempoMethod>& allTempoMethods() {
    static const std::vector<TempoMethod> methods = {
        TempoMethod::Autocorrelation,
        TempoMethod::SpectralFlux,
        TempoMethod::PeakPicking,
        TempoMethod::Combined
    };
    return methods;
}

} // namespace tactus::core
