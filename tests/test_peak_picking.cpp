#include <iostream>
#include <limits>
#include "../include/tactus/core/ITempoEstimator.h"
#include "../include/tactus/estimators/Estimators.h"
#include "test_signals.h"

using tactus::core::TempoEstimate;
namespace est = tactus::estimators;

static bool expect_bpm(double inputBpm, int expected, int sr = 44100) {
    TempoEstimate e = est::estimatePeakPicking(synth_kicks(sr, inputBpm, 10.0));
    if (e.bpm != expected) {
        std::cerr << "peak-picking " << inputBpm << " BPM @ " << sr << " Hz -> " << e.toJson().dump()
                  << ", expected " << expected << std::endl;
        return false;
    }
    return true;
}

bool test_peak_picking_kicks_120() {
    TempoEstimate e = est::estimatePeakPicking(synth_kicks(44100, 120.0, 10.0));
    return e.bpm == 120 && e.confidence == 1.0;
}

bool test_peak_picking_octave_folding() {
    // 50 and 100 BPM resolve to the same tempo; 240 halves, 40 doubles
    return expect_bpm(50.0, 100) && expect_bpm(100.0, 100) && expect_bpm(240.0, 120) && expect_bpm(40.0, 80)
           && expect_bpm(80.0, 80) && expect_bpm(200.0, 200);
}

bool test_peak_picking_sample_rates() {
    for (int sr : {16000, 22050, 32000, 48000, 88200, 96000}) {
        if (!expect_bpm(120.0, 120, sr)) return false;
    }
    return true;
}

bool test_peak_picking_silence() {
    return est::estimatePeakPicking(synth_silence(44100, 5.0)) == TempoEstimate::none()
           && est::estimatePeakPicking(tactus::core::AudioSignal({}, 44100)) == TempoEstimate::none();
}

bool test_peak_picking_estimator_config() {
    auto estimator = est::createPeakPickingEstimator();
    if (estimator->getName() != "peak-picking") return false;
    if (estimator->initialize({{"binSeconds", 0.0}})) return false;
    if (estimator->initialize({{"binSeconds", 1e-12}})) return false;
    if (estimator->initialize({{"windowSeconds", std::numeric_limits<double>::infinity()}})) return false;
    // An onset window longer than the signal finds no onsets
    if (!estimator->initialize({{"windowSeconds", 1e300}})) return false;
    if (estimator->estimate(synth_kicks(44100, 120.0, 10.0)) != TempoEstimate::none()) return false;
    if (!estimator->initialize({{"energyThreshold", 0.05}, {"windowSeconds", 0.1}})) return false;
    TempoEstimate e = estimator->estimate(synth_kicks(44100, 120.0, 10.0));
    return e.bpm == 120 && estimator->validateOutput(e);
}
