//
// Tempo estimators: configuration, pure entry points and factories.
//

#ifndef TACTUS_ESTIMATORS_ESTIMATORS_H
#define TACTUS_ESTIMATORS_ESTIMATORS_H

#include <memory>
#include <nlohmann/json.hpp>
#include "../core/TempoEstimate.h"
#include "../dsp/PeakDetector.h"
#include "../dsp/Preprocessor.h"
#include "Consensus.h"

namespace tactus {
    namespace core {
        // Forward declarations
        class AudioSignal;
        class ITempoEstimator;
    }
    namespace estimators {

        /**
         * @brief How the autocorrelation sums are evaluated.
         */
        enum class CorrelationMode {
            /** @brief Explicit double loop over lag and offset. */
            Direct,
            /** @brief Autocorrelation of |x| through an FFTW real transform. */
            Fft
        };

        /**
         * @brief Configuration for the autocorrelation estimator.
         */
        struct AutocorrelationConfig {
            /** @brief Seconds of audio analysed from the start (default: 30). */
            double analysisSeconds = dsp::kDefaultAnalysisSeconds;

            /** @brief Rate the input is decimated towards (default: 8000 Hz). */
            int targetRate = dsp::kDefaultTargetRate;

            /** @brief Length of the correlation window in seconds (default: 2). */
            double correlationSeconds = 2.0;

            /** @brief Normalised correlation the best lag must reach (default: 0.1). */
            double minCorrelation = 0.1;

            /** @brief Evaluation strategy (default: direct). */
            CorrelationMode correlation = CorrelationMode::Direct;

            /** @brief Apply a boxcar prefilter before decimating (default: false). */
            bool antiAlias = false;
        };

        /**
         * @brief Configuration for the spectral-flux estimator.
         */
        struct SpectralFluxConfig {
            /** @brief Seconds of audio analysed from the start (default: 30). */
            double analysisSeconds = dsp::kDefaultAnalysisSeconds;

            /** @brief High-pass cutoff in Hz (default: 40). */
            double cutoffHz = dsp::kDefaultCutoffHz;

            /** @brief Frame length in samples (default: 2048). */
            size_t windowSize = 2048;

            /** @brief Frame advance in samples, at most windowSize (default: 512). */
            size_t hopSize = 512;

            /** @brief Minimum number of flux frames (default: 10). */
            size_t minFrames = 10;

            /** @brief Peak threshold relative to the flux maximum (default: 0.1). */
            double peakThreshold = 0.1;
        };

        /** @brief Narrowest accepted IOI histogram bin in seconds. */
        constexpr double kMinBinSeconds = 1e-4;

        /**
         * @brief Configuration for the peak-picking (inter-onset interval) estimator.
         */
        struct PeakPickingConfig {
            /** @brief Seconds of audio analysed from the start (default: 30). */
            double analysisSeconds = dsp::kDefaultAnalysisSeconds;

            /** @brief High-pass cutoff in Hz (default: 40). */
            double cutoffHz = dsp::kDefaultCutoffHz;

            /** @brief Onset detector window and energy gate. */
            dsp::OnsetConfig onset;

            /** @brief Width of an IOI histogram bin in seconds (default: 0.01, at least kMinBinSeconds). */
            double binSeconds = 0.01;
        };

        /**
         * @brief Configuration for the combined estimator: consensus rules plus the three leaf configs.
         */
        struct CombinedConfig {
            ConsensusConfig consensus;
            AutocorrelationConfig autocorrelation;
            SpectralFluxConfig spectralFlux;
            PeakPickingConfig peakPicking;
        };

        // Configuration parsing. Only keys present in the JSON object are read.
        // Each returns false if a value is out of range; the config is then left partially updated.
        bool configure(AutocorrelationConfig& cfg, const nlohmann::json& config);
        bool configure(SpectralFluxConfig& cfg, const nlohmann::json& config);
        bool configure(PeakPickingConfig& cfg, const nlohmann::json& config);
        bool configure(CombinedConfig& cfg, const nlohmann::json& config);

        /**
         * @brief Periodicity of the decimated signal via lag autocorrelation.
         * @param signal The input signal.
         * @param cfg Estimator parameters.
         * @return The estimate; none() when no lag qualifies.
         */
        core::TempoEstimate estimateAutocorrelation(const core::AudioSignal& signal,
                                                    const AutocorrelationConfig& cfg = AutocorrelationConfig());

        /**
         * @brief Periodicity of the peaks of a frame-wise flux curve.
         * @param signal The input signal.
         * @param cfg Estimator parameters.
         * @return The estimate; none() for short input or an out-of-range tempo.
         */
        core::TempoEstimate estimateSpectralFlux(const core::AudioSignal& signal,
                                                 const SpectralFluxConfig& cfg = SpectralFluxConfig());

        /**
         * @brief Modal inter-onset interval of energy-gated onsets.
         * @param signal The input signal.
         * @param cfg Estimator parameters.
         * @return The estimate, octave-folded into range; none() if fewer than two onsets.
         */
        core::TempoEstimate estimatePeakPicking(const core::AudioSignal& signal,
                                                const PeakPickingConfig& cfg = PeakPickingConfig());

        /**
         * @brief Runs the three leaf estimators in sequence and fuses their results.
         * @param signal The input signal.
         * @param cfg Consensus and leaf parameters.
         * @return The consensus estimate.
         */
        core::TempoEstimate estimateCombined(const core::AudioSignal& signal,
                                             const CombinedConfig& cfg = CombinedConfig());

        /**
         * @brief Factory functions for the concrete estimators.
         *
         * The concrete classes are hidden in their translation units; each one
         * wraps the matching estimateXxx() function and its configuration.
         * @return A unique pointer to a default-configured estimator.
         */
        std::unique_ptr<core::ITempoEstimator> createAutocorrelationEstimator();
        std::unique_ptr<core::ITempoEstimator> createSpectralFluxEstimator();
        std::unique_ptr<core::ITempoEstimator> createPeakPickingEstimator();
        std::unique_ptr<core::ITempoEstimator> createCombinedEstimator();

        /**
         * @brief Creates the estimator implementing a method.
         * @param method The method.
         * @return A unique pointer to a default-configured estimator.
         */
        std::unique_ptr<core::ITempoEstimator> createEstimator(core::TempoMethod method);

    } // namespace estimators
} // namespace tactus

#endif //TACTUS_ESTIMATORS_ESTIMATORS_H
