#ifndef TACTUS_ESTIMATORS_CONSENSUS_H
#define TACTUS_ESTIMATORS_CONSENSUS_H

#include <optional>
#include <string>
#include <vector>
#include "../core/TempoEstimate.h"

namespace tactus {
    namespace estimators {

        /**
         * @brief How estimates are assigned to agreement groups.
         */
        enum class ClusteringMode {
            /** @brief Visit estimates in estimator order; join the first group whose anchor is within tolerance. */
            Greedy,
            /** @brief Same anchor rule, applied after a stable sort by BPM (order-independent). */
            Sorted
        };

        /** @brief Returns "greedy" or "sorted". */
        std::string toString(ClusteringMode mode);

        /**
         * @brief Parses a clustering mode name.
         * @return The mode, or std::nullopt for an unknown name.
         */
        std::optional<ClusteringMode> parseClusteringMode(const std::string& name);

        /**
         * @brief Parameters of the consensus step.
         */
        struct ConsensusConfig {
            /** @brief Maximum distance (BPM) between an estimate and a group anchor (default: 2). */
            double toleranceBPM = 2.0;

            /** @brief Boost factor applied to the agreeing fraction of estimators (default: 0.2). */
            double agreementWeight = 0.2;

            /** @brief Group assignment strategy (default: greedy). */
            ClusteringMode clustering = ClusteringMode::Greedy;
        };

        /**
         * @brief A set of estimates that agree on a tempo.
         */
        struct ConsensusGroup {
            /** @brief BPM of the first member; later members are compared against it. */
            int anchorBpm = 0;

            /** @brief Members in the order they joined. */
            std::vector<core::TempoEstimate> members;

            /** @brief Sum of the members' confidences. */
            double totalConfidence() const;
        };

        /**
         * @brief Groups the usable estimates (bpm set, confidence > 0) by tempo.
         *
         * @param estimates Estimates in estimator order.
         * @param toleranceBPM Maximum |bpm - anchor| to join a group.
         * @param mode Group assignment strategy.
         * @return Groups in creation order.
         */
        std::vector<ConsensusGroup> clusterEstimates(const std::vector<core::TempoEstimate>& estimates,
                                                     double toleranceBPM,
                                                     ClusteringMode mode = ClusteringMode::Greedy);

        /**
         * @brief Fuses several estimates into one.
         *
         * The group with the highest summed confidence wins (earliest group on
         * ties). Its BPM is the confidence-weighted mean, rounded; its confidence
         * is min(1, mean * (1 + size / estimates.size() * agreementWeight)).
         *
         * @param estimates The per-estimator results.
         * @param config Tolerance, boost and clustering parameters.
         * @return The fused estimate, or none() if nothing usable was given.
         */
        core::TempoEstimate combineEstimates(const std::vector<core::TempoEstimate>& estimates,
                                             const ConsensusConfig& config = ConsensusConfig());

    } // namespace estimators
} // namespace tactus

#endif // TACTUS_ESTIMATORS_CONSENSUS_H
