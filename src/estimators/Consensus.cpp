#include "../../include/tactus/estimators/Consensus.h"
#include <algorithm>
#include <cmath>

namespace tactus::estimators {

std::string toString(ClusteringMode mode) {
    switch (mode) {
        case ClusteringMode::Greedy: return "greedy";
        case ClusteringMode::Sorted: return "sorted";
    }
    return "greedy";
}

std::optional<ClusteringMode> parseClusteringMode(const std::string& name) {
    if (name == "greedy") return ClusteringMode::Greedy;
    if (name == "sorted") return ClusteringMode::Sorted;
    return std::nullopt;
}

double ConsensusGroup::totalConfidence() const {
    double total = 0.0;
    for (const auto& m : members) total += m.confidence;
    return total;
}

std::vector<ConsensusGroup> clusterEstimates(const std::vector<core::TempoEstimate>& estimates,
                                             double toleranceBPM,
                                             ClusteringMode mode) {
    std::vector<core::TempoEstimate> usable;
    for (const auto& e : estimates) {
        if (e.hasTempo() && e.confidence > 0.0) usable.push_back(e);
    }
    if (mode == ClusteringMode::Sorted) {
        std::stable_sort(usable.begin(), usable.end(),
                         [](const core::TempoEstimate& a, const core::TempoEstimate& b) { return *a.bpm < *b.bpm; });
    }

    std::vector<ConsensusGroup> groups;
    for (const auto& e : usable) {
        auto it = std::find_if(groups.begin(), groups.end(), [&](const ConsensusGroup& g) {
            return std::abs(*e.bpm - g.anchorBpm) <= toleranceBPM;
        });
        if (it != groups.end()) {
            it->members.push_back(e);
        } else {
            ConsensusGroup g;
            g.anchorBpm = *e.bpm;
            g.members.push_back(e);
            groups.push_back(std::move(g));
        }
    }
    return groups;
}

core::TempoEstimate combineEstimates(const std::vector<core::TempoEstimate>& estimates,
                                     const ConsensusConfig& config) {
    const std::vector<ConsensusGroup> groups = clusterEstimates(estimates, config.toleranceBPM, config.clustering);

    if (groups.empty()) {
        // Fall back to the strongest raw estimate that carries a tempo
        core::TempoEstimate best = core::TempoEstimate::none();
        for (const auto& e : estimates) {
            if (e.hasTempo() && e.confidence > best.confidence) best = e;
        }
        return best.hasTempo() ? best : core::TempoEstimate::none();
    }

    const ConsensusGroup* bestGroup = nullptr;
    double bestTotal = 0.0;
    for (const auto& g : groups) {
        const double total = g.totalConfidence();
        if (total > bestTotal) {
            bestTotal = total;
            bestGroup = &g;
        }
    }
    if (bestGroup == nullptr) return core::TempoEstimate::none();

    double weightedSum = 0.0;
    for (const auto& m : bestGroup->members) {
        weightedSum += static_cast<double>(*m.bpm) * m.confidence;
    }
    const int bpm = static_cast<int>(std::round(weightedSum / bestTotal));

    const double size = static_cast<double>(bestGroup->members.size());
    const double meanConfidence = bestTotal / size;
    const double agreement = size / static_cast<double>(estimates.size());
    const double confidence = std::min(1.0, meanConfidence * (1.0 + agreement * config.agreementWeight));

    return core::TempoEstimate::of(bpm, confidence);
}

} // namespace tactus::estimators
