#include "../../include/tactus/dsp/IntervalHistogram.h"

namespace tactus::dsp {

void IntervalHistogram::add(long long key) {
    auto it = m_bins.find(key);
    if (it == m_bins.end()) {
        Bin bin;
        bin.firstSeen = m_bins.size();
        it = m_bins.emplace(key, bin).first;
    }
    ++it->second.count;
    ++m_total;
}

std::optional<IntervalHistogram::Mode> IntervalHistogram::mode() const {
    const Bin* best = nullptr;
    long long bestKey = 0;
    for (const auto& [key, bin] : m_bins) {
        if (best == nullptr || bin.count > best->count
            || (bin.count == best->count && bin.firstSeen < best->firstSeen)) {
            best = &bin;
            bestKey = key;
        }
    }
    if (best == nullptr) return std::nullopt;
    return Mode{bestKey, best->count};
}

size_t IntervalHistogram::count(long long key) const {
    auto it = m_bins.find(key);
    return it == m_bins.end() ? 0 : it->second.count;
}

} // namespace tactus::dsp
