#include "causal/root_cause_ranker.hpp"

#include <algorithm>
#include <unordered_map>

namespace svcmap {

std::vector<RootCauseCandidate> RootCauseRanker::tally(
    const Graph& g, const std::vector<Path>& survivors) const {

    std::vector<RootCauseCandidate> counts;
    std::unordered_map<uint64_t, size_t> slot;

    for (const auto& path : survivors) {
        if (path.empty()) continue;
        uint64_t node = path.terminal();
        auto it = slot.find(node);
        if (it == slot.end()) {
            slot.emplace(node, counts.size());
            counts.push_back({node, g.label(node), 1});
        } else {
            counts[it->second].count++;
        }
    }
    return counts;
}

std::vector<RootCauseCandidate> RootCauseRanker::rank(
    const Graph& g, const std::vector<Path>& survivors) const {

    auto ranked = tally(g, survivors);

    // Higher count first; ties keep first-seen order
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const RootCauseCandidate& a, const RootCauseCandidate& b) {
                         return a.count > b.count;
                     });
    return ranked;
}

} // namespace svcmap
