#pragma once

#include "causal/path.hpp"

#include <vector>

namespace svcmap {

// ─── Candidate path filter ────────────────────────────────────
// Candidate k survives unless some candidate discovered after it
// (index > k) contains it as a contiguous subpath. Candidates found
// earlier are never consulted, so the result depends on discovery
// order: with ["AB", "ABC"] only "ABC" survives, with ["ABC", "AB"]
// both do. A lone candidate always survives.

template <typename Seq>
std::vector<Seq> filterCandidatePaths(const std::vector<Seq>& candidates) {
    if (candidates.size() == 1) {
        return candidates;
    }

    std::vector<Seq> survivors;
    for (size_t k = 0; k < candidates.size(); k++) {
        bool contained = false;
        for (size_t later = k + 1; later < candidates.size(); later++) {
            if (containsSubpath(candidates[later], candidates[k])) {
                contained = true;
                break;
            }
        }
        if (!contained) {
            survivors.push_back(candidates[k]);
        }
    }
    return survivors;
}

} // namespace svcmap
