#pragma once

#include "causal/path.hpp"
#include "graph/graph.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace svcmap {

// ─── Root-Cause Candidate ─────────────────────────────────────
// A node that terminates one or more surviving paths, with the
// number of such paths.

struct RootCauseCandidate {
    uint64_t node_id = 0;
    std::string label;
    int count = 0;

    bool operator==(const RootCauseCandidate& other) const {
        return node_id == other.node_id && label == other.label && count == other.count;
    }
};

// ─── Root-Cause Ranker ────────────────────────────────────────
// Counts the terminal node of each surviving path, in first-seen
// order, then orders by count descending. The sort is stable, so
// equal counts keep first-seen order.

class RootCauseRanker {
public:
    RootCauseRanker() = default;

    /// Count terminals in first-seen order (unsorted).
    std::vector<RootCauseCandidate> tally(const Graph& g,
                                          const std::vector<Path>& survivors) const;

    /// Tally and rank.
    std::vector<RootCauseCandidate> rank(const Graph& g,
                                         const std::vector<Path>& survivors) const;
};

} // namespace svcmap
