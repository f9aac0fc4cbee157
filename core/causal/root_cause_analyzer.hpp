#pragma once

#include "causal/path.hpp"
#include "causal/path_enumerator.hpp"
#include "causal/root_cause_ranker.hpp"
#include "graph/graph.hpp"

#include <string>
#include <vector>

namespace svcmap {

// ─── Root-Cause Result ────────────────────────────────────────
// `ranked` is the answer. The path lists record how it was reached:
// every path found between flagged pairs, in discovery order, and
// the ones that survived the containment filter.

struct RootCauseResult {
    std::vector<RootCauseCandidate> ranked;
    std::vector<Path> candidate_paths;
    std::vector<Path> surviving_paths;

    bool empty() const { return ranked.empty(); }
};

// ─── Root-Cause Analyzer ──────────────────────────────────────
// Given flagged ("unhealthy") services in the order the caller
// listed them:
// 1. For every pair (i, j) with i before j in that order, collect
//    all simple paths issue[i] → issue[j]. Pairs are not
//    symmetrized; a pair with no forward path contributes nothing.
// 2. Drop each path contained in a later-discovered path.
// 3. Count the terminal node of each surviving path.
// 4. Rank by count, descending, stable.
// Fewer than two flagged nodes, or no surviving paths, gives an
// empty result.

class RootCauseAnalyzer {
public:
    RootCauseAnalyzer() = default;

    /// Throws InvalidInput for an unknown label or a cyclic graph.
    RootCauseResult analyze(const Graph& g,
                            const std::vector<std::string>& issue_labels) const;

    /// Same, with nodes given by id.
    RootCauseResult analyzeIds(const Graph& g,
                               const std::vector<uint64_t>& issue_ids) const;

    /// Step 1 only.
    std::vector<Path> collectCandidatePaths(const Graph& g,
                                            const std::vector<uint64_t>& issue_ids) const;

    /// Map labels to ids, preserving order. Throws InvalidInput.
    static std::vector<uint64_t> resolveLabels(const Graph& g,
                                               const std::vector<std::string>& labels);

private:
    RootCauseRanker ranker_;
};

/// Convenience: RootCauseAnalyzer().analyze(g, issue_labels).
RootCauseResult analyze(const Graph& g, const std::vector<std::string>& issue_labels);

} // namespace svcmap
