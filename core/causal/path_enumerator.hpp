#pragma once

#include "causal/path.hpp"
#include "graph/graph.hpp"

#include <cstdint>
#include <vector>

namespace svcmap {

// ─── Path Enumerator ──────────────────────────────────────────
// Enumerates every simple directed path between two nodes by
// backtracking depth-first search. Successors are visited in edge
// insertion order, which fixes the order paths are returned in.
// The count is exponential in the worst case; callers bound it by
// graph size.

class PathEnumerator {
public:
    /// All simple paths source → target. Empty if source == target
    /// or target is unreachable.
    static std::vector<Path> allSimplePaths(const Graph& g,
                                            uint64_t source,
                                            uint64_t target);

private:
    struct WalkState {
        const Graph* graph = nullptr;
        uint64_t target = 0;
        std::vector<uint64_t> stack;
        std::vector<bool> on_stack;
        std::vector<Path> results;
    };

    static void walk(WalkState& state, uint64_t current);
};

} // namespace svcmap
