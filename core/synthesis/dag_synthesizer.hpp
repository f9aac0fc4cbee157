#pragma once

#include "graph/graph.hpp"
#include "synthesis/synthesis_config.hpp"

#include <cstdint>
#include <random>

namespace svcmap {

// ─── DAG Synthesizer ──────────────────────────────────────────
// Builds a random layered service map:
// 1. Backbone: every node i > 0 gets one parent drawn from
//    [max(0, i - max_depth), i - 1], so the map is connected.
// 2. Extra edges: node i draws k in [0, |W|] and links to k distinct
//    nodes of W = [i + 1, min(N - 1, i + max_depth)].
// 3. Layers: Kahn generations of the final edge set.
// All edges point from lower to higher index, so the result is
// acyclic by construction.

class DagSynthesizer {
public:
    DagSynthesizer() = default;

    /// Seeded from config.seed.
    Graph synthesize(const SynthesisConfig& config) const;

    /// Draws from the caller's engine; config.seed is ignored.
    Graph synthesize(const SynthesisConfig& config, std::mt19937& rng) const;

    /// Throws InvalidParameter if the config cannot produce a graph.
    static void validate(const SynthesisConfig& config);

private:
    void addBackbone(Graph& g, int max_depth, std::mt19937& rng) const;
    void addExtraEdges(Graph& g, int max_depth, std::mt19937& rng) const;
};

/// Convenience: synthesize(nodeCount, maxDepth, seed) with the default alphabet.
Graph synthesize(int node_count, int max_depth, uint32_t seed);

} // namespace svcmap
