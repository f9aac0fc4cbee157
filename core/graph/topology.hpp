#pragma once

#include "graph/graph.hpp"

#include <cstdint>
#include <vector>

namespace svcmap {

// ─── Topological leveling ─────────────────────────────────────
// Kahn-style generations: generation 0 holds every node with no
// incoming edges; generation k+1 holds the nodes whose last
// remaining predecessor was removed with generation k. A node's
// generation is the length of the longest path reaching it.

/// Returns the generations, each listing node ids in ascending order.
/// Throws std::runtime_error if the graph has a directed cycle.
std::vector<std::vector<uint64_t>> topologicalGenerations(const Graph& g);

/// True if no directed cycle exists.
bool isAcyclic(const Graph& g);

/// Write each node's generation index into Node::layer.
/// Returns the number of generations.
size_t assignLayers(Graph& g);

} // namespace svcmap
