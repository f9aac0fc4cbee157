#include "graph/topology.hpp"

#include <algorithm>
#include <stdexcept>

namespace svcmap {

namespace {

// Levels as many nodes as possible. `removed` is the count of nodes
// that reached in-degree zero; it is short of nodeCount() on a cycle.
std::vector<std::vector<uint64_t>> level(const Graph& g, size_t& removed) {
    std::vector<size_t> remaining(g.nodeCount(), 0);
    std::vector<uint64_t> current;
    for (uint64_t id = 0; id < g.nodeCount(); id++) {
        remaining[id] = g.inDegree(id);
        if (remaining[id] == 0) current.push_back(id);
    }

    std::vector<std::vector<uint64_t>> generations;
    removed = 0;
    while (!current.empty()) {
        std::vector<uint64_t> next;
        for (uint64_t id : current) {
            for (uint64_t child : g.getOutgoing(id)) {
                if (--remaining[child] == 0) next.push_back(child);
            }
        }
        removed += current.size();
        generations.push_back(std::move(current));
        std::sort(next.begin(), next.end());
        current = std::move(next);
    }
    return generations;
}

} // namespace

std::vector<std::vector<uint64_t>> topologicalGenerations(const Graph& g) {
    size_t removed = 0;
    auto generations = level(g, removed);
    if (removed != g.nodeCount()) {
        throw std::runtime_error("Graph contains a cycle: " +
                                 std::to_string(g.nodeCount() - removed) +
                                 " node(s) could not be leveled");
    }
    return generations;
}

bool isAcyclic(const Graph& g) {
    size_t removed = 0;
    level(g, removed);
    return removed == g.nodeCount();
}

size_t assignLayers(Graph& g) {
    auto generations = topologicalGenerations(g);
    for (size_t layer = 0; layer < generations.size(); layer++) {
        for (uint64_t id : generations[layer]) {
            g.setLayer(id, static_cast<int>(layer));
        }
    }
    return generations.size();
}

} // namespace svcmap
