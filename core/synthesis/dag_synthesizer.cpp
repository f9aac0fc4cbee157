#include "synthesis/dag_synthesizer.hpp"

#include "common/errors.hpp"
#include "common/logging.hpp"
#include "graph/topology.hpp"
#include "synthesis/uniform_draw.hpp"

#include <algorithm>
#include <cstddef>
#include <unordered_set>
#include <vector>

namespace svcmap {

void DagSynthesizer::validate(const SynthesisConfig& config) {
    if (config.node_count < 2) {
        throw InvalidParameter("node_count must be at least 2, got " +
                               std::to_string(config.node_count));
    }
    if (static_cast<size_t>(config.node_count) > config.alphabet.size()) {
        throw InvalidParameter("node_count " + std::to_string(config.node_count) +
                               " exceeds the label alphabet size " +
                               std::to_string(config.alphabet.size()));
    }
    if (config.max_depth < 1) {
        throw InvalidParameter("max_depth must be at least 1, got " +
                               std::to_string(config.max_depth));
    }
    std::unordered_set<char> seen;
    for (int i = 0; i < config.node_count; i++) {
        if (!seen.insert(config.alphabet[i]).second) {
            throw InvalidParameter(std::string("duplicate label '") +
                                   config.alphabet[i] + "' in alphabet");
        }
    }
}

Graph DagSynthesizer::synthesize(const SynthesisConfig& config) const {
    std::mt19937 rng(config.seed);
    return synthesize(config, rng);
}

Graph DagSynthesizer::synthesize(const SynthesisConfig& config, std::mt19937& rng) const {
    validate(config);

    Graph g;
    for (int i = 0; i < config.node_count; i++) {
        g.addNode(std::string(1, config.alphabet[i]));
    }

    addBackbone(g, config.max_depth, rng);
    size_t backbone_edges = g.edgeCount();
    addExtraEdges(g, config.max_depth, rng);
    size_t generations = assignLayers(g);

    SVCMAP_LOG_DEBUG("Synthesized service map: {} nodes, max_depth {}, {} backbone + {} extra edges, {} layers",
                     g.nodeCount(), config.max_depth, backbone_edges,
                     g.edgeCount() - backbone_edges, generations);
    return g;
}

void DagSynthesizer::addBackbone(Graph& g, int max_depth, std::mt19937& rng) const {
    const size_t n = g.nodeCount();
    const size_t depth = static_cast<size_t>(max_depth);
    for (size_t i = 1; i < n; i++) {
        size_t lo = i > depth ? i - depth : 0;
        size_t parent = lo + uniformIndex(rng, i - lo);
        g.addEdge(parent, i);
    }
}

void DagSynthesizer::addExtraEdges(Graph& g, int max_depth, std::mt19937& rng) const {
    const size_t n = g.nodeCount();
    const size_t depth = static_cast<size_t>(max_depth);
    for (size_t i = 0; i < n; i++) {
        size_t hi = std::min(n - 1, i + depth);
        std::vector<uint64_t> pool;
        for (size_t c = i + 1; c <= hi; c++) pool.push_back(c);

        size_t k = uniformIndex(rng, pool.size() + 1);
        for (size_t drawn = 0; drawn < k; drawn++) {
            size_t pick = uniformIndex(rng, pool.size());
            uint64_t child = pool[pick];
            pool.erase(pool.begin() + static_cast<std::ptrdiff_t>(pick));
            if (!g.addEdge(i, child)) {
                SVCMAP_LOG_TRACE("Extra edge {}->{} duplicates a backbone edge",
                                 g.label(i), g.label(child));
            }
        }
    }
}

Graph synthesize(int node_count, int max_depth, uint32_t seed) {
    SynthesisConfig config;
    config.node_count = node_count;
    config.max_depth = max_depth;
    config.seed = seed;
    return DagSynthesizer().synthesize(config);
}

} // namespace svcmap
