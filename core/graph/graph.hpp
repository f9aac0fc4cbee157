#pragma once

#include "graph/node.hpp"
#include "graph/edge.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace svcmap {

// ─── Graph ─────────────────────────────────────────────────────
// Directed service dependency map. Nodes are kept in insertion
// (generation) order and addressed by dense ids 0..N-1; labels are
// unique. Edges are kept in insertion order, and so are each node's
// successor and predecessor lists. Adding an edge that already
// exists is a no-op.

class Graph {
public:
    Graph() = default;

    // ── Node operations ──
    uint64_t addNode(const std::string& label);
    Node* getNode(uint64_t id);
    const Node* getNode(uint64_t id) const;
    const Node* findNode(const std::string& label) const;
    std::optional<uint64_t> nodeId(const std::string& label) const;
    bool hasNode(const std::string& label) const { return label_index_.count(label) > 0; }
    std::vector<std::string> labels() const;
    const std::string& label(uint64_t id) const;
    size_t nodeCount() const { return nodes_.size(); }

    // ── Edge operations ──
    /// Returns true if the edge was inserted, false if it already existed.
    bool addEdge(uint64_t source, uint64_t target);
    bool addEdge(const std::string& source, const std::string& target);
    bool hasEdge(uint64_t source, uint64_t target) const;
    const std::vector<Edge>& edges() const { return edges_; }
    std::vector<std::pair<std::string, std::string>> labeledEdges() const;
    size_t edgeCount() const { return edges_.size(); }

    // ── Adjacency queries ──
    const std::vector<uint64_t>& getOutgoing(uint64_t node_id) const;
    const std::vector<uint64_t>& getIncoming(uint64_t node_id) const;
    size_t inDegree(uint64_t node_id) const { return getIncoming(node_id).size(); }

    // ── Layers ──
    void setLayer(uint64_t node_id, int layer);
    int layer(uint64_t node_id) const;
    std::vector<int> layers() const;

    // ── Cloning ──
    Graph clone() const { return *this; }

private:
    void checkNode(uint64_t id, const char* role) const;

    std::vector<Node> nodes_;
    std::vector<Edge> edges_;
    std::unordered_map<std::string, uint64_t> label_index_;

    // Adjacency lists in edge insertion order, indexed by node id.
    std::vector<std::vector<uint64_t>> outgoing_;
    std::vector<std::vector<uint64_t>> incoming_;

    // (source, target) pairs already present, for duplicate suppression.
    std::unordered_set<uint64_t> edge_keys_;
};

} // namespace svcmap
