#include "graph/graph.hpp"

#include <stdexcept>

namespace svcmap {

namespace {
uint64_t edgeKey(uint64_t source, uint64_t target) {
    return (source << 32) | (target & 0xffffffffULL);
}
} // namespace

// ─── Node operations ───────────────────────────────────────────

uint64_t Graph::addNode(const std::string& label) {
    if (label.empty()) {
        throw std::runtime_error("Node label must not be empty");
    }
    if (label_index_.count(label)) {
        throw std::runtime_error("Node label already exists: " + label);
    }
    uint64_t id = nodes_.size();
    nodes_.emplace_back(id, label);
    label_index_.emplace(label, id);
    outgoing_.emplace_back();
    incoming_.emplace_back();
    return id;
}

Node* Graph::getNode(uint64_t id) {
    return id < nodes_.size() ? &nodes_[id] : nullptr;
}

const Node* Graph::getNode(uint64_t id) const {
    return id < nodes_.size() ? &nodes_[id] : nullptr;
}

const Node* Graph::findNode(const std::string& label) const {
    auto it = label_index_.find(label);
    return it != label_index_.end() ? &nodes_[it->second] : nullptr;
}

std::optional<uint64_t> Graph::nodeId(const std::string& label) const {
    auto it = label_index_.find(label);
    if (it == label_index_.end()) return std::nullopt;
    return it->second;
}

std::vector<std::string> Graph::labels() const {
    std::vector<std::string> out;
    out.reserve(nodes_.size());
    for (const auto& n : nodes_) {
        out.push_back(n.label);
    }
    return out;
}

const std::string& Graph::label(uint64_t id) const {
    checkNode(id, "Node");
    return nodes_[id].label;
}

void Graph::checkNode(uint64_t id, const char* role) const {
    if (id >= nodes_.size()) {
        throw std::runtime_error(std::string(role) + " node not found: " + std::to_string(id));
    }
}

// ─── Edge operations ───────────────────────────────────────────

bool Graph::addEdge(uint64_t source, uint64_t target) {
    checkNode(source, "Source");
    checkNode(target, "Target");

    if (!edge_keys_.insert(edgeKey(source, target)).second) {
        return false;
    }
    edges_.emplace_back(edges_.size(), source, target);
    outgoing_[source].push_back(target);
    incoming_[target].push_back(source);
    return true;
}

bool Graph::addEdge(const std::string& source, const std::string& target) {
    auto s = nodeId(source);
    if (!s) throw std::runtime_error("Source node not found: " + source);
    auto t = nodeId(target);
    if (!t) throw std::runtime_error("Target node not found: " + target);
    return addEdge(*s, *t);
}

bool Graph::hasEdge(uint64_t source, uint64_t target) const {
    return edge_keys_.count(edgeKey(source, target)) > 0;
}

std::vector<std::pair<std::string, std::string>> Graph::labeledEdges() const {
    std::vector<std::pair<std::string, std::string>> out;
    out.reserve(edges_.size());
    for (const auto& e : edges_) {
        out.emplace_back(nodes_[e.source].label, nodes_[e.target].label);
    }
    return out;
}

// ─── Adjacency queries ────────────────────────────────────────

const std::vector<uint64_t>& Graph::getOutgoing(uint64_t node_id) const {
    checkNode(node_id, "Source");
    return outgoing_[node_id];
}

const std::vector<uint64_t>& Graph::getIncoming(uint64_t node_id) const {
    checkNode(node_id, "Target");
    return incoming_[node_id];
}

// ─── Layers ────────────────────────────────────────────────────

void Graph::setLayer(uint64_t node_id, int layer) {
    checkNode(node_id, "Layered");
    nodes_[node_id].layer = layer;
}

int Graph::layer(uint64_t node_id) const {
    checkNode(node_id, "Layered");
    return nodes_[node_id].layer;
}

std::vector<int> Graph::layers() const {
    std::vector<int> out;
    out.reserve(nodes_.size());
    for (const auto& n : nodes_) {
        out.push_back(n.layer);
    }
    return out;
}

} // namespace svcmap
