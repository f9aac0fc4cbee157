#pragma once

#include "graph/graph.hpp"

#include <algorithm>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <vector>

namespace svcmap {

/// A simple directed path, node ids in traversal order.
struct Path {
    std::vector<uint64_t> nodes;

    Path() = default;
    explicit Path(std::vector<uint64_t> nodes) : nodes(std::move(nodes)) {}
    Path(std::initializer_list<uint64_t> ids) : nodes(ids) {}

    bool empty() const { return nodes.empty(); }
    size_t size() const { return nodes.size(); }
    uint64_t source() const { return nodes.front(); }
    uint64_t terminal() const { return nodes.back(); }

    /// Concatenated labels, e.g. "ABD".
    std::string toString(const Graph& g) const {
        std::string out;
        for (uint64_t id : nodes) out += g.label(id);
        return out;
    }

    bool operator==(const Path& other) const { return nodes == other.nodes; }
    bool operator!=(const Path& other) const { return nodes != other.nodes; }

    auto begin() const { return nodes.begin(); }
    auto end() const { return nodes.end(); }
};

/// True if `needle` occurs as a contiguous run inside `haystack`.
/// Works for std::string (substring) and Path (node subsequence).
template <typename Seq>
bool containsSubpath(const Seq& haystack, const Seq& needle) {
    return std::search(haystack.begin(), haystack.end(),
                       needle.begin(), needle.end()) != haystack.end();
}

} // namespace svcmap
