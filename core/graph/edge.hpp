#pragma once

#include <cstdint>

namespace svcmap {

/// A directed dependency edge source → target.
struct Edge {
    uint64_t id = 0;
    uint64_t source = 0;
    uint64_t target = 0;

    Edge() = default;
    Edge(uint64_t id, uint64_t source, uint64_t target)
        : id(id), source(source), target(target) {}

    bool operator==(const Edge& other) const {
        return source == other.source && target == other.target;
    }
    bool operator!=(const Edge& other) const { return !(*this == other); }
};

} // namespace svcmap
