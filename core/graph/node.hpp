#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace svcmap {

/// A service in the dependency map.
/// `id` is the node's position in generation order; `label` is its
/// unique, immutable name. `layer` is filled in by topology leveling.
struct Node {
    uint64_t id = 0;
    std::string label;
    int layer = 0;

    Node() = default;
    Node(uint64_t id, std::string label)
        : id(id), label(std::move(label)) {}
};

} // namespace svcmap
