#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <stdexcept>

namespace svcmap {

/// Uniform integer in [0, bound) by rejection sampling on raw mt19937
/// output. The same engine state gives the same value on every
/// standard library.
inline size_t uniformIndex(std::mt19937& rng, size_t bound) {
    if (bound == 0) {
        throw std::logic_error("uniformIndex: empty range");
    }
    const uint64_t range = uint64_t{1} << 32;
    const uint64_t limit = range - range % bound;
    uint64_t draw = rng();
    while (draw >= limit) {
        draw = rng();
    }
    return static_cast<size_t>(draw % bound);
}

} // namespace svcmap
