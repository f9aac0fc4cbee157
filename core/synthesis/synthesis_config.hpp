#pragma once

#include <cstdint>
#include <string>

namespace svcmap {

/// Parameters for random service-map synthesis.
struct SynthesisConfig {
    int node_count = 15;            // Number of services, 2..alphabet.size()
    int max_depth = 2;              // Maximum index span of any edge
    uint32_t seed = 123;            // Seed for std::mt19937
    std::string alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZ";  // One label per character
};

} // namespace svcmap
