#pragma once

#include <stdexcept>
#include <string>

namespace svcmap {

// ─── Error types ──────────────────────────────────────────────
// Graph-construction misuse (missing node, duplicate label) throws
// std::runtime_error. Caller-supplied parameters that can never
// produce a result throw one of the types below.

/// Synthesis parameters out of range (node count, depth, alphabet).
class InvalidParameter : public std::invalid_argument {
public:
    explicit InvalidParameter(const std::string& what)
        : std::invalid_argument(what) {}
};

/// Analysis input that violates a precondition (unknown label, cyclic graph).
class InvalidInput : public std::invalid_argument {
public:
    explicit InvalidInput(const std::string& what)
        : std::invalid_argument(what) {}
};

} // namespace svcmap
