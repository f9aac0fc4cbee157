#pragma once

#include "causal/root_cause_analyzer.hpp"

#include <string>
#include <vector>

namespace svcmap {

/// Human-readable summary of a result, one line per candidate:
///   "Node C: occurs in 3 path(s)"
/// An empty result yields a single explanatory line.
std::vector<std::string> formatRootCauseReport(const RootCauseResult& result);

/// Candidate paths as label strings, e.g. {"AB", "ABC"}.
std::vector<std::string> pathStrings(const Graph& g, const std::vector<Path>& paths);

} // namespace svcmap
