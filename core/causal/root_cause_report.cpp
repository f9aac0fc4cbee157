#include "causal/root_cause_report.hpp"

#include <fmt/format.h>

namespace svcmap {

std::vector<std::string> formatRootCauseReport(const RootCauseResult& result) {
    if (result.empty()) {
        return {"No potential root causes could be identified. The selected issue "
                "nodes might be in disconnected parts of the graph or at the start "
                "of all paths."};
    }

    std::vector<std::string> lines;
    lines.reserve(result.ranked.size());
    for (const auto& c : result.ranked) {
        lines.push_back(fmt::format("Node {}: occurs in {} path(s)", c.label, c.count));
    }
    return lines;
}

std::vector<std::string> pathStrings(const Graph& g, const std::vector<Path>& paths) {
    std::vector<std::string> out;
    out.reserve(paths.size());
    for (const auto& p : paths) {
        out.push_back(p.toString(g));
    }
    return out;
}

} // namespace svcmap
