#include "causal/root_cause_analyzer.hpp"

#include "causal/path_filter.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"
#include "graph/topology.hpp"

namespace svcmap {

std::vector<uint64_t> RootCauseAnalyzer::resolveLabels(
    const Graph& g, const std::vector<std::string>& labels) {

    std::vector<uint64_t> ids;
    ids.reserve(labels.size());
    for (const auto& label : labels) {
        auto id = g.nodeId(label);
        if (!id) {
            throw InvalidInput("Unknown issue node: '" + label + "'");
        }
        ids.push_back(*id);
    }
    return ids;
}

RootCauseResult RootCauseAnalyzer::analyze(
    const Graph& g, const std::vector<std::string>& issue_labels) const {

    return analyzeIds(g, resolveLabels(g, issue_labels));
}

std::vector<Path> RootCauseAnalyzer::collectCandidatePaths(
    const Graph& g, const std::vector<uint64_t>& issue_ids) const {

    std::vector<Path> candidates;
    for (size_t i = 0; i < issue_ids.size(); i++) {
        for (size_t j = i + 1; j < issue_ids.size(); j++) {
            auto paths = PathEnumerator::allSimplePaths(g, issue_ids[i], issue_ids[j]);
            SVCMAP_LOG_TRACE("{} -> {}: {} path(s)",
                             g.label(issue_ids[i]), g.label(issue_ids[j]), paths.size());
            for (auto& p : paths) {
                candidates.push_back(std::move(p));
            }
        }
    }
    return candidates;
}

RootCauseResult RootCauseAnalyzer::analyzeIds(
    const Graph& g, const std::vector<uint64_t>& issue_ids) const {

    for (uint64_t id : issue_ids) {
        if (id >= g.nodeCount()) {
            throw InvalidInput("Unknown issue node id: " + std::to_string(id));
        }
    }
    if (!isAcyclic(g)) {
        throw InvalidInput("Root-cause analysis requires an acyclic graph");
    }

    RootCauseResult result;
    if (issue_ids.size() < 2) {
        SVCMAP_LOG_DEBUG("{} issue node(s) flagged; nothing to correlate", issue_ids.size());
        return result;
    }

    result.candidate_paths = collectCandidatePaths(g, issue_ids);
    result.surviving_paths = filterCandidatePaths(result.candidate_paths);
    result.ranked = ranker_.rank(g, result.surviving_paths);

    SVCMAP_LOG_DEBUG("Analyzed {} issue nodes: {} candidate path(s), {} surviving",
                     issue_ids.size(), result.candidate_paths.size(),
                     result.surviving_paths.size());
    if (!result.ranked.empty()) {
        SVCMAP_LOG_INFO("Top root-cause candidate: {} ({} path(s))",
                        result.ranked.front().label, result.ranked.front().count);
    }
    return result;
}

RootCauseResult analyze(const Graph& g, const std::vector<std::string>& issue_labels) {
    return RootCauseAnalyzer().analyze(g, issue_labels);
}

} // namespace svcmap
