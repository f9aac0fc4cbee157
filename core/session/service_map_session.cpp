#include "session/service_map_session.hpp"

#include "common/errors.hpp"
#include "common/logging.hpp"
#include "graph/topology.hpp"

#include <stdexcept>

namespace svcmap {

std::shared_ptr<const Graph> ServiceMapSession::generate() {
    // Synthesize fully before touching state, so a bad config
    // leaves the previous snapshot in place.
    auto fresh = std::make_shared<const Graph>(synthesizer_.synthesize(config_));
    graph_ = std::move(fresh);
    issue_nodes_.clear();
    generation_++;
    SVCMAP_LOG_INFO("Session generation {}: {} nodes, {} edges (seed {})",
                    generation_, graph_->nodeCount(), graph_->edgeCount(), config_.seed);
    return graph_;
}

std::shared_ptr<const Graph> ServiceMapSession::generate(const SynthesisConfig& config) {
    DagSynthesizer::validate(config);
    config_ = config;
    return generate();
}

std::shared_ptr<const Graph> ServiceMapSession::adopt(Graph graph) {
    if (!isAcyclic(graph)) {
        throw InvalidInput("Cannot adopt a graph that contains a cycle");
    }
    assignLayers(graph);
    graph_ = std::make_shared<const Graph>(std::move(graph));
    issue_nodes_.clear();
    generation_++;
    return graph_;
}

const Graph& ServiceMapSession::requireGraph() const {
    if (!graph_) {
        throw std::runtime_error("No service map generated yet");
    }
    return *graph_;
}

void ServiceMapSession::setIssueNodes(const std::vector<std::string>& labels) {
    RootCauseAnalyzer::resolveLabels(requireGraph(), labels);
    issue_nodes_ = labels;
}

RootCauseResult ServiceMapSession::analyze() const {
    return analyze(issue_nodes_);
}

RootCauseResult ServiceMapSession::analyze(const std::vector<std::string>& labels) const {
    // Hold the snapshot for the duration of the call.
    std::shared_ptr<const Graph> snapshot = graph_;
    if (!snapshot) {
        throw std::runtime_error("No service map generated yet");
    }
    return analyzer_.analyze(*snapshot, labels);
}

} // namespace svcmap
