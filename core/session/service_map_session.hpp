#pragma once

#include "causal/root_cause_analyzer.hpp"
#include "graph/graph.hpp"
#include "synthesis/dag_synthesizer.hpp"
#include "synthesis/synthesis_config.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace svcmap {

/// One interactive session over a service map.
/// The current graph is an immutable snapshot. generate() swaps in a
/// new one and clears the issue selection; snapshots obtained earlier
/// through graph() stay valid and unchanged.
class ServiceMapSession {
public:
    ServiceMapSession() = default;
    explicit ServiceMapSession(SynthesisConfig config) : config_(std::move(config)) {}

    /// Synthesize from the stored config. Returns the new snapshot.
    std::shared_ptr<const Graph> generate();

    /// Replace the stored config, then synthesize.
    std::shared_ptr<const Graph> generate(const SynthesisConfig& config);

    /// Adopt an externally built graph. Throws InvalidInput if cyclic.
    std::shared_ptr<const Graph> adopt(Graph graph);

    std::shared_ptr<const Graph> graph() const { return graph_; }
    bool hasGraph() const { return graph_ != nullptr; }
    uint64_t generation() const { return generation_; }

    const SynthesisConfig& config() const { return config_; }
    void setConfig(const SynthesisConfig& config) { config_ = config; }

    /// Store the flagged nodes, order preserved. Throws InvalidInput
    /// for labels not in the current graph, std::runtime_error if
    /// there is no graph yet.
    void setIssueNodes(const std::vector<std::string>& labels);
    const std::vector<std::string>& issueNodes() const { return issue_nodes_; }
    void clearIssueNodes() { issue_nodes_.clear(); }

    /// Analyze the stored issue nodes against the current snapshot.
    RootCauseResult analyze() const;

    /// Analyze an explicit list against the current snapshot.
    RootCauseResult analyze(const std::vector<std::string>& labels) const;

private:
    const Graph& requireGraph() const;

    SynthesisConfig config_;
    std::shared_ptr<const Graph> graph_;
    std::vector<std::string> issue_nodes_;
    uint64_t generation_ = 0;
    DagSynthesizer synthesizer_;
    RootCauseAnalyzer analyzer_;
};

} // namespace svcmap
