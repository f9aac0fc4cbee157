// PyBind11 bindings for the svcmap C++ core.
// Exposes synthesis, the Graph snapshot, root-cause analysis and the
// session object to a Python presentation layer.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DSVCMAP_BUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "causal/path.hpp"
#include "causal/path_filter.hpp"
#include "causal/root_cause_analyzer.hpp"
#include "causal/root_cause_report.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"
#include "graph/graph.hpp"
#include "graph/topology.hpp"
#include "session/service_map_session.hpp"
#include "synthesis/dag_synthesizer.hpp"
#include "synthesis/synthesis_config.hpp"

namespace py = pybind11;

PYBIND11_MODULE(svcmap_bindings, m) {
    m.doc() = "svcmap C++ Core Bindings";

    // ── Errors ──
    py::register_exception<svcmap::InvalidParameter>(m, "InvalidParameter", PyExc_ValueError);
    py::register_exception<svcmap::InvalidInput>(m, "InvalidInput", PyExc_ValueError);

    // ── Node ──
    py::class_<svcmap::Node>(m, "Node")
        .def_readonly("id", &svcmap::Node::id)
        .def_readonly("label", &svcmap::Node::label)
        .def_readonly("layer", &svcmap::Node::layer);

    // ── Edge ──
    py::class_<svcmap::Edge>(m, "Edge")
        .def_readonly("id", &svcmap::Edge::id)
        .def_readonly("source", &svcmap::Edge::source)
        .def_readonly("target", &svcmap::Edge::target);

    // ── Graph ──
    py::class_<svcmap::Graph, std::shared_ptr<svcmap::Graph>>(m, "Graph")
        .def(py::init<>())
        .def("add_node", &svcmap::Graph::addNode)
        .def("add_edge", py::overload_cast<const std::string&, const std::string&>(
                             &svcmap::Graph::addEdge))
        .def("find_node", &svcmap::Graph::findNode, py::return_value_policy::reference_internal)
        .def("labels", &svcmap::Graph::labels)
        .def("edges", &svcmap::Graph::labeledEdges)
        .def("layers", &svcmap::Graph::layers)
        .def("node_count", &svcmap::Graph::nodeCount)
        .def("edge_count", &svcmap::Graph::edgeCount)
        .def("generations", [](const svcmap::Graph& g) {
            std::vector<std::vector<std::string>> out;
            for (const auto& generation : svcmap::topologicalGenerations(g)) {
                std::vector<std::string> labels;
                for (uint64_t id : generation) labels.push_back(g.label(id));
                out.push_back(std::move(labels));
            }
            return out;
        })
        .def("is_acyclic", [](const svcmap::Graph& g) { return svcmap::isAcyclic(g); })
        .def("clone", &svcmap::Graph::clone);

    // ── SynthesisConfig ──
    py::class_<svcmap::SynthesisConfig>(m, "SynthesisConfig")
        .def(py::init<>())
        .def_readwrite("node_count", &svcmap::SynthesisConfig::node_count)
        .def_readwrite("max_depth", &svcmap::SynthesisConfig::max_depth)
        .def_readwrite("seed", &svcmap::SynthesisConfig::seed)
        .def_readwrite("alphabet", &svcmap::SynthesisConfig::alphabet);

    // ── RootCauseCandidate ──
    py::class_<svcmap::RootCauseCandidate>(m, "RootCauseCandidate")
        .def_readonly("label", &svcmap::RootCauseCandidate::label)
        .def_readonly("count", &svcmap::RootCauseCandidate::count);

    // ── RootCauseResult ──
    py::class_<svcmap::RootCauseResult>(m, "RootCauseResult")
        .def_readonly("ranked", &svcmap::RootCauseResult::ranked)
        .def("empty", &svcmap::RootCauseResult::empty)
        .def("report", &svcmap::formatRootCauseReport);

    // ── ServiceMapSession ──
    py::class_<svcmap::ServiceMapSession>(m, "ServiceMapSession")
        .def(py::init<>())
        .def(py::init<svcmap::SynthesisConfig>())
        // Python always gets its own copy; the session snapshot stays immutable.
        .def("generate", [](svcmap::ServiceMapSession& s) {
            return std::make_shared<svcmap::Graph>(*s.generate());
        })
        .def("generate", [](svcmap::ServiceMapSession& s, const svcmap::SynthesisConfig& config) {
            return std::make_shared<svcmap::Graph>(*s.generate(config));
        }, py::arg("config"))
        .def("graph", [](const svcmap::ServiceMapSession& s) -> std::shared_ptr<svcmap::Graph> {
            auto snapshot = s.graph();
            if (!snapshot) return nullptr;
            return std::make_shared<svcmap::Graph>(*snapshot);
        })
        .def("generation", &svcmap::ServiceMapSession::generation)
        .def("set_issue_nodes", &svcmap::ServiceMapSession::setIssueNodes)
        .def("issue_nodes", &svcmap::ServiceMapSession::issueNodes)
        .def("analyze", py::overload_cast<>(&svcmap::ServiceMapSession::analyze, py::const_))
        .def("analyze", py::overload_cast<const std::vector<std::string>&>(
                            &svcmap::ServiceMapSession::analyze, py::const_));

    m.def("synthesize", [](int node_count, int max_depth, uint32_t seed) {
        return std::make_shared<svcmap::Graph>(svcmap::synthesize(node_count, max_depth, seed));
    }, py::arg("node_count"), py::arg("max_depth"), py::arg("seed") = 123);

    m.def("synthesize_config", [](const svcmap::SynthesisConfig& config) {
        return std::make_shared<svcmap::Graph>(svcmap::DagSynthesizer().synthesize(config));
    }, py::arg("config"));

    m.def("analyze", [](const svcmap::Graph& g, const std::vector<std::string>& issue_nodes) {
        auto result = svcmap::analyze(g, issue_nodes);
        std::vector<std::pair<std::string, int>> ranked;
        for (const auto& c : result.ranked) ranked.emplace_back(c.label, c.count);
        return ranked;
    }, py::arg("graph"), py::arg("issue_nodes"));

    m.def("filter_candidate_paths", &svcmap::filterCandidatePaths<std::string>,
          py::arg("paths"));

    // Unknown names raise InvalidParameter (a ValueError).
    m.def("set_log_level", py::overload_cast<const std::string&>(&svcmap::setLogLevel),
          py::arg("level"));
}
