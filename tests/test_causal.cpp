#include <gtest/gtest.h>
#include "causal/root_cause_analyzer.hpp"
#include "causal/root_cause_ranker.hpp"
#include "causal/root_cause_report.hpp"
#include "common/errors.hpp"
#include "graph/graph.hpp"
#include "synthesis/dag_synthesizer.hpp"

#include <string>
#include <utility>
#include <vector>

using namespace svcmap;

namespace {

Graph buildGraph(const std::vector<std::string>& labels,
                 const std::vector<std::pair<std::string, std::string>>& edges) {
    Graph g;
    for (const auto& l : labels) g.addNode(l);
    for (const auto& [s, t] : edges) g.addEdge(s, t);
    return g;
}

// A -> B -> C plus the shortcut A -> C.
Graph triangle() {
    return buildGraph({"A", "B", "C"}, {{"A", "B"}, {"B", "C"}, {"A", "C"}});
}

std::vector<std::pair<std::string, int>> ranked(const RootCauseResult& r) {
    std::vector<std::pair<std::string, int>> out;
    for (const auto& c : r.ranked) out.emplace_back(c.label, c.count);
    return out;
}

using Ranking = std::vector<std::pair<std::string, int>>;

} // namespace

// ─── Ranker ────────────────────────────────────────────────────

TEST(RootCauseRankerTest, TallyKeepsFirstSeenOrder) {
    Graph g = triangle();
    std::vector<Path> survivors = {Path{0, 2}, Path{0, 1}, Path{1, 2}, Path{0, 1}};
    RootCauseRanker ranker;

    auto tally = ranker.tally(g, survivors);
    ASSERT_EQ(tally.size(), 2u);
    EXPECT_EQ(tally[0].label, "C");
    EXPECT_EQ(tally[0].count, 2);
    EXPECT_EQ(tally[1].label, "B");
    EXPECT_EQ(tally[1].count, 2);
}

TEST(RootCauseRankerTest, RankSortsDescendingAndStable) {
    Graph g = buildGraph({"A", "B", "C", "D"}, {});
    std::vector<Path> survivors = {
        Path{0, 3}, Path{0, 1}, Path{0, 2}, Path{1, 2}, Path{0, 1, 2},
    };
    RootCauseRanker ranker;
    auto r = ranker.rank(g, survivors);
    ASSERT_EQ(r.size(), 3u);
    EXPECT_EQ(r[0].label, "C");
    EXPECT_EQ(r[0].count, 3);
    EXPECT_EQ(r[1].label, "D");  // tied with B, seen first
    EXPECT_EQ(r[2].label, "B");

    EXPECT_TRUE(ranker.rank(g, {}).empty());
}

// ─── Analyzer ──────────────────────────────────────────────────

TEST(RootCauseAnalyzerTest, TriangleInListedOrder) {
    Graph g = triangle();
    auto result = analyze(g, {"A", "B", "C"});

    EXPECT_EQ(pathStrings(g, result.candidate_paths),
              (std::vector<std::string>{"AB", "ABC", "AC", "BC"}));
    EXPECT_EQ(pathStrings(g, result.surviving_paths),
              (std::vector<std::string>{"ABC", "AC", "BC"}));
    EXPECT_EQ(ranked(result), (Ranking{{"C", 3}}));
}

TEST(RootCauseAnalyzerTest, IssueOrderChangesResult) {
    Graph g = triangle();
    auto forward = analyze(g, {"A", "B", "C"});
    auto swapped = analyze(g, {"A", "C", "B"});

    EXPECT_EQ(pathStrings(g, swapped.candidate_paths),
              (std::vector<std::string>{"ABC", "AC", "AB"}));
    EXPECT_EQ(ranked(swapped), (Ranking{{"C", 2}, {"B", 1}}));
    EXPECT_NE(ranked(forward), ranked(swapped));
}

TEST(RootCauseAnalyzerTest, ReversedOrderFindsNothing) {
    Graph g = triangle();
    auto result = analyze(g, {"C", "B", "A"});
    EXPECT_TRUE(result.empty());
    EXPECT_TRUE(result.candidate_paths.empty());
}

TEST(RootCauseAnalyzerTest, SinglePathShortcut) {
    Graph g = buildGraph({"A", "B", "C"}, {{"A", "B"}, {"A", "C"}});
    auto result = analyze(g, {"A", "B"});
    ASSERT_EQ(result.candidate_paths.size(), 1u);
    EXPECT_EQ(ranked(result), (Ranking{{"B", 1}}));
}

TEST(RootCauseAnalyzerTest, TiesKeepFirstSeenOrder) {
    Graph g = buildGraph({"A", "B", "C"}, {{"A", "B"}, {"A", "C"}});
    EXPECT_EQ(ranked(analyze(g, {"A", "C", "B"})), (Ranking{{"C", 1}, {"B", 1}}));
    EXPECT_EQ(ranked(analyze(g, {"A", "B", "C"})), (Ranking{{"B", 1}, {"C", 1}}));
}

TEST(RootCauseAnalyzerTest, FewerThanTwoIssuesIsEmpty) {
    Graph g = triangle();
    EXPECT_TRUE(analyze(g, {"A"}).empty());
    EXPECT_TRUE(analyze(g, {}).empty());
}

TEST(RootCauseAnalyzerTest, UnreachableIssuesAreEmpty) {
    Graph g = buildGraph({"A", "B", "C"}, {{"A", "B"}, {"A", "C"}});
    auto result = analyze(g, {"B", "C"});
    EXPECT_TRUE(result.empty());
}

TEST(RootCauseAnalyzerTest, RepeatedIssueContributesNoSelfPath) {
    Graph g = triangle();
    EXPECT_TRUE(analyze(g, {"B", "B"}).empty());
}

TEST(RootCauseAnalyzerTest, UnknownLabelIsInvalidInput) {
    Graph g = triangle();
    EXPECT_THROW(analyze(g, {"A", "Z"}), InvalidInput);
    EXPECT_THROW(RootCauseAnalyzer().analyzeIds(g, {0, 9}), InvalidInput);
}

TEST(RootCauseAnalyzerTest, CyclicGraphIsInvalidInput) {
    Graph g = buildGraph({"A", "B"}, {{"A", "B"}, {"B", "A"}});
    EXPECT_THROW(analyze(g, {"A", "B"}), InvalidInput);
}

TEST(RootCauseAnalyzerTest, DoesNotModifyGraph) {
    Graph g = triangle();
    auto edges_before = g.labeledEdges();
    analyze(g, {"A", "B", "C"});
    EXPECT_EQ(g.labeledEdges(), edges_before);
}

TEST(RootCauseAnalyzerTest, MultiCharacterLabels) {
    Graph g = buildGraph({"api", "db", "cache"},
                         {{"api", "db"}, {"db", "cache"}, {"api", "cache"}});
    auto result = analyze(g, {"api", "db", "cache"});
    ASSERT_EQ(result.ranked.size(), 1u);
    EXPECT_EQ(result.ranked[0].label, "cache");
    EXPECT_EQ(result.ranked[0].node_id, 2u);
    EXPECT_EQ(result.ranked[0].count, 3);
}

// ─── On a synthesized map ──────────────────────────────────────

TEST(RootCauseAnalyzerTest, GoldenGraphEndToEnd) {
    Graph g = synthesize(6, 2, 123);

    auto ends = analyze(g, {"A", "F"});
    EXPECT_EQ(ranked(ends), (Ranking{{"F", 8}}));

    auto chain = analyze(g, {"B", "D", "F"});
    EXPECT_EQ(pathStrings(g, chain.candidate_paths),
              (std::vector<std::string>{"BCD", "BD", "BCEF", "BCDF", "BCDEF",
                                        "BDF", "BDEF", "DF", "DEF"}));
    EXPECT_EQ(pathStrings(g, chain.surviving_paths),
              (std::vector<std::string>{"BCEF", "BCDF", "BCDEF", "BDF", "BDEF",
                                        "DF", "DEF"}));
    EXPECT_EQ(ranked(chain), (Ranking{{"F", 7}}));

    EXPECT_TRUE(analyze(g, {"F", "D", "B"}).empty());
}

// ─── Report ────────────────────────────────────────────────────

TEST(RootCauseReportTest, FormatsRankedLines) {
    Graph g = triangle();
    auto lines = formatRootCauseReport(analyze(g, {"A", "C", "B"}));
    EXPECT_EQ(lines, (std::vector<std::string>{"Node C: occurs in 2 path(s)",
                                                "Node B: occurs in 1 path(s)"}));
}

TEST(RootCauseReportTest, EmptyResultExplains) {
    auto lines = formatRootCauseReport(RootCauseResult{});
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find("No potential root causes"), std::string::npos);
}
