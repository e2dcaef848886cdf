/**
 * @file test_feedback_arc_set.cpp
 * @brief Unit tests for the feedback arc set heuristics and the retrying solver
 */

#include <gtest/gtest.h>
#include <decomposition/feedback_arc_set.hpp>
#include <decomposition/tree_extra_partitioner.hpp>
#include <graph/acyclicity.hpp>
#include <graph/component_graph.hpp>
#include <graph/scc_analyzer.hpp>
#include <utils/errors.hpp>
#include "../test_graphs.hpp"
#include <algorithm>
#include <set>

using namespace Arbor;
using arbor_test::make_node;

namespace {

constexpr NodeId A = 1, B = 2, C = 3, D = 4, E = 5;

// Ten nodes: triangle A -> B -> C -> A, plus D -> A and A -> E; F..J isolated
CitationGraph triangle_scenario() {
    std::vector<Node> nodes = {
        make_node(A, 0, 0, 5, 0, 2010),
        make_node(B, 1, 0, 4, 0, 2005),
        make_node(C, 2, 0, 3, 1, 2000),
        make_node(D, 3, 0, 2, 1, 2015),
        make_node(E, 4, 0, 1, 2, 1995),
    };
    for (NodeId id = 6; id <= 10; ++id) nodes.push_back(make_node(id));
    return CitationGraph::build(nodes, {{A, B}, {B, C}, {C, A}, {D, A}, {A, E}});
}

DecompositionConfig config_for(FasStrategy s) {
    DecompositionConfig config;
    config.strategy = s;
    return config;
}

} // namespace

class TriangleScenarioTest : public ::testing::TestWithParam<FasStrategy> {};

TEST_P(TriangleScenarioTest, RemovesExactlyOneCycleEdge) {
    auto g = triangle_scenario();
    auto scc = SccAnalyzer().analyze(g);
    ASSERT_EQ(scc.report.largest_size, 3u);

    FeedbackArcSetSolver solver(config_for(GetParam()));
    FasResult result = solver.solve(g, scc.largest());

    ASSERT_EQ(result.removed.size(), 1u);
    const CitationEdge removed = g.citation(result.removed.front());
    const std::set<CitationEdge> cycle = {{A, B}, {B, C}, {C, A}};
    EXPECT_TRUE(cycle.count(removed)) << removed.src << " -> " << removed.dst;
    EXPECT_FALSE(result.fell_back);

    Partition p = TreeExtraPartitioner().partition(g, result.removed, scc);
    EXPECT_EQ(p.tree_edges.size(), 4u);
    ASSERT_EQ(p.extra_edges.size(), 1u);

    const std::set<NodeId> triangle = {A, B, C};
    EXPECT_TRUE(triangle.count(p.extra_edges[0].src));
    EXPECT_TRUE(triangle.count(p.extra_edges[0].dst));

    std::vector<IndexedEdge> tree;
    for (EdgeIndex e : p.tree_ids) tree.push_back(g.edge(e));
    EXPECT_TRUE(is_acyclic(g.node_count(), tree));
}

INSTANTIATE_TEST_SUITE_P(AllStrategies, TriangleScenarioTest,
                         ::testing::Values(FasStrategy::GreedyOrdering, FasStrategy::Chronological,
                                           FasStrategy::CycleMajority),
                         [](const ::testing::TestParamInfo<FasStrategy>& info) {
                             std::string name(to_string(info.param));
                             name.erase(std::remove(name.begin(), name.end(), '-'), name.end());
                             return name;
                         });

TEST(GreedyOrderingTest, ResidualIsAcyclicAfterOneRound) {
    for (uint32_t seed = 1; seed <= 10; ++seed) {
        auto rg = arbor_test::random_graph(80, 240, seed);
        auto g = CitationGraph::build(rg.nodes, rg.edges);
        auto scc = SccAnalyzer().analyze(g);
        if (scc.report.largest_size < 2) continue;

        auto component = ComponentGraph::induced(g, scc.largest());
        GreedyOrderingStrategy greedy;
        auto picked = greedy.select(component, g);

        EXPECT_FALSE(picked.empty());
        EXPECT_TRUE(component.cyclic_core(picked).empty()) << "seed " << seed;
    }
}

TEST(GreedyOrderingTest, OrderIsAPermutation) {
    auto g = triangle_scenario();
    auto scc = SccAnalyzer().analyze(g);
    auto component = ComponentGraph::induced(g, scc.largest());

    auto order = GreedyOrderingStrategy::order(component);
    std::sort(order.begin(), order.end());
    EXPECT_EQ(order, (std::vector<uint32_t>{0, 1, 2}));
}

TEST(ChronologicalStrategyTest, ReportsCoverageAndViolations) {
    auto g = triangle_scenario();
    auto scc = SccAnalyzer().analyze(g);
    auto component = ComponentGraph::induced(g, scc.largest());

    ChronologicalStrategy chrono(0.9);
    auto picked = chrono.select(component, g);

    ASSERT_EQ(picked.size(), 1u);
    EXPECT_EQ(g.citation(component.edge_ids[picked[0]]), (CitationEdge{C, A}));
    EXPECT_EQ(chrono.last_stats().nodes, 3u);
    EXPECT_EQ(chrono.last_stats().dated_nodes, 3u);
    EXPECT_EQ(chrono.last_stats().violations, 1u);
    EXPECT_DOUBLE_EQ(chrono.last_stats().coverage(), 1.0);
}

TEST(ChronologicalStrategyTest, UnavailableBelowCoverage) {
    auto g = CitationGraph::build({make_node(1), make_node(2), make_node(3, 0, 0, 0, -1, 2000)},
                                  {{1, 2}, {2, 3}, {3, 1}});
    auto scc = SccAnalyzer().analyze(g);
    auto component = ComponentGraph::induced(g, scc.largest());

    ChronologicalStrategy chrono(0.9);
    EXPECT_THROW(chrono.select(component, g), StrategyUnavailableError);
}

TEST(FeedbackArcSetSolverTest, FallsBackToGreedyWithoutYears) {
    auto g = CitationGraph::build(arbor_test::line_of_nodes(4), {{1, 2}, {2, 3}, {3, 4}, {4, 1}, {2, 4}});
    auto scc = SccAnalyzer().analyze(g);

    FeedbackArcSetSolver solver(config_for(FasStrategy::Chronological));
    FasResult result = solver.solve(g, scc.largest());

    EXPECT_TRUE(result.fell_back);
    EXPECT_EQ(result.final_strategy, FasStrategy::GreedyOrdering);
    EXPECT_FALSE(result.removed.empty());
    ASSERT_GE(result.attempts.size(), 2u);
    EXPECT_EQ(result.attempts.front().strategy, FasStrategy::Chronological);
}

TEST(FeedbackArcSetSolverTest, FallsBackWhenNothingIsSelected) {
    // Only 1 -> 2 has two dated ends and it cites an older paper, so nothing qualifies
    auto g = CitationGraph::build({make_node(1, 0, 0, 0, -1, 2010), make_node(2, 0, 0, 0, -1, 2005), make_node(3)},
                                  {{1, 2}, {2, 3}, {3, 1}});
    auto scc = SccAnalyzer().analyze(g);

    DecompositionConfig config = config_for(FasStrategy::Chronological);
    config.chronological_min_coverage = 0.5;
    FasResult result = FeedbackArcSetSolver(config).solve(g, scc.largest());

    EXPECT_TRUE(result.fell_back);
    EXPECT_EQ(result.removed.size(), 1u);
    ASSERT_TRUE(result.chronological.has_value());
    EXPECT_EQ(result.chronological->undated_edges, 2u);
}

TEST(FeedbackArcSetSolverTest, AcyclicComponentNeedsNoRemoval) {
    auto g = CitationGraph::build(arbor_test::line_of_nodes(3), {{1, 2}, {2, 3}});
    std::vector<NodeIndex> all = {0, 1, 2};

    FasResult result = FeedbackArcSetSolver(DecompositionConfig{}).solve(g, all);
    EXPECT_TRUE(result.removed.empty());
    EXPECT_TRUE(result.attempts.empty());
}

TEST(FeedbackArcSetSolverTest, RemovedIdsAreSortedAndUnique) {
    auto rg = arbor_test::random_graph(50, 200, 7);
    auto g = CitationGraph::build(rg.nodes, rg.edges);
    auto scc = SccAnalyzer().analyze(g);
    ASSERT_GE(scc.report.largest_size, 2u);

    FasResult result = FeedbackArcSetSolver(DecompositionConfig{}).solve(g, scc.largest());
    EXPECT_TRUE(std::is_sorted(result.removed.begin(), result.removed.end()));
    EXPECT_EQ(std::adjacent_find(result.removed.begin(), result.removed.end()), result.removed.end());
}

TEST(FeedbackArcSetSolverTest, CompareRunsEveryStrategy) {
    auto g = triangle_scenario();
    auto scc = SccAnalyzer().analyze(g);

    auto rows = FeedbackArcSetSolver(DecompositionConfig{}).compare(g, scc.largest());
    ASSERT_EQ(rows.size(), 3u);

    for (const auto& row : rows) {
        EXPECT_TRUE(row.available) << to_string(row.strategy);
        EXPECT_TRUE(row.acyclic) << to_string(row.strategy);
        EXPECT_EQ(row.removed, 1u);
        EXPECT_NEAR(row.removed_pct, 100.0 / 3.0, 1e-9);
    }
}

TEST(FeedbackArcSetSolverTest, CompareMarksUnavailableStrategy) {
    auto g = CitationGraph::build(arbor_test::line_of_nodes(3), {{1, 2}, {2, 3}, {3, 1}});
    auto scc = SccAnalyzer().analyze(g);

    auto rows = FeedbackArcSetSolver(DecompositionConfig{}).compare(g, scc.largest());
    auto chrono = std::find_if(rows.begin(), rows.end(),
                               [](const StrategyComparison& r) { return r.strategy == FasStrategy::Chronological; });
    ASSERT_NE(chrono, rows.end());
    EXPECT_FALSE(chrono->available);
    EXPECT_FALSE(chrono->acyclic);
    EXPECT_FALSE(chrono->note.empty());
}
