/**
 * @file test_decomposition_pipeline.cpp
 * @brief End-to-end decomposition and serving against the in-process store
 */

#include <gtest/gtest.h>
#include <decomposition/decomposition_pipeline.hpp>
#include <graph/acyclicity.hpp>
#include <graph/citation_graph.hpp>
#include <service/tree_fragment_service.hpp>
#include <store/memory_graph_store.hpp>
#include <utils/errors.hpp>
#include "../test_graphs.hpp"
#include <set>
#include <unordered_map>

using namespace Arbor;
using arbor_test::make_node;

namespace {

MemoryGraphStore triangle_store() {
    // A=1, B=2, C=3, D=4, E=5, 6..10 isolated
    std::vector<Node> nodes;
    for (NodeId id = 1; id <= 10; ++id) {
        nodes.push_back(make_node(id, static_cast<double>(id), static_cast<double>(id % 3), static_cast<int32_t>(11 - id)));
    }
    return MemoryGraphStore(nodes, {{1, 2}, {2, 3}, {3, 1}, {4, 1}, {1, 5}});
}

} // namespace

TEST(DecompositionPipelineTest, TriangleScenarioEndToEnd) {
    auto store = triangle_store();
    DecompositionReport report = DecompositionPipeline(store, DecompositionConfig{}).run();

    EXPECT_TRUE(report.persisted);
    EXPECT_EQ(report.nodes, 10u);
    EXPECT_EQ(report.edges, 5u);
    EXPECT_EQ(report.scc.largest_size, 3u);
    EXPECT_EQ(report.tree_edges, 4u);
    EXPECT_EQ(report.extra_edges, 1u);
    ASSERT_EQ(report.solved.size(), 1u);
    EXPECT_EQ(report.solved[0].removed.size(), 1u);

    const auto tree = store.tree_edges();
    const auto extra = store.extra_edges();
    ASSERT_EQ(tree.size(), 4u);
    ASSERT_EQ(extra.size(), 1u);

    const std::set<NodeId> triangle = {1, 2, 3};
    EXPECT_TRUE(triangle.count(extra[0].src));
    EXPECT_TRUE(triangle.count(extra[0].dst));

    // Levels persisted and strictly increasing along every tree edge
    std::unordered_map<NodeId, int32_t> level;
    for (const auto& n : store.load_nodes()) level[n.id] = n.topo_level;
    for (const auto& e : tree) {
        EXPECT_GT(level[e.dst], level[e.src]) << e.src << " -> " << e.dst;
    }

    std::vector<std::string> stages;
    for (const auto& t : report.timings) stages.push_back(t.stage);
    EXPECT_EQ(stages, (std::vector<std::string>{"load", "scc", "feedback_arc_set", "partition", "levels", "persist"}));
}

TEST(DecompositionPipelineTest, DryRunWritesNothing) {
    auto store = triangle_store();
    DecompositionReport report = DecompositionPipeline(store, DecompositionConfig{}).run(false);

    EXPECT_FALSE(report.persisted);
    EXPECT_EQ(report.extra_edges, 1u);
    EXPECT_TRUE(store.tree_edges().empty());
    EXPECT_TRUE(store.extra_edges().empty());
}

TEST(DecompositionPipelineTest, SecondCycleIsFatalUnderLargestScope) {
    MemoryGraphStore store(arbor_test::line_of_nodes(6), {{1, 2}, {2, 3}, {3, 1}, {4, 5}, {5, 4}});
    store.replace_decomposition({{9, 9}}, {});

    EXPECT_THROW(DecompositionPipeline(store, DecompositionConfig{}).run(), DecompositionInvariantError);

    // Aborted before anything was written
    EXPECT_EQ(store.tree_edges(), (std::vector<CitationEdge>{{9, 9}}));
}

TEST(DecompositionPipelineTest, AllComponentsScopeBreaksEveryCycle) {
    MemoryGraphStore store(arbor_test::line_of_nodes(6), {{1, 2}, {2, 3}, {3, 1}, {4, 5}, {5, 4}, {3, 4}});
    DecompositionConfig config;
    config.scope = DecompositionScope::AllComponents;

    DecompositionReport report = DecompositionPipeline(store, config).run();
    EXPECT_EQ(report.solved.size(), 2u);
    EXPECT_EQ(report.extra_edges, 2u);
    EXPECT_EQ(report.tree_edges, 4u);
}

TEST(DecompositionPipelineTest, DanglingEdgeIsDataIntegrityError) {
    MemoryGraphStore store(arbor_test::line_of_nodes(2), {{1, 2}, {2, 99}});
    EXPECT_THROW(DecompositionPipeline(store, DecompositionConfig{}).run(), DataIntegrityError);
}

TEST(DecompositionPipelineTest, RandomGraphsSatisfyInvariants) {
    DecompositionConfig config;
    config.scope = DecompositionScope::AllComponents;

    for (uint32_t seed = 1; seed <= 10; ++seed) {
        auto rg = arbor_test::random_graph(120, 360, seed);
        MemoryGraphStore store(rg.nodes, rg.edges);
        DecompositionPipeline(store, config).run();

        const auto tree = store.tree_edges();
        const auto extra = store.extra_edges();
        EXPECT_EQ(tree.size() + extra.size(), rg.edges.size()) << "seed " << seed;

        std::set<CitationEdge> combined(tree.begin(), tree.end());
        for (const auto& e : extra) combined.insert(e.edge());
        EXPECT_EQ(combined, std::set<CitationEdge>(rg.edges.begin(), rg.edges.end())) << "seed " << seed;

        auto g = CitationGraph::build(rg.nodes, tree);
        EXPECT_TRUE(is_acyclic(g.node_count(), g.edges())) << "seed " << seed;
    }
}

TEST(DecompositionPipelineTest, CompareReportsEveryStrategy) {
    auto store = triangle_store();
    auto rows = DecompositionPipeline(store, DecompositionConfig{}).compare();
    EXPECT_EQ(rows.size(), 3u);
    EXPECT_TRUE(store.tree_edges().empty());
}

TEST(DecompositionPipelineTest, ServesTheDecomposition) {
    auto store = triangle_store();
    DecompositionPipeline(store, DecompositionConfig{}).run();

    QueryStats stats;
    ServiceConfig config;
    config.interactive_workers = 2;
    config.enrichment_workers = 1;
    config.viewport_margin = 0.0;
    TreeFragmentService service(store, NodeCatalog::load(store), config, stats);

    ViewportQuery q;
    q.box = ViewBox(Eigen::Vector2d(0.5, -1), Eigen::Vector2d(3.5, 3));
    Fragment f = service.get_viewport_fragment(q);
    ASSERT_EQ(f.nodes.size(), 3u);

    // Two of the three triangle edges are tree edges; the rest reach D or E
    EXPECT_EQ(f.tree_edges.size(), 2u);
    EXPECT_EQ(f.broken_edges.size(), 2u);

    auto extra = service.get_extra_edges_for_nodes({1, 2, 3});
    ASSERT_EQ(extra.extra_edges.size(), 1u);
    EXPECT_EQ(extra.extra_edges[0].edge_type, "feedback");

    size_t roots = 0;
    for (const auto& n : store.load_nodes()) roots += n.topo_level == 0 ? 1 : 0;

    auto overview = service.get_topological_overview();
    ASSERT_FALSE(overview.level_counts.empty());
    EXPECT_EQ(overview.level_counts.front(), roots);
}
