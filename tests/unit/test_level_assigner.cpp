/**
 * @file test_level_assigner.cpp
 * @brief Unit tests for topo level propagation over tree edges
 */

#include <gtest/gtest.h>
#include <decomposition/feedback_arc_set.hpp>
#include <decomposition/level_assigner.hpp>
#include <decomposition/tree_extra_partitioner.hpp>
#include <graph/scc_analyzer.hpp>
#include <store/memory_graph_store.hpp>
#include <utils/errors.hpp>
#include "../test_graphs.hpp"
#include <numeric>

using namespace Arbor;

namespace {

std::vector<EdgeIndex> all_edges(const CitationGraph& g) {
    std::vector<EdgeIndex> ids(g.edge_count());
    std::iota(ids.begin(), ids.end(), 0);
    return ids;
}

// 1 -> 2 -> 3 with the shortcut 1 -> 3, and 4 on its own
CitationGraph diamond_with_shortcut() {
    return CitationGraph::build(arbor_test::line_of_nodes(4), {{1, 2}, {2, 3}, {1, 3}});
}

} // namespace

TEST(LevelAssignerTest, LongestPathPlacesChildBelowEveryParent) {
    auto g = diamond_with_shortcut();
    auto levels = LevelAssigner(LevelMode::LongestPath).assign(g, all_edges(g));

    EXPECT_EQ(levels.level, (std::vector<int32_t>{0, 1, 2, 0}));
    EXPECT_EQ(levels.root_count, 2u);
    EXPECT_EQ(levels.distribution, (std::vector<size_t>{2, 1, 1}));
    EXPECT_EQ(levels.max_level(), 2);
}

TEST(LevelAssignerTest, ShortestPathUsesNearestRoot) {
    auto g = diamond_with_shortcut();
    auto levels = LevelAssigner(LevelMode::ShortestPath).assign(g, all_edges(g));

    EXPECT_EQ(levels.level, (std::vector<int32_t>{0, 1, 1, 0}));
    EXPECT_EQ(levels.distribution, (std::vector<size_t>{2, 2}));
}

TEST(LevelAssignerTest, RejectsCyclicTree) {
    auto g = CitationGraph::build(arbor_test::line_of_nodes(3), {{1, 2}, {2, 3}, {3, 1}});
    EXPECT_THROW(LevelAssigner().assign(g, all_edges(g)), DecompositionInvariantError);
}

TEST(LevelAssignerTest, EdgelessGraphIsAllRoots) {
    auto g = CitationGraph::build(arbor_test::line_of_nodes(5), {});
    auto levels = LevelAssigner().assign(g, {});
    EXPECT_EQ(levels.root_count, 5u);
    EXPECT_EQ(levels.max_level(), 0);
}

TEST(LevelAssignerTest, PersistWritesLevelsById) {
    auto nodes = arbor_test::line_of_nodes(4);
    MemoryGraphStore store(nodes, {{1, 2}, {2, 3}, {1, 3}});
    auto g = diamond_with_shortcut();
    LevelAssigner assigner;
    auto levels = assigner.assign(g, all_edges(g));

    assigner.persist(store, g, levels);

    auto by_id = levels.by_id(g);
    for (const auto& n : store.load_nodes()) {
        EXPECT_EQ(n.topo_level, by_id.at(n.id)) << n.id;
    }
}

TEST(LevelAssignerTest, RandomGraphsHaveStrictlyIncreasingLevels) {
    DecompositionConfig config;
    config.scope = DecompositionScope::AllComponents;
    FeedbackArcSetSolver solver(config);

    for (uint32_t seed = 1; seed <= 20; ++seed) {
        auto rg = arbor_test::random_graph(70, 200, seed);
        auto g = CitationGraph::build(rg.nodes, rg.edges);
        auto scc = SccAnalyzer().analyze(g);

        std::vector<EdgeIndex> removed;
        for (uint32_t c : scc.nontrivial()) {
            auto r = solver.solve(g, scc.components[c]);
            removed.insert(removed.end(), r.removed.begin(), r.removed.end());
        }
        Partition p = TreeExtraPartitioner().partition(g, removed, scc);
        auto levels = LevelAssigner(LevelMode::LongestPath).assign(g, p.tree_ids);

        for (EdgeIndex e : p.tree_ids) {
            const auto& edge = g.edge(e);
            EXPECT_GT(levels.level[edge.to], levels.level[edge.from]) << "seed " << seed;
        }
        size_t total = 0;
        for (size_t count : levels.distribution) total += count;
        EXPECT_EQ(total, g.node_count());
    }
}
