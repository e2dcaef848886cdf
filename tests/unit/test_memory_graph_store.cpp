/**
 * @file test_memory_graph_store.cpp
 * @brief Unit tests for the in-process GraphStore
 */

#include <gtest/gtest.h>
#include <store/memory_graph_store.hpp>
#include "../test_graphs.hpp"

using namespace Arbor;
using arbor_test::make_node;

class MemoryGraphStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        store.add_node(make_node(1, 0, 0, 5));
        store.add_node(make_node(2, 0, 0, 9));
        store.add_node(make_node(3, 0, 0, 5));
        store.add_node(make_node(4, 0, 0, 1));
        store.add_edge({1, 2});
        store.add_edge({2, 3});
    }

    MemoryGraphStore store;
};

TEST_F(MemoryGraphStoreTest, LoadsWhatWasAdded) {
    EXPECT_EQ(store.load_nodes().size(), 4u);
    EXPECT_EQ(store.load_edges(), (std::vector<CitationEdge>{{1, 2}, {2, 3}}));
    EXPECT_NE(store.describe().find("memory"), std::string::npos);
}

TEST_F(MemoryGraphStoreTest, ReplaceDecompositionDropsPreviousTables) {
    store.replace_decomposition({{1, 2}}, {{2, 3, 14, "feedback"}});
    store.replace_decomposition({{2, 3}}, {});

    EXPECT_EQ(store.tree_edges(), (std::vector<CitationEdge>{{2, 3}}));
    EXPECT_TRUE(store.extra_edges().empty());
}

TEST_F(MemoryGraphStoreTest, TouchingQueriesMatchEitherEndpoint) {
    store.replace_decomposition({{1, 2}, {2, 3}}, {{3, 1, 10, "feedback"}, {2, 4, 10, "feedback"}, {4, 3, 6, "feedback"}});

    std::vector<NodeId> ids = {3};
    EXPECT_EQ(store.tree_edges_touching(ids), (std::vector<CitationEdge>{{2, 3}}));

    auto extra = store.extra_edges_touching(ids, 10);
    ASSERT_EQ(extra.size(), 2u);
    EXPECT_EQ(extra[0].edge(), (CitationEdge{3, 1}));
    EXPECT_EQ(extra[1].edge(), (CitationEdge{4, 3}));

    // Equal priorities fall back to (src, dst)
    std::vector<NodeId> all = {1, 2, 3, 4};
    auto capped = store.extra_edges_touching(all, 2);
    ASSERT_EQ(capped.size(), 2u);
    EXPECT_EQ(capped[0].edge(), (CitationEdge{2, 4}));
    EXPECT_EQ(capped[1].edge(), (CitationEdge{3, 1}));
}

TEST_F(MemoryGraphStoreTest, LevelsDefaultToZero) {
    store.write_levels({{2, 1}, {3, 1}});

    auto level0 = store.nodes_at_level(0, 10);
    ASSERT_EQ(level0.size(), 2u);
    EXPECT_EQ(level0[0].id, 1);     // Degree 5 before degree 1
    EXPECT_EQ(level0[1].id, 4);

    auto level1 = store.nodes_at_level(1, 1);
    ASSERT_EQ(level1.size(), 1u);
    EXPECT_EQ(level1[0].id, 2);

    EXPECT_TRUE(store.nodes_at_level(2, 10).empty());
}

TEST_F(MemoryGraphStoreTest, CountsReads) {
    const size_t before = store.read_calls();
    std::vector<NodeId> ids = {1};
    store.tree_edges_touching(ids);
    store.extra_edges_touching(ids, 1);
    EXPECT_EQ(store.read_calls(), before + 2);
}
