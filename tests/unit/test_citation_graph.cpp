/**
 * @file test_citation_graph.cpp
 * @brief Unit tests for CSR graph construction and input validation
 */

#include <gtest/gtest.h>
#include <graph/citation_graph.hpp>
#include <utils/errors.hpp>
#include "../test_graphs.hpp"

using namespace Arbor;
using arbor_test::make_node;
using arbor_test::line_of_nodes;

TEST(CitationGraphTest, BuildsAdjacencyInBothDirections) {
    auto g = CitationGraph::build(line_of_nodes(4), {{1, 2}, {1, 3}, {3, 4}, {2, 4}});

    ASSERT_EQ(g.node_count(), 4u);
    ASSERT_EQ(g.edge_count(), 4u);

    const NodeIndex a = *g.index_of(1);
    const NodeIndex d = *g.index_of(4);
    EXPECT_EQ(g.out_degree(a), 2u);
    EXPECT_EQ(g.in_degree(a), 0u);
    EXPECT_EQ(g.in_degree(d), 2u);
    EXPECT_EQ(g.out_degree(d), 0u);

    for (EdgeIndex e : g.in_edges(d)) {
        EXPECT_EQ(g.edge(e).to, d);
    }
    for (EdgeIndex e : g.out_edges(a)) {
        EXPECT_EQ(g.edge(e).from, a);
    }
}

TEST(CitationGraphTest, KeepsNodeOrderAndMapsIds) {
    std::vector<Node> nodes = {make_node(30), make_node(10), make_node(20)};
    auto g = CitationGraph::build(nodes, {{10, 30}});

    EXPECT_EQ(*g.index_of(30), 0u);
    EXPECT_EQ(*g.index_of(10), 1u);
    EXPECT_EQ(*g.index_of(20), 2u);
    EXPECT_FALSE(g.index_of(99).has_value());

    ASSERT_EQ(g.edge_count(), 1u);
    EXPECT_EQ(g.citation(0), (CitationEdge{10, 30}));
}

TEST(CitationGraphTest, CollapsesDuplicateCitations) {
    auto g = CitationGraph::build(line_of_nodes(3), {{1, 2}, {2, 3}, {1, 2}, {1, 2}});
    EXPECT_EQ(g.edge_count(), 2u);
    EXPECT_EQ(g.duplicates_dropped(), 2u);
}

TEST(CitationGraphTest, RejectsUnknownEndpoint) {
    EXPECT_THROW(CitationGraph::build(line_of_nodes(2), {{1, 7}}), DataIntegrityError);
    EXPECT_THROW(CitationGraph::build(line_of_nodes(2), {{7, 1}}), DataIntegrityError);
}

TEST(CitationGraphTest, RejectsSelfCitation) {
    EXPECT_THROW(CitationGraph::build(line_of_nodes(2), {{2, 2}}), DataIntegrityError);
}

TEST(CitationGraphTest, RejectsDuplicateNodeIds) {
    std::vector<Node> nodes = {make_node(1), make_node(2), make_node(1)};
    EXPECT_THROW(CitationGraph::build(nodes, {}), DataIntegrityError);
}

TEST(CitationGraphTest, EmptyGraph) {
    auto g = CitationGraph::build({}, {});
    EXPECT_EQ(g.node_count(), 0u);
    EXPECT_EQ(g.edge_count(), 0u);
}
