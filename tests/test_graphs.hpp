/**
 * @file test_graphs.hpp
 * @brief Graph fixtures shared by the unit and integration tests
 */

#pragma once

#include <graph/types.hpp>
#include <optional>
#include <random>
#include <set>
#include <utility>
#include <vector>

namespace arbor_test {

using namespace Arbor;

inline Node make_node(NodeId id, double x = 0.0, double y = 0.0, int32_t degree = 0, int32_t cluster = -1,
                      std::optional<int32_t> year = std::nullopt) {
    Node n;
    n.id = id;
    n.position = Eigen::Vector2d(x, y);
    n.degree = degree;
    n.cluster_id = cluster;
    n.year = year;
    return n;
}

// Ids 1..count laid out on a line
inline std::vector<Node> line_of_nodes(size_t count) {
    std::vector<Node> nodes;
    for (size_t i = 1; i <= count; ++i) {
        nodes.push_back(make_node(static_cast<NodeId>(i), static_cast<double>(i), 0.0, static_cast<int32_t>(i)));
    }
    return nodes;
}

struct RandomGraph {
    std::vector<Node> nodes;
    std::vector<CitationEdge> edges;
};

/**
 * @brief Seeded random digraph: no self-loops, no duplicate pairs
 *
 * Nodes get ids 100, 101, ... with positions in the unit square, a random
 * cluster in [0, 4), a random degree and a year for roughly 80% of them.
 */
inline RandomGraph random_graph(size_t node_count, size_t edge_count, uint32_t seed) {
    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> coord(0.0, 1.0);
    std::uniform_int_distribution<int32_t> cluster(0, 3);
    std::uniform_int_distribution<int32_t> degree(0, 50);
    std::uniform_int_distribution<int32_t> year(1990, 2020);
    std::bernoulli_distribution dated(0.8);

    RandomGraph g;
    for (size_t i = 0; i < node_count; ++i) {
        std::optional<int32_t> y;
        if (dated(rng)) y = year(rng);
        g.nodes.push_back(make_node(static_cast<NodeId>(100 + i), coord(rng), coord(rng), degree(rng), cluster(rng), y));
    }

    std::uniform_int_distribution<size_t> pick(0, node_count - 1);
    std::set<std::pair<size_t, size_t>> seen;
    size_t guard = 0;
    while (g.edges.size() < edge_count && guard++ < edge_count * 20) {
        const size_t a = pick(rng);
        const size_t b = pick(rng);
        if (a == b || !seen.emplace(a, b).second) continue;
        g.edges.push_back({g.nodes[a].id, g.nodes[b].id});
    }
    return g;
}

} // namespace arbor_test
