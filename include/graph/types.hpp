/**
 * @file types.hpp
 * @brief Node and edge records shared by the store, the decomposition and the service
 */

#pragma once

#include <Eigen/Core>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace Arbor {

using NodeId = std::int64_t;      // Identity as stored upstream
using NodeIndex = std::uint32_t;  // Dense position inside a CitationGraph
using EdgeIndex = std::uint32_t;  // Position inside CitationGraph::edges()

struct Node {
    NodeId id = 0;
    Eigen::Vector2d position = Eigen::Vector2d::Zero();
    int32_t cluster_id = -1;
    int32_t degree = 0;              // Precomputed upstream
    std::optional<int32_t> year;     // Publication year, when known
    int32_t topo_level = 0;
};

struct CitationEdge {
    NodeId src = 0;
    NodeId dst = 0;

    bool operator==(const CitationEdge& o) const { return src == o.src && dst == o.dst; }
    bool operator<(const CitationEdge& o) const {
        return src < o.src || (src == o.src && dst < o.dst);
    }
};

struct CitationEdgeHasher {
    size_t operator()(const CitationEdge& e) const {
        // Combine like boost::hash_combine
        size_t h = std::hash<NodeId>{}(e.src);
        h ^= std::hash<NodeId>{}(e.dst) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        return h;
    }
};

/**
 * @brief A removed feedback edge, as persisted in the extra-edge table
 */
struct ExtraEdge {
    NodeId src = 0;
    NodeId dst = 0;
    int64_t priority = 0;            // Sum of endpoint degrees
    std::string edge_type = "feedback";

    CitationEdge edge() const { return {src, dst}; }
};

/**
 * @brief Edge between dense node indices
 */
struct IndexedEdge {
    NodeIndex from = 0;
    NodeIndex to = 0;
};

} // namespace Arbor
