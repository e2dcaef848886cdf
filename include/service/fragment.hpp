/**
 * @file fragment.hpp
 * @brief Request and response types of the fragment service
 */

#pragma once

#include <graph/types.hpp>
#include <Eigen/Geometry>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace Arbor {

using ViewBox = Eigen::AlignedBox2d;

struct ViewportQuery {
    ViewBox box;
    int32_t min_degree = 0;
    std::string visible_clusters;        // Comma-separated cluster ids; empty means all
    std::optional<int32_t> max_level;
    size_t offset = 0;
    std::optional<size_t> limit;         // Service default when unset
};

enum class EdgeRole {
    Parent,     // The external node is the tree edge's source
    Child       // The external node is the tree edge's destination
};

inline std::string_view to_string(EdgeRole role) {
    return role == EdgeRole::Parent ? "parent" : "child";
}

/**
 * @brief A tree edge leaving the returned node set
 */
struct BrokenEdge {
    NodeId source_id = 0;
    NodeId target_id = 0;
    NodeId external_id = 0;
    EdgeRole role = EdgeRole::Child;
    int64_t priority = 0;                // External node's degree
};

struct Fragment {
    std::vector<Node> nodes;             // Viewport: degree descending, then id. Node-centric: walk order
    std::vector<CitationEdge> tree_edges;
    std::vector<BrokenEdge> broken_edges;
    bool has_more = false;
    size_t total_matches = 0;
    size_t offset = 0;
    size_t limit = 0;
    ViewBox query_box;                   // After margin expansion; node-centric: box around the nodes

    bool empty() const { return nodes.empty(); }
};

struct ExtraEdgeBatch {
    std::vector<ExtraEdge> extra_edges;
    std::unordered_map<NodeId, bool> enriched;   // Per requested id: touched by a returned edge
    bool truncated = false;                      // max_edges reached
};

struct TopologicalOverview {
    std::vector<Node> nodes;             // Level ascending, degree descending within a level
    std::vector<size_t> level_counts;
};

struct DataBounds {
    ViewBox box;
    size_t node_count = 0;
};

} // namespace Arbor
