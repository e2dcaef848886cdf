/**
 * @file tree_fragment_service.hpp
 * @brief Viewport fragments of the tree decomposition, served through bounded executors
 */

#pragma once

#include <export.hpp>
#include <config/arbor_config.hpp>
#include <service/fragment.hpp>
#include <service/node_catalog.hpp>
#include <service/query_executor.hpp>
#include <spatial/spatial_index.hpp>
#include <store/graph_store.hpp>
#include <functional>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace Arbor {

/**
 * @brief Request-path entry point
 *
 * Viewport and overview lookups run on the interactive executor, extra-edge
 * enrichment on a separate enrichment executor, so large batches cannot
 * starve small viewport requests. Both report into the same QueryStats.
 *
 * All operations are safe to call concurrently.
 */
class ARBOR_API TreeFragmentService {
public:
    TreeFragmentService(const GraphStore& store, NodeCatalog catalog, ServiceConfig config, QueryStats& stats);

    /**
     * @brief Paginated nodes inside the (margin-expanded) box, their tree edges and broken edges
     *
     * An empty viewport yields an empty fragment with has_more == false.
     * A malformed cluster filter is logged and ignored.
     *
     * @throws QueryTimeoutError / QueryCancelledError from the executor
     */
    Fragment get_viewport_fragment(const ViewportQuery& query, const CancellationToken* token = nullptr);

    /**
     * @brief Extra (feedback) edges touching the given nodes, highest priority first
     */
    ExtraEdgeBatch get_extra_edges_for_nodes(const std::vector<NodeId>& ids,
                                             std::optional<size_t> max_edges = std::nullopt,
                                             const CancellationToken* token = nullptr);

    /**
     * @brief A node and its tree descendants down to `depth` hops
     *
     * Nodes come in walk order (the node first, then hop by hop, degree
     * descending within a hop) and stop at `max_nodes`; has_more reports a cut.
     * An unknown node id yields an empty fragment.
     */
    Fragment get_tree_children(NodeId id, size_t depth = 1, std::optional<size_t> max_nodes = std::nullopt,
                               const CancellationToken* token = nullptr);

    /**
     * @brief Tree neighbourhood of a node, following tree edges in both directions up to `radius` hops
     *
     * Used to open the fragment around a search hit. Ordering and capping as in get_tree_children().
     */
    Fragment get_fragment_around_node(NodeId center, size_t radius = 2, size_t max_nodes = 50,
                                      const CancellationToken* token = nullptr);

    /**
     * @brief Shortest tree-edge path (either direction) from start to the nearest of targets
     *
     * @return node ids from start to the reached target; empty when no target lies within
     *         max_length hops or the search touches more than the maximum page size
     */
    std::vector<NodeId> find_tree_path(NodeId start, const std::vector<NodeId>& targets, size_t max_length = 10,
                                       const CancellationToken* token = nullptr);

    /**
     * @brief Highest-degree nodes of the first max_levels levels
     */
    TopologicalOverview get_topological_overview(std::optional<size_t> max_levels = std::nullopt,
                                                 std::optional<size_t> max_nodes_per_level = std::nullopt,
                                                 const CancellationToken* token = nullptr);

    bool cancel_query(RequestId id);
    size_t cancel_all_queries();
    std::vector<ActiveQuery> active_queries() const;

    DataBounds get_data_bounds() const;
    QueryStatsSnapshot stats() const { return stats_.snapshot(); }

    const NodeCatalog& catalog() const { return catalog_; }

    /**
     * @brief Parse "3,7,12" into cluster ids
     *
     * @return nullopt for an empty or malformed list (meaning: no cluster filter)
     */
    static std::optional<std::unordered_set<int32_t>> parse_cluster_filter(std::string_view text);

private:
    enum class Walk { Down, Both };

    struct WalkResult {
        std::vector<NodeId> order;                          // Discovery order, start first
        std::unordered_map<NodeId, NodeId> parent;          // Discovering neighbour, start excluded
        bool truncated = false;
    };

    ViewBox expand(const ViewBox& box) const;

    // Breadth-first over tree edges; stops after `hops`, at `cap` nodes, or once `stop` says so
    WalkResult walk(NodeId start, size_t hops, Walk direction, size_t cap,
                    const std::function<bool(NodeId)>& stop = {}) const;

    // Split the touching tree edges of `fragment.nodes` into internal and broken edges
    void attach_edges(Fragment& fragment, const std::vector<CitationEdge>& touching) const;

    Fragment node_fragment(const char* what, NodeId start, size_t hops, Walk direction, size_t cap,
                           const CancellationToken* token);

    const GraphStore& store_;
    NodeCatalog catalog_;
    ServiceConfig config_;
    QueryStats& stats_;
    SpatialIndex index_;

    // Declared last: destroyed first, so workers stop before the data they read goes away
    QueryExecutor interactive_;
    QueryExecutor enrichment_;
};

} // namespace Arbor
