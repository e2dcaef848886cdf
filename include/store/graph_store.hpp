/**
 * @file graph_store.hpp
 * @brief Persistence seam between the algorithms and the backing database
 */

#pragma once

#include <graph/types.hpp>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace Arbor {

using LevelMap = std::unordered_map<NodeId, int32_t>;

/**
 * @brief Backing store for nodes, citations and the decomposition artifacts
 *
 * Const operations are reads and may be called concurrently from any thread.
 * Non-const operations are the batch write phase and require exclusive access.
 */
class GraphStore {
public:
    virtual ~GraphStore() = default;

    virtual std::vector<Node> load_nodes() const = 0;
    virtual std::vector<CitationEdge> load_edges() const = 0;

    /**
     * @brief Replace the tree and extra edge tables wholesale
     *
     * Both tables are recreated with src and dst indexes. Either both are
     * replaced or neither is.
     */
    virtual void replace_decomposition(const std::vector<CitationEdge>& tree_edges,
                                       const std::vector<ExtraEdge>& extra_edges) = 0;

    /**
     * @brief Write topo levels for every node; nodes missing from the map get 0
     */
    virtual void write_levels(const LevelMap& levels) = 0;

    // Tree edges with at least one endpoint in ids
    virtual std::vector<CitationEdge> tree_edges_touching(std::span<const NodeId> ids) const = 0;

    /**
     * @brief Extra edges with at least one endpoint in ids
     *
     * Ordered by priority descending, then (src, dst); at most max_edges rows.
     */
    virtual std::vector<ExtraEdge> extra_edges_touching(std::span<const NodeId> ids, size_t max_edges) const = 0;

    // Ordered by degree descending, then id
    virtual std::vector<Node> nodes_at_level(int32_t level, size_t limit) const = 0;

    virtual std::string describe() const = 0;
};

} // namespace Arbor
