#pragma once

#include <export.hpp>
#include <graph/citation_graph.hpp>
#include <cstdint>
#include <span>
#include <vector>

namespace Arbor {

/**
 * @brief Subgraph induced by a node subset, re-indexed locally
 *
 * Local node i is global node nodes[i]; local edge p runs between local
 * endpoints edges[p] and is global edge edge_ids[p]. Local edges keep the
 * (from, to) order of the parent graph.
 */
struct ARBOR_API ComponentGraph {
    std::vector<NodeIndex> nodes;
    std::vector<IndexedEdge> edges;
    std::vector<EdgeIndex> edge_ids;

    size_t node_count() const { return nodes.size(); }
    size_t edge_count() const { return edges.size(); }
    bool empty() const { return nodes.empty(); }

    static ComponentGraph induced(const CitationGraph& graph, std::span<const NodeIndex> members);

    /**
     * @brief The part of this graph that still lies on a cycle once removed_local edges are gone
     *
     * Keeps the nodes of every non-trivial SCC of the residual and only the
     * edges inside one of those SCCs. Empty when the residual is acyclic.
     */
    ComponentGraph cyclic_core(std::span<const uint32_t> removed_local = {}) const;

    bool is_acyclic() const;
};

} // namespace Arbor
