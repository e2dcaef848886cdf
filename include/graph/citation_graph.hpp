/**
 * @file citation_graph.hpp
 * @brief Immutable in-memory directed citation graph (CSR adjacency)
 */

#pragma once

#include <export.hpp>
#include <graph/types.hpp>
#include <optional>
#include <span>
#include <unordered_map>
#include <vector>

namespace Arbor {

/**
 * @brief Dense-indexed citation graph
 *
 * Nodes keep their input order and are addressed by NodeIndex. Edges are
 * sorted by (from, to) and deduplicated, so the out-edges of a node are the
 * contiguous EdgeIndex range returned by out_edges().
 */
class ARBOR_API CitationGraph {
public:
    /**
     * @brief Build from node records and citation pairs
     *
     * @throws DataIntegrityError on duplicate node ids, edges whose endpoints
     *         are not in the node set, or self-loops
     */
    static CitationGraph build(std::vector<Node> nodes, const std::vector<CitationEdge>& edges);

    CitationGraph() = default;

    size_t node_count() const { return nodes_.size(); }
    size_t edge_count() const { return edges_.size(); }

    const std::vector<Node>& nodes() const { return nodes_; }
    const Node& node(NodeIndex i) const { return nodes_[i]; }

    const std::vector<IndexedEdge>& edges() const { return edges_; }
    const IndexedEdge& edge(EdgeIndex e) const { return edges_[e]; }
    CitationEdge citation(EdgeIndex e) const {
        return {nodes_[edges_[e].from].id, nodes_[edges_[e].to].id};
    }

    std::optional<NodeIndex> index_of(NodeId id) const;

    // Edge ids leaving / entering a node
    std::span<const EdgeIndex> out_edges(NodeIndex u) const {
        return {out_ids_.data() + out_offsets_[u], out_offsets_[u + 1] - out_offsets_[u]};
    }
    std::span<const EdgeIndex> in_edges(NodeIndex v) const {
        return {in_ids_.data() + in_offsets_[v], in_offsets_[v + 1] - in_offsets_[v]};
    }

    size_t out_degree(NodeIndex u) const { return out_offsets_[u + 1] - out_offsets_[u]; }
    size_t in_degree(NodeIndex v) const { return in_offsets_[v + 1] - in_offsets_[v]; }

    size_t duplicates_dropped() const { return duplicates_dropped_; }

private:
    std::vector<Node> nodes_;
    std::unordered_map<NodeId, NodeIndex> index_;
    std::vector<IndexedEdge> edges_;
    std::vector<size_t> out_offsets_;
    std::vector<EdgeIndex> out_ids_;
    std::vector<size_t> in_offsets_;
    std::vector<EdgeIndex> in_ids_;
    size_t duplicates_dropped_ = 0;
};

} // namespace Arbor
