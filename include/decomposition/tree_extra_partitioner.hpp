#pragma once

#include <export.hpp>
#include <graph/citation_graph.hpp>
#include <graph/scc_analyzer.hpp>
#include <store/graph_store.hpp>
#include <vector>

namespace Arbor {

struct Partition {
    std::vector<EdgeIndex> tree_ids;          // Ascending
    std::vector<EdgeIndex> extra_ids;         // Ascending
    std::vector<CitationEdge> tree_edges;
    std::vector<ExtraEdge> extra_edges;

    double extra_pct() const {
        const size_t total = tree_ids.size() + extra_ids.size();
        return total ? 100.0 * extra_ids.size() / total : 0.0;
    }
};

/**
 * @brief Splits the citation edges into tree edges and extra (feedback) edges
 */
class ARBOR_API TreeExtraPartitioner {
public:
    /**
     * @brief Tree = all edges minus removed, extra = removed
     *
     * Re-verifies on the whole graph that the tree edges are acyclic and that
     * every extra edge lies inside one non-trivial SCC.
     *
     * @throws DecompositionInvariantError when either check fails
     */
    Partition partition(const CitationGraph& graph, const std::vector<EdgeIndex>& removed,
                        const SccResult& scc) const;

    /**
     * @brief Replace the persisted tree and extra edge tables
     */
    void persist(GraphStore& store, const Partition& partition) const;
};

} // namespace Arbor
