#pragma once

#include <export.hpp>
#include <config/arbor_config.hpp>
#include <graph/citation_graph.hpp>
#include <store/graph_store.hpp>
#include <span>
#include <vector>

namespace Arbor {

struct LevelResult {
    std::vector<int32_t> level;          // Per NodeIndex
    size_t root_count = 0;               // Nodes with no incoming tree edge
    std::vector<size_t> distribution;    // Nodes per level

    int32_t max_level() const { return distribution.empty() ? 0 : static_cast<int32_t>(distribution.size()) - 1; }

    LevelMap by_id(const CitationGraph& graph) const;
};

/**
 * @brief Topological levels over the tree edges, propagated frontier by frontier from the roots
 *
 * LongestPath: a node enters the next frontier once every tree parent has a
 * level, so level(v) > level(u) for every tree edge (u, v).
 * ShortestPath: plain two-frontier BFS, level is the distance to the nearest root.
 */
class ARBOR_API LevelAssigner {
public:
    explicit LevelAssigner(LevelMode mode = LevelMode::LongestPath) : mode_(mode) {}

    /**
     * @throws DecompositionInvariantError when a node cannot be levelled (a tree cycle with no root above it)
     */
    LevelResult assign(const CitationGraph& graph, std::span<const EdgeIndex> tree_ids) const;

    void persist(GraphStore& store, const CitationGraph& graph, const LevelResult& levels) const;

private:
    LevelMode mode_;
};

} // namespace Arbor
