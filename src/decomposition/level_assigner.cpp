#include <decomposition/level_assigner.hpp>
#include <graph/adjacency.hpp>
#include <utils/errors.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>

namespace Arbor {

LevelMap LevelResult::by_id(const CitationGraph& graph) const {
    LevelMap out;
    out.reserve(level.size());
    for (NodeIndex i = 0; i < level.size(); ++i) {
        out.emplace(graph.node(i).id, level[i]);
    }
    return out;
}

LevelResult LevelAssigner::assign(const CitationGraph& graph, std::span<const EdgeIndex> tree_ids) const {
    Logger::step("Assigning " + std::string(to_string(mode_)) + " topo levels");
    Timer timer;

    const size_t n = graph.node_count();
    std::vector<IndexedEdge> tree;
    tree.reserve(tree_ids.size());
    for (EdgeIndex e : tree_ids) {
        tree.push_back(graph.edge(e));
    }
    Adjacency out = Adjacency::outgoing(n, tree);

    std::vector<uint32_t> pending(n, 0);
    for (const auto& e : tree) {
        ++pending[e.to];
    }

    LevelResult result;
    result.level.assign(n, -1);

    std::vector<uint32_t> frontier;
    for (uint32_t u = 0; u < n; ++u) {
        if (pending[u] == 0) {
            frontier.push_back(u);
            result.level[u] = 0;
        }
    }
    result.root_count = frontier.size();

    size_t placed = 0;
    std::vector<uint32_t> next;
    for (int32_t depth = 0; !frontier.empty(); ++depth) {
        result.distribution.push_back(frontier.size());
        placed += frontier.size();
        next.clear();

        for (uint32_t u : frontier) {
            for (uint32_t p : out[u]) {
                const uint32_t v = tree[p].to;
                if (mode_ == LevelMode::LongestPath) {
                    if (--pending[v] == 0) {
                        result.level[v] = depth + 1;
                        next.push_back(v);
                    }
                } else if (result.level[v] < 0) {
                    result.level[v] = depth + 1;
                    next.push_back(v);
                }
            }
        }
        frontier.swap(next);
    }

    if (placed != n) {
        throw DecompositionInvariantError(std::to_string(n - placed) +
                                          " nodes unreachable from any root; tree edges are cyclic");
    }

    Logger::success("Levels assigned: " + std::to_string(result.root_count) + " roots, max level " +
                    std::to_string(result.max_level()) + " in " + std::to_string(timer.elapsed().count()) + "ms");
    return result;
}

void LevelAssigner::persist(GraphStore& store, const CitationGraph& graph, const LevelResult& levels) const {
    Logger::step("Writing topo levels");
    Timer timer;
    store.write_levels(levels.by_id(graph));
    Logger::success("Wrote " + std::to_string(levels.level.size()) + " levels in " +
                    std::to_string(timer.elapsed().count()) + "ms");
}

} // namespace Arbor
