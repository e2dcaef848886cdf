#include <decomposition/feedback_arc_set.hpp>
#include <graph/adjacency.hpp>
#include <graph/scc_analyzer.hpp>
#include <utils/errors.hpp>
#include <utils/logger.hpp>

namespace Arbor {

namespace {

struct CycleCount {
    std::vector<size_t> per_edge;   // Cycles through each residual edge
    size_t cycles = 0;
    bool exhausted = false;         // Stopped on a budget, so a zero count proves nothing
};

/**
 * Enumerate simple cycles, each rooted at its smallest node, staying inside
 * one SCC. Stops after cycle_cap cycles or step_cap DFS steps.
 */
CycleCount count_cycles(size_t n, std::span<const IndexedEdge> edges, size_t cycle_cap, size_t step_cap) {
    CycleCount result;
    result.per_edge.assign(edges.size(), 0);

    ComponentLabels labels = strongly_connected_components(n, edges);
    std::vector<uint32_t> comp_size(labels.count, 0);
    for (uint32_t c : labels.component_of) ++comp_size[c];

    Adjacency out = Adjacency::outgoing(n, edges);

    struct Frame {
        uint32_t node;
        size_t next;
        uint32_t via;   // Edge position used to enter node
    };
    std::vector<Frame> path;
    std::vector<char> on_path(n, 0);
    size_t steps = 0;

    for (uint32_t start = 0; start < n; ++start) {
        const uint32_t comp = labels.component_of[start];
        if (comp_size[comp] < 2) continue;

        path.push_back({start, 0, 0});
        on_path[start] = 1;

        while (!path.empty()) {
            if (++steps > step_cap || result.cycles >= cycle_cap) {
                result.exhausted = true;
                for (const auto& f : path) on_path[f.node] = 0;
                path.clear();
                return result;
            }

            Frame& top = path.back();
            auto succ = out[top.node];
            if (top.next == succ.size()) {
                on_path[top.node] = 0;
                path.pop_back();
                continue;
            }

            const uint32_t p = succ[top.next++];
            const uint32_t w = edges[p].to;
            if (w == start) {
                ++result.cycles;
                ++result.per_edge[p];
                for (size_t i = 1; i < path.size(); ++i) {
                    ++result.per_edge[path[i].via];
                }
            } else if (w > start && !on_path[w] && labels.component_of[w] == comp) {
                on_path[w] = 1;
                path.push_back({w, 0, p});
            }
        }
    }
    return result;
}

} // namespace

std::vector<uint32_t> CycleMajorityStrategy::select(const ComponentGraph& component, const CitationGraph&) {
    const size_t n = component.node_count();
    const size_t step_cap = cycle_cap_ * 64;

    std::vector<uint32_t> selected;
    std::vector<IndexedEdge> residual = component.edges;
    std::vector<uint32_t> residual_pos(residual.size());
    for (uint32_t p = 0; p < residual_pos.size(); ++p) residual_pos[p] = p;

    while (true) {
        CycleCount counts = count_cycles(n, residual, cycle_cap_, step_cap);
        if (counts.cycles == 0) {
            if (counts.exhausted) {
                throw StrategyUnavailableError("cycle-majority: search budget exhausted before any cycle was found");
            }
            break;
        }

        uint32_t best = 0;
        for (uint32_t p = 1; p < residual.size(); ++p) {
            if (counts.per_edge[p] > counts.per_edge[best]) best = p;
        }

        Logger::debug("cycle-majority: removing edge on " + std::to_string(counts.per_edge[best]) + " of " +
                      std::to_string(counts.cycles) + " cycles");

        selected.push_back(residual_pos[best]);
        residual.erase(residual.begin() + best);
        residual_pos.erase(residual_pos.begin() + best);
    }

    return selected;
}

} // namespace Arbor
