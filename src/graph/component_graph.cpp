#include <graph/component_graph.hpp>
#include <graph/acyclicity.hpp>
#include <graph/scc_analyzer.hpp>
#include <algorithm>
#include <limits>

namespace Arbor {

namespace {
constexpr uint32_t NONE = std::numeric_limits<uint32_t>::max();
}

ComponentGraph ComponentGraph::induced(const CitationGraph& graph, std::span<const NodeIndex> members) {
    ComponentGraph out;
    out.nodes.assign(members.begin(), members.end());
    std::sort(out.nodes.begin(), out.nodes.end());

    std::vector<uint32_t> local(graph.node_count(), NONE);
    for (uint32_t i = 0; i < out.nodes.size(); ++i) {
        local[out.nodes[i]] = i;
    }

    for (uint32_t i = 0; i < out.nodes.size(); ++i) {
        for (EdgeIndex e : graph.out_edges(out.nodes[i])) {
            const uint32_t to = local[graph.edge(e).to];
            if (to != NONE) {
                out.edges.push_back({i, to});
                out.edge_ids.push_back(e);
            }
        }
    }
    return out;
}

ComponentGraph ComponentGraph::cyclic_core(std::span<const uint32_t> removed_local) const {
    std::vector<char> removed(edges.size(), 0);
    for (uint32_t p : removed_local) {
        removed[p] = 1;
    }

    std::vector<IndexedEdge> residual;
    std::vector<uint32_t> residual_pos;
    residual.reserve(edges.size());
    residual_pos.reserve(edges.size());
    for (uint32_t p = 0; p < edges.size(); ++p) {
        if (!removed[p]) {
            residual.push_back(edges[p]);
            residual_pos.push_back(p);
        }
    }

    ComponentLabels labels = strongly_connected_components(nodes.size(), residual);
    std::vector<uint32_t> comp_size(labels.count, 0);
    for (uint32_t c : labels.component_of) {
        ++comp_size[c];
    }

    ComponentGraph core;
    std::vector<uint32_t> remap(nodes.size(), NONE);
    for (uint32_t i = 0; i < nodes.size(); ++i) {
        if (comp_size[labels.component_of[i]] >= 2) {
            remap[i] = static_cast<uint32_t>(core.nodes.size());
            core.nodes.push_back(nodes[i]);
        }
    }

    for (size_t k = 0; k < residual.size(); ++k) {
        const auto& e = residual[k];
        if (remap[e.from] == NONE || labels.component_of[e.from] != labels.component_of[e.to]) {
            continue;
        }
        core.edges.push_back({remap[e.from], remap[e.to]});
        core.edge_ids.push_back(edge_ids[residual_pos[k]]);
    }
    return core;
}

bool ComponentGraph::is_acyclic() const {
    return Arbor::is_acyclic(nodes.size(), edges);
}

} // namespace Arbor
