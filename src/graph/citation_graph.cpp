#include <graph/citation_graph.hpp>
#include <utils/errors.hpp>
#include <utils/logger.hpp>
#include <algorithm>
#include <limits>

namespace Arbor {

CitationGraph CitationGraph::build(std::vector<Node> nodes, const std::vector<CitationEdge>& edges) {
    if (nodes.size() >= std::numeric_limits<NodeIndex>::max() ||
        edges.size() >= std::numeric_limits<EdgeIndex>::max()) {
        throw DataIntegrityError("graph too large for 32-bit indices");
    }

    CitationGraph g;
    g.nodes_ = std::move(nodes);
    g.index_.reserve(g.nodes_.size());

    for (NodeIndex i = 0; i < g.nodes_.size(); ++i) {
        auto [it, inserted] = g.index_.emplace(g.nodes_[i].id, i);
        if (!inserted) {
            throw DataIntegrityError("duplicate node id " + std::to_string(g.nodes_[i].id));
        }
    }

    g.edges_.reserve(edges.size());
    for (const auto& e : edges) {
        auto src = g.index_.find(e.src);
        auto dst = g.index_.find(e.dst);
        if (src == g.index_.end() || dst == g.index_.end()) {
            throw DataIntegrityError("edge " + std::to_string(e.src) + " -> " + std::to_string(e.dst) +
                                     " references unknown node " +
                                     std::to_string(src == g.index_.end() ? e.src : e.dst));
        }
        if (src->second == dst->second) {
            throw DataIntegrityError("self-citation on node " + std::to_string(e.src));
        }
        g.edges_.push_back({src->second, dst->second});
    }

    std::sort(g.edges_.begin(), g.edges_.end(), [](const IndexedEdge& a, const IndexedEdge& b) {
        return a.from < b.from || (a.from == b.from && a.to < b.to);
    });
    auto last = std::unique(g.edges_.begin(), g.edges_.end(), [](const IndexedEdge& a, const IndexedEdge& b) {
        return a.from == b.from && a.to == b.to;
    });
    g.duplicates_dropped_ = static_cast<size_t>(std::distance(last, g.edges_.end()));
    g.edges_.erase(last, g.edges_.end());

    if (g.duplicates_dropped_ > 0) {
        Logger::warn("Collapsed " + std::to_string(g.duplicates_dropped_) + " duplicate citation edges");
    }

    const size_t n = g.nodes_.size();
    const size_t m = g.edges_.size();

    // Counting sort into CSR; edges are already grouped by source
    g.out_offsets_.assign(n + 1, 0);
    g.in_offsets_.assign(n + 1, 0);
    for (const auto& e : g.edges_) {
        ++g.out_offsets_[e.from + 1];
        ++g.in_offsets_[e.to + 1];
    }
    for (size_t i = 0; i < n; ++i) {
        g.out_offsets_[i + 1] += g.out_offsets_[i];
        g.in_offsets_[i + 1] += g.in_offsets_[i];
    }

    g.out_ids_.resize(m);
    g.in_ids_.resize(m);
    std::vector<size_t> in_cursor(g.in_offsets_.begin(), g.in_offsets_.end() - 1);
    for (EdgeIndex id = 0; id < m; ++id) {
        g.out_ids_[id] = id;
        g.in_ids_[in_cursor[g.edges_[id].to]++] = id;
    }

    return g;
}

std::optional<NodeIndex> CitationGraph::index_of(NodeId id) const {
    auto it = index_.find(id);
    if (it == index_.end()) return std::nullopt;
    return it->second;
}

} // namespace Arbor
