#include <decomposition/feedback_arc_set.hpp>
#include <graph/adjacency.hpp>
#include <queue>

namespace Arbor {

std::vector<uint32_t> GreedyOrderingStrategy::order(const ComponentGraph& component) {
    const size_t n = component.node_count();
    const auto& edges = component.edges;

    Adjacency out = Adjacency::outgoing(n, edges);
    Adjacency in = Adjacency::incoming(n, edges);

    std::vector<int64_t> score(n, 0);
    for (const auto& e : edges) {
        ++score[e.from];
        --score[e.to];
    }

    // Max score first, lowest index on ties. Stale entries are skipped on pop.
    struct Entry {
        int64_t score;
        uint32_t node;
        bool operator<(const Entry& o) const {
            return score < o.score || (score == o.score && node > o.node);
        }
    };
    std::priority_queue<Entry> heap;
    for (uint32_t u = 0; u < n; ++u) {
        heap.push({score[u], u});
    }

    std::vector<char> placed(n, 0);
    std::vector<uint32_t> sequence;
    sequence.reserve(n);

    while (sequence.size() < n) {
        Entry top = heap.top();
        heap.pop();
        if (placed[top.node] || top.score != score[top.node]) continue;

        const uint32_t u = top.node;
        placed[u] = 1;
        sequence.push_back(u);

        // A remaining successor loses an in-edge, a remaining predecessor loses an out-edge
        for (uint32_t p : out[u]) {
            const uint32_t v = edges[p].to;
            if (!placed[v]) heap.push({++score[v], v});
        }
        for (uint32_t p : in[u]) {
            const uint32_t w = edges[p].from;
            if (!placed[w]) heap.push({--score[w], w});
        }
    }

    return sequence;
}

std::vector<uint32_t> GreedyOrderingStrategy::select(const ComponentGraph& component, const CitationGraph&) {
    const auto sequence = order(component);

    std::vector<uint32_t> position(component.node_count());
    for (uint32_t i = 0; i < sequence.size(); ++i) {
        position[sequence[i]] = i;
    }

    std::vector<uint32_t> backward;
    for (uint32_t p = 0; p < component.edge_count(); ++p) {
        const auto& e = component.edges[p];
        if (position[e.from] > position[e.to]) {
            backward.push_back(p);
        }
    }
    return backward;
}

} // namespace Arbor
