#include <graph/acyclicity.hpp>
#include <graph/adjacency.hpp>
#include <functional>
#include <queue>

namespace Arbor {

std::optional<std::vector<uint32_t>> topological_order(size_t n, std::span<const IndexedEdge> edges) {
    Adjacency out = Adjacency::outgoing(n, edges);

    std::vector<uint32_t> indegree(n, 0);
    for (const auto& e : edges) {
        ++indegree[e.to];
    }

    std::priority_queue<uint32_t, std::vector<uint32_t>, std::greater<>> ready;
    for (uint32_t u = 0; u < n; ++u) {
        if (indegree[u] == 0) ready.push(u);
    }

    std::vector<uint32_t> order;
    order.reserve(n);
    while (!ready.empty()) {
        uint32_t u = ready.top();
        ready.pop();
        order.push_back(u);
        for (uint32_t p : out[u]) {
            if (--indegree[edges[p].to] == 0) {
                ready.push(edges[p].to);
            }
        }
    }

    if (order.size() != n) {
        return std::nullopt;
    }
    return order;
}

bool is_acyclic(size_t n, std::span<const IndexedEdge> edges) {
    // Plain FIFO Kahn; the order itself is not needed
    Adjacency out = Adjacency::outgoing(n, edges);
    std::vector<uint32_t> indegree(n, 0);
    for (const auto& e : edges) {
        ++indegree[e.to];
    }

    std::vector<uint32_t> frontier;
    frontier.reserve(n);
    for (uint32_t u = 0; u < n; ++u) {
        if (indegree[u] == 0) frontier.push_back(u);
    }

    size_t visited = 0;
    while (!frontier.empty()) {
        uint32_t u = frontier.back();
        frontier.pop_back();
        ++visited;
        for (uint32_t p : out[u]) {
            if (--indegree[edges[p].to] == 0) {
                frontier.push_back(edges[p].to);
            }
        }
    }
    return visited == n;
}

} // namespace Arbor
