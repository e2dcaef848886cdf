#pragma once

#include <graph/types.hpp>
#include <cstdint>
#include <span>
#include <vector>

namespace Arbor {

/**
 * @brief CSR view over an edge list: for each node, the positions of its edges in that list
 */
struct Adjacency {
    std::vector<size_t> offsets;
    std::vector<uint32_t> positions;

    std::span<const uint32_t> operator[](uint32_t u) const {
        return {positions.data() + offsets[u], offsets[u + 1] - offsets[u]};
    }

    static Adjacency outgoing(size_t n, std::span<const IndexedEdge> edges) {
        return build(n, edges, true);
    }

    static Adjacency incoming(size_t n, std::span<const IndexedEdge> edges) {
        return build(n, edges, false);
    }

private:
    static Adjacency build(size_t n, std::span<const IndexedEdge> edges, bool by_source) {
        Adjacency adj;
        adj.offsets.assign(n + 1, 0);
        for (const auto& e : edges) {
            ++adj.offsets[(by_source ? e.from : e.to) + 1];
        }
        for (size_t i = 0; i < n; ++i) {
            adj.offsets[i + 1] += adj.offsets[i];
        }
        adj.positions.resize(edges.size());
        std::vector<size_t> cursor(adj.offsets.begin(), adj.offsets.end() - 1);
        for (uint32_t p = 0; p < edges.size(); ++p) {
            adj.positions[cursor[by_source ? edges[p].from : edges[p].to]++] = p;
        }
        return adj;
    }
};

} // namespace Arbor
