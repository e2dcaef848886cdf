/**
 * @file scc_analyzer.hpp
 * @brief Strongly connected components of the citation graph
 */

#pragma once

#include <export.hpp>
#include <graph/citation_graph.hpp>
#include <cstdint>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace Arbor {

/**
 * @brief Component label per node, as produced by Tarjan's algorithm
 */
struct ComponentLabels {
    std::vector<uint32_t> component_of;
    uint32_t count = 0;
};

/**
 * @brief Iterative Tarjan over nodes [0, n). Linear time, no recursion.
 */
ARBOR_API ComponentLabels strongly_connected_components(size_t n, std::span<const IndexedEdge> edges);

/**
 * @brief Size distribution of the components, for diagnostics
 */
struct SccReport {
    size_t node_count = 0;
    size_t edge_count = 0;
    size_t component_count = 0;
    size_t singleton_count = 0;
    size_t nontrivial_count = 0;
    size_t largest_size = 0;
    size_t nodes_in_nontrivial = 0;
    size_t edges_in_nontrivial = 0;              // Edges with both endpoints in one non-trivial component
    std::vector<std::pair<size_t, size_t>> size_histogram;  // (size, components), largest sizes first

    double nontrivial_node_pct() const {
        return node_count ? 100.0 * nodes_in_nontrivial / node_count : 0.0;
    }
    double nontrivial_edge_pct() const {
        return edge_count ? 100.0 * edges_in_nontrivial / edge_count : 0.0;
    }
};

struct SccResult {
    std::vector<uint32_t> component_of;             // Index into components
    std::vector<std::vector<NodeIndex>> components; // Size descending, then smallest member
    SccReport report;

    /**
     * @brief The largest component; empty when the graph has no nodes
     */
    std::span<const NodeIndex> largest() const {
        if (components.empty()) return {};
        return components.front();
    }

    // Components with at least two members, in the same order as components
    std::vector<uint32_t> nontrivial() const;

    bool same_component(NodeIndex a, NodeIndex b) const {
        return component_of[a] == component_of[b];
    }
};

class ARBOR_API SccAnalyzer {
public:
    explicit SccAnalyzer(size_t histogram_entries = 10) : histogram_entries_(histogram_entries) {}

    SccResult analyze(const CitationGraph& graph) const;

    static void log_report(const SccReport& report);

private:
    size_t histogram_entries_;
};

} // namespace Arbor
