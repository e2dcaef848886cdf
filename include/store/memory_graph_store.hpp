#pragma once

#include <export.hpp>
#include <store/graph_store.hpp>
#include <atomic>
#include <shared_mutex>

namespace Arbor {

/**
 * @brief In-process GraphStore with the same semantics as the Postgres one
 *
 * Used by the CSV path of arbor_decompose and by tests.
 */
class ARBOR_API MemoryGraphStore final : public GraphStore {
public:
    MemoryGraphStore() = default;
    MemoryGraphStore(std::vector<Node> nodes, std::vector<CitationEdge> edges);

    std::vector<Node> load_nodes() const override;
    std::vector<CitationEdge> load_edges() const override;

    void replace_decomposition(const std::vector<CitationEdge>& tree_edges,
                               const std::vector<ExtraEdge>& extra_edges) override;
    void write_levels(const LevelMap& levels) override;

    std::vector<CitationEdge> tree_edges_touching(std::span<const NodeId> ids) const override;
    std::vector<ExtraEdge> extra_edges_touching(std::span<const NodeId> ids, size_t max_edges) const override;
    std::vector<Node> nodes_at_level(int32_t level, size_t limit) const override;

    std::string describe() const override;

    void add_node(const Node& node);
    void add_edge(const CitationEdge& edge);

    std::vector<CitationEdge> tree_edges() const;
    std::vector<ExtraEdge> extra_edges() const;

    // Number of read calls served, for tests that count round trips
    size_t read_calls() const;

private:
    mutable std::shared_mutex mutex_;
    std::vector<Node> nodes_;
    std::vector<CitationEdge> edges_;
    std::vector<CitationEdge> tree_edges_;
    std::vector<ExtraEdge> extra_edges_;
    mutable std::atomic<size_t> read_calls_{0};
};

} // namespace Arbor
