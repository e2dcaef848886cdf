/**
 * @file postgres_graph_store.hpp
 * @brief GraphStore backed by PostgreSQL through libpq
 */

#pragma once

#include <export.hpp>
#include <config/arbor_config.hpp>
#include <database/connection_pool.hpp>
#include <store/graph_store.hpp>

namespace Arbor {

/**
 * @brief PostgreSQL GraphStore
 *
 * Table names come from StoreConfig and are always quoted. Every value,
 * including node id lists (one bigint[] parameter), is bound with $n.
 * Each call leases its own connection, so reads from several worker threads
 * never share a libpq handle.
 */
class ARBOR_API PostgresGraphStore final : public GraphStore {
public:
    PostgresGraphStore(const DatabaseConfig& database, StoreConfig tables);
    PostgresGraphStore(std::string conninfo, size_t pool_size, StoreConfig tables);

    std::vector<Node> load_nodes() const override;
    std::vector<CitationEdge> load_edges() const override;

    void replace_decomposition(const std::vector<CitationEdge>& tree_edges,
                               const std::vector<ExtraEdge>& extra_edges) override;
    void write_levels(const LevelMap& levels) override;

    std::vector<CitationEdge> tree_edges_touching(std::span<const NodeId> ids) const override;
    std::vector<ExtraEdge> extra_edges_touching(std::span<const NodeId> ids, size_t max_edges) const override;
    std::vector<Node> nodes_at_level(int32_t level, size_t limit) const override;

    std::string describe() const override;

    /**
     * @brief Create the node and citation tables when missing (tests and fresh databases)
     */
    void ensure_input_schema();

    const StoreConfig& tables() const { return tables_; }

private:
    bool has_level_column(PostgresConnection& db) const;
    std::string node_columns(bool with_level) const;
    static Node parse_node(const PostgresConnection::Row& row, bool with_level);

    mutable PostgresConnectionPool pool_;
    StoreConfig tables_;
    std::string node_table_;
    std::string edge_table_;
    std::string tree_table_;
    std::string extra_table_;
};

} // namespace Arbor
