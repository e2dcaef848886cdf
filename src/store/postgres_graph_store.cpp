#include <store/postgres_graph_store.hpp>
#include <database/bulk_copy.hpp>
#include <utils/errors.hpp>
#include <utils/logger.hpp>
#include <cmath>
#include <sstream>
#include <type_traits>

namespace Arbor {

namespace {

std::string base_name(const std::string& table) {
    auto dot = table.rfind('.');
    return dot == std::string::npos ? table : table.substr(dot + 1);
}

template <typename T>
T parse_number(const std::string& text, const char* column) {
    try {
        size_t pos = 0;
        T value;
        if constexpr (std::is_floating_point_v<T>) {
            value = static_cast<T>(std::stod(text, &pos));
        } else {
            value = static_cast<T>(std::stoll(text, &pos));
        }
        if (pos != text.size()) {
            throw DataIntegrityError(std::string("trailing characters in ") + column + " value '" + text + "'");
        }
        if constexpr (std::is_floating_point_v<T>) {
            if (!std::isfinite(value)) {
                throw DataIntegrityError(std::string("non-finite ") + column + " value '" + text + "'");
            }
        }
        return value;
    } catch (const std::logic_error&) {
        throw DataIntegrityError(std::string("bad ") + column + " value '" + text + "'");
    }
}

} // namespace

PostgresGraphStore::PostgresGraphStore(const DatabaseConfig& database, StoreConfig tables)
    : PostgresGraphStore(database.conninfo(), database.pool_size, std::move(tables)) {}

PostgresGraphStore::PostgresGraphStore(std::string conninfo, size_t pool_size, StoreConfig tables)
    : pool_(std::move(conninfo), pool_size),
      tables_(std::move(tables)),
      node_table_(PostgresConnection::quote_identifier(tables_.node_table)),
      edge_table_(PostgresConnection::quote_identifier(tables_.edge_table)),
      tree_table_(PostgresConnection::quote_identifier(tables_.tree_edge_table)),
      extra_table_(PostgresConnection::quote_identifier(tables_.extra_edge_table)) {}

std::string PostgresGraphStore::describe() const {
    return "postgres (" + tables_.node_table + ", " + tables_.edge_table + ")";
}

void PostgresGraphStore::ensure_input_schema() {
    auto db = pool_.acquire();
    db->execute("CREATE TABLE IF NOT EXISTS " + node_table_ + " ("
                "id BIGINT PRIMARY KEY, "
                "x DOUBLE PRECISION NOT NULL, "
                "y DOUBLE PRECISION NOT NULL, "
                "cluster_id INTEGER, "
                "degree INTEGER NOT NULL DEFAULT 0, "
                "year INTEGER)");
    db->execute("CREATE TABLE IF NOT EXISTS " + edge_table_ + " ("
                "src BIGINT NOT NULL, "
                "dst BIGINT NOT NULL)");
}

bool PostgresGraphStore::has_level_column(PostgresConnection& db) const {
    auto found = db.query_single(
        "SELECT 1 FROM pg_attribute "
        "WHERE attrelid = to_regclass($1) AND attname = 'topo_level' AND NOT attisdropped",
        {node_table_});
    return found.has_value();
}

std::string PostgresGraphStore::node_columns(bool with_level) const {
    std::string cols = "id, x, y, COALESCE(cluster_id, -1), COALESCE(degree, 0), year";
    cols += with_level ? ", COALESCE(topo_level, 0)" : ", 0";
    return cols;
}

Node PostgresGraphStore::parse_node(const PostgresConnection::Row& row, bool) {
    Node n;
    n.id = parse_number<int64_t>(row[0], "id");
    n.position = Eigen::Vector2d(parse_number<double>(row[1], "x"), parse_number<double>(row[2], "y"));
    n.cluster_id = parse_number<int32_t>(row[3], "cluster_id");
    n.degree = parse_number<int32_t>(row[4], "degree");
    if (!row[5].empty()) {
        n.year = parse_number<int32_t>(row[5], "year");
    }
    n.topo_level = parse_number<int32_t>(row[6], "topo_level");
    return n;
}

std::vector<Node> PostgresGraphStore::load_nodes() const {
    auto db = pool_.acquire();
    const bool with_level = has_level_column(*db);

    std::vector<Node> nodes;
    db->query("SELECT " + node_columns(with_level) + " FROM " + node_table_ + " ORDER BY id",
              [&](const PostgresConnection::Row& row) { nodes.push_back(parse_node(row, with_level)); });
    return nodes;
}

std::vector<CitationEdge> PostgresGraphStore::load_edges() const {
    auto db = pool_.acquire();

    std::vector<CitationEdge> edges;
    db->query("SELECT src, dst FROM " + edge_table_,
              [&](const PostgresConnection::Row& row) {
                  edges.push_back({parse_number<int64_t>(row[0], "src"), parse_number<int64_t>(row[1], "dst")});
              });
    return edges;
}

void PostgresGraphStore::replace_decomposition(const std::vector<CitationEdge>& tree_edges,
                                               const std::vector<ExtraEdge>& extra_edges) {
    auto db = pool_.acquire();
    PostgresConnection::Transaction txn(*db);

    db->execute("DROP TABLE IF EXISTS " + tree_table_);
    db->execute("DROP TABLE IF EXISTS " + extra_table_);
    db->execute("CREATE TABLE " + tree_table_ + " (src BIGINT NOT NULL, dst BIGINT NOT NULL)");
    db->execute("CREATE TABLE " + extra_table_ + " ("
                "src BIGINT NOT NULL, "
                "dst BIGINT NOT NULL, "
                "priority BIGINT NOT NULL DEFAULT 0, "
                "edge_type TEXT NOT NULL DEFAULT 'feedback')");

    {
        BulkCopy copy(*db);
        copy.begin_table(tables_.tree_edge_table, {"src", "dst"});
        for (const auto& e : tree_edges) {
            copy.add_row({std::to_string(e.src), std::to_string(e.dst)});
        }
        copy.flush();

        copy.begin_table(tables_.extra_edge_table, {"src", "dst", "priority", "edge_type"});
        for (const auto& e : extra_edges) {
            copy.add_row({std::to_string(e.src), std::to_string(e.dst), std::to_string(e.priority), e.edge_type});
        }
        copy.flush();
    }

    // Indexes after the load, not before
    for (const auto* table : {&tree_table_, &extra_table_}) {
        db->execute("CREATE INDEX ON " + *table + " (src)");
        db->execute("CREATE INDEX ON " + *table + " (dst)");
    }

    txn.commit();
    Logger::debug("Replaced " + tables_.tree_edge_table + " (" + std::to_string(tree_edges.size()) + ") and " +
                  tables_.extra_edge_table + " (" + std::to_string(extra_edges.size()) + ")");
}

void PostgresGraphStore::write_levels(const LevelMap& levels) {
    auto db = pool_.acquire();
    PostgresConnection::Transaction txn(*db);

    db->execute("ALTER TABLE " + node_table_ + " ADD COLUMN IF NOT EXISTS topo_level INTEGER NOT NULL DEFAULT 0");
    db->execute("CREATE TEMP TABLE arbor_level_stage (id BIGINT PRIMARY KEY, topo_level INTEGER NOT NULL) "
                "ON COMMIT DROP");

    {
        BulkCopy copy(*db);
        copy.begin_table("arbor_level_stage", {"id", "topo_level"});
        for (const auto& [id, level] : levels) {
            copy.add_row({std::to_string(id), std::to_string(level)});
        }
        copy.flush();
    }

    db->execute("UPDATE " + node_table_ + " n SET topo_level = "
                "COALESCE((SELECT s.topo_level FROM arbor_level_stage s WHERE s.id = n.id), 0)");

    const std::string index = PostgresConnection::quote_identifier(base_name(tables_.node_table) + "_topo_level_idx");
    db->execute("CREATE INDEX IF NOT EXISTS " + index + " ON " + node_table_ + " (topo_level, degree DESC, id)");

    txn.commit();
}

std::vector<CitationEdge> PostgresGraphStore::tree_edges_touching(std::span<const NodeId> ids) const {
    if (ids.empty()) return {};

    auto db = pool_.acquire();
    std::vector<CitationEdge> edges;
    db->query("SELECT src, dst FROM " + tree_table_ + " WHERE src = ANY($1::bigint[]) "
              "UNION "
              "SELECT src, dst FROM " + tree_table_ + " WHERE dst = ANY($1::bigint[])",
              {PostgresConnection::array_literal(ids)},
              [&](const PostgresConnection::Row& row) {
                  edges.push_back({parse_number<int64_t>(row[0], "src"), parse_number<int64_t>(row[1], "dst")});
              });
    return edges;
}

std::vector<ExtraEdge> PostgresGraphStore::extra_edges_touching(std::span<const NodeId> ids, size_t max_edges) const {
    if (ids.empty() || max_edges == 0) return {};

    auto db = pool_.acquire();
    std::vector<ExtraEdge> edges;
    db->query("SELECT src, dst, priority, edge_type FROM ("
              "SELECT src, dst, priority, edge_type FROM " + extra_table_ + " WHERE src = ANY($1::bigint[]) "
              "UNION "
              "SELECT src, dst, priority, edge_type FROM " + extra_table_ + " WHERE dst = ANY($1::bigint[])"
              ") touching ORDER BY priority DESC, src, dst LIMIT $2",
              {PostgresConnection::array_literal(ids), std::to_string(max_edges)},
              [&](const PostgresConnection::Row& row) {
                  ExtraEdge e;
                  e.src = parse_number<int64_t>(row[0], "src");
                  e.dst = parse_number<int64_t>(row[1], "dst");
                  e.priority = parse_number<int64_t>(row[2], "priority");
                  e.edge_type = row[3];
                  edges.push_back(std::move(e));
              });
    return edges;
}

std::vector<Node> PostgresGraphStore::nodes_at_level(int32_t level, size_t limit) const {
    auto db = pool_.acquire();
    const bool with_level = has_level_column(*db);

    // Without a level column every node sits at level 0
    if (!with_level && level != 0) return {};

    std::ostringstream sql;
    sql << "SELECT " << node_columns(with_level) << " FROM " << node_table_;
    std::vector<std::string> params;
    if (with_level) {
        sql << " WHERE topo_level = $1";
        params.push_back(std::to_string(level));
    }
    sql << " ORDER BY COALESCE(degree, 0) DESC, id LIMIT $" << (params.size() + 1);
    params.push_back(std::to_string(limit));

    std::vector<Node> nodes;
    db->query(sql.str(), params,
              [&](const PostgresConnection::Row& row) { nodes.push_back(parse_node(row, with_level)); });
    return nodes;
}

} // namespace Arbor
