/**
 * @file graph_csv.hpp
 * @brief CSV import for running the pipeline without a database
 */

#pragma once

#include <export.hpp>
#include <store/memory_graph_store.hpp>
#include <istream>
#include <memory>
#include <string>
#include <vector>

namespace Arbor {

/**
 * @brief Reads nodes.csv and edges.csv
 *
 * nodes.csv: id,x,y,cluster_id,degree[,year]
 * edges.csv: src,dst
 *
 * A header line is optional and recognised by a non-numeric first field.
 * Blank lines and lines starting with '#' are skipped. Empty cluster_id,
 * degree and year fields mean -1, 0 and undated.
 *
 * @throws DataIntegrityError naming source and line for malformed rows
 */
class ARBOR_API GraphCsv {
public:
    static std::vector<Node> parse_nodes(std::istream& in, const std::string& source = "nodes.csv");
    static std::vector<CitationEdge> parse_edges(std::istream& in, const std::string& source = "edges.csv");

    static std::vector<Node> read_nodes(const std::string& path);
    static std::vector<CitationEdge> read_edges(const std::string& path);

    static std::unique_ptr<MemoryGraphStore> load(const std::string& nodes_path, const std::string& edges_path);
};

} // namespace Arbor
