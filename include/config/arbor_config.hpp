/**
 * @file arbor_config.hpp
 * @brief Configuration structs for the decomposition job and the query service
 */

#pragma once

#include <export.hpp>
#include <utils/logger.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace Arbor {

enum class FasStrategy {
    GreedyOrdering,
    Chronological,
    CycleMajority
};

enum class DecompositionScope {
    LargestComponent,   // Only the largest SCC is broken; other cycles are fatal
    AllComponents       // Every non-trivial SCC is broken, largest first
};

enum class LevelMode {
    LongestPath,        // level(v) > level(u) for every tree edge
    ShortestPath        // distance from the nearest root
};

ARBOR_API std::string_view to_string(FasStrategy s);
ARBOR_API std::string_view to_string(DecompositionScope s);
ARBOR_API std::string_view to_string(LevelMode m);

// Throw ConfigError on unknown spellings
ARBOR_API FasStrategy parse_fas_strategy(std::string_view name);
ARBOR_API DecompositionScope parse_scope(std::string_view name);
ARBOR_API LevelMode parse_level_mode(std::string_view name);

struct DatabaseConfig {
    std::string host = "localhost";
    uint16_t port = 5432;
    std::string dbname = "arbor";
    std::string user = "postgres";
    std::string password;
    size_t pool_size = 4;             // Connections per store, shared by all workers

    std::string conninfo() const;
};

/**
 * @brief Table names. Injected into PostgresGraphStore, never global.
 */
struct StoreConfig {
    std::string node_table = "nodes";             // id, x, y, cluster_id, degree, year, topo_level
    std::string edge_table = "citations";         // src, dst
    std::string tree_edge_table = "tree_edges";
    std::string extra_edge_table = "extra_edges";
};

struct DecompositionConfig {
    FasStrategy strategy = FasStrategy::GreedyOrdering;
    DecompositionScope scope = DecompositionScope::LargestComponent;
    size_t max_attempts = 4;                      // Solver rounds before giving up
    double chronological_min_coverage = 0.9;      // Fraction of component nodes with a year
    size_t cycle_enumeration_cap = 100000;        // Simple cycles per cycle-majority round
    LevelMode level_mode = LevelMode::LongestPath;
};

/**
 * @brief Per-endpoint-class timeouts. The clock starts at submission.
 */
struct TimeoutPolicy {
    std::chrono::milliseconds bounds_lookup{2000};   // Spatial lookups, data bounds
    std::chrono::milliseconds edge_batch{10000};     // Tree/extra edge batches
    std::chrono::milliseconds overview{5000};        // Topological overview
};

struct ServiceConfig {
    size_t interactive_workers = 4;
    size_t enrichment_workers = 2;
    TimeoutPolicy timeouts;
    double viewport_margin = 0.1;                 // Fraction of box width/height added per side
    size_t default_page_limit = 1000;
    size_t max_page_limit = 10000;
    size_t default_max_extra_edges = 5000;
    size_t default_overview_levels = 5;
    size_t default_overview_nodes_per_level = 200;
};

struct ARBOR_API ArborConfig {
    DatabaseConfig database;
    StoreConfig store;
    DecompositionConfig decomposition;
    ServiceConfig service;
    Logger::Level log_level = Logger::Level::Info;

    /**
     * @brief Defaults overlaid with PG* and ARBOR_* environment variables
     */
    static ArborConfig from_env();

    /**
     * @brief Parse a JSON document. Missing keys keep their defaults.
     * @throws ConfigError on malformed JSON, wrong value types or unknown enum spellings
     */
    static ArborConfig from_json(const std::string& text);
    static ArborConfig from_json_file(const std::string& path);

    /**
     * @brief Apply PG* / ARBOR_* variables on top of the current values
     */
    void apply_env_overrides();

    /**
     * @brief Range checks shared by every loader
     * @throws ConfigError naming the first offending key
     */
    void validate() const;
};

} // namespace Arbor
