/**
 * @file arbor_decompose.cpp
 * @brief Offline decomposition of a citation graph into tree and extra edges
 *
 * Usage: arbor_decompose [--nodes nodes.csv --edges edges.csv] [--config arbor.json]
 *                        [--strategy NAME] [--compare] [--dry-run] [--log-level LEVEL]
 */

#include <config/arbor_config.hpp>
#include <decomposition/decomposition_pipeline.hpp>
#include <store/graph_csv.hpp>
#include <store/postgres_graph_store.hpp>
#include <utils/errors.hpp>
#include <utils/logger.hpp>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

using namespace Arbor;

namespace {

constexpr int EXIT_FATAL = 1;
constexpr int EXIT_USAGE = 2;

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options]\n"
              << "  --nodes PATH       Read nodes from CSV (id,x,y,cluster_id,degree[,year])\n"
              << "  --edges PATH       Read citations from CSV (src,dst)\n"
              << "  --config PATH      JSON configuration file\n"
              << "  --strategy NAME    greedy-ordering | chronological | cycle-majority\n"
              << "  --compare          Compare every strategy on the largest component, write nothing\n"
              << "  --dry-run          Run the full pipeline but skip persistence\n"
              << "  --log-level LEVEL  debug | info | warning | error\n"
              << "Without --nodes/--edges the graph is read from PostgreSQL (PG* environment).\n";
}

struct Options {
    std::optional<std::string> nodes;
    std::optional<std::string> edges;
    std::optional<std::string> config;
    std::optional<std::string> strategy;
    std::optional<std::string> log_level;
    bool compare = false;
    bool dry_run = false;
};

} // namespace

int main(int argc, char** argv) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto value = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) return std::nullopt;
            return std::string(argv[++i]);
        };

        std::optional<std::string>* target = nullptr;
        if (arg == "--nodes") target = &opts.nodes;
        else if (arg == "--edges") target = &opts.edges;
        else if (arg == "--config") target = &opts.config;
        else if (arg == "--strategy") target = &opts.strategy;
        else if (arg == "--log-level") target = &opts.log_level;
        else if (arg == "--compare") { opts.compare = true; continue; }
        else if (arg == "--dry-run") { opts.dry_run = true; continue; }
        else if (arg == "--help" || arg == "-h") { print_usage(argv[0]); return 0; }
        else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            return EXIT_USAGE;
        }

        *target = value();
        if (!*target) {
            std::cerr << arg << " requires a value\n";
            return EXIT_USAGE;
        }
    }

    if (opts.nodes.has_value() != opts.edges.has_value()) {
        std::cerr << "--nodes and --edges must be given together\n";
        return EXIT_USAGE;
    }

    ArborConfig config;
    try {
        if (opts.config) {
            config = ArborConfig::from_json_file(*opts.config);
            config.apply_env_overrides();
        } else {
            config = ArborConfig::from_env();
        }
        if (opts.strategy) config.decomposition.strategy = parse_fas_strategy(*opts.strategy);
        if (opts.log_level) config.log_level = Logger::parse_level(*opts.log_level);
    } catch (const ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_USAGE;
    }
    Logger::set_level(config.log_level);

    try {
        std::unique_ptr<GraphStore> store;
        if (opts.nodes) {
            store = GraphCsv::load(*opts.nodes, *opts.edges);
            if (!opts.dry_run && !opts.compare) {
                Logger::info("CSV input: results are kept in memory only");
            }
        } else {
            store = std::make_unique<PostgresGraphStore>(config.database, config.store);
        }
        Logger::info("Store: " + store->describe() + ", strategy " +
                     std::string(to_string(config.decomposition.strategy)));

        DecompositionPipeline pipeline(*store, config.decomposition);

        if (opts.compare) {
            FeedbackArcSetSolver::log_comparison(pipeline.compare());
            return 0;
        }

        auto report = pipeline.run(!opts.dry_run);
        DecompositionPipeline::log_report(report);
        return 0;

    } catch (const std::exception& e) {
        Logger::error(std::string("Decomposition failed: ") + e.what());
        return EXIT_FATAL;
    }
}
