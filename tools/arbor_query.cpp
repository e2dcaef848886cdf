/**
 * @file arbor_query.cpp
 * @brief Answer one fragment-service query and print it as JSON
 *
 * Usage:
 *   arbor_query [--config arbor.json] [--nodes nodes.csv --edges edges.csv] COMMAND ...
 *
 *   viewport MIN_X MIN_Y MAX_X MAX_Y [--min-degree N] [--clusters 1,2] [--max-level N]
 *                                    [--offset N] [--limit N]
 *   extra ID[,ID...] [--max N]
 *   overview [--levels N] [--per-level N]
 *   bounds
 *
 * With CSV input the graph is decomposed in memory before the query runs.
 */

#include <config/arbor_config.hpp>
#include <decomposition/decomposition_pipeline.hpp>
#include <service/tree_fragment_service.hpp>
#include <store/graph_csv.hpp>
#include <store/postgres_graph_store.hpp>
#include <utils/errors.hpp>
#include <utils/logger.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace Arbor;
using json = nlohmann::json;

namespace {

constexpr int EXIT_FATAL = 1;
constexpr int EXIT_USAGE = 2;

class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

json to_json(const Node& n) {
    return {
        {"id", n.id},
        {"x", n.position.x()},
        {"y", n.position.y()},
        {"cluster_id", n.cluster_id},
        {"degree", n.degree},
        {"year", n.year ? json(*n.year) : json(nullptr)},
        {"topo_level", n.topo_level}
    };
}

json to_json(const ViewBox& box) {
    return {{"min_x", box.min().x()}, {"min_y", box.min().y()}, {"max_x", box.max().x()}, {"max_y", box.max().y()}};
}

json to_json(const Fragment& f) {
    json nodes = json::array();
    for (const auto& n : f.nodes) nodes.push_back(to_json(n));

    json tree = json::array();
    for (const auto& e : f.tree_edges) tree.push_back({{"src", e.src}, {"dst", e.dst}});

    json broken = json::array();
    for (const auto& b : f.broken_edges) {
        broken.push_back({
            {"source_id", b.source_id},
            {"target_id", b.target_id},
            {"external_id", b.external_id},
            {"role", std::string(to_string(b.role))},
            {"priority", b.priority}
        });
    }

    return {
        {"nodes", nodes},
        {"tree_edges", tree},
        {"broken_edges", broken},
        {"has_more", f.has_more},
        {"total_matches", f.total_matches},
        {"offset", f.offset},
        {"limit", f.limit},
        {"query_box", to_json(f.query_box)}
    };
}

json to_json(const ExtraEdgeBatch& batch) {
    json edges = json::array();
    for (const auto& e : batch.extra_edges) {
        edges.push_back({{"src", e.src}, {"dst", e.dst}, {"priority", e.priority}, {"edge_type", e.edge_type}});
    }
    // Ordered by id so the output is stable
    std::map<NodeId, bool> enriched(batch.enriched.begin(), batch.enriched.end());
    json flags = json::object();
    for (const auto& [id, touched] : enriched) flags[std::to_string(id)] = touched;

    return {{"extra_edges", edges}, {"enriched", flags}, {"truncated", batch.truncated}};
}

json to_json(const TopologicalOverview& overview) {
    json nodes = json::array();
    for (const auto& n : overview.nodes) nodes.push_back(to_json(n));
    return {{"nodes", nodes}, {"level_counts", overview.level_counts}};
}

json to_json(const QueryStatsSnapshot& s) {
    return {
        {"submitted", s.submitted},
        {"succeeded", s.succeeded},
        {"failed", s.failed},
        {"timed_out", s.timed_out},
        {"cancelled", s.cancelled}
    };
}

double parse_double(const std::string& text) {
    try {
        size_t pos = 0;
        double v = std::stod(text, &pos);
        if (pos == text.size()) return v;
    } catch (const std::logic_error&) {
    }
    throw UsageError("not a number: '" + text + "'");
}

long long parse_integer(const std::string& text) {
    try {
        size_t pos = 0;
        long long v = std::stoll(text, &pos);
        if (pos == text.size()) return v;
    } catch (const std::logic_error&) {
    }
    throw UsageError("not an integer: '" + text + "'");
}

size_t parse_size(const std::string& text) {
    long long v = parse_integer(text);
    if (v < 0) throw UsageError("must not be negative: '" + text + "'");
    return static_cast<size_t>(v);
}

std::vector<NodeId> parse_ids(const std::string& text) {
    std::vector<NodeId> ids;
    std::stringstream ss(text);
    std::string part;
    while (std::getline(ss, part, ',')) {
        if (!part.empty()) ids.push_back(parse_integer(part));
    }
    if (ids.empty()) throw UsageError("no node ids given");
    return ids;
}

// Remaining "--flag value" pairs after the positional arguments
std::map<std::string, std::string> parse_flags(const std::vector<std::string>& args, size_t from) {
    std::map<std::string, std::string> flags;
    for (size_t i = from; i < args.size(); ++i) {
        if (args[i].rfind("--", 0) != 0 || i + 1 >= args.size()) {
            throw UsageError("unexpected argument '" + args[i] + "'");
        }
        flags[args[i]] = args[i + 1];
        ++i;
    }
    return flags;
}

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [--config PATH] [--nodes PATH --edges PATH] COMMAND ...\n"
              << "  viewport MIN_X MIN_Y MAX_X MAX_Y [--min-degree N] [--clusters LIST] [--max-level N]\n"
              << "                                   [--offset N] [--limit N]\n"
              << "  extra ID[,ID...] [--max N]\n"
              << "  children ID [--depth N] [--max N]\n"
              << "  around ID [--radius N] [--max N]\n"
              << "  path FROM TO[,TO...] [--max-length N]\n"
              << "  overview [--levels N] [--per-level N]\n"
              << "  bounds\n";
}

json run_command(TreeFragmentService& service, const std::vector<std::string>& args) {
    const std::string& command = args[0];

    if (command == "viewport") {
        if (args.size() < 5) throw UsageError("viewport needs MIN_X MIN_Y MAX_X MAX_Y");
        ViewportQuery q;
        q.box = ViewBox(Eigen::Vector2d(parse_double(args[1]), parse_double(args[2])),
                        Eigen::Vector2d(parse_double(args[3]), parse_double(args[4])));
        for (const auto& [flag, value] : parse_flags(args, 5)) {
            if (flag == "--min-degree") q.min_degree = static_cast<int32_t>(parse_integer(value));
            else if (flag == "--clusters") q.visible_clusters = value;
            else if (flag == "--max-level") q.max_level = static_cast<int32_t>(parse_integer(value));
            else if (flag == "--offset") q.offset = parse_size(value);
            else if (flag == "--limit") q.limit = parse_size(value);
            else throw UsageError("unknown viewport option " + flag);
        }
        return to_json(service.get_viewport_fragment(q));
    }

    if (command == "extra") {
        if (args.size() < 2) throw UsageError("extra needs a list of node ids");
        std::optional<size_t> max_edges;
        for (const auto& [flag, value] : parse_flags(args, 2)) {
            if (flag == "--max") max_edges = parse_size(value);
            else throw UsageError("unknown extra option " + flag);
        }
        return to_json(service.get_extra_edges_for_nodes(parse_ids(args[1]), max_edges));
    }

    if (command == "children" || command == "around") {
        if (args.size() < 2) throw UsageError(command + " needs a node id");
        const NodeId id = parse_integer(args[1]);
        const bool down = command == "children";
        size_t hops = down ? 1 : 2;
        std::optional<size_t> max_nodes;
        for (const auto& [flag, value] : parse_flags(args, 2)) {
            if (flag == (down ? "--depth" : "--radius")) hops = parse_size(value);
            else if (flag == "--max") max_nodes = parse_size(value);
            else throw UsageError("unknown " + command + " option " + flag);
        }
        return to_json(down ? service.get_tree_children(id, hops, max_nodes)
                            : service.get_fragment_around_node(id, hops, max_nodes.value_or(50)));
    }

    if (command == "path") {
        if (args.size() < 3) throw UsageError("path needs FROM and a list of target ids");
        size_t max_length = 10;
        for (const auto& [flag, value] : parse_flags(args, 3)) {
            if (flag == "--max-length") max_length = parse_size(value);
            else throw UsageError("unknown path option " + flag);
        }
        const auto path = service.find_tree_path(parse_integer(args[1]), parse_ids(args[2]), max_length);
        return {{"path", path}, {"found", !path.empty()}};
    }

    if (command == "overview") {
        std::optional<size_t> levels;
        std::optional<size_t> per_level;
        for (const auto& [flag, value] : parse_flags(args, 1)) {
            if (flag == "--levels") levels = parse_size(value);
            else if (flag == "--per-level") per_level = parse_size(value);
            else throw UsageError("unknown overview option " + flag);
        }
        return to_json(service.get_topological_overview(levels, per_level));
    }

    if (command == "bounds") {
        auto bounds = service.get_data_bounds();
        return {{"box", to_json(bounds.box)}, {"node_count", bounds.node_count}};
    }

    throw UsageError("unknown command '" + command + "'");
}

} // namespace

int main(int argc, char** argv) {
    std::optional<std::string> config_path;
    std::optional<std::string> nodes_path;
    std::optional<std::string> edges_path;
    std::vector<std::string> command;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (command.empty() && (arg == "--config" || arg == "--nodes" || arg == "--edges")) {
            if (i + 1 >= argc) {
                std::cerr << arg << " requires a value\n";
                return EXIT_USAGE;
            }
            auto& target = arg == "--config" ? config_path : arg == "--nodes" ? nodes_path : edges_path;
            target = argv[++i];
        } else if (command.empty() && (arg == "--help" || arg == "-h")) {
            print_usage(argv[0]);
            return 0;
        } else {
            command.push_back(arg);
        }
    }

    if (command.empty() || nodes_path.has_value() != edges_path.has_value()) {
        print_usage(argv[0]);
        return EXIT_USAGE;
    }

    ArborConfig config;
    try {
        config = config_path ? ArborConfig::from_json_file(*config_path) : ArborConfig::from_env();
        if (config_path) config.apply_env_overrides();
    } catch (const ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_USAGE;
    }
    // stdout carries the JSON; keep progress chatter to warnings and above
    Logger::set_level(std::max(config.log_level, Logger::Level::Warning));

    try {
        std::unique_ptr<GraphStore> store;
        if (nodes_path) {
            store = GraphCsv::load(*nodes_path, *edges_path);
            DecompositionPipeline(*store, config.decomposition).run(true);
        } else {
            store = std::make_unique<PostgresGraphStore>(config.database, config.store);
        }

        QueryStats stats;
        TreeFragmentService service(*store, NodeCatalog::load(*store), config.service, stats);

        json out = run_command(service, command);
        out["stats"] = to_json(service.stats());
        std::cout << out.dump(2) << std::endl;
        return 0;

    } catch (const UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        print_usage(argv[0]);
        return EXIT_USAGE;
    } catch (const std::exception& e) {
        Logger::error(std::string("Query failed: ") + e.what());
        return EXIT_FATAL;
    }
}
