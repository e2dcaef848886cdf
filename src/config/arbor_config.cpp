#include <config/arbor_config.hpp>
#include <utils/errors.hpp>
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <limits>
#include <type_traits>
#include <fstream>
#include <sstream>

namespace Arbor {

using json = nlohmann::json;

std::string_view to_string(FasStrategy s) {
    switch (s) {
        case FasStrategy::GreedyOrdering: return "greedy-ordering";
        case FasStrategy::Chronological:  return "chronological";
        case FasStrategy::CycleMajority:  return "cycle-majority";
    }
    return "unknown";
}

std::string_view to_string(DecompositionScope s) {
    switch (s) {
        case DecompositionScope::LargestComponent: return "largest-component";
        case DecompositionScope::AllComponents:    return "all-components";
    }
    return "unknown";
}

std::string_view to_string(LevelMode m) {
    switch (m) {
        case LevelMode::LongestPath:  return "longest-path";
        case LevelMode::ShortestPath: return "shortest-path";
    }
    return "unknown";
}

FasStrategy parse_fas_strategy(std::string_view name) {
    if (name == "greedy-ordering" || name == "greedy") return FasStrategy::GreedyOrdering;
    if (name == "chronological") return FasStrategy::Chronological;
    if (name == "cycle-majority") return FasStrategy::CycleMajority;
    throw ConfigError("unknown feedback arc set strategy '" + std::string(name) + "'");
}

DecompositionScope parse_scope(std::string_view name) {
    if (name == "largest-component") return DecompositionScope::LargestComponent;
    if (name == "all-components") return DecompositionScope::AllComponents;
    throw ConfigError("unknown decomposition scope '" + std::string(name) + "'");
}

LevelMode parse_level_mode(std::string_view name) {
    if (name == "longest-path") return LevelMode::LongestPath;
    if (name == "shortest-path") return LevelMode::ShortestPath;
    throw ConfigError("unknown level mode '" + std::string(name) + "'");
}

std::string DatabaseConfig::conninfo() const {
    std::ostringstream out;
    out << "host=" << host << " port=" << port << " dbname=" << dbname << " user=" << user;
    if (!password.empty()) {
        out << " password=" << password;
    }
    return out.str();
}

namespace {

const char* env(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

size_t parse_count(const char* name, const char* text) {
    try {
        size_t pos = 0;
        long long value = std::stoll(text, &pos);
        if (pos != std::string(text).size() || value <= 0) {
            throw ConfigError(std::string(name) + " must be a positive integer, got '" + text + "'");
        }
        return static_cast<size_t>(value);
    } catch (const std::logic_error&) {
        throw ConfigError(std::string(name) + " must be a positive integer, got '" + text + "'");
    }
}

template <typename T>
void read(const json& section, const char* key, T& target) {
    if (!section.contains(key)) return;
    const json& value = section.at(key);

    // json's get<unsigned>() wraps negative numbers instead of failing
    if constexpr (std::is_integral_v<T> && std::is_unsigned_v<T>) {
        if (!value.is_number_unsigned() || value.get<uint64_t>() > std::numeric_limits<T>::max()) {
            throw ConfigError(std::string(key) + " must be an integer in [0, " +
                              std::to_string(std::numeric_limits<T>::max()) + "], got " + value.dump());
        }
    }
    target = value.get<T>();
}

void read_ms(const json& section, const char* key, std::chrono::milliseconds& target) {
    if (!section.contains(key)) return;
    const json& value = section.at(key);
    if (!value.is_number_integer() || value.get<int64_t>() <= 0) {
        throw ConfigError(std::string("timeouts_ms.") + key + " must be a positive integer, got " + value.dump());
    }
    target = std::chrono::milliseconds(value.get<int64_t>());
}

void require_positive(size_t value, const char* key) {
    if (value == 0) {
        throw ConfigError(std::string(key) + " must be at least 1");
    }
}

} // namespace

void ArborConfig::apply_env_overrides() {
    if (const char* v = env("PGHOST")) database.host = v;
    if (const char* v = env("PGPORT")) {
        const size_t port = parse_count("PGPORT", v);
        if (port > std::numeric_limits<uint16_t>::max()) {
            throw ConfigError("PGPORT out of range, got '" + std::string(v) + "'");
        }
        database.port = static_cast<uint16_t>(port);
    }
    if (const char* v = env("PGDATABASE")) database.dbname = v;
    if (const char* v = env("PGUSER")) database.user = v;
    if (const char* v = env("PGPASSWORD")) database.password = v;

    if (const char* v = env("ARBOR_FAS_STRATEGY")) decomposition.strategy = parse_fas_strategy(v);
    if (const char* v = env("ARBOR_WORKERS")) service.interactive_workers = parse_count("ARBOR_WORKERS", v);
    if (const char* v = env("ARBOR_LOG_LEVEL")) log_level = Logger::parse_level(v);
}

ArborConfig ArborConfig::from_env() {
    ArborConfig config;
    config.apply_env_overrides();
    config.validate();
    return config;
}

ArborConfig ArborConfig::from_json(const std::string& text) {
    ArborConfig config;

    try {
        const json doc = json::parse(text);
        if (!doc.is_object()) {
            throw ConfigError("top-level JSON value must be an object");
        }

        if (doc.contains("database")) {
            const auto& s = doc.at("database");
            read(s, "host", config.database.host);
            read(s, "port", config.database.port);
            read(s, "dbname", config.database.dbname);
            read(s, "user", config.database.user);
            read(s, "password", config.database.password);
            read(s, "pool_size", config.database.pool_size);
        }

        if (doc.contains("store")) {
            const auto& s = doc.at("store");
            read(s, "node_table", config.store.node_table);
            read(s, "edge_table", config.store.edge_table);
            read(s, "tree_edge_table", config.store.tree_edge_table);
            read(s, "extra_edge_table", config.store.extra_edge_table);
        }

        if (doc.contains("decomposition")) {
            const auto& s = doc.at("decomposition");
            auto& d = config.decomposition;
            if (s.contains("strategy")) d.strategy = parse_fas_strategy(s.at("strategy").get<std::string>());
            if (s.contains("scope")) d.scope = parse_scope(s.at("scope").get<std::string>());
            if (s.contains("level_mode")) d.level_mode = parse_level_mode(s.at("level_mode").get<std::string>());
            read(s, "max_attempts", d.max_attempts);
            read(s, "chronological_min_coverage", d.chronological_min_coverage);
            read(s, "cycle_enumeration_cap", d.cycle_enumeration_cap);
        }

        if (doc.contains("service")) {
            const auto& s = doc.at("service");
            auto& sv = config.service;
            read(s, "interactive_workers", sv.interactive_workers);
            read(s, "enrichment_workers", sv.enrichment_workers);
            read(s, "viewport_margin", sv.viewport_margin);
            read(s, "default_page_limit", sv.default_page_limit);
            read(s, "max_page_limit", sv.max_page_limit);
            read(s, "default_max_extra_edges", sv.default_max_extra_edges);
            read(s, "default_overview_levels", sv.default_overview_levels);
            read(s, "default_overview_nodes_per_level", sv.default_overview_nodes_per_level);
            if (s.contains("timeouts_ms")) {
                const auto& t = s.at("timeouts_ms");
                read_ms(t, "bounds_lookup", sv.timeouts.bounds_lookup);
                read_ms(t, "edge_batch", sv.timeouts.edge_batch);
                read_ms(t, "overview", sv.timeouts.overview);
            }
        }

        if (doc.contains("log_level")) {
            config.log_level = Logger::parse_level(doc.at("log_level").get<std::string>());
        }
    } catch (const json::exception& e) {
        throw ConfigError(e.what());
    }

    config.validate();
    return config;
}

void ArborConfig::validate() const {
    if (database.port == 0) {
        throw ConfigError("database.port must be at least 1");
    }
    require_positive(database.pool_size, "database.pool_size");
    require_positive(decomposition.max_attempts, "decomposition.max_attempts");
    require_positive(service.interactive_workers, "service.interactive_workers");
    require_positive(service.enrichment_workers, "service.enrichment_workers");
    require_positive(service.default_page_limit, "service.default_page_limit");
    if (service.max_page_limit < service.default_page_limit) {
        throw ConfigError("service.max_page_limit (" + std::to_string(service.max_page_limit) +
                          ") must be at least service.default_page_limit (" +
                          std::to_string(service.default_page_limit) + ")");
    }
    if (!(service.viewport_margin >= 0.0)) {
        throw ConfigError("service.viewport_margin must not be negative");
    }
    if (!(decomposition.chronological_min_coverage >= 0.0 && decomposition.chronological_min_coverage <= 1.0)) {
        throw ConfigError("decomposition.chronological_min_coverage must lie in [0, 1]");
    }
}

ArborConfig ArborConfig::from_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("cannot open " + path);
    }
    std::stringstream contents;
    contents << file.rdbuf();
    return from_json(contents.str());
}

} // namespace Arbor
