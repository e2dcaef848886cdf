#include <decomposition/feedback_arc_set.hpp>
#include <utils/errors.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace Arbor {

namespace {

std::vector<uint32_t> to_local(const ComponentGraph& full, const std::vector<EdgeIndex>& removed_sorted) {
    std::vector<uint32_t> local;
    for (uint32_t p = 0; p < full.edge_ids.size(); ++p) {
        if (std::binary_search(removed_sorted.begin(), removed_sorted.end(), full.edge_ids[p])) {
            local.push_back(p);
        }
    }
    return local;
}

} // namespace

FeedbackArcSetSolver::FeedbackArcSetSolver(DecompositionConfig config)
    : config_(std::move(config)) {}

std::unique_ptr<FeedbackArcSetStrategy> FeedbackArcSetSolver::make_strategy(FasStrategy kind,
                                                                            const DecompositionConfig& config) {
    switch (kind) {
        case FasStrategy::GreedyOrdering:
            return std::make_unique<GreedyOrderingStrategy>();
        case FasStrategy::Chronological:
            return std::make_unique<ChronologicalStrategy>(config.chronological_min_coverage);
        case FasStrategy::CycleMajority:
            return std::make_unique<CycleMajorityStrategy>(config.cycle_enumeration_cap);
    }
    throw ConfigError("unhandled feedback arc set strategy");
}

FasResult FeedbackArcSetSolver::solve(const CitationGraph& graph, std::span<const NodeIndex> component) const {
    const ComponentGraph full = ComponentGraph::induced(graph, component);

    FasResult result;
    result.component_nodes = full.node_count();
    result.component_edges = full.edge_count();
    result.final_strategy = config_.strategy;

    ComponentGraph core = full.cyclic_core();
    if (core.empty()) {
        return result;
    }

    auto strategy = make_strategy(config_.strategy, config_);

    auto fall_back = [&](const std::string& reason) {
        if (strategy->kind() == FasStrategy::GreedyOrdering) {
            throw DecompositionInvariantError("greedy ordering could not break the remaining cycles: " + reason);
        }
        Logger::warn(std::string(strategy->name()) + " unusable (" + reason + "); falling back to greedy-ordering");
        strategy = make_strategy(FasStrategy::GreedyOrdering, config_);
        result.fell_back = true;
        result.final_strategy = FasStrategy::GreedyOrdering;
    };

    for (size_t attempt = 1; attempt <= config_.max_attempts && !core.empty(); ++attempt) {
        FasAttempt record{strategy->kind(), core.node_count(), core.edge_count()};
        Timer timer;

        std::vector<uint32_t> picked;
        try {
            picked = strategy->select(core, graph);
        } catch (const StrategyUnavailableError& e) {
            record.elapsed_ms = timer.elapsed_ms();
            record.note = e.what();
            result.attempts.push_back(record);
            fall_back(e.what());
            continue;
        }

        if (auto* chrono = dynamic_cast<ChronologicalStrategy*>(strategy.get())) {
            if (!result.chronological) result.chronological = chrono->last_stats();
        }

        record.elapsed_ms = timer.elapsed_ms();
        record.removed = picked.size();

        if (picked.empty()) {
            record.note = "selected no edges";
            result.attempts.push_back(record);
            fall_back("selected no edges on a cyclic core of " + std::to_string(core.node_count()) + " nodes");
            continue;
        }

        for (uint32_t p : picked) {
            result.removed.push_back(core.edge_ids[p]);
        }
        core = core.cyclic_core(picked);
        record.note = core.empty() ? "acyclic" : std::to_string(core.node_count()) + " nodes still cyclic";
        result.attempts.push_back(record);

        Logger::debug("Attempt " + std::to_string(attempt) + " (" + std::string(strategy->name()) + "): removed " +
                      std::to_string(picked.size()) + ", " + record.note);
    }

    if (!core.empty()) {
        throw DecompositionInvariantError(std::to_string(core.node_count()) + " nodes still on cycles after " +
                                          std::to_string(config_.max_attempts) + " attempts");
    }

    std::sort(result.removed.begin(), result.removed.end());

    // Postcondition on the whole component, independent of the bookkeeping above
    if (!full.cyclic_core(to_local(full, result.removed)).empty()) {
        throw DecompositionInvariantError("component induced subgraph is cyclic after removing the feedback set");
    }

    return result;
}

std::vector<StrategyComparison> FeedbackArcSetSolver::compare(const CitationGraph& graph,
                                                               std::span<const NodeIndex> component) const {
    const ComponentGraph full = ComponentGraph::induced(graph, component);
    std::vector<StrategyComparison> rows;

    for (FasStrategy kind : {FasStrategy::GreedyOrdering, FasStrategy::Chronological, FasStrategy::CycleMajority}) {
        StrategyComparison row{kind};
        auto strategy = make_strategy(kind, config_);
        Timer timer;

        std::vector<EdgeIndex> removed;
        ComponentGraph core = full.cyclic_core();
        try {
            for (size_t attempt = 0; attempt < config_.max_attempts && !core.empty(); ++attempt) {
                auto picked = strategy->select(core, graph);
                if (picked.empty()) break;
                for (uint32_t p : picked) removed.push_back(core.edge_ids[p]);
                core = core.cyclic_core(picked);
            }
        } catch (const StrategyUnavailableError& e) {
            row.available = false;
            row.note = e.what();
        }

        row.elapsed_ms = timer.elapsed_ms();
        row.removed = removed.size();
        row.removed_pct = full.edge_count() ? 100.0 * removed.size() / full.edge_count() : 0.0;
        row.acyclic = row.available && core.empty();

        size_t same_cluster = 0;
        for (EdgeIndex e : removed) {
            const auto& edge = graph.edge(e);
            if (graph.node(edge.from).cluster_id == graph.node(edge.to).cluster_id) ++same_cluster;
        }
        row.same_cluster_ratio = removed.empty() ? 0.0 : static_cast<double>(same_cluster) / removed.size();

        if (auto* chrono = dynamic_cast<ChronologicalStrategy*>(strategy.get()); chrono && row.available) {
            std::ostringstream note;
            note << std::fixed << std::setprecision(1) << "coverage " << chrono->last_stats().coverage() * 100.0 << "%";
            row.note = note.str();
        }

        rows.push_back(row);
    }

    return rows;
}

void FeedbackArcSetSolver::log_comparison(const std::vector<StrategyComparison>& rows) {
    Logger::info("Feedback arc set strategy comparison");
    for (const auto& row : rows) {
        std::ostringstream line;
        line << std::fixed << std::setprecision(2);
        line << "  " << std::setw(16) << std::left << to_string(row.strategy);
        if (!row.available) {
            line << " unavailable: " << row.note;
        } else {
            line << " removed " << row.removed << " (" << row.removed_pct << "%)"
                 << ", " << row.elapsed_ms << "ms"
                 << ", acyclic " << (row.acyclic ? "yes" : "no")
                 << ", same-cluster " << row.same_cluster_ratio * 100.0 << "%";
            if (!row.note.empty()) line << ", " << row.note;
        }
        Logger::info(line.str());
    }
}

} // namespace Arbor
