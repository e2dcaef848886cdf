#include <decomposition/decomposition_pipeline.hpp>
#include <decomposition/tree_extra_partitioner.hpp>
#include <graph/graph_loader.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <iomanip>
#include <sstream>

namespace Arbor {

DecompositionPipeline::DecompositionPipeline(GraphStore& store, DecompositionConfig config)
    : store_(store), config_(std::move(config)) {}

DecompositionReport DecompositionPipeline::run(bool persist) {
    Logger::info("Decomposition (" + std::string(to_string(config_.strategy)) + ", " +
                 std::string(to_string(config_.scope)) + ")");
    Timer total;
    DecompositionReport report;

    auto stage = [&report](const char* name, const Timer& t) {
        report.timings.push_back({name, t.elapsed_ms()});
    };

    Timer t;
    CitationGraph graph = GraphLoader(store_).load();
    report.nodes = graph.node_count();
    report.edges = graph.edge_count();
    report.duplicates_dropped = graph.duplicates_dropped();
    stage("load", t);

    t.reset();
    SccResult scc = SccAnalyzer().analyze(graph);
    report.scc = scc.report;
    SccAnalyzer::log_report(scc.report);
    stage("scc", t);

    t.reset();
    std::vector<uint32_t> targets;
    if (config_.scope == DecompositionScope::AllComponents) {
        targets = scc.nontrivial();
    } else if (scc.report.largest_size >= 2) {
        targets.push_back(0);
    }

    FeedbackArcSetSolver solver(config_);
    std::vector<EdgeIndex> removed;
    for (uint32_t c : targets) {
        Logger::step("Breaking cycles in component of " + std::to_string(scc.components[c].size()) + " nodes");
        FasResult solved = solver.solve(graph, scc.components[c]);
        Logger::success("Removed " + std::to_string(solved.removed.size()) + " of " +
                        std::to_string(solved.component_edges) + " component edges using " +
                        std::string(to_string(solved.final_strategy)) + (solved.fell_back ? " (fallback)" : ""));
        removed.insert(removed.end(), solved.removed.begin(), solved.removed.end());
        report.solved.push_back(std::move(solved));
    }
    stage("feedback_arc_set", t);

    t.reset();
    TreeExtraPartitioner partitioner;
    Partition partition = partitioner.partition(graph, removed, scc);
    report.tree_edges = partition.tree_ids.size();
    report.extra_edges = partition.extra_ids.size();
    report.extra_pct = partition.extra_pct();
    stage("partition", t);

    t.reset();
    LevelAssigner assigner(config_.level_mode);
    LevelResult levels = assigner.assign(graph, partition.tree_ids);
    report.root_count = levels.root_count;
    report.level_distribution = levels.distribution;
    stage("levels", t);

    if (persist) {
        t.reset();
        partitioner.persist(store_, partition);
        assigner.persist(store_, graph, levels);
        report.persisted = true;
        stage("persist", t);
    } else {
        Logger::info("Dry run: nothing written");
    }

    report.total_ms = total.elapsed_ms();
    return report;
}

std::vector<StrategyComparison> DecompositionPipeline::compare() {
    CitationGraph graph = GraphLoader(store_).load();
    SccResult scc = SccAnalyzer().analyze(graph);
    SccAnalyzer::log_report(scc.report);

    if (scc.report.largest_size < 2) {
        Logger::info("Graph is already acyclic; nothing to compare");
        return {};
    }

    FeedbackArcSetSolver solver(config_);
    return solver.compare(graph, scc.largest());
}

void DecompositionPipeline::log_report(const DecompositionReport& report) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2);
    out << "Decomposition: " << report.nodes << " nodes, " << report.edges << " edges -> "
        << report.tree_edges << " tree, " << report.extra_edges << " extra (" << report.extra_pct << "%), "
        << report.root_count << " roots, " << report.level_distribution.size() << " levels";
    Logger::success(out.str());

    for (const auto& timing : report.timings) {
        std::ostringstream line;
        line << std::fixed << std::setprecision(1) << "  " << std::setw(18) << std::left << timing.stage
             << timing.elapsed_ms << "ms";
        Logger::info(line.str());
    }

    std::ostringstream total;
    total << std::fixed << std::setprecision(1) << "  total " << report.total_ms << "ms"
          << (report.persisted ? "" : " (not persisted)");
    Logger::info(total.str());
}

} // namespace Arbor
