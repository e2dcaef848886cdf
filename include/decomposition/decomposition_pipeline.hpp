/**
 * @file decomposition_pipeline.hpp
 * @brief Offline batch job: load, SCC, feedback arc set, partition, levels, persist
 */

#pragma once

#include <export.hpp>
#include <config/arbor_config.hpp>
#include <decomposition/feedback_arc_set.hpp>
#include <decomposition/level_assigner.hpp>
#include <graph/scc_analyzer.hpp>
#include <store/graph_store.hpp>
#include <string>
#include <vector>

namespace Arbor {

struct StageTiming {
    std::string stage;
    double elapsed_ms = 0.0;
};

struct DecompositionReport {
    size_t nodes = 0;
    size_t edges = 0;
    size_t duplicates_dropped = 0;
    SccReport scc;
    std::vector<FasResult> solved;          // One per component that was broken
    size_t tree_edges = 0;
    size_t extra_edges = 0;
    double extra_pct = 0.0;
    size_t root_count = 0;
    std::vector<size_t> level_distribution;
    bool persisted = false;
    std::vector<StageTiming> timings;
    double total_ms = 0.0;
};

/**
 * @brief Runs the whole decomposition single-threaded against one GraphStore
 *
 * Nothing is written unless every invariant holds. The store must not be
 * written by anyone else while run() is in progress.
 */
class ARBOR_API DecompositionPipeline {
public:
    DecompositionPipeline(GraphStore& store, DecompositionConfig config);

    /**
     * @param persist write tree/extra tables and topo levels back to the store
     * @throws DataIntegrityError on malformed input
     * @throws DecompositionInvariantError when acyclicity cannot be established
     */
    DecompositionReport run(bool persist = true);

    /**
     * @brief Strategy comparison on the largest component, no writes
     */
    std::vector<StrategyComparison> compare();

    static void log_report(const DecompositionReport& report);

private:
    GraphStore& store_;
    DecompositionConfig config_;
};

} // namespace Arbor
