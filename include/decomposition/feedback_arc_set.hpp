/**
 * @file feedback_arc_set.hpp
 * @brief Feedback arc set heuristics and the retrying solver that guarantees acyclicity
 */

#pragma once

#include <export.hpp>
#include <config/arbor_config.hpp>
#include <graph/citation_graph.hpp>
#include <graph/component_graph.hpp>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace Arbor {

/**
 * @brief One heuristic for choosing edges whose removal breaks the cycles of a component
 *
 * select() returns local edge positions of the component. It may leave cycles
 * behind; the solver re-checks and iterates. It throws StrategyUnavailableError
 * when it cannot run on this input at all.
 */
class ARBOR_API FeedbackArcSetStrategy {
public:
    virtual ~FeedbackArcSetStrategy() = default;

    virtual FasStrategy kind() const = 0;
    std::string_view name() const { return to_string(kind()); }

    virtual std::vector<uint32_t> select(const ComponentGraph& component, const CitationGraph& graph) = 0;
};

/**
 * @brief Greedy linear ordering by (out-degree - in-degree)
 *
 * Repeatedly takes the remaining node with the highest score, then removes
 * every edge pointing backward in the resulting order. The selection alone
 * always leaves an acyclic residual.
 */
class ARBOR_API GreedyOrderingStrategy final : public FeedbackArcSetStrategy {
public:
    FasStrategy kind() const override { return FasStrategy::GreedyOrdering; }
    std::vector<uint32_t> select(const ComponentGraph& component, const CitationGraph& graph) override;

    /**
     * @brief The linear order over local node indices
     */
    static std::vector<uint32_t> order(const ComponentGraph& component);
};

struct ChronologicalStats {
    size_t nodes = 0;
    size_t dated_nodes = 0;
    size_t edges = 0;
    size_t undated_edges = 0;     // At least one endpoint without a year
    size_t violations = 0;        // src year <= dst year

    double coverage() const { return nodes ? static_cast<double>(dated_nodes) / nodes : 0.0; }
};

/**
 * @brief Removes citations that do not point back in time
 *
 * An edge is backward when the citing node's year is not later than the cited
 * node's. Edges with an undated endpoint are never selected.
 */
class ARBOR_API ChronologicalStrategy final : public FeedbackArcSetStrategy {
public:
    explicit ChronologicalStrategy(double min_coverage) : min_coverage_(min_coverage) {}

    FasStrategy kind() const override { return FasStrategy::Chronological; }
    std::vector<uint32_t> select(const ComponentGraph& component, const CitationGraph& graph) override;

    const ChronologicalStats& last_stats() const { return stats_; }

private:
    double min_coverage_;
    ChronologicalStats stats_;
};

/**
 * @brief Removes the edge that lies on the most simple cycles until none remain
 *
 * Exponential in the worst case. Only meant for small components and for
 * comparing against the other heuristics.
 */
class ARBOR_API CycleMajorityStrategy final : public FeedbackArcSetStrategy {
public:
    explicit CycleMajorityStrategy(size_t cycle_cap) : cycle_cap_(cycle_cap) {}

    FasStrategy kind() const override { return FasStrategy::CycleMajority; }
    std::vector<uint32_t> select(const ComponentGraph& component, const CitationGraph& graph) override;

private:
    size_t cycle_cap_;
};

struct FasAttempt {
    FasStrategy strategy;
    size_t core_nodes = 0;
    size_t core_edges = 0;
    size_t removed = 0;
    double elapsed_ms = 0.0;
    std::string note;
};

struct FasResult {
    std::vector<EdgeIndex> removed;                 // Global edge ids, ascending
    std::vector<FasAttempt> attempts;
    FasStrategy final_strategy = FasStrategy::GreedyOrdering;
    bool fell_back = false;
    size_t component_nodes = 0;
    size_t component_edges = 0;
    std::optional<ChronologicalStats> chronological;
};

struct StrategyComparison {
    FasStrategy strategy;
    bool available = true;
    std::string note;
    size_t removed = 0;
    double removed_pct = 0.0;            // Of the component's edges
    double elapsed_ms = 0.0;
    bool acyclic = false;
    double same_cluster_ratio = 0.0;     // Removed edges whose endpoints share a cluster
};

class ARBOR_API FeedbackArcSetSolver {
public:
    explicit FeedbackArcSetSolver(DecompositionConfig config);

    /**
     * @brief Break every cycle among the given component's nodes
     *
     * Runs the configured strategy on the cyclic core, then keeps iterating on
     * whatever is still cyclic. A strategy that is unavailable or selects
     * nothing is replaced by greedy ordering.
     *
     * @throws DecompositionInvariantError when the component is still cyclic
     *         after max_attempts rounds
     */
    FasResult solve(const CitationGraph& graph, std::span<const NodeIndex> component) const;

    /**
     * @brief Run every strategy on the same component, without fallback
     */
    std::vector<StrategyComparison> compare(const CitationGraph& graph, std::span<const NodeIndex> component) const;

    static std::unique_ptr<FeedbackArcSetStrategy> make_strategy(FasStrategy kind, const DecompositionConfig& config);

    static void log_comparison(const std::vector<StrategyComparison>& rows);

private:
    DecompositionConfig config_;
};

} // namespace Arbor
