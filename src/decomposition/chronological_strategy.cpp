#include <decomposition/feedback_arc_set.hpp>
#include <utils/errors.hpp>
#include <iomanip>
#include <sstream>

namespace Arbor {

std::vector<uint32_t> ChronologicalStrategy::select(const ComponentGraph& component, const CitationGraph& graph) {
    stats_ = ChronologicalStats{};
    stats_.nodes = component.node_count();
    stats_.edges = component.edge_count();

    for (NodeIndex g : component.nodes) {
        if (graph.node(g).year) ++stats_.dated_nodes;
    }

    if (stats_.coverage() < min_coverage_) {
        std::ostringstream msg;
        msg << std::fixed << std::setprecision(1)
            << "chronological: year coverage " << stats_.coverage() * 100.0 << "% is below the required "
            << min_coverage_ * 100.0 << "%";
        throw StrategyUnavailableError(msg.str());
    }

    std::vector<uint32_t> backward;
    for (uint32_t p = 0; p < component.edge_count(); ++p) {
        const auto& src = graph.node(component.nodes[component.edges[p].from]);
        const auto& dst = graph.node(component.nodes[component.edges[p].to]);
        if (!src.year || !dst.year) {
            ++stats_.undated_edges;
            continue;
        }
        // A citing paper should be strictly newer than the one it cites
        if (*src.year <= *dst.year) {
            backward.push_back(p);
        }
    }
    stats_.violations = backward.size();
    return backward;
}

} // namespace Arbor
