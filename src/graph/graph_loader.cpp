#include <graph/graph_loader.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>

namespace Arbor {

CitationGraph GraphLoader::load() const {
    Logger::step("Loading graph from " + store_.describe());
    Timer timer;

    auto nodes = store_.load_nodes();
    auto edges = store_.load_edges();
    const size_t raw_edges = edges.size();

    CitationGraph graph = CitationGraph::build(std::move(nodes), edges);

    size_t with_year = 0;
    for (const auto& n : graph.nodes()) {
        if (n.year) ++with_year;
    }

    Logger::success("Loaded " + std::to_string(graph.node_count()) + " nodes, " +
                    std::to_string(graph.edge_count()) + " edges (" + std::to_string(raw_edges) +
                    " rows, " + std::to_string(with_year) + " nodes dated) in " +
                    std::to_string(timer.elapsed().count()) + "ms");
    return graph;
}

} // namespace Arbor
