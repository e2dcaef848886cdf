#pragma once

#include <export.hpp>
#include <graph/citation_graph.hpp>
#include <store/graph_store.hpp>

namespace Arbor {

/**
 * @brief Reads nodes and citations from a GraphStore into a CitationGraph
 */
class ARBOR_API GraphLoader {
public:
    explicit GraphLoader(const GraphStore& store) : store_(store) {}

    /**
     * @throws DataIntegrityError when an edge references a node the store does not have
     */
    CitationGraph load() const;

private:
    const GraphStore& store_;
};

} // namespace Arbor
