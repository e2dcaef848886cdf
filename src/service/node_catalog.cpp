#include <service/node_catalog.hpp>
#include <utils/errors.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>

namespace Arbor {

NodeCatalog::NodeCatalog(std::vector<Node> nodes) : nodes_(std::move(nodes)) {
    bounds_.setEmpty();
    index_.reserve(nodes_.size());
    for (uint32_t i = 0; i < nodes_.size(); ++i) {
        if (!index_.emplace(nodes_[i].id, i).second) {
            throw DataIntegrityError("duplicate node id " + std::to_string(nodes_[i].id) + " in catalog");
        }
        if (!nodes_[i].position.allFinite()) {
            throw DataIntegrityError("node " + std::to_string(nodes_[i].id) + " has a non-finite coordinate");
        }
        bounds_.extend(nodes_[i].position);
    }
}

NodeCatalog NodeCatalog::load(const GraphStore& store) {
    Logger::step("Loading node catalog from " + store.describe());
    Timer timer;
    NodeCatalog catalog(store.load_nodes());
    Logger::success("Catalog holds " + std::to_string(catalog.size()) + " nodes (" +
                    std::to_string(timer.elapsed().count()) + "ms)");
    return catalog;
}

const Node* NodeCatalog::find(NodeId id) const {
    auto it = index_.find(id);
    return it == index_.end() ? nullptr : &nodes_[it->second];
}

std::optional<uint32_t> NodeCatalog::position_of(NodeId id) const {
    auto it = index_.find(id);
    if (it == index_.end()) return std::nullopt;
    return it->second;
}

} // namespace Arbor
