#pragma once

#include <export.hpp>
#include <graph/types.hpp>
#include <store/graph_store.hpp>
#include <Eigen/Geometry>
#include <optional>
#include <unordered_map>
#include <vector>

namespace Arbor {

/**
 * @brief Immutable in-memory copy of the node table for the request path
 */
class ARBOR_API NodeCatalog {
public:
    NodeCatalog() = default;
    explicit NodeCatalog(std::vector<Node> nodes);

    static NodeCatalog load(const GraphStore& store);

    size_t size() const { return nodes_.size(); }
    bool empty() const { return nodes_.empty(); }

    const std::vector<Node>& nodes() const { return nodes_; }
    const Node& at(uint32_t position) const { return nodes_[position]; }

    const Node* find(NodeId id) const;
    std::optional<uint32_t> position_of(NodeId id) const;

    const Eigen::AlignedBox2d& bounds() const { return bounds_; }

private:
    std::vector<Node> nodes_;
    std::unordered_map<NodeId, uint32_t> index_;
    Eigen::AlignedBox2d bounds_;
};

} // namespace Arbor
