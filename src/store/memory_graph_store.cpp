#include <store/memory_graph_store.hpp>
#include <algorithm>
#include <mutex>
#include <unordered_set>

namespace Arbor {

MemoryGraphStore::MemoryGraphStore(std::vector<Node> nodes, std::vector<CitationEdge> edges)
    : nodes_(std::move(nodes)), edges_(std::move(edges)) {}

std::vector<Node> MemoryGraphStore::load_nodes() const {
    std::shared_lock lock(mutex_);
    ++read_calls_;
    return nodes_;
}

std::vector<CitationEdge> MemoryGraphStore::load_edges() const {
    std::shared_lock lock(mutex_);
    ++read_calls_;
    return edges_;
}

void MemoryGraphStore::replace_decomposition(const std::vector<CitationEdge>& tree_edges,
                                             const std::vector<ExtraEdge>& extra_edges) {
    std::unique_lock lock(mutex_);
    tree_edges_ = tree_edges;
    extra_edges_ = extra_edges;
}

void MemoryGraphStore::write_levels(const LevelMap& levels) {
    std::unique_lock lock(mutex_);
    for (auto& node : nodes_) {
        auto it = levels.find(node.id);
        node.topo_level = (it != levels.end()) ? it->second : 0;
    }
}

std::vector<CitationEdge> MemoryGraphStore::tree_edges_touching(std::span<const NodeId> ids) const {
    std::unordered_set<NodeId> wanted(ids.begin(), ids.end());

    std::shared_lock lock(mutex_);
    ++read_calls_;
    std::vector<CitationEdge> out;
    for (const auto& e : tree_edges_) {
        if (wanted.count(e.src) || wanted.count(e.dst)) {
            out.push_back(e);
        }
    }
    return out;
}

std::vector<ExtraEdge> MemoryGraphStore::extra_edges_touching(std::span<const NodeId> ids, size_t max_edges) const {
    std::unordered_set<NodeId> wanted(ids.begin(), ids.end());

    std::vector<ExtraEdge> out;
    {
        std::shared_lock lock(mutex_);
        ++read_calls_;
        for (const auto& e : extra_edges_) {
            if (wanted.count(e.src) || wanted.count(e.dst)) {
                out.push_back(e);
            }
        }
    }

    std::sort(out.begin(), out.end(), [](const ExtraEdge& a, const ExtraEdge& b) {
        if (a.priority != b.priority) return a.priority > b.priority;
        if (a.src != b.src) return a.src < b.src;
        return a.dst < b.dst;
    });
    if (out.size() > max_edges) {
        out.resize(max_edges);
    }
    return out;
}

std::vector<Node> MemoryGraphStore::nodes_at_level(int32_t level, size_t limit) const {
    std::vector<Node> out;
    {
        std::shared_lock lock(mutex_);
        ++read_calls_;
        for (const auto& n : nodes_) {
            if (n.topo_level == level) {
                out.push_back(n);
            }
        }
    }

    std::sort(out.begin(), out.end(), [](const Node& a, const Node& b) {
        if (a.degree != b.degree) return a.degree > b.degree;
        return a.id < b.id;
    });
    if (out.size() > limit) {
        out.resize(limit);
    }
    return out;
}

std::string MemoryGraphStore::describe() const {
    std::shared_lock lock(mutex_);
    return "memory store (" + std::to_string(nodes_.size()) + " nodes, " +
           std::to_string(edges_.size()) + " edges)";
}

void MemoryGraphStore::add_node(const Node& node) {
    std::unique_lock lock(mutex_);
    nodes_.push_back(node);
}

void MemoryGraphStore::add_edge(const CitationEdge& edge) {
    std::unique_lock lock(mutex_);
    edges_.push_back(edge);
}

std::vector<CitationEdge> MemoryGraphStore::tree_edges() const {
    std::shared_lock lock(mutex_);
    return tree_edges_;
}

std::vector<ExtraEdge> MemoryGraphStore::extra_edges() const {
    std::shared_lock lock(mutex_);
    return extra_edges_;
}

size_t MemoryGraphStore::read_calls() const {
    return read_calls_.load();
}

} // namespace Arbor
