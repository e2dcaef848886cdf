#include <service/tree_fragment_service.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <algorithm>
#include <charconv>
#include <sstream>
#include <unordered_set>

namespace Arbor {

namespace {

std::string describe_box(const ViewBox& box) {
    std::ostringstream out;
    out << "[" << box.min().x() << "," << box.min().y() << " .. " << box.max().x() << "," << box.max().y() << "]";
    return out.str();
}

bool by_importance(const Node& a, const Node& b) {
    if (a.degree != b.degree) return a.degree > b.degree;
    return a.id < b.id;
}

} // namespace

TreeFragmentService::TreeFragmentService(const GraphStore& store, NodeCatalog catalog, ServiceConfig config,
                                         QueryStats& stats)
    : store_(store),
      catalog_(std::move(catalog)),
      config_(std::move(config)),
      stats_(stats),
      interactive_("interactive", config_.interactive_workers, stats),
      enrichment_("enrichment", config_.enrichment_workers, stats) {
    Logger::step("Building spatial index over " + std::to_string(catalog_.size()) + " nodes");
    Timer timer;

    std::vector<SpatialIndex::Entry> entries;
    entries.reserve(catalog_.size());
    for (uint32_t i = 0; i < catalog_.size(); ++i) {
        entries.push_back({catalog_.at(i).position, i});
    }
    index_.build(entries);

    Logger::success("Spatial index ready (" + std::to_string(index_.size()) + " points, " +
                    std::to_string(timer.elapsed().count()) + "ms)");
}

std::optional<std::unordered_set<int32_t>> TreeFragmentService::parse_cluster_filter(std::string_view text) {
    std::unordered_set<int32_t> clusters;
    bool any_token = false;

    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find(',', start);
        if (end == std::string_view::npos) end = text.size();

        std::string_view token = text.substr(start, end - start);
        while (!token.empty() && token.front() == ' ') token.remove_prefix(1);
        while (!token.empty() && token.back() == ' ') token.remove_suffix(1);

        if (!token.empty()) {
            int32_t value = 0;
            auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
            if (ec != std::errc() || ptr != token.data() + token.size()) {
                Logger::warn("Ignoring malformed cluster filter '" + std::string(text) + "'");
                return std::nullopt;
            }
            clusters.insert(value);
            any_token = true;
        } else if (end != text.size() || start != 0) {
            // An empty entry between commas
            Logger::warn("Ignoring malformed cluster filter '" + std::string(text) + "'");
            return std::nullopt;
        }
        start = end + 1;
    }

    if (!any_token) return std::nullopt;
    return clusters;
}

ViewBox TreeFragmentService::expand(const ViewBox& box) const {
    const Eigen::Vector2d pad = box.sizes() * config_.viewport_margin;
    return ViewBox(box.min() - pad, box.max() + pad);
}

Fragment TreeFragmentService::get_viewport_fragment(const ViewportQuery& query, const CancellationToken* token) {
    Fragment fragment;
    fragment.offset = query.offset;
    fragment.limit = std::clamp(query.limit.value_or(config_.default_page_limit), size_t{1},
                                std::max(config_.max_page_limit, size_t{1}));

    if (query.box.isEmpty()) {
        Logger::warn("Inverted viewport " + describe_box(query.box) + "; returning an empty fragment");
        fragment.query_box = query.box;
        return fragment;
    }

    const ViewBox box = expand(query.box);
    fragment.query_box = box;

    std::vector<uint32_t> candidates = interactive_.run(
        "viewport lookup " + describe_box(box), config_.timeouts.bounds_lookup,
        [this, box] { return index_.query(box); }, token);

    const auto clusters = parse_cluster_filter(query.visible_clusters);

    std::vector<const Node*> matches;
    matches.reserve(candidates.size());
    for (uint32_t pos : candidates) {
        const Node& node = catalog_.at(pos);
        if (node.degree < query.min_degree) continue;
        if (clusters && !clusters->count(node.cluster_id)) continue;
        if (query.max_level && node.topo_level > *query.max_level) continue;
        matches.push_back(&node);
    }

    std::sort(matches.begin(), matches.end(), [](const Node* a, const Node* b) { return by_importance(*a, *b); });

    fragment.total_matches = matches.size();
    const size_t begin = std::min(query.offset, matches.size());
    const size_t end = std::min(begin + fragment.limit, matches.size());
    fragment.has_more = end < matches.size();

    if (begin == end) {
        return fragment;
    }

    fragment.nodes.reserve(end - begin);
    std::vector<NodeId> ids;
    ids.reserve(end - begin);
    for (size_t i = begin; i < end; ++i) {
        fragment.nodes.push_back(*matches[i]);
        ids.push_back(matches[i]->id);
    }

    std::vector<CitationEdge> touching = interactive_.run(
        "tree edges for " + std::to_string(ids.size()) + " nodes", config_.timeouts.edge_batch,
        [this, ids] { return store_.tree_edges_touching(ids); }, token);

    attach_edges(fragment, touching);
    return fragment;
}

void TreeFragmentService::attach_edges(Fragment& fragment, const std::vector<CitationEdge>& touching) const {
    std::unordered_set<NodeId> in_page;
    in_page.reserve(fragment.nodes.size());
    for (const auto& n : fragment.nodes) {
        in_page.insert(n.id);
    }

    for (const auto& e : touching) {
        const bool has_src = in_page.count(e.src) > 0;
        const bool has_dst = in_page.count(e.dst) > 0;
        if (has_src && has_dst) {
            fragment.tree_edges.push_back(e);
        } else if (has_src || has_dst) {
            BrokenEdge broken;
            broken.source_id = e.src;
            broken.target_id = e.dst;
            broken.external_id = has_src ? e.dst : e.src;
            broken.role = has_src ? EdgeRole::Child : EdgeRole::Parent;
            const Node* external = catalog_.find(broken.external_id);
            broken.priority = external ? external->degree : 0;
            fragment.broken_edges.push_back(broken);
        }
    }

    std::sort(fragment.tree_edges.begin(), fragment.tree_edges.end());
    fragment.tree_edges.erase(std::unique(fragment.tree_edges.begin(), fragment.tree_edges.end()),
                              fragment.tree_edges.end());
    std::sort(fragment.broken_edges.begin(), fragment.broken_edges.end(), [](const BrokenEdge& a, const BrokenEdge& b) {
        if (a.priority != b.priority) return a.priority > b.priority;
        if (a.source_id != b.source_id) return a.source_id < b.source_id;
        return a.target_id < b.target_id;
    });
}

TreeFragmentService::WalkResult TreeFragmentService::walk(NodeId start, size_t hops, Walk direction, size_t cap,
                                                          const std::function<bool(NodeId)>& stop) const {
    WalkResult result;
    result.order.push_back(start);
    if (stop && stop(start)) return result;

    std::unordered_set<NodeId> seen{start};
    std::vector<NodeId> frontier{start};

    for (size_t hop = 0; hop < hops && !frontier.empty(); ++hop) {
        std::vector<CitationEdge> edges = store_.tree_edges_touching(frontier);
        std::sort(edges.begin(), edges.end());

        const std::unordered_set<NodeId> current(frontier.begin(), frontier.end());
        std::vector<NodeId> found;
        for (const auto& e : edges) {
            std::pair<NodeId, NodeId> steps[2] = {{e.src, e.dst}, {e.dst, e.src}};
            const size_t ways = direction == Walk::Both ? 2 : 1;
            for (size_t w = 0; w < ways; ++w) {
                const auto [from, to] = steps[w];
                if (!current.count(from) || !seen.insert(to).second) continue;
                result.parent.emplace(to, from);
                found.push_back(to);
            }
        }

        std::sort(found.begin(), found.end(), [this](NodeId a, NodeId b) {
            const Node* na = catalog_.find(a);
            const Node* nb = catalog_.find(b);
            const int32_t da = na ? na->degree : 0;
            const int32_t db = nb ? nb->degree : 0;
            return da != db ? da > db : a < b;
        });

        frontier.clear();
        for (NodeId id : found) {
            if (result.order.size() >= cap) {
                result.truncated = true;
                return result;
            }
            result.order.push_back(id);
            frontier.push_back(id);
            if (stop && stop(id)) return result;
        }
    }
    return result;
}

Fragment TreeFragmentService::node_fragment(const char* what, NodeId start, size_t hops, Walk direction, size_t cap,
                                            const CancellationToken* token) {
    Fragment fragment;
    fragment.limit = std::clamp(cap, size_t{1}, std::max(config_.max_page_limit, size_t{1}));
    fragment.query_box.setEmpty();

    if (!catalog_.find(start)) {
        Logger::warn(std::string(what) + ": unknown node " + std::to_string(start) + "; returning an empty fragment");
        return fragment;
    }

    const size_t limit = fragment.limit;
    return interactive_.run(
        std::string(what) + " " + std::to_string(start) + " (" + std::to_string(hops) + " hops)",
        config_.timeouts.edge_batch,
        [this, fragment, start, hops, direction, limit]() mutable {
            WalkResult walked = walk(start, hops, direction, limit);

            std::vector<NodeId> ids;
            ids.reserve(walked.order.size());
            for (NodeId id : walked.order) {
                if (const Node* node = catalog_.find(id)) {
                    fragment.nodes.push_back(*node);
                    fragment.query_box.extend(node->position);
                    ids.push_back(id);
                }
            }
            fragment.total_matches = fragment.nodes.size();
            fragment.has_more = walked.truncated;

            attach_edges(fragment, store_.tree_edges_touching(ids));
            return fragment;
        },
        token);
}

Fragment TreeFragmentService::get_tree_children(NodeId id, size_t depth, std::optional<size_t> max_nodes,
                                                const CancellationToken* token) {
    return node_fragment("tree children of", id, depth, Walk::Down, max_nodes.value_or(config_.default_page_limit),
                         token);
}

Fragment TreeFragmentService::get_fragment_around_node(NodeId center, size_t radius, size_t max_nodes,
                                                       const CancellationToken* token) {
    return node_fragment("tree fragment around", center, radius, Walk::Both, max_nodes, token);
}

std::vector<NodeId> TreeFragmentService::find_tree_path(NodeId start, const std::vector<NodeId>& targets,
                                                        size_t max_length, const CancellationToken* token) {
    if (targets.empty() || !catalog_.find(start)) {
        return {};
    }

    const std::unordered_set<NodeId> wanted(targets.begin(), targets.end());
    const size_t cap = std::max(config_.max_page_limit, size_t{1});

    return interactive_.run(
        "tree path from " + std::to_string(start) + " to " + std::to_string(wanted.size()) + " targets",
        config_.timeouts.edge_batch,
        [this, start, wanted, max_length, cap] {
            NodeId reached = 0;
            bool found = false;
            WalkResult walked = walk(start, max_length, Walk::Both, cap, [&](NodeId id) {
                if (!wanted.count(id)) return false;
                reached = id;
                found = true;
                return true;
            });

            std::vector<NodeId> path;
            if (!found) return path;
            for (NodeId at = reached;; at = walked.parent.at(at)) {
                path.push_back(at);
                if (at == start) break;
            }
            std::reverse(path.begin(), path.end());
            return path;
        },
        token);
}

ExtraEdgeBatch TreeFragmentService::get_extra_edges_for_nodes(const std::vector<NodeId>& ids,
                                                              std::optional<size_t> max_edges,
                                                              const CancellationToken* token) {
    ExtraEdgeBatch batch;

    std::vector<NodeId> unique_ids;
    unique_ids.reserve(ids.size());
    for (NodeId id : ids) {
        if (batch.enriched.emplace(id, false).second) {
            unique_ids.push_back(id);
        }
    }
    if (unique_ids.empty()) {
        return batch;
    }

    const size_t cap = max_edges.value_or(config_.default_max_extra_edges);
    if (cap == 0) {
        return batch;
    }

    // One row past the cap tells us whether anything was cut off
    batch.extra_edges = enrichment_.run(
        "extra edges for " + std::to_string(unique_ids.size()) + " nodes (max " + std::to_string(cap) + ")",
        config_.timeouts.edge_batch,
        [this, unique_ids, cap] { return store_.extra_edges_touching(unique_ids, cap + 1); }, token);

    if (batch.extra_edges.size() > cap) {
        batch.extra_edges.resize(cap);
        batch.truncated = true;
    }

    for (const auto& e : batch.extra_edges) {
        if (auto it = batch.enriched.find(e.src); it != batch.enriched.end()) it->second = true;
        if (auto it = batch.enriched.find(e.dst); it != batch.enriched.end()) it->second = true;
    }
    return batch;
}

TopologicalOverview TreeFragmentService::get_topological_overview(std::optional<size_t> max_levels,
                                                                  std::optional<size_t> max_nodes_per_level,
                                                                  const CancellationToken* token) {
    const size_t levels = max_levels.value_or(config_.default_overview_levels);
    const size_t per_level = std::min(max_nodes_per_level.value_or(config_.default_overview_nodes_per_level),
                                      config_.max_page_limit);

    return interactive_.run(
        "topological overview (" + std::to_string(levels) + " levels x " + std::to_string(per_level) + ")",
        config_.timeouts.overview,
        [this, levels, per_level] {
            TopologicalOverview overview;
            for (size_t level = 0; level < levels; ++level) {
                auto nodes = store_.nodes_at_level(static_cast<int32_t>(level), per_level);
                if (nodes.empty()) break;
                overview.level_counts.push_back(nodes.size());
                overview.nodes.insert(overview.nodes.end(), nodes.begin(), nodes.end());
            }
            return overview;
        },
        token);
}

bool TreeFragmentService::cancel_query(RequestId id) {
    return interactive_.cancel(id) || enrichment_.cancel(id);
}

size_t TreeFragmentService::cancel_all_queries() {
    const size_t cancelled = interactive_.cancel_all() + enrichment_.cancel_all();
    Logger::warn("Cancelled " + std::to_string(cancelled) + " outstanding requests");
    return cancelled;
}

std::vector<ActiveQuery> TreeFragmentService::active_queries() const {
    auto out = interactive_.active_queries();
    auto more = enrichment_.active_queries();
    out.insert(out.end(), more.begin(), more.end());
    std::sort(out.begin(), out.end(), [](const ActiveQuery& a, const ActiveQuery& b) { return a.id < b.id; });
    return out;
}

DataBounds TreeFragmentService::get_data_bounds() const {
    return {catalog_.bounds(), catalog_.size()};
}

} // namespace Arbor
