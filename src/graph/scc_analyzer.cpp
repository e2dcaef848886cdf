#include <graph/scc_analyzer.hpp>
#include <graph/adjacency.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <algorithm>
#include <functional>
#include <iomanip>
#include <limits>
#include <map>
#include <sstream>

namespace Arbor {

namespace {
constexpr uint32_t UNVISITED = std::numeric_limits<uint32_t>::max();
}

ComponentLabels strongly_connected_components(size_t n, std::span<const IndexedEdge> edges) {
    Adjacency out = Adjacency::outgoing(n, edges);

    ComponentLabels labels;
    labels.component_of.assign(n, UNVISITED);

    std::vector<uint32_t> index(n, UNVISITED);
    std::vector<uint32_t> low(n, 0);
    std::vector<char> on_stack(n, 0);
    std::vector<uint32_t> stack;

    struct Frame {
        uint32_t node;
        size_t next;
    };
    std::vector<Frame> call;

    uint32_t counter = 0;

    for (uint32_t root = 0; root < n; ++root) {
        if (index[root] != UNVISITED) continue;

        index[root] = low[root] = counter++;
        stack.push_back(root);
        on_stack[root] = 1;
        call.push_back({root, 0});

        while (!call.empty()) {
            const uint32_t v = call.back().node;
            auto succ = out[v];

            if (call.back().next < succ.size()) {
                const uint32_t w = edges[succ[call.back().next++]].to;
                if (index[w] == UNVISITED) {
                    index[w] = low[w] = counter++;
                    stack.push_back(w);
                    on_stack[w] = 1;
                    call.push_back({w, 0});
                } else if (on_stack[w]) {
                    low[v] = std::min(low[v], index[w]);
                }
                continue;
            }

            call.pop_back();
            if (!call.empty()) {
                const uint32_t parent = call.back().node;
                low[parent] = std::min(low[parent], low[v]);
            }

            if (low[v] == index[v]) {
                uint32_t w;
                do {
                    w = stack.back();
                    stack.pop_back();
                    on_stack[w] = 0;
                    labels.component_of[w] = labels.count;
                } while (w != v);
                ++labels.count;
            }
        }
    }

    return labels;
}

std::vector<uint32_t> SccResult::nontrivial() const {
    std::vector<uint32_t> out;
    for (uint32_t c = 0; c < components.size(); ++c) {
        if (components[c].size() >= 2) out.push_back(c);
    }
    return out;
}

SccResult SccAnalyzer::analyze(const CitationGraph& graph) const {
    Logger::step("Computing strongly connected components");
    Timer timer;

    const size_t n = graph.node_count();
    ComponentLabels labels = strongly_connected_components(n, graph.edges());

    std::vector<std::vector<NodeIndex>> grouped(labels.count);
    for (NodeIndex v = 0; v < n; ++v) {
        grouped[labels.component_of[v]].push_back(v);
    }

    // Members are already in ascending index order, so front() is the smallest
    std::vector<uint32_t> order(labels.count);
    for (uint32_t c = 0; c < labels.count; ++c) order[c] = c;
    std::sort(order.begin(), order.end(), [&](uint32_t a, uint32_t b) {
        if (grouped[a].size() != grouped[b].size()) return grouped[a].size() > grouped[b].size();
        return grouped[a].front() < grouped[b].front();
    });

    SccResult result;
    result.components.reserve(labels.count);
    std::vector<uint32_t> renumber(labels.count);
    for (uint32_t rank = 0; rank < order.size(); ++rank) {
        renumber[order[rank]] = rank;
        result.components.push_back(std::move(grouped[order[rank]]));
    }
    result.component_of.resize(n);
    for (NodeIndex v = 0; v < n; ++v) {
        result.component_of[v] = renumber[labels.component_of[v]];
    }

    SccReport& r = result.report;
    r.node_count = n;
    r.edge_count = graph.edge_count();
    r.component_count = result.components.size();
    r.largest_size = result.components.empty() ? 0 : result.components.front().size();

    std::map<size_t, size_t, std::greater<>> by_size;
    for (const auto& comp : result.components) {
        if (comp.size() == 1) {
            ++r.singleton_count;
        } else {
            ++r.nontrivial_count;
            r.nodes_in_nontrivial += comp.size();
        }
        ++by_size[comp.size()];
    }
    for (const auto& e : graph.edges()) {
        const uint32_t c = result.component_of[e.from];
        if (c == result.component_of[e.to] && result.components[c].size() >= 2) {
            ++r.edges_in_nontrivial;
        }
    }
    for (const auto& [size, count] : by_size) {
        if (r.size_histogram.size() >= histogram_entries_) break;
        r.size_histogram.emplace_back(size, count);
    }

    Logger::success("Found " + std::to_string(r.component_count) + " components (" +
                    std::to_string(r.nontrivial_count) + " non-trivial, largest " +
                    std::to_string(r.largest_size) + ") in " + std::to_string(timer.elapsed().count()) + "ms");
    return result;
}

void SccAnalyzer::log_report(const SccReport& report) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2);
    out << "SCC report: " << report.component_count << " components, "
        << report.singleton_count << " singletons, "
        << report.nontrivial_count << " non-trivial; "
        << report.nodes_in_nontrivial << " nodes (" << report.nontrivial_node_pct() << "%) and "
        << report.edges_in_nontrivial << " edges (" << report.nontrivial_edge_pct() << "%) inside cycles";
    Logger::info(out.str());

    for (const auto& [size, count] : report.size_histogram) {
        Logger::info("  size " + std::to_string(size) + ": " + std::to_string(count) + " component(s)");
    }
}

} // namespace Arbor
