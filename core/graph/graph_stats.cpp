#include "graph/graph_stats.hpp"

#include <algorithm>
#include <iomanip>
#include <limits>
#include <numeric>
#include <sstream>
#include <utility>
#include <vector>

namespace biokg {

GraphStatsReport GraphStats::compute(const Graph& g) {
    GraphStatsReport report;
    report.node_count = g.nodeCount();
    report.edge_count = g.edgeCount();

    size_t total_degree = 0;
    size_t min_degree = std::numeric_limits<size_t>::max();
    size_t max_degree = 0;

    g.forEachNode([&](const Node& n) {
        report.node_types[n.type]++;
        size_t degree = g.degree(n.index);
        total_degree += degree;
        min_degree = std::min(min_degree, degree);
        max_degree = std::max(max_degree, degree);
    });

    g.forEachEdge([&](const Edge& e) {
        report.relations[e.relation]++;
    });

    if (report.node_count > 0) {
        report.min_degree = min_degree;
        report.max_degree = max_degree;
        report.avg_degree = static_cast<double>(total_degree) / report.node_count;
    }
    report.weak_components = weaklyConnectedComponents(g);
    report.strong_components = stronglyConnectedComponents(g);
    return report;
}

size_t GraphStats::weaklyConnectedComponents(const Graph& g) {
    const size_t n = g.nodeCount();
    std::vector<uint64_t> parent(n);
    std::iota(parent.begin(), parent.end(), 0);

    auto find = [&](uint64_t x) {
        while (parent[x] != x) {
            parent[x] = parent[parent[x]];
            x = parent[x];
        }
        return x;
    };

    size_t components = n;
    g.forEachEdge([&](const Edge& e) {
        uint64_t a = find(e.source);
        uint64_t b = find(e.target);
        if (a != b) {
            parent[std::max(a, b)] = std::min(a, b);
            components--;
        }
    });
    return components;
}

size_t GraphStats::stronglyConnectedComponents(const Graph& g) {
    const size_t n = g.nodeCount();
    constexpr uint64_t UNVISITED = std::numeric_limits<uint64_t>::max();

    std::vector<uint64_t> order(n, UNVISITED);
    std::vector<uint64_t> low(n, 0);
    std::vector<bool> on_stack(n, false);
    std::vector<uint64_t> stack;
    uint64_t counter = 0;
    size_t components = 0;

    // Explicit DFS frames: (node, position in its outgoing edge list).
    std::vector<std::pair<uint64_t, size_t>> frames;

    for (uint64_t root = 0; root < n; root++) {
        if (order[root] != UNVISITED) continue;

        frames.emplace_back(root, 0);
        order[root] = low[root] = counter++;
        stack.push_back(root);
        on_stack[root] = true;

        while (!frames.empty()) {
            auto& [v, pos] = frames.back();
            const auto& out = g.outgoingEdges(v);

            if (pos < out.size()) {
                uint64_t w = g.getEdge(out[pos])->target;
                pos++;
                if (order[w] == UNVISITED) {
                    order[w] = low[w] = counter++;
                    stack.push_back(w);
                    on_stack[w] = true;
                    frames.emplace_back(w, 0);
                } else if (on_stack[w]) {
                    low[v] = std::min(low[v], order[w]);
                }
                continue;
            }

            uint64_t finished = v;
            if (low[finished] == order[finished]) {
                uint64_t w;
                do {
                    w = stack.back();
                    stack.pop_back();
                    on_stack[w] = false;
                } while (w != finished);
                components++;
            }
            frames.pop_back();
            if (!frames.empty()) {
                uint64_t parent = frames.back().first;
                low[parent] = std::min(low[parent], low[finished]);
            }
        }
    }
    return components;
}

std::string GraphStats::format(const GraphStatsReport& report) {
    std::ostringstream out;
    out << "Graph size: " << report.node_count << " nodes, " << report.edge_count << " edges\n";
    out << "Node types:\n";
    for (const auto& [type, count] : report.node_types) {
        out << "  - " << type << ": " << count << "\n";
    }
    out << "Relations:\n";
    for (const auto& [relation, count] : report.relations) {
        out << "  - " << relation << ": " << count << "\n";
    }
    out << "Connectivity:\n";
    out << "  - Weakly connected components: " << report.weak_components << "\n";
    out << "  - Strongly connected components: " << report.strong_components << "\n";
    out << "Degree: min " << report.min_degree << ", max " << report.max_degree
        << ", avg " << std::fixed << std::setprecision(2) << report.avg_degree << "\n";
    return out.str();
}

} // namespace biokg
