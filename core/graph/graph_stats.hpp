#pragma once

#include "graph/graph.hpp"

#include <cstddef>
#include <map>
#include <string>

namespace biokg {

/// Health-check summary of a built graph.
struct GraphStatsReport {
    size_t node_count = 0;
    size_t edge_count = 0;
    std::map<std::string, size_t> node_types;   // type → count
    std::map<std::string, size_t> relations;    // relation → count
    size_t weak_components = 0;
    size_t strong_components = 0;
    size_t min_degree = 0;
    size_t max_degree = 0;
    double avg_degree = 0.0;
};

class GraphStats {
public:
    static GraphStatsReport compute(const Graph& g);

    /// Connected components ignoring edge direction (union-find).
    static size_t weaklyConnectedComponents(const Graph& g);

    /// Strongly connected components (iterative Tarjan).
    static size_t stronglyConnectedComponents(const Graph& g);

    /// Multi-line human-readable report.
    static std::string format(const GraphStatsReport& report);
};

} // namespace biokg
