#pragma once

#include "graph/graph.hpp"

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace biokg {

/// Node set plus the store edges induced by it, in store order.
struct Subgraph {
    std::vector<uint64_t> nodes;
    std::vector<Edge> edges;

    bool empty() const { return nodes.empty(); }
};

/// Read-only queries over a built Graph.
///
/// Unresolved names and unreachable targets come back as std::nullopt,
/// never as exceptions. The engine only calls const Graph members, so any
/// number of engines may query one finished graph concurrently.
class QueryEngine {
public:
    explicit QueryEngine(const Graph& graph) : graph_(graph) {}

    /// First node in insertion order whose name matches case-insensitively.
    std::optional<uint64_t> resolve(const std::string& name) const;

    /// Names of neighbors (either direction) of exactly `node_type`, in
    /// neighbor order. Parallel edges yield repeated names.
    std::optional<std::vector<std::string>> typedNeighbors(const std::string& entity_name,
                                                           const std::string& node_type) const;

    /// Unweighted BFS over the undirected view. Among minimum paths, the one
    /// discovered first in adjacency-insertion order is returned.
    std::optional<std::vector<uint64_t>> shortestPath(const std::string& name_a,
                                                      const std::string& name_b) const;
    std::optional<std::vector<uint64_t>> shortestPath(uint64_t from, uint64_t to) const;

    /// Induced subgraph over the resolvable names; unresolved names are skipped.
    Subgraph subgraph(const std::vector<std::string>& names) const;

    /// Entity → neighbors of `bridge_type` → their neighbors of `target_type`,
    /// excluding the entity itself.
    std::optional<std::set<std::string>> sharedSecondOrder(const std::string& entity_name,
                                                           const std::string& bridge_type,
                                                           const std::string& target_type) const;

    /// The entity, its distinct neighbors, and every edge among them.
    std::optional<Subgraph> neighborhood(const std::string& entity_name) const;

    /// Induced subgraph over explicit node indices (duplicates and unknown
    /// indices dropped).
    Subgraph inducedSubgraph(const std::vector<uint64_t>& indices) const;

    std::vector<std::string> pathNames(const std::vector<uint64_t>& path) const;

    const Graph& graph() const { return graph_; }

private:
    std::vector<uint64_t> neighborsOfType(uint64_t index, const std::string& node_type) const;

    const Graph& graph_;
};

} // namespace biokg
