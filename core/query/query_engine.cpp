#include "query/query_engine.hpp"

#include <algorithm>
#include <queue>
#include <unordered_map>
#include <unordered_set>

namespace biokg {

std::optional<uint64_t> QueryEngine::resolve(const std::string& name) const {
    return graph_.findByName(name);
}

std::vector<uint64_t> QueryEngine::neighborsOfType(uint64_t index, const std::string& node_type) const {
    std::vector<uint64_t> result;
    for (uint64_t n : graph_.neighbors(index, Direction::Both)) {
        if (graph_.getNode(n)->type == node_type) {
            result.push_back(n);
        }
    }
    return result;
}

std::optional<std::vector<std::string>> QueryEngine::typedNeighbors(
    const std::string& entity_name, const std::string& node_type) const {
    auto entity = resolve(entity_name);
    if (!entity) return std::nullopt;

    std::vector<std::string> names;
    for (uint64_t n : neighborsOfType(*entity, node_type)) {
        names.push_back(graph_.getNode(n)->name);
    }
    return names;
}

// ─── Shortest path ────────────────────────────────────────────

std::optional<std::vector<uint64_t>> QueryEngine::shortestPath(
    const std::string& name_a, const std::string& name_b) const {
    auto from = resolve(name_a);
    auto to = resolve(name_b);
    if (!from || !to) return std::nullopt;
    return shortestPath(*from, *to);
}

std::optional<std::vector<uint64_t>> QueryEngine::shortestPath(uint64_t from, uint64_t to) const {
    if (!graph_.containsIndex(from) || !graph_.containsIndex(to)) return std::nullopt;
    if (from == to) return std::vector<uint64_t>{from};

    // parent[n] = node from which n was first discovered
    std::unordered_map<uint64_t, uint64_t> parent;
    parent.emplace(from, from);
    std::queue<uint64_t> frontier;
    frontier.push(from);

    bool found = false;
    while (!frontier.empty() && !found) {
        uint64_t current = frontier.front();
        frontier.pop();
        for (uint64_t next : graph_.neighbors(current, Direction::Both)) {
            if (!parent.emplace(next, current).second) continue;
            if (next == to) {
                found = true;
                break;
            }
            frontier.push(next);
        }
    }
    if (!found) return std::nullopt;

    std::vector<uint64_t> path;
    for (uint64_t n = to; n != from; n = parent.at(n)) {
        path.push_back(n);
    }
    path.push_back(from);
    std::reverse(path.begin(), path.end());
    return path;
}

// ─── Subgraph extraction ──────────────────────────────────────

Subgraph QueryEngine::inducedSubgraph(const std::vector<uint64_t>& indices) const {
    Subgraph sub;
    std::unordered_set<uint64_t> members;
    for (uint64_t idx : indices) {
        if (!graph_.containsIndex(idx)) continue;
        if (members.insert(idx).second) {
            sub.nodes.push_back(idx);
        }
    }

    std::vector<uint64_t> edge_ids;
    for (uint64_t idx : sub.nodes) {
        for (uint64_t eid : graph_.outgoingEdges(idx)) {
            if (members.count(graph_.getEdge(eid)->target)) {
                edge_ids.push_back(eid);
            }
        }
    }
    std::sort(edge_ids.begin(), edge_ids.end());
    sub.edges.reserve(edge_ids.size());
    for (uint64_t eid : edge_ids) {
        sub.edges.push_back(*graph_.getEdge(eid));
    }
    return sub;
}

Subgraph QueryEngine::subgraph(const std::vector<std::string>& names) const {
    std::vector<uint64_t> indices;
    for (const auto& name : names) {
        auto idx = resolve(name);
        if (idx) indices.push_back(*idx);
    }
    return inducedSubgraph(indices);
}

std::optional<Subgraph> QueryEngine::neighborhood(const std::string& entity_name) const {
    auto entity = resolve(entity_name);
    if (!entity) return std::nullopt;

    std::vector<uint64_t> indices{*entity};
    auto neighbors = graph_.neighbors(*entity, Direction::Both);
    indices.insert(indices.end(), neighbors.begin(), neighbors.end());
    return inducedSubgraph(indices);
}

// ─── Two-hop join ─────────────────────────────────────────────

std::optional<std::set<std::string>> QueryEngine::sharedSecondOrder(
    const std::string& entity_name, const std::string& bridge_type,
    const std::string& target_type) const {
    auto entity = resolve(entity_name);
    if (!entity) return std::nullopt;

    std::set<std::string> shared;
    std::unordered_set<uint64_t> seen_bridges;
    for (uint64_t bridge : neighborsOfType(*entity, bridge_type)) {
        if (!seen_bridges.insert(bridge).second) continue;
        for (uint64_t candidate : neighborsOfType(bridge, target_type)) {
            if (candidate == *entity) continue;
            shared.insert(graph_.getNode(candidate)->name);
        }
    }
    return shared;
}

std::vector<std::string> QueryEngine::pathNames(const std::vector<uint64_t>& path) const {
    std::vector<std::string> names;
    names.reserve(path.size());
    for (uint64_t idx : path) {
        const Node* n = graph_.getNode(idx);
        names.push_back(n ? n->name : std::to_string(idx));
    }
    return names;
}

} // namespace biokg
