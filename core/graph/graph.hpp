#pragma once

#include "graph/node.hpp"
#include "graph/edge.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace biokg {

enum class Direction {
    Out,
    In,
    Both
};

// ─── Graph ─────────────────────────────────────────────────────
// Typed, attributed, directed multigraph.
// Nodes and edges live in insertion-ordered vectors; node index and
// edge index are positions in those vectors and are never reused.
// Per-node adjacency vectors hold edge indices in insertion order.
// Only additive mutation is supported.

class Graph {
public:
    Graph() = default;

    // ── Node operations ──

    /// Insert a node keyed by (type, id). Re-inserting an existing key is a
    /// no-op that returns the index assigned by the first insertion.
    uint64_t addNode(int64_t id, const std::string& type, const std::string& name,
                     const std::string& source, const std::string& accession = "");
    bool hasNode(const std::string& type, int64_t id) const;
    bool containsIndex(uint64_t index) const { return index < nodes_.size(); }
    const Node* getNode(uint64_t index) const;
    size_t nodeCount() const { return nodes_.size(); }

    /// First node (in insertion order) carrying external id `id`.
    std::optional<uint64_t> findById(int64_t id) const;
    std::optional<uint64_t> findByTypeAndId(const std::string& type, int64_t id) const;
    /// First node (in insertion order) whose name matches case-insensitively.
    std::optional<uint64_t> findByName(const std::string& name) const;

    /// Set a feature attribute. Throws UnknownNodeError for a bad index.
    void setAttribute(uint64_t index, const std::string& key, const std::string& value);

    // ── Edge operations ──

    /// Returns false when (source, target, relation) already exists.
    /// Throws UnknownNodeError when either endpoint is absent.
    bool addEdge(uint64_t source, uint64_t target,
                 const std::string& relation, const std::string& display_relation);
    bool hasEdge(uint64_t source, uint64_t target, const std::string& relation) const;
    const Edge* getEdge(uint64_t edge_index) const;
    size_t edgeCount() const { return edges_.size(); }

    // ── Adjacency queries ──

    /// Neighbor node indices in edge-insertion order, multiplicity kept.
    std::vector<uint64_t> neighbors(uint64_t index, Direction direction = Direction::Both) const;
    const std::vector<uint64_t>& outgoingEdges(uint64_t index) const;
    const std::vector<uint64_t>& incomingEdges(uint64_t index) const;
    size_t degree(uint64_t index) const;

    // ── Iteration ──
    void forEachNode(const std::function<void(const Node&)>& fn) const;
    void forEachEdge(const std::function<void(const Edge&)>& fn) const;
    const std::vector<Node>& nodes() const { return nodes_; }
    const std::vector<Edge>& edges() const { return edges_; }

    void reserve(size_t node_capacity, size_t edge_capacity);

private:
    void requireNode(uint64_t index) const;

    std::vector<Node> nodes_;
    std::vector<Edge> edges_;

    // Adjacency lists: node index → edge indices
    std::vector<std::vector<uint64_t>> outgoing_;
    std::vector<std::vector<uint64_t>> incoming_;

    std::unordered_map<std::string, std::unordered_map<int64_t, uint64_t>> type_id_index_;
    std::unordered_map<int64_t, uint64_t> id_index_;          // first node per id
    std::unordered_map<std::string, uint64_t> name_index_;    // lower-cased name → first node
    std::unordered_set<EdgeKey, EdgeKeyHash> edge_keys_;
};

} // namespace biokg
