#include "graph/graph.hpp"
#include "common/errors.hpp"
#include "common/text.hpp"

namespace biokg {

// ─── Node operations ───────────────────────────────────────────

uint64_t Graph::addNode(int64_t id, const std::string& type, const std::string& name,
                        const std::string& source, const std::string& accession) {
    auto& ids_for_type = type_id_index_[type];
    auto existing = ids_for_type.find(id);
    if (existing != ids_for_type.end()) {
        return existing->second;
    }

    uint64_t index = nodes_.size();
    nodes_.emplace_back(index, id, type, name, source, accession);
    outgoing_.emplace_back();
    incoming_.emplace_back();

    ids_for_type.emplace(id, index);
    id_index_.emplace(id, index);  // keeps the first node per id
    if (!name.empty()) {
        name_index_.emplace(toLower(name), index);
    }
    return index;
}

bool Graph::hasNode(const std::string& type, int64_t id) const {
    return findByTypeAndId(type, id).has_value();
}

const Node* Graph::getNode(uint64_t index) const {
    return index < nodes_.size() ? &nodes_[index] : nullptr;
}

std::optional<uint64_t> Graph::findById(int64_t id) const {
    auto it = id_index_.find(id);
    if (it == id_index_.end()) return std::nullopt;
    return it->second;
}

std::optional<uint64_t> Graph::findByTypeAndId(const std::string& type, int64_t id) const {
    auto tit = type_id_index_.find(type);
    if (tit == type_id_index_.end()) return std::nullopt;
    auto it = tit->second.find(id);
    if (it == tit->second.end()) return std::nullopt;
    return it->second;
}

std::optional<uint64_t> Graph::findByName(const std::string& name) const {
    auto it = name_index_.find(toLower(name));
    if (it == name_index_.end()) return std::nullopt;
    return it->second;
}

void Graph::setAttribute(uint64_t index, const std::string& key, const std::string& value) {
    requireNode(index);
    nodes_[index].attributes[key] = value;
}

// ─── Edge operations ───────────────────────────────────────────

bool Graph::addEdge(uint64_t source, uint64_t target,
                    const std::string& relation, const std::string& display_relation) {
    requireNode(source);
    requireNode(target);

    if (!edge_keys_.insert(EdgeKey{source, target, relation}).second) {
        return false;
    }

    uint64_t edge_index = edges_.size();
    edges_.emplace_back(source, target, relation, display_relation);
    outgoing_[source].push_back(edge_index);
    incoming_[target].push_back(edge_index);
    return true;
}

bool Graph::hasEdge(uint64_t source, uint64_t target, const std::string& relation) const {
    return edge_keys_.count(EdgeKey{source, target, relation}) > 0;
}

const Edge* Graph::getEdge(uint64_t edge_index) const {
    return edge_index < edges_.size() ? &edges_[edge_index] : nullptr;
}

// ─── Adjacency queries ────────────────────────────────────────

std::vector<uint64_t> Graph::neighbors(uint64_t index, Direction direction) const {
    requireNode(index);
    const auto& out = outgoing_[index];
    const auto& in = incoming_[index];

    std::vector<uint64_t> result;
    switch (direction) {
        case Direction::Out:
            result.reserve(out.size());
            for (uint64_t eid : out) result.push_back(edges_[eid].target);
            break;
        case Direction::In:
            result.reserve(in.size());
            for (uint64_t eid : in) result.push_back(edges_[eid].source);
            break;
        case Direction::Both: {
            // Both lists are ascending in edge index; merge them so the
            // result follows global edge-insertion order.
            result.reserve(out.size() + in.size());
            size_t i = 0;
            size_t j = 0;
            while (i < out.size() || j < in.size()) {
                if (j == in.size() || (i < out.size() && out[i] <= in[j])) {
                    result.push_back(edges_[out[i++]].target);
                } else {
                    result.push_back(edges_[in[j++]].source);
                }
            }
            break;
        }
    }
    return result;
}

const std::vector<uint64_t>& Graph::outgoingEdges(uint64_t index) const {
    requireNode(index);
    return outgoing_[index];
}

const std::vector<uint64_t>& Graph::incomingEdges(uint64_t index) const {
    requireNode(index);
    return incoming_[index];
}

size_t Graph::degree(uint64_t index) const {
    requireNode(index);
    return outgoing_[index].size() + incoming_[index].size();
}

// ─── Iteration ─────────────────────────────────────────────────

void Graph::forEachNode(const std::function<void(const Node&)>& fn) const {
    for (const auto& node : nodes_) {
        fn(node);
    }
}

void Graph::forEachEdge(const std::function<void(const Edge&)>& fn) const {
    for (const auto& edge : edges_) {
        fn(edge);
    }
}

void Graph::reserve(size_t node_capacity, size_t edge_capacity) {
    nodes_.reserve(node_capacity);
    outgoing_.reserve(node_capacity);
    incoming_.reserve(node_capacity);
    edges_.reserve(edge_capacity);
    edge_keys_.reserve(edge_capacity);
}

void Graph::requireNode(uint64_t index) const {
    if (index >= nodes_.size()) {
        throw UnknownNodeError(index);
    }
}

} // namespace biokg
