#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <utility>

namespace biokg {

/// A directed, relation-typed edge between two node indices.
/// Identity is (source, target, relation); parallel edges with other
/// relations between the same pair are distinct.
struct Edge {
    uint64_t source = 0;
    uint64_t target = 0;
    std::string relation;
    std::string display_relation;

    Edge() = default;
    Edge(uint64_t source, uint64_t target, std::string relation, std::string display_relation)
        : source(source), target(target),
          relation(std::move(relation)), display_relation(std::move(display_relation)) {}
};

/// Identity triple used for duplicate suppression.
struct EdgeKey {
    uint64_t source;
    uint64_t target;
    std::string relation;

    bool operator==(const EdgeKey& other) const {
        return source == other.source && target == other.target &&
               relation == other.relation;
    }
};

struct EdgeKeyHash {
    size_t operator()(const EdgeKey& key) const {
        size_t h = std::hash<uint64_t>()(key.source);
        h ^= std::hash<uint64_t>()(key.target) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        h ^= std::hash<std::string>()(key.relation) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        return h;
    }
};

} // namespace biokg
