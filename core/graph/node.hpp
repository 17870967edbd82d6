#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>

namespace biokg {

/// A typed entity in the knowledge graph (gene, drug, disease, ...).
/// Core fields are always present; feature values live in `attributes`
/// and never shadow the core fields.
struct Node {
    uint64_t index = 0;       // dense internal position, the primary key
    int64_t id = 0;           // external identifier from the source dataset
    std::string type;
    std::string name;
    std::string source;
    std::string accession;    // source database accession, may be empty
    std::unordered_map<std::string, std::string> attributes;

    Node() = default;
    Node(uint64_t index, int64_t id, std::string type, std::string name,
         std::string source, std::string accession = "")
        : index(index), id(id), type(std::move(type)), name(std::move(name)),
          source(std::move(source)), accession(std::move(accession)) {}

    std::string getAttribute(const std::string& key, const std::string& default_val = "") const {
        auto it = attributes.find(key);
        return it != attributes.end() ? it->second : default_val;
    }

    bool hasAttribute(const std::string& key) const {
        return attributes.count(key) > 0;
    }
};

} // namespace biokg
