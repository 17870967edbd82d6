#pragma once

#include "graph/graph.hpp"

#include <cstdint>
#include <string>

namespace biokg {

/// Binary snapshot of a fully built Graph.
///
/// Layout (host byte order, no cross-build compatibility promised):
///   "BKGS" | u32 version | u64 node_count | u64 edge_count
///   nodes in index order: i64 id, str type, str name, str source,
///                         str accession, u32 n_attrs, (str key, str value)*
///   edges in insertion order: u64 source, u64 target, str relation,
///                             str display_relation
///   u32 crc32 of everything above
/// Strings are u32 length-prefixed. Adjacency is rebuilt by replaying the
/// edges in order, which reproduces neighbor order exactly.
class GraphSnapshot {
public:
    static constexpr uint32_t FORMAT_VERSION = 1;

    static std::string save(const Graph& graph);

    /// Throws SnapshotError on a truncated, corrupt or foreign buffer.
    static Graph load(const std::string& bytes);

    /// Writes `path`.tmp and renames it over `path`; an existing snapshot is
    /// left untouched on failure. Throws SnapshotError.
    static void saveToFile(const Graph& graph, const std::string& path);
    /// Throws SnapshotError if the file cannot be read or is corrupt.
    static Graph loadFromFile(const std::string& path);
};

} // namespace biokg
