#pragma once

#include "graph/graph.hpp"
#include "ingest/ingest_report.hpp"
#include "io/table_reader.hpp"

#include <string>

namespace biokg {

/// Populates a Graph from node, edge and per-type feature tables.
///
/// Loads are independent: a failed edge load leaves the nodes already
/// inserted in place. Malformed or dangling rows are skipped and counted
/// in the returned report; only a missing required column (SchemaError) or
/// an unreadable file (TableError) aborts a load.
///
/// Re-running any load against the same store leaves it unchanged.
class IngestionPipeline {
public:
    explicit IngestionPipeline(Graph& graph) : graph_(graph) {}

    /// Columns: node_index|id, node_type|type, and optionally
    /// node_name|name, node_source|source, node_id (accession).
    IngestReport loadNodes(const Table& table, const std::string& label = "nodes");

    /// Columns: x_index|source, y_index|target, relation, and optionally
    /// display_relation (defaults to the relation).
    IngestReport loadEdges(const Table& table, const std::string& label = "edges");

    /// First column is the node id; every other column becomes an attribute
    /// on nodes whose type is `node_type`.
    IngestReport loadFeatures(const Table& table, const std::string& node_type,
                              const std::string& label = "features");

    IngestReport loadNodesFile(const std::string& path, char delimiter = ',');
    IngestReport loadEdgesFile(const std::string& path, char delimiter = ',');
    IngestReport loadFeaturesFile(const std::string& path, const std::string& node_type,
                                  char delimiter = ',');

private:
    Graph& graph_;
};

} // namespace biokg
