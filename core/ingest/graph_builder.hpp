#pragma once

#include "common/config.hpp"
#include "graph/graph.hpp"
#include "ingest/cluster_linker.hpp"
#include "ingest/ingest_report.hpp"

#include <optional>
#include <vector>

namespace biokg {

struct BuildResult {
    Graph graph;
    IngestReport nodes;
    IngestReport edges;
    std::vector<IngestReport> features;
    std::optional<LinkReport> clusters;
};

/// Runs the full build described by a Config: nodes, base edges, feature
/// tables, then cluster links. A missing node or edge table is fatal
/// (TableError/SchemaError); a failing feature or cluster table is logged
/// and skipped so the graph built so far stays usable.
BuildResult buildFromConfig(const Config& config);

} // namespace biokg
