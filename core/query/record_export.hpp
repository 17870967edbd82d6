#pragma once

#include "graph/graph.hpp"
#include "query/query_engine.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace biokg {

/// One flattened edge, ready for a table or a plotting front end.
struct EdgeRecord {
    int64_t source_id = 0;
    std::string source_name;
    std::string source_type;
    int64_t target_id = 0;
    std::string target_name;
    std::string target_type;
    std::string relation;
};

std::vector<EdgeRecord> toEdgeRecords(const Graph& graph, const Subgraph& subgraph);

/// Write records as CSV with a header row. Throws TableError on I/O failure.
void writeEdgeRecordsCsv(const std::string& path, const std::vector<EdgeRecord>& records);

/// Quote a CSV field when it contains a delimiter, quote or line break.
std::string csvEscape(const std::string& field);

} // namespace biokg
