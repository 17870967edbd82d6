#pragma once

#include "graph/graph.hpp"
#include "io/table_reader.hpp"

#include <cstddef>
#include <string>
#include <utility>

namespace biokg {

/// Column layout and relation tags for a cluster-assignment table.
/// Defaults match the PrimeKG BERT disease grouping export.
struct ClusterTableOptions {
    std::string id_column = "node_id";
    std::string members_column = "group_id_bert";
    std::string label_column = "group_name_bert";
    std::string member_delimiter = "_";

    std::string relation = "bert_group";
    std::string display_relation = "BERT similarity";
    std::string label_relation = "bert_related";
    std::string label_display_relation = "BERT cluster approx";
};

struct LinkReport {
    size_t rows = 0;                  // rows considered
    size_t edges_added = 0;
    size_t duplicates = 0;            // edge already present
    size_t self_references = 0;       // member equal to the row entity
    size_t unresolved_members = 0;    // member id not in the store
    size_t unresolved_rows = 0;       // row entity not in the store
    size_t parse_errors = 0;          // malformed row or member id
    bool entity_found = true;         // label mode only

    size_t skipped() const { return unresolved_members + unresolved_rows + parse_errors; }
    std::string summary() const;
};

/// Synthesizes similarity edges from cluster assignments.
/// Relies on the Graph's duplicate suppression, so repeated runs add
/// nothing new.
class ClusterLinker {
public:
    explicit ClusterLinker(Graph& graph, ClusterTableOptions options = {})
        : graph_(graph), options_(std::move(options)) {}

    /// Link every row entity to each of its listed co-members.
    LinkReport linkClusters(const Table& table);

    /// Link the entity named `entity_name` to the row entity of every row
    /// whose group label contains `label_substring` (case-insensitive).
    LinkReport linkByLabel(const Table& table, const std::string& entity_name,
                           const std::string& label_substring);

    const ClusterTableOptions& options() const { return options_; }

private:
    // Adds source → member and updates the counters.
    void linkOne(uint64_t source, int64_t source_id, int64_t member_id,
                 const std::string& relation, const std::string& display,
                 LinkReport& report);

    Graph& graph_;
    ClusterTableOptions options_;
};

} // namespace biokg
