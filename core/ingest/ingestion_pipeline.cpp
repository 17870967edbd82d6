#include "ingest/ingestion_pipeline.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"
#include "common/text.hpp"

namespace biokg {

// ─── Node table ────────────────────────────────────────────────

IngestReport IngestionPipeline::loadNodes(const Table& table, const std::string& label) {
    const size_t id_col = table.requireColumn({"node_index", "id"}, "node id");
    const size_t type_col = table.requireColumn({"node_type", "type"}, "node type");
    const auto name_col = table.findColumn({"node_name", "name"});
    const auto source_col = table.findColumn({"node_source", "source"});
    const auto accession_col = table.findColumn({"node_id"});

    IngestReport report;
    report.table = label;
    graph_.reserve(graph_.nodeCount() + table.rowCount(), graph_.edgeCount());

    for (size_t r = 0; r < table.rowCount(); r++) {
        report.rows++;
        if (table.malformed(r)) {
            report.parse_errors++;
            BIOKG_LOG_DEBUG(label + " row " + std::to_string(r + 1) + ": malformed quoting");
            continue;
        }
        const std::string id_text = trim(table.cellOrEmpty(r, id_col));
        const std::string type = trim(table.cellOrEmpty(r, type_col));
        if (id_text.empty() || type.empty()) {
            report.missing_fields++;
            BIOKG_LOG_DEBUG(label + " row " + std::to_string(r + 1) + ": missing id or type");
            continue;
        }

        int64_t id = 0;
        try {
            id = parseIdentifier(id_text);
        } catch (const ParseError& e) {
            report.parse_errors++;
            BIOKG_LOG_DEBUG(label + " row " + std::to_string(r + 1) + ": " + e.what());
            continue;
        }

        if (graph_.hasNode(type, id)) {
            report.duplicates++;
            continue;
        }
        graph_.addNode(id, type,
                       name_col ? table.cellOrEmpty(r, *name_col) : std::string(),
                       source_col ? table.cellOrEmpty(r, *source_col) : std::string(),
                       accession_col ? table.cellOrEmpty(r, *accession_col) : std::string());
        report.inserted++;
    }

    BIOKG_LOG_INFO(report.summary());
    return report;
}

// ─── Edge table ────────────────────────────────────────────────

IngestReport IngestionPipeline::loadEdges(const Table& table, const std::string& label) {
    const size_t source_col = table.requireColumn({"x_index", "source"}, "edge source");
    const size_t target_col = table.requireColumn({"y_index", "target"}, "edge target");
    const size_t relation_col = table.requireColumn({"relation"}, "relation");
    const auto display_col = table.findColumn({"display_relation"});

    IngestReport report;
    report.table = label;
    graph_.reserve(graph_.nodeCount(), graph_.edgeCount() + table.rowCount());

    for (size_t r = 0; r < table.rowCount(); r++) {
        report.rows++;
        if (table.malformed(r)) {
            report.parse_errors++;
            BIOKG_LOG_DEBUG(label + " row " + std::to_string(r + 1) + ": malformed quoting");
            continue;
        }
        int64_t source_id = 0;
        int64_t target_id = 0;
        std::string relation;
        try {
            source_id = table.integer(r, source_col);
            target_id = table.integer(r, target_col);
            relation = trim(table.cell(r, relation_col));
        } catch (const ParseError& e) {
            report.parse_errors++;
            BIOKG_LOG_DEBUG(label + " row " + std::to_string(r + 1) + ": " + e.what());
            continue;
        }
        if (relation.empty()) {
            report.missing_fields++;
            continue;
        }

        auto source = graph_.findById(source_id);
        auto target = graph_.findById(target_id);
        if (!source || !target) {
            report.unresolved++;
            BIOKG_LOG_DEBUG(label + " row " + std::to_string(r + 1) + ": unresolved endpoint " +
                            std::to_string(source ? target_id : source_id));
            continue;
        }

        std::string display = display_col ? trim(table.cellOrEmpty(r, *display_col)) : std::string();
        if (display.empty()) display = relation;

        if (graph_.addEdge(*source, *target, relation, display)) {
            report.inserted++;
        } else {
            report.duplicates++;
        }
    }

    BIOKG_LOG_INFO(report.summary());
    return report;
}

// ─── Feature tables ────────────────────────────────────────────

IngestReport IngestionPipeline::loadFeatures(const Table& table, const std::string& node_type,
                                             const std::string& label) {
    if (table.columnCount() == 0) {
        throw SchemaError(label + ": feature table has no id column");
    }
    const size_t id_col = 0;

    IngestReport report;
    report.table = label;

    for (size_t r = 0; r < table.rowCount(); r++) {
        report.rows++;
        if (table.malformed(r)) {
            report.parse_errors++;
            BIOKG_LOG_DEBUG(label + " row " + std::to_string(r + 1) + ": malformed quoting");
            continue;
        }
        int64_t id = 0;
        try {
            id = table.integer(r, id_col);
        } catch (const ParseError& e) {
            report.parse_errors++;
            BIOKG_LOG_DEBUG(label + " row " + std::to_string(r + 1) + ": " + e.what());
            continue;
        }

        // Prefer the node of the target type; fall back to the first node
        // with this id so a mismatch is reported as such.
        auto index = graph_.findByTypeAndId(node_type, id);
        if (!index) {
            if (graph_.findById(id)) {
                report.type_mismatches++;
            } else {
                report.unresolved++;
            }
            continue;
        }

        const auto& fields = table.row(r);
        for (size_t c = 0; c < table.columnCount() && c < fields.size(); c++) {
            if (c == id_col || fields[c].empty()) continue;
            graph_.setAttribute(*index, table.header()[c], fields[c]);
            report.attributes_set++;
        }
        report.inserted++;
    }

    BIOKG_LOG_INFO(report.summary());
    return report;
}

// ─── File entry points ─────────────────────────────────────────

IngestReport IngestionPipeline::loadNodesFile(const std::string& path, char delimiter) {
    return loadNodes(Table::readFile(path, delimiter), path);
}

IngestReport IngestionPipeline::loadEdgesFile(const std::string& path, char delimiter) {
    return loadEdges(Table::readFile(path, delimiter), path);
}

IngestReport IngestionPipeline::loadFeaturesFile(const std::string& path, const std::string& node_type,
                                                 char delimiter) {
    return loadFeatures(Table::readFile(path, delimiter), node_type, path);
}

} // namespace biokg
