#include "ingest/cluster_linker.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"
#include "common/text.hpp"

#include <sstream>

namespace biokg {

std::string LinkReport::summary() const {
    std::ostringstream out;
    out << rows << " rows, " << edges_added << " edges added, " << duplicates
        << " duplicate, " << self_references << " self-references, " << skipped()
        << " skipped (unresolved_members=" << unresolved_members
        << " unresolved_rows=" << unresolved_rows << " malformed=" << parse_errors << ")";
    return out.str();
}

void ClusterLinker::linkOne(uint64_t source, int64_t source_id, int64_t member_id,
                            const std::string& relation, const std::string& display,
                            LinkReport& report) {
    if (member_id == source_id) {
        report.self_references++;
        return;
    }
    auto target = graph_.findById(member_id);
    if (!target) {
        report.unresolved_members++;
        return;
    }
    if (graph_.addEdge(source, *target, relation, display)) {
        report.edges_added++;
    } else {
        report.duplicates++;
    }
}

LinkReport ClusterLinker::linkClusters(const Table& table) {
    const size_t id_col = table.requireColumn({options_.id_column.c_str()}, "cluster entity id");
    const size_t members_col = table.requireColumn({options_.members_column.c_str()}, "cluster members");

    LinkReport report;
    for (size_t r = 0; r < table.rowCount(); r++) {
        report.rows++;
        if (table.malformed(r)) {
            report.parse_errors++;
            BIOKG_LOG_DEBUG("cluster row " + std::to_string(r + 1) + ": malformed quoting");
            continue;
        }
        int64_t entity_id = 0;
        std::string members;
        try {
            entity_id = table.integer(r, id_col);
            members = table.cell(r, members_col);
        } catch (const ParseError& e) {
            report.parse_errors++;
            BIOKG_LOG_DEBUG("cluster row " + std::to_string(r + 1) + ": " + e.what());
            continue;
        }

        auto source = graph_.findById(entity_id);
        if (!source) {
            report.unresolved_rows++;
            continue;
        }

        for (const auto& piece : split(members, options_.member_delimiter)) {
            if (trim(piece).empty()) continue;
            int64_t member_id = 0;
            try {
                member_id = parseIdentifier(piece);
            } catch (const ParseError& e) {
                report.parse_errors++;
                BIOKG_LOG_DEBUG("cluster row " + std::to_string(r + 1) + ": " + e.what());
                continue;
            }
            linkOne(*source, entity_id, member_id, options_.relation, options_.display_relation, report);
        }
    }

    BIOKG_LOG_INFO("Cluster links (" + options_.relation + "): " + report.summary());
    return report;
}

LinkReport ClusterLinker::linkByLabel(const Table& table, const std::string& entity_name,
                                      const std::string& label_substring) {
    const size_t id_col = table.requireColumn({options_.id_column.c_str()}, "cluster entity id");
    const size_t label_col = table.requireColumn({options_.label_column.c_str()}, "cluster label");

    LinkReport report;
    auto entity = graph_.findByName(entity_name);
    if (!entity) {
        report.entity_found = false;
        BIOKG_LOG_WARNING("Label linking: entity '" + entity_name + "' not found");
        return report;
    }
    const int64_t entity_id = graph_.getNode(*entity)->id;

    for (size_t r = 0; r < table.rowCount(); r++) {
        if (table.malformed(r)) {
            report.parse_errors++;
            BIOKG_LOG_DEBUG("cluster row " + std::to_string(r + 1) + ": malformed quoting");
            continue;
        }
        if (!containsIgnoreCase(table.cellOrEmpty(r, label_col), label_substring)) continue;
        report.rows++;

        int64_t member_id = 0;
        try {
            member_id = table.integer(r, id_col);
        } catch (const ParseError& e) {
            report.parse_errors++;
            BIOKG_LOG_DEBUG("cluster row " + std::to_string(r + 1) + ": " + e.what());
            continue;
        }
        linkOne(*entity, entity_id, member_id, options_.label_relation,
                options_.label_display_relation, report);
    }

    BIOKG_LOG_INFO("Label links '" + entity_name + "' ~ '" + label_substring + "' (" +
                   options_.label_relation + "): " + report.summary());
    return report;
}

} // namespace biokg
