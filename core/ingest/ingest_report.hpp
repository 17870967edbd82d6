#pragma once

#include <cstddef>
#include <sstream>
#include <string>

namespace biokg {

/// Outcome counters for one bulk table load.
/// Per-row failures are only ever reported here, never raised.
struct IngestReport {
    std::string table;
    size_t rows = 0;
    size_t inserted = 0;          // nodes added, edges added, or nodes enriched
    size_t duplicates = 0;        // rows that matched existing nodes/edges
    size_t attributes_set = 0;    // feature tables only
    size_t missing_fields = 0;    // required cell empty
    size_t parse_errors = 0;      // malformed cell or short row
    size_t unresolved = 0;        // id not present in the store
    size_t type_mismatches = 0;   // feature row targeting a node of another type

    size_t skipped() const {
        return missing_fields + parse_errors + unresolved + type_mismatches;
    }

    std::string summary() const {
        std::ostringstream out;
        out << table << ": " << rows << " rows, " << inserted << " inserted, "
            << duplicates << " duplicate, " << skipped() << " skipped";
        if (skipped() > 0) {
            out << " (missing=" << missing_fields << " malformed=" << parse_errors
                << " unresolved=" << unresolved << " type_mismatch=" << type_mismatches << ")";
        }
        if (attributes_set > 0) {
            out << ", " << attributes_set << " attributes set";
        }
        return out.str();
    }
};

} // namespace biokg
