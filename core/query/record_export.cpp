#include "query/record_export.hpp"
#include "common/errors.hpp"

#include <fstream>

namespace biokg {

std::vector<EdgeRecord> toEdgeRecords(const Graph& graph, const Subgraph& subgraph) {
    std::vector<EdgeRecord> records;
    records.reserve(subgraph.edges.size());
    for (const Edge& e : subgraph.edges) {
        const Node* s = graph.getNode(e.source);
        const Node* t = graph.getNode(e.target);
        if (!s || !t) continue;

        EdgeRecord rec;
        rec.source_id = s->id;
        rec.source_name = s->name;
        rec.source_type = s->type;
        rec.target_id = t->id;
        rec.target_name = t->name;
        rec.target_type = t->type;
        rec.relation = e.relation;
        records.push_back(std::move(rec));
    }
    return records;
}

std::string csvEscape(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
        return field;
    }
    std::string out = "\"";
    for (char c : field) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

void writeEdgeRecordsCsv(const std::string& path, const std::vector<EdgeRecord>& records) {
    std::ofstream out(path);
    if (!out) {
        throw TableError("Cannot open for writing: " + path);
    }
    out << "source_id,source_name,source_type,target_id,target_name,target_type,relation\n";
    for (const auto& r : records) {
        out << r.source_id << ',' << csvEscape(r.source_name) << ',' << csvEscape(r.source_type) << ','
            << r.target_id << ',' << csvEscape(r.target_name) << ',' << csvEscape(r.target_type) << ','
            << csvEscape(r.relation) << '\n';
    }
    if (!out) {
        throw TableError("Failed writing: " + path);
    }
}

} // namespace biokg
