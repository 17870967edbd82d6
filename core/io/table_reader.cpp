#include "io/table_reader.hpp"
#include "common/errors.hpp"
#include "common/text.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace biokg {

namespace {

struct RawRecord {
    std::vector<std::string> fields;
    bool malformed = false;
};

// Splits `text` into records of fields. A record ends at an unquoted
// newline; blank and whitespace-only records are dropped.
//
// A record is malformed when a closing quote is followed by anything but
// the delimiter or a line break, or when a quote is still open at end of
// input. Its fields are discarded and parsing resumes on the line after
// the one the record started on, so a stray quote costs exactly one row.
std::vector<RawRecord> parseRecords(const std::string& text, char delimiter) {
    std::vector<RawRecord> records;
    const size_t n = text.size();
    size_t i = 0;

    while (i < n) {
        const size_t start = i;
        RawRecord record;
        std::string field;
        bool in_quotes = false;
        bool quoted = false;  // current field opened with a quote
        bool bad = false;

        for (; i < n; i++) {
            char c = text[i];
            if (in_quotes) {
                if (c != '"') {
                    field.push_back(c);
                } else if (i + 1 < n && text[i + 1] == '"') {
                    field.push_back('"');
                    i++;
                } else {
                    in_quotes = false;
                    char next = i + 1 < n ? text[i + 1] : '\n';
                    if (next != delimiter && next != '\n' && next != '\r') {
                        bad = true;
                        break;
                    }
                }
                continue;
            }

            if (c == '"' && field.empty() && !quoted) {
                in_quotes = true;
                quoted = true;
            } else if (c == delimiter) {
                record.fields.push_back(std::move(field));
                field.clear();
                quoted = false;
            } else if (c == '\r') {
                // CRLF line endings
            } else if (c == '\n') {
                i++;
                break;
            } else {
                field.push_back(c);
            }
        }
        if (in_quotes) {
            bad = true;
        }

        if (bad) {
            size_t eol = text.find('\n', start);
            i = eol == std::string::npos ? n : eol + 1;
            record.fields.clear();
            record.malformed = true;
            records.push_back(std::move(record));
            continue;
        }

        record.fields.push_back(std::move(field));
        bool blank = record.fields.size() == 1 && trim(record.fields[0]).empty();
        if (!blank) {
            records.push_back(std::move(record));
        }
    }
    return records;
}

} // namespace

Table Table::parse(const std::string& text, char delimiter) {
    auto records = parseRecords(text, delimiter);
    if (records.empty()) {
        return Table();
    }
    if (records.front().malformed) {
        throw ParseError("Malformed quoting in header row");
    }

    std::vector<std::string> header = std::move(records.front().fields);
    for (auto& name : header) {
        name = trim(name);
    }
    // Strip a UTF-8 byte order mark from the first header cell.
    if (!header.empty() && header[0].rfind("\xEF\xBB\xBF", 0) == 0) {
        header[0] = header[0].substr(3);
    }

    std::vector<std::vector<std::string>> rows;
    std::vector<bool> malformed;
    rows.reserve(records.size() - 1);
    malformed.reserve(records.size() - 1);
    for (size_t r = 1; r < records.size(); r++) {
        rows.push_back(std::move(records[r].fields));
        malformed.push_back(records[r].malformed);
    }
    return Table(std::move(header), std::move(rows), std::move(malformed));
}

Table Table::readFile(const std::string& path, char delimiter) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw TableError("Cannot open table: " + path);
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        throw TableError("Failed reading table: " + path);
    }
    try {
        return parse(buffer.str(), delimiter);
    } catch (const ParseError& e) {
        throw TableError(path + ": " + e.what());
    }
}

bool Table::malformed(size_t r) const {
    return r < malformed_.size() && malformed_[r];
}

size_t Table::malformedCount() const {
    return static_cast<size_t>(std::count(malformed_.begin(), malformed_.end(), true));
}

std::optional<size_t> Table::findColumn(const std::string& name) const {
    for (size_t i = 0; i < header_.size(); i++) {
        if (header_[i] == name) return i;
    }
    return std::nullopt;
}

std::optional<size_t> Table::findColumn(std::initializer_list<const char*> candidates) const {
    for (const char* name : candidates) {
        auto col = findColumn(std::string(name));
        if (col) return col;
    }
    return std::nullopt;
}

size_t Table::requireColumn(std::initializer_list<const char*> candidates,
                            const std::string& what) const {
    auto col = findColumn(candidates);
    if (!col) {
        std::string names;
        for (const char* name : candidates) {
            if (!names.empty()) names += " or ";
            names += name;
        }
        throw SchemaError("Missing required " + what + " column (" + names + ")");
    }
    return *col;
}

const std::string& Table::cell(size_t r, size_t col) const {
    const auto& fields = rows_.at(r);
    if (col >= fields.size()) {
        throw ParseError("Row " + std::to_string(r + 1) + " has " +
                         std::to_string(fields.size()) + " fields, expected at least " +
                         std::to_string(col + 1));
    }
    return fields[col];
}

std::string Table::cellOrEmpty(size_t r, size_t col) const {
    const auto& fields = rows_.at(r);
    return col < fields.size() ? fields[col] : std::string();
}

int64_t Table::integer(size_t r, size_t col) const {
    return parseIdentifier(cell(r, col));
}

int64_t parseIdentifier(const std::string& text) {
    std::string s = trim(text);
    if (s.empty()) {
        throw ParseError("Empty identifier");
    }

    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(s.c_str(), &end, 10);
    if (end == s.c_str() || errno == ERANGE) {
        throw ParseError("Invalid identifier: '" + s + "'");
    }

    // Accept "42.0" / "42.000" as written by dataframe exports.
    const char* rest = end;
    if (*rest == '.') {
        rest++;
        while (*rest == '0') rest++;
    }
    if (*rest != '\0') {
        throw ParseError("Invalid identifier: '" + s + "'");
    }
    return static_cast<int64_t>(value);
}

char delimiterFromString(const std::string& spelling) {
    std::string lower = toLower(spelling);
    if (lower == "\\t" || lower == "\t" || lower == "tab" || lower == "tsv") return '\t';
    if (lower.empty() || lower == "csv") return ',';
    return spelling[0];
}

} // namespace biokg
