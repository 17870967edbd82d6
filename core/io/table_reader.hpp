#pragma once

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <utility>
#include <string>
#include <vector>

namespace biokg {

/// A row/column text table with a header row.
/// Cells are kept as text; typed accessors convert on demand and throw
/// ParseError for malformed cells so loaders can skip and count the row.
/// Rows with broken quoting are kept as empty, flagged placeholders.
class Table {
public:
    Table() = default;
    Table(std::vector<std::string> header, std::vector<std::vector<std::string>> rows,
          std::vector<bool> malformed = {})
        : header_(std::move(header)), rows_(std::move(rows)), malformed_(std::move(malformed)) {}

    /// Parse delimited text. Supports double-quoted fields with embedded
    /// delimiters, doubled quotes and line breaks; tolerates CRLF endings.
    /// Throws ParseError only when the header row itself is malformed.
    static Table parse(const std::string& text, char delimiter = ',');

    /// Read and parse a file. Throws TableError if it cannot be opened.
    static Table readFile(const std::string& path, char delimiter = ',');

    const std::vector<std::string>& header() const { return header_; }
    size_t rowCount() const { return rows_.size(); }
    size_t columnCount() const { return header_.size(); }
    const std::vector<std::string>& row(size_t r) const { return rows_.at(r); }

    /// True when row `r` had unbalanced or misplaced quotes.
    bool malformed(size_t r) const;
    size_t malformedCount() const;

    std::optional<size_t> findColumn(const std::string& name) const;
    /// First column among `candidates` present in the header.
    std::optional<size_t> findColumn(std::initializer_list<const char*> candidates) const;
    /// Like findColumn but throws SchemaError naming `what` when absent.
    size_t requireColumn(std::initializer_list<const char*> candidates, const std::string& what) const;

    /// Cell text. Throws ParseError when the row is shorter than `col`.
    const std::string& cell(size_t r, size_t col) const;
    /// Cell text, or empty when the row is short.
    std::string cellOrEmpty(size_t r, size_t col) const;

    /// Parse a cell as a signed integer. Accepts an integral float spelling
    /// such as "42.0". Throws ParseError otherwise.
    int64_t integer(size_t r, size_t col) const;

private:
    std::vector<std::string> header_;
    std::vector<std::vector<std::string>> rows_;
    std::vector<bool> malformed_;
};

/// Parse an integer identifier ("17", " 17 ", "17.0"). Throws ParseError.
int64_t parseIdentifier(const std::string& text);

/// Map a configured delimiter spelling ("," "\t" "tab" "tsv") to a char.
char delimiterFromString(const std::string& spelling);

} // namespace biokg
