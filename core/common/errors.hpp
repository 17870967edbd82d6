#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace biokg {

/// Base for structural failures raised by the graph store.
class GraphError : public std::runtime_error {
public:
    explicit GraphError(const std::string& what) : std::runtime_error(what) {}
};

/// An operation referenced a node index that is not in the store.
class UnknownNodeError : public GraphError {
public:
    explicit UnknownNodeError(uint64_t index)
        : GraphError("Unknown node index: " + std::to_string(index)),
          index_(index) {}

    uint64_t index() const { return index_; }

private:
    uint64_t index_;
};

/// A table cell or row could not be interpreted.
/// Raised per row; bulk loaders catch it and count the row as skipped.
class ParseError : public std::runtime_error {
public:
    explicit ParseError(const std::string& what) : std::runtime_error(what) {}
};

/// A source table could not be opened or read at all.
class TableError : public std::runtime_error {
public:
    explicit TableError(const std::string& what) : std::runtime_error(what) {}
};

/// A source table lacks a column the loader requires.
class SchemaError : public std::runtime_error {
public:
    explicit SchemaError(const std::string& what) : std::runtime_error(what) {}
};

/// A snapshot is unreadable, truncated, or fails its integrity check.
class SnapshotError : public std::runtime_error {
public:
    explicit SnapshotError(const std::string& what) : std::runtime_error(what) {}
};

/// The configuration file is missing or malformed.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace biokg
