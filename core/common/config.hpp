#pragma once

#include "ingest/cluster_linker.hpp"

#include <optional>
#include <string>
#include <vector>

namespace biokg {

struct FeatureTableConfig {
    std::string path;
    std::string node_type;
};

struct ClusterTableConfig {
    std::string path;
    ClusterTableOptions options;
};

/// Dataset layout and runtime settings for a build.
/// Table paths are resolved against `data_dir` by resolvePath().
struct Config {
    std::string data_dir = ".";
    std::string delimiter = ",";
    std::string nodes_path = "nodes.csv";
    std::string edges_path = "kg.csv";
    std::vector<FeatureTableConfig> features;
    std::optional<ClusterTableConfig> clusters;
    std::string snapshot_path = "primekg_graph.bin";
    std::string log_level = "info";
    std::string log_file;

    /// `path` unchanged if absolute, else joined onto data_dir.
    std::string resolvePath(const std::string& path) const;
    char delimiterChar() const;
};

/// Defaults overridden field by field from a YAML file.
/// Throws ConfigError if the file is unreadable or a field has the wrong shape.
Config loadConfig(const std::string& config_file);

/// Same as loadConfig but from YAML text; used by tests.
Config parseConfig(const std::string& yaml_text);

/// Apply log level and file from the config to the process logger.
void applyLogging(const Config& config);

} // namespace biokg
