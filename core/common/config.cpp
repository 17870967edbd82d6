#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"
#include "io/table_reader.hpp"

#include <yaml-cpp/yaml.h>

#include <filesystem>

namespace biokg {

namespace {

void readClusterOptions(const YAML::Node& node, ClusterTableOptions& opts) {
    if (node["id_column"]) opts.id_column = node["id_column"].as<std::string>();
    if (node["members_column"]) opts.members_column = node["members_column"].as<std::string>();
    if (node["label_column"]) opts.label_column = node["label_column"].as<std::string>();
    if (node["delimiter"]) opts.member_delimiter = node["delimiter"].as<std::string>();
    if (node["relation"]) opts.relation = node["relation"].as<std::string>();
    if (node["display_relation"]) opts.display_relation = node["display_relation"].as<std::string>();
    if (node["label_relation"]) opts.label_relation = node["label_relation"].as<std::string>();
    if (node["label_display_relation"]) {
        opts.label_display_relation = node["label_display_relation"].as<std::string>();
    }
}

Config fromYaml(const YAML::Node& yaml) {
    Config config;
    if (!yaml || yaml.IsNull()) return config;
    if (!yaml.IsMap()) {
        throw ConfigError("Configuration root must be a mapping");
    }

    if (yaml["data_dir"]) config.data_dir = yaml["data_dir"].as<std::string>();
    if (yaml["delimiter"]) config.delimiter = yaml["delimiter"].as<std::string>();
    if (yaml["nodes"]) config.nodes_path = yaml["nodes"].as<std::string>();
    if (yaml["edges"]) config.edges_path = yaml["edges"].as<std::string>();
    if (yaml["snapshot"]) config.snapshot_path = yaml["snapshot"].as<std::string>();

    if (yaml["features"]) {
        const auto& features = yaml["features"];
        if (!features.IsSequence()) {
            throw ConfigError("'features' must be a list");
        }
        for (const auto& entry : features) {
            if (!entry["path"] || !entry["type"]) {
                throw ConfigError("Each feature table needs 'path' and 'type'");
            }
            config.features.push_back({entry["path"].as<std::string>(), entry["type"].as<std::string>()});
        }
    }

    if (yaml["clusters"]) {
        const auto& clusters = yaml["clusters"];
        if (!clusters["path"]) {
            throw ConfigError("'clusters' needs a 'path'");
        }
        ClusterTableConfig cluster;
        cluster.path = clusters["path"].as<std::string>();
        readClusterOptions(clusters, cluster.options);
        config.clusters = cluster;
    }

    if (yaml["logging"]) {
        const auto& log = yaml["logging"];
        if (log["level"]) {
            config.log_level = log["level"].as<std::string>();
            if (!findLogLevel(config.log_level)) {
                throw ConfigError("Unknown log level '" + config.log_level + "'");
            }
        }
        if (log["file"]) config.log_file = log["file"].as<std::string>();
    }
    return config;
}

} // namespace

std::string Config::resolvePath(const std::string& path) const {
    std::filesystem::path p(path);
    if (p.is_absolute() || data_dir.empty()) return path;
    return (std::filesystem::path(data_dir) / p).string();
}

char Config::delimiterChar() const {
    return delimiterFromString(delimiter);
}

Config parseConfig(const std::string& yaml_text) {
    try {
        return fromYaml(YAML::Load(yaml_text));
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Invalid configuration: ") + e.what());
    }
}

Config loadConfig(const std::string& config_file) {
    try {
        Config config = fromYaml(YAML::LoadFile(config_file));
        BIOKG_LOG_DEBUG("Configuration loaded from " + config_file);
        return config;
    } catch (const YAML::BadFile&) {
        throw ConfigError("Cannot read configuration file: " + config_file);
    } catch (const YAML::Exception& e) {
        throw ConfigError(config_file + ": " + e.what());
    }
}

void applyLogging(const Config& config) {
    auto logger = Logger::getInstance();
    logger->setLevel(parseLogLevel(config.log_level));
    logger->setOutputFile(config.log_file);
}

} // namespace biokg
