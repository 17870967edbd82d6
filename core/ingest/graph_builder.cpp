#include "ingest/graph_builder.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"
#include "ingest/ingestion_pipeline.hpp"
#include "io/table_reader.hpp"

namespace biokg {

BuildResult buildFromConfig(const Config& config) {
    BuildResult result;
    const char delimiter = config.delimiterChar();
    IngestionPipeline pipeline(result.graph);

    result.nodes = pipeline.loadNodesFile(config.resolvePath(config.nodes_path), delimiter);
    result.edges = pipeline.loadEdgesFile(config.resolvePath(config.edges_path), delimiter);

    for (const auto& feature : config.features) {
        const std::string path = config.resolvePath(feature.path);
        try {
            result.features.push_back(pipeline.loadFeaturesFile(path, feature.node_type, delimiter));
        } catch (const TableError& e) {
            BIOKG_LOG_ERROR(std::string("Feature table skipped: ") + e.what());
        } catch (const SchemaError& e) {
            BIOKG_LOG_ERROR(path + ": " + e.what());
        }
    }

    if (config.clusters) {
        const std::string path = config.resolvePath(config.clusters->path);
        try {
            ClusterLinker linker(result.graph, config.clusters->options);
            result.clusters = linker.linkClusters(Table::readFile(path, delimiter));
        } catch (const TableError& e) {
            BIOKG_LOG_ERROR(std::string("Cluster table skipped: ") + e.what());
        } catch (const SchemaError& e) {
            BIOKG_LOG_ERROR(path + ": " + e.what());
        }
    }

    BIOKG_LOG_INFO("Graph built with " + std::to_string(result.graph.nodeCount()) + " nodes and " +
                   std::to_string(result.graph.edgeCount()) + " edges");
    return result;
}

} // namespace biokg
