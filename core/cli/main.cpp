// =============================================================================
// biokg - command-line front end for the biomedical knowledge graph
// =============================================================================
//
// Usage:
//   biokg <command> [args]
//
// Commands:
//   build       Ingest tables from a config file and write a snapshot
//   stats       Print a health-check report for a snapshot
//   neighbors   List neighbors of a given type
//   path        Shortest path between two named entities
//   shared      Entities sharing a bridge neighbor (two-hop query)
//   link-label  Link an entity to label-matched cluster rows
//   export      Write an entity's neighborhood as CSV edge records
//   help        Show this message
//
// Exit codes: 0 success, 1 usage error or nothing found, 2 fatal error.
// =============================================================================

#include "common/config.hpp"
#include "common/logging.hpp"
#include "graph/graph_snapshot.hpp"
#include "graph/graph_stats.hpp"
#include "ingest/cluster_linker.hpp"
#include "ingest/graph_builder.hpp"
#include "io/table_reader.hpp"
#include "query/query_engine.hpp"
#include "query/record_export.hpp"

#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace biokg::cli {

constexpr int EXIT_OK = 0;
constexpr int EXIT_USAGE = 1;
constexpr int EXIT_FATAL = 2;

int cmd_help(int argc, char* argv[]);

namespace {

std::string joinPath(const std::vector<std::string>& names) {
    std::string out;
    for (size_t i = 0; i < names.size(); i++) {
        if (i > 0) out += " -> ";
        out += names[i];
    }
    return out;
}

} // namespace

int cmd_build(int argc, char* argv[]) {
    if (argc < 1) {
        std::cerr << "usage: biokg build <config.yaml>\n";
        return EXIT_USAGE;
    }
    Config config = loadConfig(argv[0]);
    applyLogging(config);

    BuildResult result = buildFromConfig(config);
    std::cout << result.nodes.summary() << "\n" << result.edges.summary() << "\n";
    for (const auto& report : result.features) {
        std::cout << report.summary() << "\n";
    }
    if (result.clusters) {
        std::cout << "clusters: " << result.clusters->summary() << "\n";
    }
    std::cout << GraphStats::format(GraphStats::compute(result.graph));

    GraphSnapshot::saveToFile(result.graph, config.snapshot_path);
    std::cout << "Snapshot written to " << config.snapshot_path << "\n";
    return EXIT_OK;
}

int cmd_stats(int argc, char* argv[]) {
    if (argc < 1) {
        std::cerr << "usage: biokg stats <snapshot>\n";
        return EXIT_USAGE;
    }
    Graph graph = GraphSnapshot::loadFromFile(argv[0]);
    std::cout << GraphStats::format(GraphStats::compute(graph));
    return EXIT_OK;
}

int cmd_neighbors(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "usage: biokg neighbors <snapshot> <name> <type>\n";
        return EXIT_USAGE;
    }
    Graph graph = GraphSnapshot::loadFromFile(argv[0]);
    QueryEngine query(graph);

    auto names = query.typedNeighbors(argv[1], argv[2]);
    if (!names) {
        std::cerr << "Entity not found: " << argv[1] << "\n";
        return EXIT_USAGE;
    }
    for (const auto& name : *names) {
        std::cout << name << "\n";
    }
    return EXIT_OK;
}

int cmd_path(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "usage: biokg path <snapshot> <name_a> <name_b>\n";
        return EXIT_USAGE;
    }
    Graph graph = GraphSnapshot::loadFromFile(argv[0]);
    QueryEngine query(graph);

    auto path = query.shortestPath(argv[1], argv[2]);
    if (!path) {
        std::cerr << "No path found between '" << argv[1] << "' and '" << argv[2] << "'\n";
        return EXIT_USAGE;
    }
    std::cout << "Shortest path (" << path->size() << " nodes): "
              << joinPath(query.pathNames(*path)) << "\n";
    return EXIT_OK;
}

int cmd_shared(int argc, char* argv[]) {
    if (argc < 4) {
        std::cerr << "usage: biokg shared <snapshot> <name> <bridge_type> <target_type>\n";
        return EXIT_USAGE;
    }
    Graph graph = GraphSnapshot::loadFromFile(argv[0]);
    QueryEngine query(graph);

    auto shared = query.sharedSecondOrder(argv[1], argv[2], argv[3]);
    if (!shared) {
        std::cerr << "Entity not found: " << argv[1] << "\n";
        return EXIT_USAGE;
    }
    for (const auto& name : *shared) {
        std::cout << name << "\n";
    }
    return EXIT_OK;
}

int cmd_link_label(int argc, char* argv[]) {
    if (argc < 4) {
        std::cerr << "usage: biokg link-label <snapshot> <config.yaml> <name> <label>\n";
        return EXIT_USAGE;
    }
    Config config = loadConfig(argv[1]);
    applyLogging(config);
    if (!config.clusters) {
        std::cerr << "Configuration has no 'clusters' table\n";
        return EXIT_USAGE;
    }

    Graph graph = GraphSnapshot::loadFromFile(argv[0]);
    ClusterLinker linker(graph, config.clusters->options);
    Table table = Table::readFile(config.resolvePath(config.clusters->path), config.delimiterChar());

    LinkReport report = linker.linkByLabel(table, argv[2], argv[3]);
    if (!report.entity_found) {
        std::cerr << "Entity not found: " << argv[2] << "\n";
        return EXIT_USAGE;
    }
    std::cout << "Linked '" << argv[2] << "': " << report.summary() << "\n";
    GraphSnapshot::saveToFile(graph, argv[0]);
    return EXIT_OK;
}

int cmd_export(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "usage: biokg export <snapshot> <name> <out.csv>\n";
        return EXIT_USAGE;
    }
    Graph graph = GraphSnapshot::loadFromFile(argv[0]);
    QueryEngine query(graph);

    auto sub = query.neighborhood(argv[1]);
    if (!sub) {
        std::cerr << "Entity not found: " << argv[1] << "\n";
        return EXIT_USAGE;
    }
    auto records = toEdgeRecords(graph, *sub);
    writeEdgeRecordsCsv(argv[2], records);
    std::cout << "Wrote " << records.size() << " edge records for " << sub->nodes.size()
              << " nodes to " << argv[2] << "\n";
    return EXIT_OK;
}

struct Command {
    const char* name;
    const char* description;
    int (*handler)(int argc, char* argv[]);
};

static const Command g_commands[] = {
    {"build",      "Ingest tables from a config file and write a snapshot", cmd_build},
    {"stats",      "Print a health-check report for a snapshot", cmd_stats},
    {"neighbors",  "List neighbors of a given type", cmd_neighbors},
    {"path",       "Shortest path between two named entities", cmd_path},
    {"shared",     "Entities sharing a bridge neighbor (two-hop query)", cmd_shared},
    {"link-label", "Link an entity to label-matched cluster rows", cmd_link_label},
    {"export",     "Write an entity's neighborhood as CSV edge records", cmd_export},
    {"help",       "Show this message", cmd_help},
};

int cmd_help(int, char*[]) {
    std::cout << "Usage: biokg <command> [args]\n\nCommands:\n";
    for (const auto& cmd : g_commands) {
        std::cout << "  " << cmd.name;
        for (size_t pad = std::strlen(cmd.name); pad < 12; pad++) std::cout << ' ';
        std::cout << cmd.description << "\n";
    }
    return EXIT_OK;
}

int dispatch(int argc, char* argv[]) {
    if (argc < 2) {
        cmd_help(0, nullptr);
        return EXIT_USAGE;
    }
    const std::string name = argv[1];
    for (const auto& cmd : g_commands) {
        if (name == cmd.name) {
            return cmd.handler(argc - 2, argv + 2);
        }
    }
    std::cerr << "Unknown command: " << name << "\n";
    cmd_help(0, nullptr);
    return EXIT_USAGE;
}

} // namespace biokg::cli

int main(int argc, char* argv[]) {
    try {
        return biokg::cli::dispatch(argc, argv);
    } catch (const std::exception& e) {
        BIOKG_LOG_CRITICAL(e.what());
    }
    return biokg::cli::EXIT_FATAL;
}
