// PyBind11 bindings for the BioKG C++ core.
// Exposes the graph store, ingestion, linking, queries and snapshots to Python.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DBIOKG_BUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "common/errors.hpp"
#include "graph/graph.hpp"
#include "graph/graph_snapshot.hpp"
#include "graph/graph_stats.hpp"
#include "ingest/cluster_linker.hpp"
#include "ingest/ingestion_pipeline.hpp"
#include "io/table_reader.hpp"
#include "query/query_engine.hpp"
#include "query/record_export.hpp"

namespace py = pybind11;

PYBIND11_MODULE(biokg_bindings, m) {
    m.doc() = "BioKG C++ Core Bindings";

    py::register_exception<biokg::UnknownNodeError>(m, "UnknownNodeError", PyExc_KeyError);
    py::register_exception<biokg::SchemaError>(m, "SchemaError", PyExc_ValueError);
    py::register_exception<biokg::TableError>(m, "TableError", PyExc_IOError);
    py::register_exception<biokg::SnapshotError>(m, "SnapshotError", PyExc_IOError);

    // ── Node ──
    py::class_<biokg::Node>(m, "Node")
        .def_readonly("index", &biokg::Node::index)
        .def_readonly("id", &biokg::Node::id)
        .def_readonly("type", &biokg::Node::type)
        .def_readonly("name", &biokg::Node::name)
        .def_readonly("source", &biokg::Node::source)
        .def_readonly("accession", &biokg::Node::accession)
        .def_readonly("attributes", &biokg::Node::attributes)
        .def("get_attribute", &biokg::Node::getAttribute,
             py::arg("key"), py::arg("default_val") = "")
        .def("has_attribute", &biokg::Node::hasAttribute);

    // ── Edge ──
    py::class_<biokg::Edge>(m, "Edge")
        .def_readonly("source", &biokg::Edge::source)
        .def_readonly("target", &biokg::Edge::target)
        .def_readonly("relation", &biokg::Edge::relation)
        .def_readonly("display_relation", &biokg::Edge::display_relation);

    py::enum_<biokg::Direction>(m, "Direction")
        .value("OUT", biokg::Direction::Out)
        .value("IN", biokg::Direction::In)
        .value("BOTH", biokg::Direction::Both);

    // ── Graph ──
    py::class_<biokg::Graph>(m, "Graph")
        .def(py::init<>())
        .def("add_node", &biokg::Graph::addNode,
             py::arg("id"), py::arg("type"), py::arg("name"), py::arg("source"),
             py::arg("accession") = "")
        .def("add_edge", &biokg::Graph::addEdge,
             py::arg("source"), py::arg("target"),
             py::arg("relation"), py::arg("display_relation"))
        .def("set_attribute", &biokg::Graph::setAttribute)
        .def("get_node", &biokg::Graph::getNode, py::return_value_policy::reference_internal)
        .def("find_by_id", &biokg::Graph::findById)
        .def("find_by_name", &biokg::Graph::findByName)
        .def("neighbors", &biokg::Graph::neighbors,
             py::arg("index"), py::arg("direction") = biokg::Direction::Both)
        .def("degree", &biokg::Graph::degree)
        .def("node_count", &biokg::Graph::nodeCount)
        .def("edge_count", &biokg::Graph::edgeCount);

    // ── Ingestion ──
    py::class_<biokg::IngestReport>(m, "IngestReport")
        .def_readonly("table", &biokg::IngestReport::table)
        .def_readonly("rows", &biokg::IngestReport::rows)
        .def_readonly("inserted", &biokg::IngestReport::inserted)
        .def_readonly("duplicates", &biokg::IngestReport::duplicates)
        .def_readonly("attributes_set", &biokg::IngestReport::attributes_set)
        .def("skipped", &biokg::IngestReport::skipped)
        .def("summary", &biokg::IngestReport::summary);

    py::class_<biokg::IngestionPipeline>(m, "IngestionPipeline")
        .def(py::init<biokg::Graph&>(), py::keep_alive<1, 2>())
        .def("load_nodes_file", &biokg::IngestionPipeline::loadNodesFile,
             py::arg("path"), py::arg("delimiter") = ',')
        .def("load_edges_file", &biokg::IngestionPipeline::loadEdgesFile,
             py::arg("path"), py::arg("delimiter") = ',')
        .def("load_features_file", &biokg::IngestionPipeline::loadFeaturesFile,
             py::arg("path"), py::arg("node_type"), py::arg("delimiter") = ',');

    // ── Linking ──
    py::class_<biokg::ClusterTableOptions>(m, "ClusterTableOptions")
        .def(py::init<>())
        .def_readwrite("id_column", &biokg::ClusterTableOptions::id_column)
        .def_readwrite("members_column", &biokg::ClusterTableOptions::members_column)
        .def_readwrite("label_column", &biokg::ClusterTableOptions::label_column)
        .def_readwrite("member_delimiter", &biokg::ClusterTableOptions::member_delimiter)
        .def_readwrite("relation", &biokg::ClusterTableOptions::relation)
        .def_readwrite("display_relation", &biokg::ClusterTableOptions::display_relation)
        .def_readwrite("label_relation", &biokg::ClusterTableOptions::label_relation)
        .def_readwrite("label_display_relation", &biokg::ClusterTableOptions::label_display_relation);

    py::class_<biokg::LinkReport>(m, "LinkReport")
        .def_readonly("rows", &biokg::LinkReport::rows)
        .def_readonly("edges_added", &biokg::LinkReport::edges_added)
        .def_readonly("duplicates", &biokg::LinkReport::duplicates)
        .def_readonly("self_references", &biokg::LinkReport::self_references)
        .def_readonly("entity_found", &biokg::LinkReport::entity_found)
        .def("skipped", &biokg::LinkReport::skipped)
        .def("summary", &biokg::LinkReport::summary);

    py::class_<biokg::ClusterLinker>(m, "ClusterLinker")
        .def(py::init<biokg::Graph&, biokg::ClusterTableOptions>(),
             py::arg("graph"), py::arg("options") = biokg::ClusterTableOptions{},
             py::keep_alive<1, 2>())
        .def("link_clusters_file", [](biokg::ClusterLinker& self, const std::string& path, char delimiter) {
            return self.linkClusters(biokg::Table::readFile(path, delimiter));
        }, py::arg("path"), py::arg("delimiter") = ',')
        .def("link_by_label_file", [](biokg::ClusterLinker& self, const std::string& path,
                                      const std::string& entity, const std::string& label, char delimiter) {
            return self.linkByLabel(biokg::Table::readFile(path, delimiter), entity, label);
        }, py::arg("path"), py::arg("entity_name"), py::arg("label_substring"), py::arg("delimiter") = ',');

    // ── Queries ──
    py::class_<biokg::Subgraph>(m, "Subgraph")
        .def_readonly("nodes", &biokg::Subgraph::nodes)
        .def_readonly("edges", &biokg::Subgraph::edges);

    py::class_<biokg::EdgeRecord>(m, "EdgeRecord")
        .def_readonly("source_id", &biokg::EdgeRecord::source_id)
        .def_readonly("source_name", &biokg::EdgeRecord::source_name)
        .def_readonly("source_type", &biokg::EdgeRecord::source_type)
        .def_readonly("target_id", &biokg::EdgeRecord::target_id)
        .def_readonly("target_name", &biokg::EdgeRecord::target_name)
        .def_readonly("target_type", &biokg::EdgeRecord::target_type)
        .def_readonly("relation", &biokg::EdgeRecord::relation);

    py::class_<biokg::QueryEngine>(m, "QueryEngine")
        .def(py::init<const biokg::Graph&>(), py::keep_alive<1, 2>())
        .def("resolve", &biokg::QueryEngine::resolve)
        .def("typed_neighbors", &biokg::QueryEngine::typedNeighbors)
        .def("shortest_path",
             py::overload_cast<const std::string&, const std::string&>(
                 &biokg::QueryEngine::shortestPath, py::const_))
        .def("subgraph", &biokg::QueryEngine::subgraph)
        .def("shared_second_order", &biokg::QueryEngine::sharedSecondOrder)
        .def("neighborhood", &biokg::QueryEngine::neighborhood)
        .def("path_names", &biokg::QueryEngine::pathNames)
        .def("edge_records", [](const biokg::QueryEngine& self, const biokg::Subgraph& sub) {
            return biokg::toEdgeRecords(self.graph(), sub);
        });

    // ── Snapshots and stats ──
    m.def("save_snapshot", &biokg::GraphSnapshot::saveToFile, py::arg("graph"), py::arg("path"));
    m.def("load_snapshot", &biokg::GraphSnapshot::loadFromFile, py::arg("path"));

    py::class_<biokg::GraphStatsReport>(m, "GraphStatsReport")
        .def_readonly("node_count", &biokg::GraphStatsReport::node_count)
        .def_readonly("edge_count", &biokg::GraphStatsReport::edge_count)
        .def_readonly("node_types", &biokg::GraphStatsReport::node_types)
        .def_readonly("relations", &biokg::GraphStatsReport::relations)
        .def_readonly("weak_components", &biokg::GraphStatsReport::weak_components)
        .def_readonly("strong_components", &biokg::GraphStatsReport::strong_components)
        .def_readonly("min_degree", &biokg::GraphStatsReport::min_degree)
        .def_readonly("max_degree", &biokg::GraphStatsReport::max_degree)
        .def_readonly("avg_degree", &biokg::GraphStatsReport::avg_degree);

    m.def("compute_stats", &biokg::GraphStats::compute);
    m.def("format_stats", &biokg::GraphStats::format);
}
