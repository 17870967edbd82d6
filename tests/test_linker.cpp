#include <gtest/gtest.h>
#include "ingest/cluster_linker.hpp"
#include "common/errors.hpp"

using namespace biokg;

namespace {

// Diseases 10..14 plus one drug; E=10, F=11, G=99 (absent).
Graph makeDiseaseGraph() {
    Graph g;
    g.addNode(10, "disease", "asthma", "MONDO");
    g.addNode(11, "disease", "allergic asthma", "MONDO");
    g.addNode(12, "disease", "bronchitis", "MONDO");
    g.addNode(13, "disease", "childhood asthma", "MONDO");
    g.addNode(14, "disease", "eczema", "MONDO");
    g.addNode(20, "drug", "albuterol", "DrugBank");
    return g;
}

} // namespace

// ─── Cluster mode ──────────────────────────────────────────────

TEST(ClusterLinkerTest, LinksEachRowToItsMembers) {
    Graph g = makeDiseaseGraph();
    ClusterLinker linker(g);
    Table t = Table::parse(
        "node_id,group_id_bert,group_name_bert\n"
        "10,10_11_99,asthma group\n");

    LinkReport report = linker.linkClusters(t);
    EXPECT_EQ(report.rows, 1);
    EXPECT_EQ(report.edges_added, 1);
    EXPECT_EQ(report.self_references, 1);
    EXPECT_EQ(report.unresolved_members, 1);
    EXPECT_EQ(report.skipped(), 1);
    EXPECT_EQ(g.edgeCount(), 1);

    uint64_t e = *g.findById(10);
    uint64_t f = *g.findById(11);
    ASSERT_TRUE(g.hasEdge(e, f, "bert_group"));
    EXPECT_EQ(g.getEdge(0)->display_relation, "BERT similarity");
    EXPECT_FALSE(g.hasEdge(f, e, "bert_group"));
}

TEST(ClusterLinkerTest, RerunAddsNothing) {
    Graph g = makeDiseaseGraph();
    ClusterLinker linker(g);
    Table t = Table::parse(
        "node_id,group_id_bert,group_name_bert\n"
        "10,10_11_12,airway\n"
        "11,10_11_12,airway\n"
        "12,10_11_12,airway\n");

    LinkReport first = linker.linkClusters(t);
    EXPECT_EQ(first.edges_added, 6);
    LinkReport second = linker.linkClusters(t);
    EXPECT_EQ(second.edges_added, 0);
    EXPECT_EQ(second.duplicates, 6);
    EXPECT_EQ(g.edgeCount(), 6);
}

TEST(ClusterLinkerTest, UnresolvedAndMalformedRowsAreSkipped) {
    Graph g = makeDiseaseGraph();
    ClusterLinker linker(g);
    Table t = Table::parse(
        "node_id,group_id_bert\n"
        "77,10_11,x\n"
        "abc,10_11\n"
        "12,10__x1_13\n");

    LinkReport report = linker.linkClusters(t);
    EXPECT_EQ(report.rows, 3);
    EXPECT_EQ(report.unresolved_rows, 1);
    EXPECT_EQ(report.parse_errors, 2);  // "abc" entity and "x1" member
    EXPECT_EQ(report.edges_added, 2);   // 12→10, 12→13
    EXPECT_TRUE(g.hasEdge(*g.findById(12), *g.findById(13), "bert_group"));
}

TEST(ClusterLinkerTest, BadlyQuotedRowsAreCountedAsParseErrors) {
    Graph g = makeDiseaseGraph();
    ClusterLinker linker(g);
    Table t = Table::parse(
        "node_id,group_id_bert,group_name_bert\n"
        "10,\"10_11,asthma group\n"
        "12,12_13,\"airway\"s\n"
        "13,13_14,skin\n");

    LinkReport report = linker.linkClusters(t);
    EXPECT_EQ(report.rows, 3);
    EXPECT_EQ(report.parse_errors, 2);
    EXPECT_EQ(report.edges_added, 1);
    EXPECT_TRUE(g.hasEdge(*g.findById(13), *g.findById(14), "bert_group"));

    LinkReport labels = linker.linkByLabel(t, "albuterol", "skin");
    EXPECT_EQ(labels.parse_errors, 2);
    EXPECT_EQ(labels.edges_added, 1);
}

TEST(ClusterLinkerTest, MissingColumnsThrowSchemaError) {
    Graph g = makeDiseaseGraph();
    ClusterLinker linker(g);
    EXPECT_THROW(linker.linkClusters(Table::parse("node_id,name\n10,x\n")), SchemaError);
    EXPECT_THROW(linker.linkByLabel(Table::parse("node_id\n10\n"), "albuterol", "asthma"), SchemaError);
}

TEST(ClusterLinkerTest, CustomOptions) {
    Graph g = makeDiseaseGraph();
    ClusterTableOptions options;
    options.id_column = "entity";
    options.members_column = "members";
    options.member_delimiter = ";";
    options.relation = "same_cluster";
    options.display_relation = "same cluster";
    ClusterLinker linker(g, options);

    LinkReport report = linker.linkClusters(Table::parse("entity,members\n13,10;14\n"));
    EXPECT_EQ(report.edges_added, 2);
    EXPECT_TRUE(g.hasEdge(*g.findById(13), *g.findById(14), "same_cluster"));
}

// ─── Label mode ────────────────────────────────────────────────

TEST(ClusterLinkerTest, LinkByLabelMatchesSubstringCaseInsensitively) {
    Graph g = makeDiseaseGraph();
    ClusterLinker linker(g);
    Table t = Table::parse(
        "node_id,group_id_bert,group_name_bert\n"
        "10,10,Asthma cluster\n"
        "11,11,allergic ASTHMA\n"
        "12,12,bronchitis\n"
        "99,99,asthma (unknown)\n");

    LinkReport report = linker.linkByLabel(t, "Albuterol", "asthma");
    EXPECT_TRUE(report.entity_found);
    EXPECT_EQ(report.rows, 3);
    EXPECT_EQ(report.edges_added, 2);
    EXPECT_EQ(report.unresolved_members, 1);

    uint64_t drug = *g.findById(20);
    EXPECT_TRUE(g.hasEdge(drug, *g.findById(10), "bert_related"));
    EXPECT_TRUE(g.hasEdge(drug, *g.findById(11), "bert_related"));
    EXPECT_FALSE(g.hasEdge(drug, *g.findById(12), "bert_related"));
    EXPECT_EQ(g.getEdge(0)->display_relation, "BERT cluster approx");

    LinkReport again = linker.linkByLabel(t, "albuterol", "asthma");
    EXPECT_EQ(again.edges_added, 0);
    EXPECT_EQ(again.duplicates, 2);
}

TEST(ClusterLinkerTest, LinkByLabelEntityNotFound) {
    Graph g = makeDiseaseGraph();
    ClusterLinker linker(g);
    Table t = Table::parse("node_id,group_name_bert\n10,asthma\n");

    LinkReport report = linker.linkByLabel(t, "nonexistent", "asthma");
    EXPECT_FALSE(report.entity_found);
    EXPECT_EQ(report.edges_added, 0);
    EXPECT_EQ(g.edgeCount(), 0);
}

TEST(ClusterLinkerTest, ReportSummaryMentionsCounts) {
    LinkReport report;
    report.rows = 4;
    report.edges_added = 3;
    report.unresolved_members = 1;
    std::string s = report.summary();
    EXPECT_NE(s.find("4 rows"), std::string::npos);
    EXPECT_NE(s.find("3 edges added"), std::string::npos);
    EXPECT_NE(s.find("1 skipped"), std::string::npos);
}
