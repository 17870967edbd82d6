#include <gtest/gtest.h>
#include "graph/graph.hpp"
#include "common/errors.hpp"

using namespace biokg;

// ─── Nodes ─────────────────────────────────────────────────────

TEST(GraphTest, AddAndGetNode) {
    Graph g;
    uint64_t idx = g.addNode(101, "drug", "Albuterol", "DrugBank", "DB01001");
    ASSERT_EQ(g.nodeCount(), 1);
    EXPECT_EQ(idx, 0);

    const Node* n = g.getNode(idx);
    ASSERT_NE(n, nullptr);
    EXPECT_EQ(n->index, idx);
    EXPECT_EQ(n->id, 101);
    EXPECT_EQ(n->type, "drug");
    EXPECT_EQ(n->name, "Albuterol");
    EXPECT_EQ(n->source, "DrugBank");
    EXPECT_EQ(n->accession, "DB01001");
    EXPECT_TRUE(n->attributes.empty());
}

TEST(GraphTest, IndicesAreDenseAndOrdered) {
    Graph g;
    EXPECT_EQ(g.addNode(10, "gene/protein", "TP53", "NCBI"), 0);
    EXPECT_EQ(g.addNode(20, "disease", "asthma", "MONDO"), 1);
    EXPECT_EQ(g.addNode(30, "drug", "albuterol", "DrugBank"), 2);
    EXPECT_EQ(g.getNode(3), nullptr);
}

TEST(GraphTest, ReinsertingSameTypeAndIdIsNoOp) {
    Graph g;
    uint64_t first = g.addNode(7, "disease", "asthma", "MONDO");
    uint64_t again = g.addNode(7, "disease", "renamed", "other");
    EXPECT_EQ(first, again);
    EXPECT_EQ(g.nodeCount(), 1);
    EXPECT_EQ(g.getNode(first)->name, "asthma");
    EXPECT_TRUE(g.hasNode("disease", 7));
    EXPECT_FALSE(g.hasNode("drug", 7));
}

TEST(GraphTest, SameIdDifferentTypeIsDistinct) {
    Graph g;
    uint64_t a = g.addNode(7, "disease", "asthma", "MONDO");
    uint64_t b = g.addNode(7, "drug", "seven", "DrugBank");
    EXPECT_NE(a, b);
    EXPECT_EQ(g.findById(7), a);
    EXPECT_EQ(g.findByTypeAndId("drug", 7), b);
}

TEST(GraphTest, FindByNameIsCaseInsensitiveFirstMatch) {
    Graph g;
    uint64_t first = g.addNode(1, "disease", "Asthma", "MONDO");
    g.addNode(2, "phenotype", "asthma", "HPO");
    EXPECT_EQ(g.findByName("ASTHMA"), first);
    EXPECT_EQ(g.findByName("asthma"), first);
    EXPECT_FALSE(g.findByName("nonexistent").has_value());
}

TEST(GraphTest, SetAttribute) {
    Graph g;
    uint64_t idx = g.addNode(1, "drug", "aspirin", "DrugBank");
    g.setAttribute(idx, "molecular_weight", "180.16");
    g.setAttribute(idx, "state", "solid");
    g.setAttribute(idx, "state", "powder");

    const Node* n = g.getNode(idx);
    EXPECT_EQ(n->getAttribute("molecular_weight"), "180.16");
    EXPECT_EQ(n->getAttribute("state"), "powder");
    EXPECT_FALSE(n->hasAttribute("category"));
    EXPECT_EQ(n->getAttribute("category", "n/a"), "n/a");
}

TEST(GraphTest, SetAttributeNeverTouchesCoreFields) {
    Graph g;
    uint64_t idx = g.addNode(1, "drug", "aspirin", "DrugBank");
    g.setAttribute(idx, "name", "overwritten");
    g.setAttribute(idx, "type", "disease");

    const Node* n = g.getNode(idx);
    EXPECT_EQ(n->name, "aspirin");
    EXPECT_EQ(n->type, "drug");
    EXPECT_EQ(n->getAttribute("name"), "overwritten");
}

TEST(GraphTest, SetAttributeUnknownNodeThrows) {
    Graph g;
    g.addNode(1, "drug", "aspirin", "DrugBank");
    EXPECT_THROW(g.setAttribute(5, "k", "v"), UnknownNodeError);
}

// ─── Edges ─────────────────────────────────────────────────────

TEST(GraphTest, AddAndGetEdge) {
    Graph g;
    uint64_t a = g.addNode(1, "drug", "albuterol", "DrugBank");
    uint64_t b = g.addNode(2, "disease", "asthma", "MONDO");
    EXPECT_TRUE(g.addEdge(a, b, "indication", "indication"));
    ASSERT_EQ(g.edgeCount(), 1);

    const Edge* e = g.getEdge(0);
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(e->source, a);
    EXPECT_EQ(e->target, b);
    EXPECT_EQ(e->relation, "indication");
    EXPECT_TRUE(g.hasEdge(a, b, "indication"));
    EXPECT_FALSE(g.hasEdge(b, a, "indication"));
}

TEST(GraphTest, DuplicateEdgeIsSuppressed) {
    Graph g;
    uint64_t a = g.addNode(1, "drug", "albuterol", "DrugBank");
    uint64_t b = g.addNode(2, "disease", "asthma", "MONDO");
    EXPECT_TRUE(g.addEdge(a, b, "indication", "indication"));
    EXPECT_FALSE(g.addEdge(a, b, "indication", "another label"));
    EXPECT_EQ(g.edgeCount(), 1);
    EXPECT_EQ(g.degree(a), 1);
}

TEST(GraphTest, ParallelEdgesWithDifferentRelations) {
    Graph g;
    uint64_t a = g.addNode(1, "drug", "albuterol", "DrugBank");
    uint64_t b = g.addNode(2, "disease", "asthma", "MONDO");
    EXPECT_TRUE(g.addEdge(a, b, "indication", "indication"));
    EXPECT_TRUE(g.addEdge(a, b, "off-label use", "off-label use"));
    EXPECT_TRUE(g.addEdge(b, a, "indication", "indication"));
    EXPECT_EQ(g.edgeCount(), 3);

    auto out = g.neighbors(a, Direction::Out);
    EXPECT_EQ(out, (std::vector<uint64_t>{b, b}));
}

TEST(GraphTest, UnknownEndpointRejectedWithoutMutation) {
    Graph g;
    uint64_t a = g.addNode(1, "drug", "albuterol", "DrugBank");
    EXPECT_THROW(g.addEdge(a, 42, "indication", "indication"), UnknownNodeError);
    EXPECT_THROW(g.addEdge(42, a, "indication", "indication"), UnknownNodeError);
    EXPECT_EQ(g.edgeCount(), 0);
    EXPECT_EQ(g.degree(a), 0);
    EXPECT_FALSE(g.hasEdge(a, 42, "indication"));
}

// ─── Adjacency ─────────────────────────────────────────────────

TEST(GraphTest, NeighborsFollowEdgeInsertionOrder) {
    Graph g;
    uint64_t hub = g.addNode(0, "gene/protein", "hub", "NCBI");
    uint64_t a = g.addNode(1, "gene/protein", "a", "NCBI");
    uint64_t b = g.addNode(2, "gene/protein", "b", "NCBI");
    uint64_t c = g.addNode(3, "gene/protein", "c", "NCBI");

    g.addEdge(hub, a, "ppi", "ppi");  // out
    g.addEdge(b, hub, "ppi", "ppi");  // in
    g.addEdge(hub, c, "ppi", "ppi");  // out
    g.addEdge(a, hub, "ppi", "ppi");  // in

    EXPECT_EQ(g.neighbors(hub, Direction::Out), (std::vector<uint64_t>{a, c}));
    EXPECT_EQ(g.neighbors(hub, Direction::In), (std::vector<uint64_t>{b, a}));
    EXPECT_EQ(g.neighbors(hub, Direction::Both), (std::vector<uint64_t>{a, b, c, a}));
    EXPECT_EQ(g.degree(hub), 4);
}

TEST(GraphTest, SelfLoopAppearsInBothDirections) {
    Graph g;
    uint64_t a = g.addNode(1, "gene/protein", "a", "NCBI");
    g.addEdge(a, a, "ppi", "ppi");
    EXPECT_EQ(g.neighbors(a, Direction::Both), (std::vector<uint64_t>{a, a}));
    EXPECT_EQ(g.degree(a), 2);
}

TEST(GraphTest, NeighborsOfUnknownNodeThrows) {
    Graph g;
    EXPECT_THROW(g.neighbors(0), UnknownNodeError);
    EXPECT_THROW(g.degree(3), UnknownNodeError);
}

TEST(GraphTest, ForEachVisitsInInsertionOrder) {
    Graph g;
    g.addNode(5, "drug", "x", "s");
    g.addNode(3, "drug", "y", "s");
    g.addEdge(1, 0, "r", "r");
    g.addEdge(0, 1, "r", "r");

    std::vector<int64_t> ids;
    g.forEachNode([&](const Node& n) { ids.push_back(n.id); });
    EXPECT_EQ(ids, (std::vector<int64_t>{5, 3}));

    std::vector<uint64_t> sources;
    g.forEachEdge([&](const Edge& e) { sources.push_back(e.source); });
    EXPECT_EQ(sources, (std::vector<uint64_t>{1, 0}));
}
