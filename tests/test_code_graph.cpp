#include <gtest/gtest.h>
#include <cmath>
#include "code_atlas/code_graph.hpp"
#include "code_atlas/graph_layout.hpp"

using namespace code_atlas;

namespace {

GraphNode file_node(const std::string& id) {
    GraphNode n;
    n.id = id;
    n.kind = NodeKind::File;
    n.label = base_name(id);
    return n;
}

} // namespace

class CodeGraphTest : public ::testing::Test {
protected:
    CodeGraph graph;

    void SetUp() override {
        // a -> b -> c, d isolated
        for (const auto* id : {"src/a.cpp", "src/b.h", "lib/c.h", "d.py"}) graph.add_node(file_node(id));
        graph.add_edge("src/a.cpp", "src/b.h", EdgeKind::Include);
        graph.add_edge("src/b.h", "lib/c.h", EdgeKind::Include);
    }
};

// ==========================================
// Basic Operations Tests
// ==========================================

TEST_F(CodeGraphTest, CountsNodesAndEdges) {
    EXPECT_EQ(graph.node_count(), 4u);
    EXPECT_EQ(graph.edge_count(), 2u);
    EXPECT_FALSE(graph.empty());
}

TEST_F(CodeGraphTest, RejectsEdgesWithMissingEndpoints) {
    EXPECT_FALSE(graph.add_edge("src/a.cpp", "nowhere.h", EdgeKind::Include));
    EXPECT_FALSE(graph.add_edge("ghost.cpp", "src/a.cpp", EdgeKind::Include));
    EXPECT_EQ(graph.edge_count(), 2u);
}

TEST_F(CodeGraphTest, AddNodeUpsertsAttributes) {
    GraphNode replacement = file_node("src/a.cpp");
    replacement.group = "src";
    EXPECT_FALSE(graph.add_node(replacement));
    EXPECT_EQ(graph.node_count(), 4u);
    EXPECT_EQ(graph.get_node("src/a.cpp")->group, "src");
    EXPECT_TRUE(graph.has_edge("src/a.cpp", "src/b.h"));
}

TEST_F(CodeGraphTest, AtMostOneEdgePerPair) {
    EXPECT_TRUE(graph.add_edge("src/a.cpp", "src/b.h", EdgeKind::Dependency, {{"dashes", true}}));
    EXPECT_EQ(graph.edge_count(), 2u);
    const GraphEdge* e = graph.get_edge("src/a.cpp", "src/b.h");
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(e->kind, EdgeKind::Dependency);
    EXPECT_TRUE(e->style.value("dashes", false));
    EXPECT_EQ(graph.successors("src/a.cpp").size(), 1u);
}

// ==========================================
// Traversal Tests
// ==========================================

TEST_F(CodeGraphTest, HasPathFollowsDirection) {
    EXPECT_TRUE(graph.has_path("src/a.cpp", "lib/c.h"));
    EXPECT_FALSE(graph.has_path("lib/c.h", "src/a.cpp"));
    EXPECT_FALSE(graph.has_path("src/a.cpp", "d.py"));
    EXPECT_FALSE(graph.has_path("src/a.cpp", "src/a.cpp"));
}

TEST_F(CodeGraphTest, HasPathThroughCycle) {
    graph.add_edge("lib/c.h", "src/a.cpp", EdgeKind::Include);
    EXPECT_TRUE(graph.has_path("src/a.cpp", "src/a.cpp"));
}

TEST_F(CodeGraphTest, DegreesCountBothDirections) {
    EXPECT_EQ(graph.degree("src/b.h"), 2u);
    EXPECT_EQ(graph.degree("src/a.cpp"), 1u);
    EXPECT_EQ(graph.degree("d.py"), 0u);
}

TEST_F(CodeGraphTest, IdsByDegreeIsStable) {
    auto ids = graph.ids_by_degree();
    ASSERT_EQ(ids.size(), 4u);
    EXPECT_EQ(ids[0], "src/b.h");
    // a and c tie at one; insertion order decides.
    EXPECT_EQ(ids[1], "src/a.cpp");
    EXPECT_EQ(ids[2], "lib/c.h");
    EXPECT_EQ(ids[3], "d.py");
}

TEST_F(CodeGraphTest, InducedSubgraphKeepsOnlyInternalEdges) {
    CodeGraph sub = graph.induced_subgraph(std::vector<std::string>{"src/a.cpp", "src/b.h", "d.py"});
    EXPECT_EQ(sub.node_count(), 3u);
    EXPECT_EQ(sub.edge_count(), 1u);
    EXPECT_TRUE(sub.has_edge("src/a.cpp", "src/b.h"));
    EXPECT_FALSE(sub.has_node("lib/c.h"));
}

TEST_F(CodeGraphTest, JsonRoundTripPreservesOrderAndStyle) {
    graph.get_node("d.py")->attributes["color"] = "#fff";
    CodeGraph copy = CodeGraph::from_json(graph.to_json());
    EXPECT_EQ(copy.node_ids(), graph.node_ids());
    EXPECT_EQ(copy.edge_count(), graph.edge_count());
    EXPECT_EQ(copy.get_node("d.py")->attributes.value("color", ""), "#fff");
    EXPECT_EQ(copy.get_edge("src/b.h", "lib/c.h")->kind, EdgeKind::Include);
}

TEST(GraphIds, ParentAndBaseName) {
    EXPECT_EQ(parent_dir("src/utils/helper.h"), "src/utils");
    EXPECT_EQ(parent_dir("main.py"), "");
    EXPECT_EQ(base_name("src/utils/helper.h"), "helper.h");
    EXPECT_EQ(base_name("main.py"), "main.py");
}

TEST(GraphLayout, PlacesEveryNodeInsideUnitSquare) {
    CodeGraph g;
    for (int i = 0; i < 12; ++i) g.add_node(file_node("f" + std::to_string(i) + ".c"));
    for (int i = 1; i < 12; ++i) g.add_edge("f0.c", "f" + std::to_string(i) + ".c", EdgeKind::Include);

    Layout layout = spring_layout(g);
    ASSERT_EQ(layout.size(), 12u);
    for (const auto& [id, p] : layout) {
        EXPECT_LE(std::abs(p.x), 1.0 + 1e-9) << id;
        EXPECT_LE(std::abs(p.y), 1.0 + 1e-9) << id;
    }
    Layout again = spring_layout(g);
    EXPECT_DOUBLE_EQ(again["f3.c"].x, layout["f3.c"].x);
}
