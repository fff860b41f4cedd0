#include <gtest/gtest.h>
#include "code_atlas/graph_styler.hpp"

using namespace code_atlas;

namespace {

void add(CodeGraph& g, const std::string& id, NodeKind kind = NodeKind::File) {
    GraphNode n;
    n.id = id;
    n.kind = kind;
    g.add_node(n);
}

} // namespace

TEST(GraphStyler, GroupsByParentDirectory) {
    EXPECT_EQ(group_for("src/core/engine.cpp"), "src/core");
    EXPECT_EQ(group_for("main.py"), "Root");
    EXPECT_EQ(group_for("src/a.py::run"), "src/a.py");
}

TEST(GraphStyler, SizesSpanTheConfiguredRange) {
    CodeGraph g;
    add(g, "hub.h");
    add(g, "src/a.c");
    add(g, "src/b.c");
    add(g, "src/c.c");
    add(g, "lonely.c");
    g.add_edge("src/a.c", "hub.h", EdgeKind::Include);
    g.add_edge("src/b.c", "hub.h", EdgeKind::Include);
    g.add_edge("src/c.c", "hub.h", EdgeKind::Include);

    apply_visual_styles(g);

    EXPECT_DOUBLE_EQ(g.get_node("hub.h")->size, kMaxNodeSize);
    EXPECT_DOUBLE_EQ(g.get_node("lonely.c")->size, kMinNodeSize);
    double leaf = g.get_node("src/a.c")->size;
    EXPECT_GT(leaf, kMinNodeSize);
    EXPECT_LT(leaf, kMaxNodeSize);

    EXPECT_EQ(g.get_node("hub.h")->group, "Root");
    EXPECT_EQ(g.get_node("src/b.c")->group, "src");
}

TEST(GraphStyler, EqualDegreesGetTheMidpoint) {
    CodeGraph g;
    add(g, "a.c");
    add(g, "b.c");
    add(g, "c.c");
    apply_visual_styles(g);
    for (const auto& n : g.nodes()) {
        EXPECT_DOUBLE_EQ(n.size, 27.5) << n.id;
    }
}

TEST(GraphStyler, LeavesTopologyAlone) {
    CodeGraph g;
    add(g, "a.c");
    add(g, "b.c");
    g.add_edge("a.c", "b.c", EdgeKind::Include);
    apply_visual_styles(g);
    EXPECT_EQ(g.node_count(), 2u);
    EXPECT_EQ(g.edge_count(), 1u);
    EXPECT_TRUE(g.has_edge("a.c", "b.c"));
}

TEST(GraphStyler, EmptyGraphIsANoOp) {
    CodeGraph g;
    apply_visual_styles(g);
    EXPECT_TRUE(g.empty());
}
