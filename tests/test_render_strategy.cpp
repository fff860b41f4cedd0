#include <gtest/gtest.h>
#include "code_atlas/render_strategy.hpp"
#include "test_helpers.hpp"

using namespace code_atlas;
using code_atlas::test_support::TempDir;

namespace {

GraphArtifact artifact_with(size_t nodes) {
    GraphArtifact a;
    for (size_t i = 0; i < nodes; ++i) {
        GraphNode n;
        n.id = "f" + std::to_string(i) + ".c";
        a.graph.add_node(n);
    }
    a.metadata = {{"f0.c", {{"imports", nlohmann::json::array()}}}};
    return a;
}

} // namespace

TEST(RenderStrategy, SmallGraphsAreAlwaysInteractive) {
    RenderDecision d = select_render_strategy(artifact_with(50), true, "/tmp/static.png");
    EXPECT_EQ(d.mode, RenderMode::Interactive);
    EXPECT_EQ(d.graph.node_count(), 50u);
    EXPECT_TRUE(d.static_image_path.empty());
    EXPECT_TRUE(d.metadata.contains("f0.c"));
}

TEST(RenderStrategy, LargeFullDetailWithImageUsesTheImage) {
    RenderDecision d = select_render_strategy(artifact_with(51), true, "/tmp/static.png");
    EXPECT_EQ(d.mode, RenderMode::StaticImage);
    EXPECT_EQ(d.static_image_path, "/tmp/static.png");
    EXPECT_TRUE(d.graph.empty());
}

TEST(RenderStrategy, LargeWithoutImageIsInteractive) {
    RenderDecision d = select_render_strategy(artifact_with(200), true, "");
    EXPECT_EQ(d.mode, RenderMode::Interactive);
    EXPECT_EQ(d.graph.node_count(), 200u);
}

TEST(RenderStrategy, OverviewIgnoresTheImage) {
    RenderDecision d = select_render_strategy(artifact_with(200), false, "/tmp/static.png");
    EXPECT_EQ(d.mode, RenderMode::Interactive);
    EXPECT_TRUE(d.static_image_path.empty());
}

TEST(RenderStrategy, EmptyGraph) {
    EXPECT_EQ(select_render_strategy(artifact_with(0), false, "").mode, RenderMode::Empty);
}

TEST(RenderStrategy, CustomLimit) {
    EXPECT_EQ(select_render_strategy(artifact_with(10), true, "/tmp/static.png", 5).mode, RenderMode::StaticImage);
}

TEST(RenderStrategy, StoreOverloadUsesTheRecordedImage) {
    TempDir tmp;
    GraphStore store(tmp.path());
    store.save(GraphKind::Dependency, Tier::Full, artifact_with(80));
    store.save(GraphKind::Dependency, Tier::Simple, artifact_with(20));

    EXPECT_EQ(select_render_strategy(store, GraphKind::Dependency, true).mode, RenderMode::Interactive);

    // An image on disk that the artifact does not record is left alone.
    tmp.write("graphs/static_dependency_graph_full.png", "png");
    EXPECT_EQ(select_render_strategy(store, GraphKind::Dependency, true).mode, RenderMode::Interactive);

    GraphArtifact with_image = artifact_with(80);
    with_image.static_image_path = store.static_image_path("dependency_graph_full").string();
    store.save(GraphKind::Dependency, Tier::Full, with_image);

    RenderDecision full = select_render_strategy(store, GraphKind::Dependency, true);
    EXPECT_EQ(full.mode, RenderMode::StaticImage);
    EXPECT_EQ(fs::path(full.static_image_path), store.static_image_path("dependency_graph_full"));

    RenderDecision simple = select_render_strategy(store, GraphKind::Dependency, false);
    EXPECT_EQ(simple.mode, RenderMode::Interactive);
    EXPECT_EQ(simple.graph.node_count(), 20u);

    EXPECT_EQ(select_render_strategy(store, GraphKind::Scope, true).mode, RenderMode::Empty);
}

TEST(RenderStrategy, RecordedImageMissingFromDiskFallsBackToInteractive) {
    TempDir tmp;
    GraphStore store(tmp.path());
    GraphArtifact a = artifact_with(80);
    a.static_image_path = (tmp.path() / "graphs" / "gone.png").string();
    store.save(GraphKind::Structure, Tier::Full, a);

    RenderDecision d = select_render_strategy(store, GraphKind::Structure, true);
    EXPECT_EQ(d.mode, RenderMode::Interactive);
    EXPECT_EQ(d.graph.node_count(), 80u);
}

TEST(RenderStrategy, ModeNames) {
    EXPECT_EQ(to_string(RenderMode::Interactive), "interactive");
    EXPECT_EQ(to_string(RenderMode::StaticImage), "static");
    EXPECT_EQ(to_string(RenderMode::Empty), "empty");
}
