#include <gtest/gtest.h>
#include <set>
#include "code_atlas/progressive_loader.hpp"
#include "test_helpers.hpp"

using namespace code_atlas;
using code_atlas::test_support::RecordingSink;

namespace {

// Hub "n0" links to every other node, plus a chain n1 -> n2 -> ... -> n9.
CodeGraph sample_graph(size_t n = 10) {
    CodeGraph g;
    for (size_t i = 0; i < n; ++i) {
        GraphNode node;
        node.id = "n" + std::to_string(i);
        g.add_node(node);
    }
    for (size_t i = 1; i < n; ++i) g.add_edge("n0", "n" + std::to_string(i), EdgeKind::Include);
    for (size_t i = 1; i + 1 < n; ++i) {
        g.add_edge("n" + std::to_string(i), "n" + std::to_string(i + 1), EdgeKind::Include);
    }
    return g;
}

LoaderOptions small_options() {
    LoaderOptions o;
    o.initial_load_size = 3;
    o.chunk_size = 2;
    return o;
}

ProgressiveLoader::Dispatcher inline_dispatch() {
    return [](std::function<void()> job) { job(); };
}

} // namespace

TEST(ProgressiveLoader, StreamsEveryNodeAndEdgeExactlyOnce) {
    RecordingSink sink;
    ProgressiveLoader loader(sink, inline_dispatch(), small_options());
    CodeGraph graph = sample_graph();

    uint64_t gen = loader.begin(graph, "Dependency graph", true);
    ASSERT_EQ(sink.count("render_graph"), 1u);
    const auto& first = sink.events.front();
    EXPECT_TRUE(first.chunk_loading);
    EXPECT_EQ(first.title, "Dependency graph");
    ASSERT_EQ(first.nodes.size(), 3u);
    EXPECT_EQ(first.nodes[0]["id"], "n0");
    EXPECT_TRUE(loader.has_pending());

    loader.on_page_ready(gen);

    std::multiset<std::string> nodes;
    std::multiset<std::pair<std::string, std::string>> edges;
    for (const auto& e : sink.events) {
        if (e.type != "render_graph" && e.type != "add_data") continue;
        for (const auto& n : e.nodes) nodes.insert(n["id"].get<std::string>());
        for (const auto& x : e.edges) edges.emplace(x["from"].get<std::string>(), x["to"].get<std::string>());
    }

    EXPECT_EQ(nodes.size(), graph.node_count());
    EXPECT_EQ(std::set<std::string>(nodes.begin(), nodes.end()).size(), graph.node_count());
    EXPECT_EQ(edges.size(), graph.edge_count());
    for (const auto& e : graph.edges()) {
        EXPECT_EQ(edges.count({e.source, e.target}), 1u) << e.source << " -> " << e.target;
    }

    EXPECT_EQ(sink.count("add_data"), 4u);
    EXPECT_EQ(sink.count("hide_loading"), 1u);
    EXPECT_EQ(sink.events.back().type, "hide_loading");
    EXPECT_FALSE(loader.has_pending());
    EXPECT_EQ(loader.displayed_count(), 10u);
}

TEST(ProgressiveLoader, NodesArriveInDegreeOrderWithStableTies) {
    // Inserted out of alphabetical order; four nodes tie at degree 2, two at degree 1.
    CodeGraph graph;
    for (const auto* id : {"z", "y", "x", "w", "v", "u", "hub"}) {
        GraphNode node;
        node.id = id;
        graph.add_node(node);
    }
    for (const auto* id : {"z", "y", "x", "w", "v", "u"}) graph.add_edge("hub", id, EdgeKind::Include);
    graph.add_edge("x", "v", EdgeKind::Include);
    graph.add_edge("u", "z", EdgeKind::Include);

    const std::vector<std::string> expected{"hub", "z", "x", "v", "u", "y", "w"};
    ASSERT_EQ(graph.ids_by_degree(), expected);

    RecordingSink sink;
    LoaderOptions options;
    options.initial_load_size = 2;
    options.chunk_size = 2;
    ProgressiveLoader loader(sink, inline_dispatch(), options);
    loader.on_page_ready(loader.begin(graph, "G", true));

    std::vector<std::string> streamed;
    std::vector<size_t> batch_sizes;
    for (const auto& e : sink.events) {
        if (e.type != "render_graph" && e.type != "add_data") continue;
        batch_sizes.push_back(e.nodes.size());
        for (const auto& n : e.nodes) streamed.push_back(n["id"].get<std::string>());
    }
    EXPECT_EQ(streamed, expected);
    EXPECT_EQ(batch_sizes, (std::vector<size_t>{2, 2, 2, 1}));
}

TEST(ProgressiveLoader, OptionsFollowTheProjectConfig) {
    AtlasConfig cfg;
    cfg.initial_load_size = 4;
    cfg.chunk_size = 3;
    LoaderOptions options = LoaderOptions::from_config(cfg);
    EXPECT_EQ(options.initial_load_size, 4u);
    EXPECT_EQ(options.chunk_size, 3u);

    RecordingSink sink;
    ProgressiveLoader loader(sink, inline_dispatch());
    uint64_t gen = loader.begin(sample_graph(), "G", true, options);
    EXPECT_EQ(loader.options().chunk_size, 3u);
    ASSERT_EQ(sink.events.front().nodes.size(), 4u);

    loader.on_page_ready(gen);
    EXPECT_EQ(sink.count("add_data"), 2u);
    EXPECT_EQ(loader.displayed_count(), 10u);
}

TEST(ProgressiveLoader, ProgressEndsAtTotal) {
    RecordingSink sink;
    ProgressiveLoader loader(sink, inline_dispatch(), small_options());
    loader.on_page_ready(loader.begin(sample_graph(), "G", true));

    std::vector<size_t> currents;
    for (const auto& e : sink.events) {
        if (e.type == "progress") {
            currents.push_back(e.current);
            EXPECT_EQ(e.total, 10u);
        }
    }
    EXPECT_EQ(currents, (std::vector<size_t>{3, 5, 7, 9, 10}));
}

TEST(ProgressiveLoader, SmallGraphsRenderInOnePass) {
    RecordingSink sink;
    ProgressiveLoader loader(sink, inline_dispatch(), small_options());

    uint64_t gen = loader.begin(sample_graph(3), "Scope graph", false);
    ASSERT_EQ(sink.events.size(), 1u);
    EXPECT_EQ(sink.events[0].title, "Scope graph (Overview)");
    EXPECT_FALSE(sink.events[0].chunk_loading);
    EXPECT_EQ(sink.events[0].nodes.size(), 3u);

    loader.on_page_ready(gen);
    EXPECT_EQ(sink.events.size(), 1u);

    loader.begin(sample_graph(3), "Scope graph", true);
    EXPECT_EQ(sink.events.back().title, "Scope graph (Full)");
}

TEST(ProgressiveLoader, OverviewOfALargeGraphIsNotChunked) {
    RecordingSink sink;
    ProgressiveLoader loader(sink, inline_dispatch(), small_options());
    loader.begin(sample_graph(), "G", false);
    EXPECT_EQ(sink.events[0].nodes.size(), 10u);
    EXPECT_FALSE(loader.has_pending());
}

TEST(ProgressiveLoader, EmptyGraphShowsEmptyState) {
    RecordingSink sink;
    ProgressiveLoader loader(sink, inline_dispatch(), small_options());
    loader.begin(CodeGraph{}, "G", true);
    ASSERT_EQ(sink.events.size(), 1u);
    EXPECT_EQ(sink.events[0].type, "empty");
}

TEST(ProgressiveLoader, StaleGenerationsAreDropped) {
    RecordingSink sink;
    std::vector<std::function<void()>> queued;
    ProgressiveLoader loader(sink, [&](std::function<void()> job) { queued.push_back(std::move(job)); },
                             small_options());

    uint64_t first = loader.begin(sample_graph(), "Old", true);
    loader.on_page_ready(first);
    ASSERT_EQ(queued.size(), 1u);

    uint64_t second = loader.begin(sample_graph(4), "New", false);
    EXPECT_GT(second, first);
    EXPECT_EQ(loader.generation(), second);

    const size_t before = sink.events.size();
    queued.front()();
    EXPECT_EQ(sink.events.size(), before);
    EXPECT_EQ(sink.count("add_data"), 0u);

    // An acknowledgement for the old generation does nothing either.
    loader.on_page_ready(first);
    EXPECT_EQ(queued.size(), 1u);
}

TEST(ProgressiveLoader, ChunkFailureReportsAnError) {
    RecordingSink sink;
    sink.throw_on_add = true;
    ProgressiveLoader loader(sink, inline_dispatch(), small_options());

    loader.on_page_ready(loader.begin(sample_graph(), "G", true));

    ASSERT_EQ(sink.count("error"), 1u);
    EXPECT_EQ(sink.events.back().type, "error");
    EXPECT_EQ(sink.events.back().title, "Chunk load error: front-end went away");
    EXPECT_EQ(sink.count("hide_loading"), 0u);
    EXPECT_FALSE(loader.has_pending());
}

TEST(EventQueueSink, DrainEmptiesTheQueue) {
    EventQueueSink sink;
    sink.update_progress(1, 4);
    sink.show_empty();
    EXPECT_EQ(sink.pending(), 2u);

    auto events = sink.drain();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0]["type"], "progress");
    EXPECT_EQ(events[0]["total"], 4);
    EXPECT_EQ(events[1]["type"], "empty");
    EXPECT_EQ(sink.pending(), 0u);
}

TEST(EventQueueSink, BuildProgressIsTaggedApartFromStreamProgress) {
    EventQueueSink sink;
    sink.update_build_progress(20, 45, "Parsing src/a.c");
    sink.update_progress(3, 10);

    auto events = sink.drain();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0]["type"], "build_progress");
    EXPECT_EQ(events[0]["current"], 20);
    EXPECT_EQ(events[0]["message"], "Parsing src/a.c");
    EXPECT_EQ(events[1]["type"], "progress");
}

TEST(FrontendRecords, NodeAndEdgeDefaults) {
    GraphNode n;
    n.id = "src/a.c";
    n.size = 12.0;
    auto node = format_node(n);
    EXPECT_EQ(node["label"], "a.c");
    EXPECT_EQ(node["group"], "Default");
    EXPECT_EQ(node["title"], "src/a.c");
    EXPECT_EQ(node["value"], 12.0);

    GraphEdge e{"a", "b", EdgeKind::Dependency, {{"dashes", true}, {"color", "#555"}}};
    auto edge = format_edge(e);
    EXPECT_EQ(edge["from"], "a");
    EXPECT_EQ(edge["to"], "b");
    EXPECT_EQ(edge["kind"], "dependency");
    EXPECT_EQ(edge["dashes"], true);
    EXPECT_EQ(edge["color"]["color"], "#555");
}
