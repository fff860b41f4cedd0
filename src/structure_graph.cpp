#include "code_atlas/structure_graph.hpp"
#include "code_atlas/graph_layout.hpp"
#include "code_atlas/graph_styler.hpp"
#include "code_atlas/project_walker.hpp"
#include "code_atlas/static_raster.hpp"
#include <spdlog/spdlog.h>

namespace code_atlas {

StructureGraphBuilder::StructureGraphBuilder(fs::path project_root, AtlasConfig config, const GraphStore& store)
    : project_root_(std::move(project_root)), config_(std::move(config)), store_(store) {}

CodeGraph StructureGraphBuilder::scan() const {
    CodeGraph graph;
    PathFilter filter(config_);

    std::string root_label = fs::path(project_root_).lexically_normal().filename().string();
    if (root_label.empty()) root_label = project_root_.lexically_normal().parent_path().filename().string();

    WalkVisitor visitor;
    visitor.on_directory = [&](const std::string& rel, const std::string& parent) {
        GraphNode node;
        node.id = rel;
        node.kind = NodeKind::Directory;
        node.label = rel == "." ? root_label : base_name(rel);
        graph.add_node(std::move(node));
        if (!parent.empty()) graph.add_edge(parent, rel, EdgeKind::Contains);
    };
    visitor.on_file = [&](const std::string& rel, const std::string& parent) {
        GraphNode node;
        node.id = rel;
        node.kind = NodeKind::File;
        node.label = base_name(rel);
        graph.add_node(std::move(node));
        graph.add_edge(parent, rel, EdgeKind::Contains);
    };

    walk_project(project_root_, filter, visitor, store_.storage_dir());
    return graph;
}

CodeGraph StructureGraphBuilder::simple_tier(const CodeGraph& full, size_t limit) {
    if (full.node_count() <= limit) return full;
    auto ranked = full.ids_by_degree();
    ranked.resize(limit);
    return full.induced_subgraph(ranked);
}

CodeGraph StructureGraphBuilder::build(const ProgressCallback& progress) const {
    spdlog::info("🌳 Scanning project structure: {}", project_root_.string());
    CodeGraph graph = scan();

    size_t file_count = 0;
    for (const auto& n : graph.nodes()) {
        if (n.kind == NodeKind::File) ++file_count;
    }
    if (progress) {
        progress(file_count, file_count, "File Scan Complete. Found " + std::to_string(file_count) + " items.");
    }

    apply_visual_styles(graph);

    spdlog::info("📐 Calculating layout for {} nodes...", graph.node_count());
    LayoutOptions opts;
    opts.k = repulsion_for(graph.node_count(), kLayoutScale);
    Layout positions = spring_layout(graph, opts);

    GraphArtifact full;
    full.graph = graph;
    full.positions = positions;
    full.project_root = project_root_.string();

    if (graph.node_count() > config_.static_render_threshold) {
        spdlog::info("Full structure graph is large. Generating static image.");
        StaticRasterGenerator raster(store_.graphs_dir(), config_.raster_command);
        full.static_image_path = raster.generate(graph, "structure_graph_full", positions);
    } else {
        std::error_code ec;
        fs::remove(store_.static_image_path("structure_graph_full"), ec);
    }
    store_.save(GraphKind::Structure, Tier::Full, full);

    GraphArtifact simple;
    simple.graph = simple_tier(graph, config_.simple_graph_size);
    simple.project_root = full.project_root;
    store_.save(GraphKind::Structure, Tier::Simple, simple);

    spdlog::info("✅ Structure graph ready: {} nodes, {} edges (simple: {} nodes)",
                 graph.node_count(), graph.edge_count(), simple.graph.node_count());
    return graph;
}

} // namespace code_atlas
