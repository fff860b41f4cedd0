#include "code_atlas/dependency_graph.hpp"
#include "code_atlas/import_resolver.hpp"
#include "code_atlas/project_walker.hpp"
#include "code_atlas/static_raster.hpp"
#include "code_atlas/structure_graph.hpp"
#include <spdlog/spdlog.h>

namespace code_atlas {

using json = nlohmann::json;

DependencyGraphBuilder::DependencyGraphBuilder(fs::path project_root, AtlasConfig config, const GraphStore& store,
                                               ParserFactory parser_factory)
    : project_root_(std::move(project_root)), config_(std::move(config)), store_(store),
      parser_factory_(std::move(parser_factory)) {}

CodeGraph DependencyGraphBuilder::link(const CodeGraph& base, const ParseRecords& records) {
    CodeGraph graph = base;
    graph.clear_edges();

    ImportResolver resolver(graph.node_ids());
    size_t total_imports = 0;
    for (const auto& [source, record] : records) {
        if (!record.ok() || !graph.has_node(source)) continue;
        total_imports += record.imports.size();

        for (const auto& imp : record.imports) {
            auto target = resolver.resolve(source, imp);
            if (!target || *target == source || !graph.has_node(*target)) continue;
            graph.add_edge(source, *target, EdgeKind::Include, {{"arrows", "to"}});
        }
    }
    spdlog::info("Linked {} include edges from {} raw imports.", graph.edge_count(), total_imports);
    return graph;
}

GraphArtifact DependencyGraphBuilder::load_structure(Tier tier) const {
    if (store_.exists(GraphKind::Structure, tier)) {
        GraphArtifact artifact = store_.load(GraphKind::Structure, tier);
        if (!artifact.graph.empty()) return artifact;
    }
    spdlog::info("🌳 Structure graph missing, building it first...");
    StructureGraphBuilder(project_root_, config_, store_).build();
    return store_.load(GraphKind::Structure, tier);
}

CodeGraph DependencyGraphBuilder::build(const ProgressCallback& progress) const {
    if (progress) progress(0, 1, "Scanning project structure...");

    auto files = collect_source_files(project_root_, config_, store_.storage_dir());
    if (files.empty()) {
        spdlog::warn("⚠️ No target files found to analyze.");
        std::error_code ec;
        fs::remove(store_.static_image_path("dependency_graph_full"), ec);

        GraphArtifact empty;
        empty.project_root = project_root_.string();
        store_.save(GraphKind::Dependency, Tier::Full, empty);
        store_.save(GraphKind::Dependency, Tier::Simple, empty);
        if (progress) progress(0, 0, "Dependency analysis complete.");
        return {};
    }

    ParseRecords records = parse_concurrently(project_root_, files, parser_factory_,
                                              config_.worker_count(), config_.progress_every, progress);
    json metadata = records_to_json(records);

    // Full tier
    if (progress) progress(0, 1, "Constructing full dependency graph...");
    GraphArtifact base = load_structure(Tier::Full);

    GraphArtifact full;
    full.graph = link(base.graph, records);
    full.positions = base.positions;
    full.metadata = metadata;
    full.project_root = project_root_.string();

    if (full.graph.node_count() > config_.static_render_threshold) {
        StaticRasterGenerator raster(store_.graphs_dir(), config_.raster_command);
        full.static_image_path = raster.generate(full.graph, "dependency_graph_full", base.positions);
    } else {
        std::error_code ec;
        fs::remove(store_.static_image_path("dependency_graph_full"), ec);
    }
    store_.save(GraphKind::Dependency, Tier::Full, full);

    // Simple tier: the full tier restricted to the simple structure nodes.
    if (progress) progress(0, 1, "Constructing simple dependency graph...");
    GraphArtifact base_simple = load_structure(Tier::Simple);
    std::vector<std::string> keep;
    keep.reserve(base_simple.graph.node_count());
    for (const auto& id : base_simple.graph.node_ids()) {
        if (full.graph.has_node(id)) keep.push_back(id);
    }

    GraphArtifact simple;
    simple.graph = full.graph.induced_subgraph(keep);
    simple.positions = base_simple.positions;
    simple.metadata = metadata;
    simple.project_root = full.project_root;
    store_.save(GraphKind::Dependency, Tier::Simple, simple);

    if (progress) progress(files.size(), files.size(), "Dependency analysis complete.");
    spdlog::info("✅ Dependency graph ready: {} nodes, {} edges", full.graph.node_count(), full.graph.edge_count());
    return full.graph;
}

} // namespace code_atlas
