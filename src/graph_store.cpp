#include "code_atlas/graph_store.hpp"
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace code_atlas {

using json = nlohmann::json;

std::string to_string(GraphKind kind) {
    switch (kind) {
        case GraphKind::Structure: return "structure";
        case GraphKind::Dependency: return "dependency";
        case GraphKind::Scope: return "scope";
    }
    return "structure";
}

std::string to_string(Tier tier) {
    return tier == Tier::Full ? "full" : "simple";
}

GraphKind graph_kind_from_string(const std::string& s) {
    if (s == "structure" || s == "file") return GraphKind::Structure;
    if (s == "dependency" || s == "logic") return GraphKind::Dependency;
    if (s == "scope") return GraphKind::Scope;
    throw std::invalid_argument("Unknown graph kind: " + s);
}

json GraphArtifact::to_json() const {
    json j = {
        {"graph", graph.to_json()},
        {"metadata", metadata},
        {"static_image_path", static_image_path},
        {"root", project_root}
    };
    j["positions"] = positions ? layout_to_json(*positions) : json(nullptr);
    return j;
}

GraphArtifact GraphArtifact::from_json(const json& j) {
    GraphArtifact a;
    if (j.contains("graph")) a.graph = CodeGraph::from_json(j["graph"]);
    if (j.contains("positions") && j["positions"].is_object()) a.positions = layout_from_json(j["positions"]);
    if (j.contains("metadata") && j["metadata"].is_object()) a.metadata = j["metadata"];
    a.static_image_path = j.value("static_image_path", "");
    a.project_root = j.value("root", "");
    return a;
}

GraphStore::GraphStore(fs::path storage_dir) : storage_dir_(std::move(storage_dir)) {}

fs::path GraphStore::artifact_path(GraphKind kind, Tier tier) const {
    return graphs_dir() / (to_string(kind) + "_graph_" + to_string(tier) + ".msgpack");
}

fs::path GraphStore::static_image_path(const std::string& name) const {
    return graphs_dir() / ("static_" + name + ".png");
}

bool GraphStore::exists(GraphKind kind, Tier tier) const {
    std::error_code ec;
    return fs::exists(artifact_path(kind, tier), ec);
}

void GraphStore::save(GraphKind kind, Tier tier, const GraphArtifact& artifact) const {
    fs::create_directories(graphs_dir());
    fs::path path = artifact_path(kind, tier);

    std::vector<std::uint8_t> bytes = json::to_msgpack(artifact.to_json());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Cannot write graph artifact: " + path.string());
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));

    spdlog::info("💾 Saved {} {} graph: {} nodes, {} edges",
                 to_string(kind), to_string(tier), artifact.graph.node_count(), artifact.graph.edge_count());
}

GraphArtifact GraphStore::load(GraphKind kind, Tier tier) const {
    fs::path path = artifact_path(kind, tier);
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        spdlog::debug("No {} {} graph at {}", to_string(kind), to_string(tier), path.string());
        return {};
    }

    try {
        std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        return GraphArtifact::from_json(json::from_msgpack(bytes));
    } catch (const std::exception& e) {
        spdlog::warn("⚠️ Unreadable graph artifact {} ({}), using an empty graph", path.string(), e.what());
        return {};
    }
}

} // namespace code_atlas
