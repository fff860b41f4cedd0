#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "code_atlas/code_graph.hpp"
#include "code_atlas/graph_layout.hpp"

namespace code_atlas {

namespace fs = std::filesystem;

enum class GraphKind { Structure, Dependency, Scope };
enum class Tier { Full, Simple };

std::string to_string(GraphKind kind);
std::string to_string(Tier tier);
// Accepts "structure"/"file", "dependency"/"logic", "scope"; throws std::invalid_argument otherwise.
GraphKind graph_kind_from_string(const std::string& s);

// Everything persisted for one (kind, tier).
struct GraphArtifact {
    CodeGraph graph;
    std::optional<Layout> positions;
    nlohmann::json metadata = nlohmann::json::object();
    std::string static_image_path;
    std::string project_root;

    nlohmann::json to_json() const;
    static GraphArtifact from_json(const nlohmann::json& j);
};

// 💾 MessagePack snapshots under <storage>/graphs.
class GraphStore {
public:
    explicit GraphStore(fs::path storage_dir);

    // Overwrites the whole artifact.
    void save(GraphKind kind, Tier tier, const GraphArtifact& artifact) const;

    // Missing or unreadable artifacts load as an empty graph.
    GraphArtifact load(GraphKind kind, Tier tier) const;

    bool exists(GraphKind kind, Tier tier) const;

    fs::path artifact_path(GraphKind kind, Tier tier) const;
    fs::path static_image_path(const std::string& name) const;
    fs::path graphs_dir() const { return storage_dir_ / "graphs"; }
    fs::path outputs_dir() const { return storage_dir_ / "outputs"; }
    const fs::path& storage_dir() const { return storage_dir_; }

private:
    fs::path storage_dir_;
};

} // namespace code_atlas
