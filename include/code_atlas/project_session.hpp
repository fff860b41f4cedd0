#pragma once
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "code_atlas/code_graph.hpp"
#include "code_atlas/config.hpp"
#include "code_atlas/graph_store.hpp"
#include "code_atlas/parse_stage.hpp"
#include "code_atlas/render_strategy.hpp"
#include "code_atlas/scope_set.hpp"
#include "code_atlas/source_parser.hpp"

namespace code_atlas {

namespace fs = std::filesystem;

struct BuildReport {
    std::string stage;
    size_t node_count = 0;
    size_t edge_count = 0;
    double duration_ms = 0.0;
    bool ok = true;
    std::string error;

    nlohmann::json to_json() const;
};

// 🧭 Everything tied to one opened project: root, config, storage, scope set
// and the graph most recently loaded for display.
class ProjectSession {
public:
    explicit ProjectSession(fs::path project_root, ParserFactory parser_factory = tree_sitter_parser_factory());
    ProjectSession(fs::path project_root, AtlasConfig config, ParserFactory parser_factory);

    const fs::path& project_root() const { return project_root_; }
    const AtlasConfig& config() const { return config_; }
    const GraphStore& store() const { return store_; }

    // Builds never throw; failures come back in the report.
    BuildReport build_structure(const ProgressCallback& progress = nullptr);
    BuildReport build_dependencies(const ProgressCallback& progress = nullptr);
    BuildReport build_scope(const ProgressCallback& progress = nullptr);
    BuildReport build(GraphKind kind, const ProgressCallback& progress = nullptr);

    // Applies the render strategy and remembers the result as the current graph.
    RenderDecision load_graph(GraphKind kind, bool full_detail);
    CodeGraph current_graph() const;
    nlohmann::json file_metadata() const;

    // Deletes persisted graphs and outputs (scope file included).
    void clear_cache();

    std::vector<std::string> scope_list() const;
    std::vector<std::string> add_to_scope(const std::vector<std::string>& files);
    size_t remove_from_scope(const std::vector<std::string>& files);
    void update_scope(const std::vector<std::string>& to_add, const std::vector<std::string>& to_remove);
    void clear_scope();

    // The file followed by its importers and its imports; empty when no
    // dependency graph is available or the file is not part of it.
    std::vector<std::string> extrapolate_dependencies(const std::string& file) const;

    std::vector<std::string> all_project_files() const;
    // Case-insensitive substring match, shortest paths first, at most 50.
    // An empty query lists the first 100 files.
    std::vector<std::string> search_files(const std::string& query) const;
    // Unreadable or out-of-project paths are skipped.
    std::map<std::string, std::string> files_content(const std::vector<std::string>& relative_paths) const;

private:
    BuildReport run_build(const std::string& stage, const std::function<CodeGraph()>& fn);

    fs::path project_root_;
    AtlasConfig config_;
    GraphStore store_;
    ScopeSet scope_;
    ParserFactory parser_factory_;

    std::mutex build_mtx_;
    mutable std::mutex state_mtx_;
    CodeGraph current_graph_;
    nlohmann::json file_metadata_ = nlohmann::json::object();
};

} // namespace code_atlas
