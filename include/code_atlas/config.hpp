#pragma once

#include <string>
#include <vector>
#include <unordered_set>
#include <filesystem>
#include <nlohmann/json.hpp>

namespace code_atlas {

namespace fs = std::filesystem;

// ⚙️ Per-project settings. Every field has a usable default so a project
// without a config file still builds.
struct AtlasConfig {
    std::unordered_set<std::string> ignore_dirs = {
        ".git", ".svn", ".hg", ".idea", ".vscode",
        "node_modules", "venv", ".venv", "env",
        "dist", "build", "target", "bin", "obj",
        "vendor", "third_party", "cmake-build-debug",
        "__pycache__", ".code_atlas"
    };

    // Lower-case, dot-prefixed.
    std::unordered_set<std::string> allowed_extensions = {
        ".c", ".h", ".cpp", ".hpp", ".cc", ".cxx",
        ".py", ".pyw",
        ".js", ".ts", ".jsx", ".tsx",
        ".java", ".kt",
        ".rs", ".go",
        ".lua"
    };

    // Project-relative prefix rules; an included path re-opens part of an ignored one.
    std::vector<std::string> ignored_paths;
    std::vector<std::string> included_paths;

    size_t static_render_threshold = 2000;
    size_t simple_graph_size = 2000;
    size_t num_workers = 0;          // 0 = 75% of hardware threads
    size_t progress_every = 20;
    std::string storage_path;        // empty = data/<project name>
    std::string raster_command = "neato";

    size_t small_graph_limit = 50;
    size_t initial_load_size = 1500;
    size_t chunk_size = 1000;

    size_t worker_count() const;
    bool is_allowed_extension(const fs::path& file) const;

    nlohmann::json to_json() const;
    // Missing keys keep their defaults.
    static AtlasConfig from_json(const nlohmann::json& j);
};

// Reads <root>/.code_atlas/config.json, then <root>/code_atlas.json.
// A missing or corrupt file yields the defaults.
AtlasConfig load_config(const std::string& project_root);

// Storage directory for a project: the configured path, else data/<project name>.
fs::path resolve_storage_dir(const std::string& project_root, const AtlasConfig& config);

} // namespace code_atlas
