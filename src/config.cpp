#include "code_atlas/config.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <thread>
#include <spdlog/spdlog.h>

namespace code_atlas {

using json = nlohmann::json;

namespace {

std::string normalize_extension(std::string ext) {
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (!ext.empty() && ext[0] != '.') ext.insert(ext.begin(), '.');
    return ext;
}

} // namespace

size_t AtlasConfig::worker_count() const {
    if (num_workers > 0) return num_workers;
    unsigned int hw = std::thread::hardware_concurrency();
    size_t workers = static_cast<size_t>(hw * 0.75);
    return std::max<size_t>(1, workers);
}

bool AtlasConfig::is_allowed_extension(const fs::path& file) const {
    std::string ext = normalize_extension(file.extension().string());
    return !ext.empty() && allowed_extensions.count(ext) > 0;
}

json AtlasConfig::to_json() const {
    std::vector<std::string> dirs(ignore_dirs.begin(), ignore_dirs.end());
    std::vector<std::string> exts(allowed_extensions.begin(), allowed_extensions.end());
    std::sort(dirs.begin(), dirs.end());
    std::sort(exts.begin(), exts.end());
    return json{
        {"ignore_dirs", dirs},
        {"allowed_extensions", exts},
        {"ignored_paths", ignored_paths},
        {"included_paths", included_paths},
        {"static_render_threshold", static_render_threshold},
        {"simple_graph_size", simple_graph_size},
        {"num_workers", num_workers},
        {"progress_every", progress_every},
        {"storage_path", storage_path},
        {"raster_command", raster_command},
        {"small_graph_limit", small_graph_limit},
        {"initial_load_size", initial_load_size},
        {"chunk_size", chunk_size}
    };
}

AtlasConfig AtlasConfig::from_json(const json& j) {
    AtlasConfig cfg;
    if (j.contains("ignore_dirs")) {
        auto dirs = j["ignore_dirs"].get<std::vector<std::string>>();
        cfg.ignore_dirs = std::unordered_set<std::string>(dirs.begin(), dirs.end());
    }
    if (j.contains("allowed_extensions")) {
        cfg.allowed_extensions.clear();
        for (const auto& ext : j["allowed_extensions"].get<std::vector<std::string>>()) {
            if (!ext.empty()) cfg.allowed_extensions.insert(normalize_extension(ext));
        }
    }
    cfg.ignored_paths = j.value("ignored_paths", cfg.ignored_paths);
    cfg.included_paths = j.value("included_paths", cfg.included_paths);
    cfg.static_render_threshold = j.value("static_render_threshold", cfg.static_render_threshold);
    cfg.simple_graph_size = j.value("simple_graph_size", cfg.simple_graph_size);
    cfg.num_workers = j.value("num_workers", cfg.num_workers);
    cfg.progress_every = std::max<size_t>(1, j.value("progress_every", cfg.progress_every));
    cfg.storage_path = j.value("storage_path", cfg.storage_path);
    cfg.raster_command = j.value("raster_command", cfg.raster_command);
    cfg.small_graph_limit = j.value("small_graph_limit", cfg.small_graph_limit);
    cfg.initial_load_size = std::max<size_t>(1, j.value("initial_load_size", cfg.initial_load_size));
    cfg.chunk_size = std::max<size_t>(1, j.value("chunk_size", cfg.chunk_size));
    return cfg;
}

AtlasConfig load_config(const std::string& project_root) {
    fs::path config_path = fs::path(project_root) / ".code_atlas" / "config.json";
    if (!fs::exists(config_path)) {
        config_path = fs::path(project_root) / "code_atlas.json";
    }
    if (!fs::exists(config_path)) return AtlasConfig{};

    try {
        std::ifstream f(config_path);
        auto j = json::parse(f);
        AtlasConfig cfg = AtlasConfig::from_json(j);
        spdlog::info("⚙️  Config loaded from {}: {} ignored dirs, {} extensions.",
                     config_path.string(), cfg.ignore_dirs.size(), cfg.allowed_extensions.size());
        return cfg;
    } catch (const std::exception& e) {
        spdlog::error("❌ Config corrupted at {}: {}", config_path.string(), e.what());
    }
    return AtlasConfig{};
}

fs::path resolve_storage_dir(const std::string& project_root, const AtlasConfig& config) {
    if (!config.storage_path.empty()) return fs::path(config.storage_path);
    fs::path root = fs::path(project_root).lexically_normal();
    std::string name = root.filename().string();
    if (name.empty()) name = root.parent_path().filename().string();
    if (name.empty()) name = "project";
    return fs::path("data") / name;
}

} // namespace code_atlas
