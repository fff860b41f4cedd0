#include "code_atlas/project_session.hpp"
#include "code_atlas/dependency_graph.hpp"
#include "code_atlas/LogManager.hpp"
#include "code_atlas/project_walker.hpp"
#include "code_atlas/scope_graph.hpp"
#include "code_atlas/structure_graph.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <fstream>
#include <sstream>
#include <unordered_set>
#include <spdlog/spdlog.h>

namespace code_atlas {

using json = nlohmann::json;

json BuildReport::to_json() const {
    return {
        {"stage", stage},
        {"node_count", node_count},
        {"edge_count", edge_count},
        {"duration_ms", duration_ms},
        {"success", ok},
        {"error", error}
    };
}

ProjectSession::ProjectSession(fs::path project_root, ParserFactory parser_factory)
    : ProjectSession(project_root, load_config(project_root.string()), std::move(parser_factory)) {}

ProjectSession::ProjectSession(fs::path project_root, AtlasConfig config, ParserFactory parser_factory)
    : project_root_(std::move(project_root)),
      config_(std::move(config)),
      store_(resolve_storage_dir(project_root_.string(), config_)),
      scope_(store_.outputs_dir() / "scope.txt"),
      parser_factory_(std::move(parser_factory)) {
    spdlog::info("📂 Project set to: {} (storage: {})", project_root_.string(), store_.storage_dir().string());
}

BuildReport ProjectSession::run_build(const std::string& stage, const std::function<CodeGraph()>& fn) {
    std::lock_guard<std::mutex> lock(build_mtx_);
    auto start_time = std::chrono::high_resolution_clock::now();

    BuildReport report;
    report.stage = stage;
    try {
        CodeGraph graph = fn();
        report.node_count = graph.node_count();
        report.edge_count = graph.edge_count();
    } catch (const std::exception& e) {
        spdlog::error("❌ {} build failed: {}", stage, e.what());
        report.ok = false;
        report.error = e.what();
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    report.duration_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();

    LogManager::instance().add_log({
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count(),
        project_root_.filename().string(),
        stage,
        report.node_count,
        report.edge_count,
        report.duration_ms,
        report.ok ? "ok" : report.error
    });
    return report;
}

BuildReport ProjectSession::build_structure(const ProgressCallback& progress) {
    return run_build("structure", [&]() {
        return StructureGraphBuilder(project_root_, config_, store_).build(progress);
    });
}

BuildReport ProjectSession::build_dependencies(const ProgressCallback& progress) {
    return run_build("dependency", [&]() {
        return DependencyGraphBuilder(project_root_, config_, store_, parser_factory_).build(progress);
    });
}

BuildReport ProjectSession::build_scope(const ProgressCallback& progress) {
    return run_build("scope", [&]() {
        return ScopeGraphBuilder(project_root_, config_, store_, parser_factory_).build(scope_.load(), progress);
    });
}

BuildReport ProjectSession::build(GraphKind kind, const ProgressCallback& progress) {
    switch (kind) {
        case GraphKind::Structure: return build_structure(progress);
        case GraphKind::Dependency: return build_dependencies(progress);
        case GraphKind::Scope: return build_scope(progress);
    }
    return build_structure(progress);
}

RenderDecision ProjectSession::load_graph(GraphKind kind, bool full_detail) {
    RenderDecision decision = select_render_strategy(store_, kind, full_detail, config_.small_graph_limit);

    std::lock_guard<std::mutex> lock(state_mtx_);
    current_graph_ = decision.graph;
    file_metadata_ = decision.metadata;
    spdlog::info("📊 Loaded {} graph ({}): {} nodes, mode {}", to_string(kind), full_detail ? "full" : "simple",
                 current_graph_.node_count(), to_string(decision.mode));
    return decision;
}

CodeGraph ProjectSession::current_graph() const {
    std::lock_guard<std::mutex> lock(state_mtx_);
    return current_graph_;
}

json ProjectSession::file_metadata() const {
    std::lock_guard<std::mutex> lock(state_mtx_);
    return file_metadata_;
}

void ProjectSession::clear_cache() {
    std::lock_guard<std::mutex> build_lock(build_mtx_);
    for (const auto& dir : {store_.graphs_dir(), store_.outputs_dir()}) {
        std::error_code ec;
        if (!fs::is_directory(dir, ec)) continue;
        for (const auto& entry : fs::directory_iterator(dir, ec)) {
            std::error_code rm_ec;
            fs::remove_all(entry.path(), rm_ec);
            if (rm_ec) spdlog::error("Failed to delete {}: {}", entry.path().string(), rm_ec.message());
        }
    }

    std::lock_guard<std::mutex> lock(state_mtx_);
    current_graph_.clear();
    file_metadata_ = json::object();
    spdlog::info("🧹 Cleared cache for {}", project_root_.string());
}

std::vector<std::string> ProjectSession::scope_list() const {
    return scope_.list();
}

std::vector<std::string> ProjectSession::add_to_scope(const std::vector<std::string>& files) {
    return scope_.add(files);
}

size_t ProjectSession::remove_from_scope(const std::vector<std::string>& files) {
    return scope_.remove(files);
}

void ProjectSession::update_scope(const std::vector<std::string>& to_add, const std::vector<std::string>& to_remove) {
    scope_.update(to_add, to_remove);
}

void ProjectSession::clear_scope() {
    scope_.clear();
}

std::vector<std::string> ProjectSession::extrapolate_dependencies(const std::string& file) const {
    CodeGraph graph = current_graph();
    if (graph.edges().empty() || graph.edges().front().kind != EdgeKind::Include) {
        graph = store_.load(GraphKind::Dependency, Tier::Full).graph;
    }
    if (graph.empty()) {
        spdlog::warn("⚠️ Extrapolation unavailable: no dependency graph found.");
        return {};
    }
    if (!graph.has_node(file)) {
        spdlog::warn("⚠️ Extrapolation failed: {} not in graph.", file);
        return {};
    }

    std::vector<std::string> result{file};
    std::unordered_set<std::string> seen{file};
    const auto& up = graph.predecessors(file);
    const auto& down = graph.successors(file);
    for (const auto* list : {&up, &down}) {
        for (const auto& id : *list) {
            if (seen.insert(id).second) result.push_back(id);
        }
    }
    spdlog::info("Extrapolated {}: {} importers, {} imports.", file, up.size(), down.size());
    return result;
}

std::vector<std::string> ProjectSession::all_project_files() const {
    json metadata = file_metadata();
    if (metadata.is_object() && !metadata.empty()) {
        std::vector<std::string> files;
        files.reserve(metadata.size());
        for (auto it = metadata.begin(); it != metadata.end(); ++it) files.push_back(it.key());
        return files;
    }
    return collect_source_files(project_root_, config_, store_.storage_dir());
}

std::vector<std::string> ProjectSession::search_files(const std::string& query) const {
    auto files = all_project_files();
    if (query.empty()) {
        if (files.size() > 100) files.resize(100);
        return files;
    }

    auto lower = [](std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    };
    const std::string needle = lower(query);

    std::vector<std::string> matches;
    for (const auto& f : files) {
        if (lower(f).find(needle) != std::string::npos) matches.push_back(f);
    }
    std::stable_sort(matches.begin(), matches.end(),
                     [](const std::string& a, const std::string& b) { return a.size() < b.size(); });
    if (matches.size() > 50) matches.resize(50);
    return matches;
}

std::map<std::string, std::string> ProjectSession::files_content(const std::vector<std::string>& relative_paths) const {
    std::map<std::string, std::string> content_map;
    for (const auto& rel : relative_paths) {
        fs::path rel_path = fs::path(rel).lexically_normal();
        if (rel_path.is_absolute() || (!rel_path.empty() && *rel_path.begin() == "..")) {
            spdlog::warn("⚠️ Refusing to read outside the project: {}", rel);
            continue;
        }

        fs::path full_path = project_root_ / rel_path;
        std::error_code ec;
        std::ifstream f;
        if (fs::is_regular_file(full_path, ec)) f.open(full_path, std::ios::in | std::ios::binary);
        if (!f.is_open()) {
            spdlog::warn("⚠️ Could not read content of {}", rel);
            continue;
        }
        std::stringstream buffer;
        buffer << f.rdbuf();
        content_map[rel] = buffer.str();
    }
    return content_map;
}

} // namespace code_atlas
