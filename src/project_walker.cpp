#include "code_atlas/project_walker.hpp"
#include <algorithm>
#include <system_error>
#include <spdlog/spdlog.h>

namespace code_atlas {

PathFilter::PathFilter(const AtlasConfig& config) : ignore_dirs_(config.ignore_dirs) {
    for (const auto& p : config.ignored_paths) {
        if (!p.empty()) rules_.insert(p, PathFlag::IGNORE);
    }
    for (const auto& p : config.included_paths) {
        if (!p.empty()) rules_.insert(p, PathFlag::INCLUDE);
    }
}

bool PathFilter::should_enter(const std::string& dir_name, const fs::path& rel_dir) const {
    if (ignore_dirs_.count(dir_name)) return false;
    if (rules_.empty()) return true;
    return !rules_.is_ignored(rel_dir) || rules_.leads_to_include(rel_dir);
}

bool PathFilter::should_collect(const fs::path& rel_file) const {
    return rules_.empty() || !rules_.is_ignored(rel_file);
}

namespace {

void scan_directory_recursive(const fs::path& current_dir,
                              const fs::path& root_dir,
                              const std::string& rel_current,
                              const PathFilter& filter,
                              const WalkVisitor& visitor,
                              const fs::path& skip) {
    std::vector<fs::directory_entry> entries;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(current_dir, fs::directory_options::skip_permission_denied, ec)) {
        entries.push_back(entry);
    }
    if (ec) {
        spdlog::error("Scanner error at {}: {}", current_dir.string(), ec.message());
        return;
    }
    std::sort(entries.begin(), entries.end(), [](const auto& a, const auto& b) {
        return a.path().filename().string() < b.path().filename().string();
    });

    std::vector<fs::directory_entry> subdirs;
    for (const auto& entry : entries) {
        const auto& path = entry.path();
        std::string name = path.filename().string();
        std::string rel = rel_current == "." ? name : rel_current + "/" + name;

        std::error_code type_ec;
        if (entry.is_directory(type_ec)) {
            if (!skip.empty()) {
                std::error_code eq_ec;
                if (fs::equivalent(path, skip, eq_ec)) continue;
            }
            if (!filter.should_enter(name, fs::path(rel))) {
                spdlog::debug("DIR  | {} | Action: SKIP", rel);
                continue;
            }
            if (visitor.on_directory) visitor.on_directory(rel, rel_current);
            subdirs.push_back(entry);
        } else if (entry.is_regular_file(type_ec)) {
            if (!filter.should_collect(fs::path(rel))) continue;
            if (visitor.on_file) visitor.on_file(rel, rel_current);
        }
    }

    for (const auto& dir : subdirs) {
        std::string name = dir.path().filename().string();
        std::string rel = rel_current == "." ? name : rel_current + "/" + name;
        scan_directory_recursive(dir.path(), root_dir, rel, filter, visitor, skip);
    }
}

} // namespace

void walk_project(const fs::path& root, const PathFilter& filter,
                  const WalkVisitor& visitor, const fs::path& skip) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        spdlog::warn("⚠️ Project root is not a directory: {}", root.string());
        return;
    }
    if (visitor.on_directory) visitor.on_directory(".", "");
    scan_directory_recursive(root, root, ".", filter, visitor, skip);
}

std::vector<std::string> collect_source_files(const fs::path& root, const AtlasConfig& config,
                                              const fs::path& skip) {
    std::vector<std::string> files;
    PathFilter filter(config);
    WalkVisitor visitor;
    visitor.on_file = [&](const std::string& rel, const std::string&) {
        if (config.is_allowed_extension(fs::path(rel))) files.push_back(rel);
    };
    walk_project(root, filter, visitor, skip);
    return files;
}

} // namespace code_atlas
