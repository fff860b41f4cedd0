#include "code_atlas/import_resolver.hpp"
#include <algorithm>
#include <filesystem>

namespace code_atlas {

namespace fs = std::filesystem;

namespace {

bool has_suffix(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string strip_extension(const std::string& path) {
    size_t slash = path.find_last_of('/');
    size_t dot = path.find_last_of('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) return path;
    if (dot == (slash == std::string::npos ? 0 : slash + 1)) return path;  // dotfile
    return path.substr(0, dot);
}

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

} // namespace

ImportResolver::ImportResolver(const std::vector<std::string>& all_files)
    : all_files_(all_files.begin(), all_files.end()) {
    for (const auto& f : all_files) {
        std::string generic = f;
        std::replace(generic.begin(), generic.end(), '\\', '/');

        basename_map_.emplace(fs::path(generic).filename().string(), f);

        std::string stem = strip_extension(generic);
        if (stem != generic) stem_map_.emplace(stem, f);

        if (has_suffix(generic, ".py") || has_suffix(generic, ".lua")) {
            std::string mod_name = stem;
            std::replace(mod_name.begin(), mod_name.end(), '/', '.');
            module_map_.emplace(mod_name, f);

            const std::string init_suffix = ".__init__";
            if (has_suffix(mod_name, init_suffix)) {
                module_map_.emplace(mod_name.substr(0, mod_name.size() - init_suffix.size()), f);
            }
        }
    }
}

std::string ImportResolver::sanitize(const std::string& raw_import) {
    std::string clean = trim(raw_import);
    while (clean.size() >= 2) {
        char first = clean.front();
        char last = clean.back();
        bool quoted = (first == '"' && last == '"') || (first == '\'' && last == '\'') ||
                      (first == '<' && last == '>');
        if (!quoted) break;
        clean = trim(clean.substr(1, clean.size() - 2));
    }
    return clean;
}

std::optional<std::string> ImportResolver::lookup_exact(const std::string& candidate) const {
    if (all_files_.count(candidate)) return candidate;

    std::string forward = candidate;
    std::replace(forward.begin(), forward.end(), '\\', '/');
    if (all_files_.count(forward)) return forward;

    std::string backward = candidate;
    std::replace(backward.begin(), backward.end(), '/', '\\');
    if (all_files_.count(backward)) return backward;

    return std::nullopt;
}

std::optional<std::string> ImportResolver::resolve(const std::string& source_file,
                                                   const std::string& raw_import) const {
    std::string target = sanitize(raw_import);
    if (target.empty()) return std::nullopt;

    // 1. Direct match / module match
    if (all_files_.count(target)) return target;
    auto mod_it = module_map_.find(target);
    if (mod_it != module_map_.end()) return mod_it->second;

    // 2. Relative path resolution
    std::string source = source_file;
    std::replace(source.begin(), source.end(), '\\', '/');
    std::string normalized_target = target;
    std::replace(normalized_target.begin(), normalized_target.end(), '\\', '/');

    fs::path source_dir = fs::path(source).parent_path();
    fs::path joined = normalized_target == "." ? source_dir : source_dir / normalized_target;
    std::string candidate = joined.lexically_normal().generic_string();
    while (candidate.size() > 1 && candidate.back() == '/') candidate.pop_back();

    if (!candidate.empty() && candidate.rfind("..", 0) != 0) {
        if (auto hit = lookup_exact(candidate)) return hit;
        auto stem_it = stem_map_.find(candidate);
        if (stem_it != stem_map_.end()) return stem_it->second;
    }

    // 3. Basename fallback (non-normalized include paths)
    std::string basename = fs::path(normalized_target).filename().string();
    auto base_it = basename_map_.find(basename);
    if (base_it != basename_map_.end()) return base_it->second;

    return std::nullopt;
}

} // namespace code_atlas
