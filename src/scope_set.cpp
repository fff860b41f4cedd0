#include "code_atlas/scope_set.hpp"
#include <fstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace code_atlas {

namespace {

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

} // namespace

ScopeSet::ScopeSet(fs::path scope_file) : scope_file_(std::move(scope_file)) {}

std::set<std::string> ScopeSet::load() const {
    std::set<std::string> entries;
    std::ifstream f(scope_file_);
    if (!f) return entries;

    std::string line;
    while (std::getline(f, line)) {
        std::string entry = trim(line);
        if (!entry.empty()) entries.insert(entry);
    }
    return entries;
}

std::vector<std::string> ScopeSet::list() const {
    auto entries = load();
    return {entries.begin(), entries.end()};
}

void ScopeSet::save(const std::set<std::string>& entries) const {
    fs::create_directories(scope_file_.parent_path());
    std::ofstream f(scope_file_, std::ios::trunc);
    if (!f) throw std::runtime_error("Cannot write scope file: " + scope_file_.string());
    bool first = true;
    for (const auto& e : entries) {
        if (!first) f << "\n";
        f << e;
        first = false;
    }
}

std::vector<std::string> ScopeSet::add(const std::vector<std::string>& files) {
    auto entries = load();
    std::vector<std::string> newly_added;
    for (const auto& file : files) {
        std::string entry = trim(file);
        if (entry.empty()) continue;
        if (entries.insert(entry).second) newly_added.push_back(entry);
    }
    if (!newly_added.empty()) {
        save(entries);
        spdlog::info("🎯 Scope +{} ({} total)", newly_added.size(), entries.size());
    }
    return newly_added;
}

size_t ScopeSet::remove(const std::vector<std::string>& files) {
    auto entries = load();
    size_t removed = 0;
    for (const auto& file : files) removed += entries.erase(trim(file));
    if (removed > 0) save(entries);
    return removed;
}

void ScopeSet::update(const std::vector<std::string>& to_add, const std::vector<std::string>& to_remove) {
    auto entries = load();
    for (const auto& file : to_add) {
        std::string entry = trim(file);
        if (!entry.empty()) entries.insert(entry);
    }
    for (const auto& file : to_remove) entries.erase(trim(file));
    save(entries);
}

void ScopeSet::clear() {
    save({});
}

} // namespace code_atlas
