#pragma once
#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace code_atlas {

namespace fs = std::filesystem;

// User-curated file subset driving the scope graph, stored one path per line.
// Entries are never checked against the filesystem.
class ScopeSet {
public:
    explicit ScopeSet(fs::path scope_file);

    // Blank lines are ignored; a missing file is an empty set.
    std::set<std::string> load() const;
    std::vector<std::string> list() const;

    // Returns the entries that were not already present.
    std::vector<std::string> add(const std::vector<std::string>& files);
    // Returns how many entries were dropped.
    size_t remove(const std::vector<std::string>& files);
    void update(const std::vector<std::string>& to_add, const std::vector<std::string>& to_remove);
    void clear();

    const fs::path& path() const { return scope_file_; }

private:
    void save(const std::set<std::string>& entries) const;

    fs::path scope_file_;
};

} // namespace code_atlas
