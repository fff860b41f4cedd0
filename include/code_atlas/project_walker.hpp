#pragma once
#include <filesystem>
#include <functional>
#include <string>
#include <vector>
#include "code_atlas/config.hpp"
#include "code_atlas/PrefixTrie.hpp"

namespace code_atlas {

namespace fs = std::filesystem;

// Directory-name ignore set plus the configured path rules.
class PathFilter {
public:
    explicit PathFilter(const AtlasConfig& config);

    bool should_enter(const std::string& dir_name, const fs::path& rel_dir) const;
    bool should_collect(const fs::path& rel_file) const;

private:
    std::unordered_set<std::string> ignore_dirs_;
    PrefixTrie rules_;
};

struct WalkVisitor {
    // (relative dir, relative parent dir); the root is reported as "." with an empty parent.
    std::function<void(const std::string&, const std::string&)> on_directory;
    // (relative file, relative parent dir)
    std::function<void(const std::string&, const std::string&)> on_file;
};

// Depth-first walk in sorted entry order. Relative paths use '/' separators.
// `skip` (typically the storage directory) is never entered.
void walk_project(const fs::path& root, const PathFilter& filter,
                  const WalkVisitor& visitor, const fs::path& skip = {});

// Project-relative paths of every file the parse stage should read.
std::vector<std::string> collect_source_files(const fs::path& root, const AtlasConfig& config,
                                              const fs::path& skip = {});

} // namespace code_atlas
