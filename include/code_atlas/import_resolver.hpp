#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace code_atlas {

// Maps raw import tokens onto files of a known project universe.
// Lookups never touch the filesystem; everything is indexed up front.
class ImportResolver {
public:
    explicit ImportResolver(const std::vector<std::string>& all_files);

    // Project path for `raw_import` as seen from `source_file`, or nullopt
    // when the token is external or cannot be matched.
    std::optional<std::string> resolve(const std::string& source_file,
                                       const std::string& raw_import) const;

    // Strips whitespace and surrounding "", '' or <> pairs, repeatedly.
    static std::string sanitize(const std::string& raw_import);

private:
    std::optional<std::string> lookup_exact(const std::string& candidate) const;

    std::unordered_set<std::string> all_files_;
    std::unordered_map<std::string, std::string> module_map_;    // "pkg.mod" -> "pkg/mod.py"
    std::unordered_map<std::string, std::string> stem_map_;      // "src/util" -> "src/util.h"
    std::unordered_map<std::string, std::string> basename_map_;  // "util.h" -> "src/util.h"
};

} // namespace code_atlas
