#pragma once
#include <filesystem>
#include <set>
#include <string>
#include <vector>
#include "code_atlas/code_graph.hpp"
#include "code_atlas/config.hpp"
#include "code_atlas/graph_store.hpp"
#include "code_atlas/parse_stage.hpp"
#include "code_atlas/source_parser.hpp"

namespace code_atlas {

namespace fs = std::filesystem;

// 🔬 Symbol-level graph over the scope set: file nodes, their definitions,
// reachability edges taken from the dependency graph and heuristic call edges.
class ScopeGraphBuilder {
public:
    static constexpr size_t kTooltipRows = 20;
    static constexpr size_t kSignatureLimit = 60;
    static constexpr double kDefinitionSize = 10.0;

    ScopeGraphBuilder(fs::path project_root, AtlasConfig config, const GraphStore& store,
                      ParserFactory parser_factory);

    // Rebuilds and persists both scope tiers. An empty scope persists empty graphs.
    CodeGraph build(const std::set<std::string>& scope, const ProgressCallback& progress = nullptr) const;

    // Adds a calls edge per recorded call. Candidates sharing the called name
    // are looked up in insertion order; one in the caller's own file wins.
    static void link_calls(CodeGraph& graph);

    // File nodes (tooltips included) and the dependency edges between them.
    static CodeGraph simple_view(const CodeGraph& full);

    // First line of a definition, trailing '{' removed, HTML-escaped and capped.
    static std::string display_signature(const std::string& definition_text);

    static std::string file_tooltip(const std::string& file, const std::vector<Definition>& definitions);

private:
    fs::path project_root_;
    AtlasConfig config_;
    const GraphStore& store_;
    ParserFactory parser_factory_;
};

} // namespace code_atlas
