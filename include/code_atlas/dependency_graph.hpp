#pragma once
#include <filesystem>
#include "code_atlas/code_graph.hpp"
#include "code_atlas/config.hpp"
#include "code_atlas/graph_store.hpp"
#include "code_atlas/parse_stage.hpp"
#include "code_atlas/source_parser.hpp"

namespace code_atlas {

namespace fs = std::filesystem;

// 🔗 File-to-file import graph laid over the structure graph's nodes and layout.
class DependencyGraphBuilder {
public:
    DependencyGraphBuilder(fs::path project_root, AtlasConfig config, const GraphStore& store,
                           ParserFactory parser_factory);

    // Parses every eligible file, links imports on top of the structure graph
    // (building it first when missing) and persists both tiers.
    // Returns the full graph, or an empty one when there is nothing to parse.
    CodeGraph build(const ProgressCallback& progress = nullptr) const;

    // `base` with its edges replaced by one include edge per resolved import.
    static CodeGraph link(const CodeGraph& base, const ParseRecords& records);

private:
    GraphArtifact load_structure(Tier tier) const;

    fs::path project_root_;
    AtlasConfig config_;
    const GraphStore& store_;
    ParserFactory parser_factory_;
};

} // namespace code_atlas
