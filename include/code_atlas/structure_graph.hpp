#pragma once
#include <filesystem>
#include "code_atlas/code_graph.hpp"
#include "code_atlas/config.hpp"
#include "code_atlas/graph_store.hpp"
#include "code_atlas/parse_stage.hpp"

namespace code_atlas {

namespace fs = std::filesystem;

// 🌳 Directory/file containment graph.
class StructureGraphBuilder {
public:
    static constexpr double kLayoutScale = 0.8;

    StructureGraphBuilder(fs::path project_root, AtlasConfig config, const GraphStore& store);

    // Walks the tree, styles and lays out the result, then persists the full
    // and simple tiers (rasterizing the full tier when it is oversized).
    // Returns the full graph.
    CodeGraph build(const ProgressCallback& progress = nullptr) const;

    // Unstyled containment graph; the root directory is node ".".
    CodeGraph scan() const;

    // Top `limit` nodes by degree with the edges induced between them.
    static CodeGraph simple_tier(const CodeGraph& full, size_t limit);

private:
    fs::path project_root_;
    AtlasConfig config_;
    const GraphStore& store_;
};

} // namespace code_atlas
