#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "code_atlas/code_graph.hpp"
#include "code_atlas/graph_store.hpp"

namespace code_atlas {

enum class RenderMode { Interactive, StaticImage, Empty };

std::string to_string(RenderMode mode);

struct RenderDecision {
    RenderMode mode = RenderMode::Empty;
    CodeGraph graph;                 // empty unless mode is Interactive
    std::string static_image_path;   // set only for StaticImage
    nlohmann::json metadata = nlohmann::json::object();
};

// Chooses how a loaded graph reaches the front-end:
//  - (0, small_graph_limit] nodes: interactive, any static image is ignored
//  - full detail with an existing static image: the image only
//  - otherwise the loaded graph, interactive
// `static_image` is the pre-rendered image path, empty when none exists.
RenderDecision select_render_strategy(GraphArtifact loaded, bool full_detail,
                                      const std::string& static_image, size_t small_graph_limit = 50);

// Loads the (kind, tier) artifact from `store` and applies the rules above. The
// static image is the one the artifact records, provided the file still exists.
RenderDecision select_render_strategy(const GraphStore& store, GraphKind kind, bool full_detail,
                                      size_t small_graph_limit = 50);

} // namespace code_atlas
