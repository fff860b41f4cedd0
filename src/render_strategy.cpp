#include "code_atlas/render_strategy.hpp"
#include <spdlog/spdlog.h>

namespace code_atlas {

std::string to_string(RenderMode mode) {
    switch (mode) {
        case RenderMode::Interactive: return "interactive";
        case RenderMode::StaticImage: return "static";
        case RenderMode::Empty: return "empty";
    }
    return "empty";
}

RenderDecision select_render_strategy(GraphArtifact loaded, bool full_detail,
                                      const std::string& static_image, size_t small_graph_limit) {
    RenderDecision decision;
    decision.metadata = std::move(loaded.metadata);
    const size_t n = loaded.graph.node_count();

    if (n > 0 && n <= small_graph_limit) {
        decision.mode = RenderMode::Interactive;
        decision.graph = std::move(loaded.graph);
        return decision;
    }

    if (full_detail && !static_image.empty()) {
        spdlog::info("🖼️  Using pre-generated static image: {}", static_image);
        decision.mode = RenderMode::StaticImage;
        decision.static_image_path = static_image;
        return decision;
    }

    decision.mode = n > 0 ? RenderMode::Interactive : RenderMode::Empty;
    decision.graph = std::move(loaded.graph);
    return decision;
}

RenderDecision select_render_strategy(const GraphStore& store, GraphKind kind, bool full_detail,
                                      size_t small_graph_limit) {
    Tier tier = full_detail ? Tier::Full : Tier::Simple;
    GraphArtifact artifact = store.load(kind, tier);

    // Only the image recorded by the last build counts, and only while it is on disk.
    std::string static_image;
    if (full_detail && !artifact.static_image_path.empty()) {
        std::error_code ec;
        if (fs::exists(artifact.static_image_path, ec)) {
            static_image = artifact.static_image_path;
        } else {
            spdlog::warn("⚠️ Static image recorded but missing: {}", artifact.static_image_path);
        }
    }
    return select_render_strategy(std::move(artifact), full_detail, static_image, small_graph_limit);
}

} // namespace code_atlas
