#include "code_atlas/graph_styler.hpp"
#include <algorithm>
#include <limits>

namespace code_atlas {

std::string group_for(const std::string& node_id) {
    size_t sep = node_id.find("::");
    std::string folder = sep != std::string::npos ? node_id.substr(0, sep) : parent_dir(node_id);
    return folder.empty() ? "Root" : folder;
}

void apply_visual_styles(CodeGraph& graph) {
    if (graph.empty()) return;

    auto degrees = graph.degrees();
    size_t max_deg = 0;
    size_t min_deg = std::numeric_limits<size_t>::max();
    for (const auto& [id, deg] : degrees) {
        max_deg = std::max(max_deg, deg);
        min_deg = std::min(min_deg, deg);
    }

    for (const auto& id : graph.node_ids()) {
        GraphNode* node = graph.get_node(id);
        node->group = group_for(id);

        double norm = 0.5;
        if (max_deg > min_deg) {
            norm = static_cast<double>(degrees[id] - min_deg) / static_cast<double>(max_deg - min_deg);
        }
        node->size = kMinNodeSize + norm * (kMaxNodeSize - kMinNodeSize);
    }
}

} // namespace code_atlas
