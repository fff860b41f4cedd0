#pragma once

#include "code_atlas/code_graph.hpp"

namespace code_atlas {

constexpr double kMinNodeSize = 5.0;
constexpr double kMaxNodeSize = 50.0;

// Annotates every node in place:
//  - group: parent directory ("path::name" ids use their owning file), "Root" at top level
//  - size:  degree scaled linearly into [kMinNodeSize, kMaxNodeSize]; when every
//           node has the same degree all of them get the midpoint.
// Topology is left untouched, so the pass works for every graph kind.
void apply_visual_styles(CodeGraph& graph);

// Group a node id belongs to, as assigned by apply_visual_styles.
std::string group_for(const std::string& node_id);

} // namespace code_atlas
