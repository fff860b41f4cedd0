#pragma once

#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "code_atlas/code_graph.hpp"

namespace code_atlas {

struct Point {
    double x = 0.0;
    double y = 0.0;
};

using Layout = std::unordered_map<std::string, Point>;

struct LayoutOptions {
    int iterations = 50;
    double k = 0.0;           // optimal distance; <= 0 picks 1 / sqrt(n)
    unsigned int seed = 42;
};

// Fruchterman-Reingold spring layout. Edge direction is ignored and the
// result is centred at the origin and scaled into [-1, 1].
// Graphs above a few hundred nodes use the grid variant, where repulsion
// only acts between nodes closer than 2k.
Layout spring_layout(const CodeGraph& graph, const LayoutOptions& options = {});

// Repulsion constant that keeps dense graphs from collapsing.
double repulsion_for(size_t node_count, double scale);

nlohmann::json layout_to_json(const Layout& layout);
Layout layout_from_json(const nlohmann::json& j);

} // namespace code_atlas
