#include "code_atlas/static_raster.hpp"
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <map>
#include <set>
#include <spdlog/spdlog.h>

namespace code_atlas {

namespace {

const char* const kPalette[] = {
    "#1f77b4", "#aec7e8", "#ff7f0e", "#ffbb78", "#2ca02c",
    "#98df8a", "#d62728", "#ff9896", "#9467bd", "#c5b0d5",
    "#8c564b", "#c49c94", "#e377c2", "#f7b6d2", "#7f7f7f",
    "#c7c7c7", "#bcbd22", "#dbdb8d", "#17becf", "#9edae5"
};
constexpr size_t kPaletteSize = sizeof(kPalette) / sizeof(kPalette[0]);

std::string dot_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '"' || c == '\\') out += '\\';
        if (c == '\n' || c == '\r') continue;
        out += c;
    }
    return out;
}

} // namespace

StaticRasterGenerator::StaticRasterGenerator(fs::path output_dir, std::string layout_command)
    : output_dir_(std::move(output_dir)), layout_command_(std::move(layout_command)) {}

fs::path StaticRasterGenerator::output_path(const std::string& name) const {
    return output_dir_ / ("static_" + name + ".png");
}

std::string StaticRasterGenerator::palette_color(size_t group_index) {
    return kPalette[group_index % kPaletteSize];
}

void StaticRasterGenerator::write_dot(std::ostream& out, const CodeGraph& graph, const Layout& layout) {
    std::set<std::string> group_set;
    for (const auto& n : graph.nodes()) group_set.insert(n.group);
    std::map<std::string, size_t> group_index;
    for (const auto& g : group_set) group_index.emplace(g, group_index.size());

    // Layout coordinates live in [-1, 1]; map them onto the canvas in points.
    const double canvas_pt = kCanvasInches * 72.0;
    const double half = canvas_pt / 2.0 * 0.95;

    out << "digraph G {\n";
    out << "  graph [size=\"" << kCanvasInches << "," << kCanvasInches << "!\", dpi=" << kDpi
        << ", bgcolor=\"#222222\", outputorder=edgesfirst, pad=0.5];\n";
    out << "  node [shape=circle, style=filled, fixedsize=true, penwidth=0, fontsize=6, fontcolor=\"#eeeeee\"];\n";
    out << "  edge [color=\"#aaaaaa33\", arrowsize=0.3, penwidth=0.5];\n";

    for (const auto& n : graph.nodes()) {
        Point p;
        auto it = layout.find(n.id);
        if (it != layout.end()) p = it->second;
        const double x = canvas_pt / 2.0 + p.x * half;
        const double y = canvas_pt / 2.0 + p.y * half;
        const double width = std::max(n.size, 1.0) / 50.0;

        out << "  \"" << dot_escape(n.id) << "\" [label=\"" << dot_escape(base_name(n.id))
            << "\", pos=\"" << x << "," << y << "!\", width=" << width
            << ", fillcolor=\"" << palette_color(group_index[n.group]) << "\"];\n";
    }
    for (const auto& e : graph.edges()) {
        out << "  \"" << dot_escape(e.source) << "\" -> \"" << dot_escape(e.target) << "\";\n";
    }
    out << "}\n";
}

std::string StaticRasterGenerator::shell_quote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::string StaticRasterGenerator::generate(const CodeGraph& graph, const std::string& name,
                                            const std::optional<Layout>& layout) const {
    if (graph.empty()) return "";

    try {
        spdlog::info("🖼️  Generating static image for {} ({} nodes)...", name, graph.node_count());
        fs::create_directories(output_dir_);

        Layout positions;
        if (layout && !layout->empty()) {
            positions = *layout;
        } else {
            LayoutOptions opts;
            opts.iterations = kLayoutIterations;
            opts.k = repulsion_for(graph.node_count(), kLayoutScale);
            positions = spring_layout(graph, opts);
        }

        const fs::path dot_file = output_dir_ / ("static_" + name + ".dot");
        const fs::path png_file = output_path(name);
        {
            std::ofstream ofs(dot_file);
            if (!ofs) throw std::runtime_error("could not open dot file " + dot_file.string());
            write_dot(ofs, graph, positions);
        }

        std::error_code ec;
        fs::remove(png_file, ec);

        const std::string command = layout_command_ + " -n2 -Tpng -o " + shell_quote(png_file.string()) +
                                    " " + shell_quote(dot_file.string());
        const int rc = std::system(command.c_str());
        fs::remove(dot_file, ec);

        if (rc != 0 || !fs::exists(png_file, ec)) {
            throw std::runtime_error("graphviz render failed (exit " + std::to_string(rc) + ")");
        }

        spdlog::info("✅ Static image saved: {}", png_file.string());
        return png_file.string();
    } catch (const std::exception& e) {
        spdlog::error("❌ Static image generation failed for {}: {}", name, e.what());
        return "";
    }
}

} // namespace code_atlas
