#pragma once
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include "code_atlas/code_graph.hpp"
#include "code_atlas/graph_layout.hpp"

namespace code_atlas {

namespace fs = std::filesystem;

// 🖼️ Pre-renders a graph to PNG through Graphviz with pinned node positions.
class StaticRasterGenerator {
public:
    static constexpr double kCanvasInches = 100.0;
    static constexpr int kDpi = 120;
    static constexpr int kLayoutIterations = 60;
    static constexpr double kLayoutScale = 5.0;

    StaticRasterGenerator(fs::path output_dir, std::string layout_command = "neato");

    // Renders `graph` to <output_dir>/static_<name>.png and returns that path.
    // Without a layout one is computed. Returns "" when the graph is empty or
    // anything in the pipeline fails.
    std::string generate(const CodeGraph& graph, const std::string& name,
                         const std::optional<Layout>& layout = std::nullopt) const;

    fs::path output_path(const std::string& name) const;

    // DOT document for `graph`; nodes missing from `layout` sit at the centre.
    static void write_dot(std::ostream& out, const CodeGraph& graph, const Layout& layout);

    // `arg` as one POSIX shell word: single-quoted, embedded quotes escaped.
    static std::string shell_quote(const std::string& arg);

    // Colour of the group at `group_index` in the sorted group set.
    static std::string palette_color(size_t group_index);

private:
    fs::path output_dir_;
    std::string layout_command_;
};

} // namespace code_atlas
