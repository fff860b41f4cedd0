#include "code_atlas/scope_graph.hpp"
#include "code_atlas/static_raster.hpp"
#include <cctype>
#include <stdexcept>
#include <unordered_map>
#include <spdlog/spdlog.h>

namespace code_atlas {

using json = nlohmann::json;

namespace {

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::string html_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            default: out += c;
        }
    }
    return out;
}

// "path::name" -> {"path", "name"}
std::pair<std::string, std::string> split_definition_id(const std::string& id) {
    size_t sep = id.find("::");
    if (sep == std::string::npos) return {id, ""};
    return {id.substr(0, sep), id.substr(sep + 2)};
}

} // namespace

ScopeGraphBuilder::ScopeGraphBuilder(fs::path project_root, AtlasConfig config, const GraphStore& store,
                                     ParserFactory parser_factory)
    : project_root_(std::move(project_root)), config_(std::move(config)), store_(store),
      parser_factory_(std::move(parser_factory)) {}

std::string ScopeGraphBuilder::display_signature(const std::string& definition_text) {
    std::string line = trim(definition_text.substr(0, definition_text.find('\n')));
    while (!line.empty() && line.back() == '{') line = trim(line.substr(0, line.size() - 1));

    std::string safe = html_escape(line);
    if (safe.size() > kSignatureLimit) safe = safe.substr(0, kSignatureLimit - 3) + "...";
    return safe;
}

std::string ScopeGraphBuilder::file_tooltip(const std::string& file, const std::vector<Definition>& definitions) {
    const std::string name = html_escape(base_name(file));
    if (definitions.empty()) {
        return "<b>" + name + "</b><br><i style='font-size:10px; color:#888'>No structures found</i>";
    }

    std::string rows;
    for (size_t i = 0; i < definitions.size() && i < kTooltipRows; ++i) {
        const auto& d = definitions[i];
        const std::string type_style = d.kind == "function" ? "color:#e06c75; font-weight:bold;"
                                                            : "color:#e5c07b; font-weight:bold;";
        char initial = d.kind.empty() ? '?' : static_cast<char>(std::toupper(static_cast<unsigned char>(d.kind[0])));
        rows += "<tr><td style='" + type_style + " padding-right:8px;'>" + std::string(1, initial) + "</td>"
                "<td style='font-family:monospace; color:#ccc;'>" + display_signature(d.content) + "</td></tr>";
    }
    if (definitions.size() > kTooltipRows) {
        rows += "<tr><td colspan='2'><i>...and more...</i></td></tr>";
    }

    const std::string header = "<div style='font-weight:bold; border-bottom:1px solid #555; "
                               "margin-bottom:4px; font-size:12px;'>" + name + "</div>";
    return "<div style='text-align:left;'>" + header +
           "<table style='border-spacing:0; font-size:11px;'>" + rows + "</table></div>";
}

void ScopeGraphBuilder::link_calls(CodeGraph& graph) {
    std::unordered_map<std::string, std::vector<std::string>> name_map;
    for (const auto& n : graph.nodes()) {
        if (n.kind != NodeKind::Definition) continue;
        name_map[split_definition_id(n.id).second].push_back(n.id);
    }

    std::vector<std::pair<std::string, std::string>> links;
    for (const auto& n : graph.nodes()) {
        if (n.kind != NodeKind::Definition || !n.attributes.contains("calls")) continue;
        const std::string origin = split_definition_id(n.id).first;

        for (const auto& call : n.attributes["calls"]) {
            if (!call.is_string()) continue;
            auto it = name_map.find(call.get<std::string>());
            if (it == name_map.end() || it->second.empty()) continue;

            const std::string* target = nullptr;
            for (const auto& candidate : it->second) {
                if (split_definition_id(candidate).first == origin) {
                    target = &candidate;
                    break;
                }
            }
            if (!target) target = &it->second.front();
            if (*target != n.id) links.emplace_back(n.id, *target);
        }
    }

    for (const auto& [from, to] : links) {
        graph.add_edge(from, to, EdgeKind::Calls, {{"color", "#e5c07b"}, {"arrows", "to"}});
    }
}

CodeGraph ScopeGraphBuilder::simple_view(const CodeGraph& full) {
    return full.filtered(
        [](const GraphNode& n) { return n.kind == NodeKind::File; },
        [](const GraphEdge& e) { return e.kind == EdgeKind::Dependency; });
}

CodeGraph ScopeGraphBuilder::build(const std::set<std::string>& scope, const ProgressCallback& progress) const {
    const std::string root = project_root_.string();

    // 1. Dependency graph for topology and inherited styles
    CodeGraph dependency = store_.load(GraphKind::Dependency, Tier::Full).graph;

    // 2. Empty scope
    if (scope.empty()) {
        if (progress) progress(0, 0, "Scope is empty. Clearing graphs.");
        GraphArtifact empty;
        empty.project_root = root;
        store_.save(GraphKind::Scope, Tier::Full, empty);
        store_.save(GraphKind::Scope, Tier::Simple, empty);
        std::error_code ec;
        fs::remove(store_.static_image_path("scope_graph_full"), ec);
        return {};
    }

    const size_t total = scope.size();
    CodeGraph graph;

    // 3. File nodes
    if (progress) progress(0, total, "Adding files and inheriting styles...");
    for (const auto& file : scope) {
        GraphNode node;
        node.id = file;
        node.kind = NodeKind::File;
        node.label = base_name(file);
        if (const GraphNode* dep = dependency.get_node(file)) {
            node.group = dep->group.empty() ? "Default" : dep->group;
            if (dep->attributes.contains("color")) node.attributes["color"] = dep->attributes["color"];
        } else {
            std::string dir = parent_dir(file);
            node.group = dir.empty() ? "Root" : dir;
        }
        graph.add_node(std::move(node));
    }

    // 4. Direct and transitive file dependencies
    if (progress) progress(1, total, "Mapping scope dependencies...");
    for (const auto& source : scope) {
        if (!dependency.has_node(source)) continue;
        for (const auto& target : scope) {
            if (source == target || !dependency.has_node(target)) continue;
            if (dependency.has_path(source, target)) {
                graph.add_edge(source, target, EdgeKind::Dependency,
                               {{"dashes", true}, {"color", "#555"}, {"arrows", "to"}});
            }
        }
    }

    // 5. Definitions
    if (progress) progress(2, total, "Parsing internal structure...");
    auto parser = parser_factory_();
    if (!parser) throw std::runtime_error("parser factory returned no parser");
    for (const auto& file : scope) {
        fs::path full_path = project_root_ / fs::path(file);
        std::error_code ec;
        if (!fs::exists(full_path, ec)) {
            spdlog::warn("⚠️ Scope file missing on disk: {}", file);
            continue;
        }

        ParseResult res = parser->parse_file(full_path.string(), true);
        if (!res.ok()) spdlog::warn("⚠️ Could not parse {}: {}", file, *res.error);

        const std::string group = graph.get_node(file)->group;
        for (const auto& d : res.definitions) {
            GraphNode def;
            def.id = file + "::" + d.name;
            def.kind = NodeKind::Definition;
            def.label = d.name;
            def.group = group;
            def.size = kDefinitionSize;
            std::string signature = display_signature(d.content);
            def.title = "<b>" + html_escape(d.name) + "</b><br><pre>" + signature + "</pre>";
            def.attributes = {
                {"definition_kind", d.kind},
                {"signature", signature},
                {"calls", d.calls}
            };
            std::string def_id = def.id;
            graph.add_node(std::move(def));
            graph.add_edge(file, def_id, EdgeKind::Defines, {{"color", "#61afef"}, {"width", 2}});
        }
        graph.get_node(file)->title = file_tooltip(file, res.definitions);
    }

    // 6. Calls
    if (progress) progress(3, total, "Linking function calls...");
    link_calls(graph);

    // 7. Full tier with its pre-rendered image
    if (progress) progress(total, total, "Rendering scope visualization...");
    GraphArtifact full;
    full.graph = graph;
    full.project_root = root;
    StaticRasterGenerator raster(store_.graphs_dir(), config_.raster_command);
    full.static_image_path = raster.generate(graph, "scope_graph_full");
    store_.save(GraphKind::Scope, Tier::Full, full);

    // 8. Simple tier
    GraphArtifact simple;
    simple.graph = simple_view(graph);
    simple.project_root = root;
    store_.save(GraphKind::Scope, Tier::Simple, simple);

    if (progress) progress(total, total, "Scope processing complete.");
    spdlog::info("✅ Scope graph ready: {} files, {} nodes, {} edges", total, graph.node_count(), graph.edge_count());
    return graph;
}

} // namespace code_atlas
