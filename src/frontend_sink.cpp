#include "code_atlas/frontend_sink.hpp"

namespace code_atlas {

using json = nlohmann::json;

json format_node(const GraphNode& node) {
    return {
        {"id", node.id},
        {"label", node.label.empty() ? base_name(node.id) : node.label},
        {"group", node.group.empty() ? "Default" : node.group},
        {"title", node.title.empty() ? node.id : node.title},
        {"value", node.size},
        {"mass", node.attributes.value("mass", 1)},
        {"font", {{"color", "white"}, {"strokeWidth", 0}}},
        {"kind", to_string(node.kind)}
    };
}

json format_edge(const GraphEdge& edge) {
    const json& s = edge.style;
    return {
        {"from", edge.source},
        {"to", edge.target},
        {"kind", to_string(edge.kind)},
        {"arrows", s.value("arrows", "to")},
        {"color", {{"color", s.value("color", "#666")}, {"opacity", 0.5}}},
        {"dashes", s.value("dashes", false)}
    };
}

json format_nodes(const CodeGraph& graph) {
    json out = json::array();
    for (const auto& n : graph.nodes()) out.push_back(format_node(n));
    return out;
}

json format_edges(const CodeGraph& graph) {
    json out = json::array();
    for (const auto& e : graph.edges()) out.push_back(format_edge(e));
    return out;
}

void EventQueueSink::push(json event) {
    std::lock_guard<std::mutex> lock(mtx_);
    events_.push_back(std::move(event));
}

void EventQueueSink::render_graph(const std::string& title, const json& nodes, const json& edges,
                                  bool massive, bool chunk_loading) {
    push({{"type", "render_graph"}, {"title", title}, {"nodes", nodes}, {"edges", edges},
          {"massive", massive}, {"chunk_loading", chunk_loading}});
}

void EventQueueSink::add_data(const json& nodes, const json& edges) {
    push({{"type", "add_data"}, {"nodes", nodes}, {"edges", edges}});
}

void EventQueueSink::update_progress(size_t current, size_t total) {
    push({{"type", "progress"}, {"current", current}, {"total", total}});
}

void EventQueueSink::update_build_progress(size_t current, size_t total, const std::string& message) {
    push({{"type", "build_progress"}, {"current", current}, {"total", total}, {"message", message}});
}

void EventQueueSink::hide_loading() {
    push({{"type", "hide_loading"}});
}

void EventQueueSink::show_error(const std::string& message) {
    push({{"type", "error"}, {"message", message}});
}

void EventQueueSink::show_static_image(const std::string& path, const std::string& title) {
    push({{"type", "static_image"}, {"path", path}, {"title", title}});
}

void EventQueueSink::show_empty() {
    push({{"type", "empty"}});
}

json EventQueueSink::drain() {
    std::lock_guard<std::mutex> lock(mtx_);
    json out = json::array();
    for (auto& e : events_) out.push_back(std::move(e));
    events_.clear();
    return out;
}

size_t EventQueueSink::pending() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return events_.size();
}

} // namespace code_atlas
