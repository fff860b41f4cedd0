#pragma once
#include <deque>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "code_atlas/code_graph.hpp"

namespace code_atlas {

// Receiver of everything the visualization front-end is told to draw.
class FrontendSink {
public:
    virtual ~FrontendSink() = default;

    virtual void render_graph(const std::string& title, const nlohmann::json& nodes, const nlohmann::json& edges,
                              bool massive, bool chunk_loading) = 0;
    virtual void add_data(const nlohmann::json& nodes, const nlohmann::json& edges) = 0;
    virtual void update_progress(size_t current, size_t total) = 0;
    virtual void hide_loading() = 0;
    virtual void show_error(const std::string& message) = 0;
    virtual void show_static_image(const std::string& path, const std::string& title) = 0;
    virtual void show_empty() = 0;
};

// Front-end records: {id, label, group, title, value, mass, font, kind}
nlohmann::json format_node(const GraphNode& node);
// {from, to, kind, arrows, color{color, opacity}, dashes}
nlohmann::json format_edge(const GraphEdge& edge);

nlohmann::json format_nodes(const CodeGraph& graph);
nlohmann::json format_edges(const CodeGraph& graph);

// Buffers front-end calls as JSON events for a polling client.
class EventQueueSink : public FrontendSink {
public:
    void render_graph(const std::string& title, const nlohmann::json& nodes, const nlohmann::json& edges,
                      bool massive, bool chunk_loading) override;
    void add_data(const nlohmann::json& nodes, const nlohmann::json& edges) override;
    void update_progress(size_t current, size_t total) override;
    void hide_loading() override;
    void show_error(const std::string& message) override;
    void show_static_image(const std::string& path, const std::string& title) override;
    void show_empty() override;

    // Build-stage progress, kept apart from the graph stream's "progress".
    void update_build_progress(size_t current, size_t total, const std::string& message);

    // Every queued event, oldest first; the queue is emptied.
    nlohmann::json drain();
    size_t pending() const;

private:
    void push(nlohmann::json event);

    mutable std::mutex mtx_;
    std::deque<nlohmann::json> events_;
};

} // namespace code_atlas
