#include "code_atlas/code_graph.hpp"
#include <algorithm>
#include <deque>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace code_atlas {

using json = nlohmann::json;

namespace {
const std::vector<std::string> kNoNeighbours;
}

std::string to_string(NodeKind kind) {
    switch (kind) {
        case NodeKind::File: return "file";
        case NodeKind::Directory: return "directory";
        case NodeKind::Definition: return "definition";
    }
    return "file";
}

std::string to_string(EdgeKind kind) {
    switch (kind) {
        case EdgeKind::Contains: return "contains";
        case EdgeKind::Include: return "include";
        case EdgeKind::Dependency: return "dependency";
        case EdgeKind::Defines: return "defines";
        case EdgeKind::Calls: return "calls";
    }
    return "contains";
}

NodeKind node_kind_from_string(const std::string& s) {
    if (s == "file") return NodeKind::File;
    if (s == "directory") return NodeKind::Directory;
    if (s == "definition") return NodeKind::Definition;
    throw std::invalid_argument("Unknown node kind: " + s);
}

EdgeKind edge_kind_from_string(const std::string& s) {
    if (s == "contains") return EdgeKind::Contains;
    if (s == "include") return EdgeKind::Include;
    if (s == "dependency") return EdgeKind::Dependency;
    if (s == "defines") return EdgeKind::Defines;
    if (s == "calls") return EdgeKind::Calls;
    throw std::invalid_argument("Unknown edge kind: " + s);
}

json GraphNode::to_json() const {
    return json{
        {"id", id},
        {"kind", to_string(kind)},
        {"label", label},
        {"group", group},
        {"size", size},
        {"title", title},
        {"attributes", attributes}
    };
}

GraphNode GraphNode::from_json(const json& j) {
    GraphNode node;
    auto safe_get = [&](const std::string& key) { return j.value(key, ""); };
    node.id = j.at("id").get<std::string>();
    node.kind = node_kind_from_string(j.value("kind", "file"));
    node.label = safe_get("label");
    node.group = safe_get("group");
    node.size = j.value("size", 15.0);
    node.title = safe_get("title");
    if (j.contains("attributes") && j["attributes"].is_object()) node.attributes = j["attributes"];
    return node;
}

json GraphEdge::to_json() const {
    return json{
        {"source", source},
        {"target", target},
        {"kind", to_string(kind)},
        {"style", style}
    };
}

GraphEdge GraphEdge::from_json(const json& j) {
    GraphEdge edge;
    edge.source = j.at("source").get<std::string>();
    edge.target = j.at("target").get<std::string>();
    edge.kind = edge_kind_from_string(j.value("kind", "contains"));
    if (j.contains("style") && j["style"].is_object()) edge.style = j["style"];
    return edge;
}

// --- GRAPH ---

std::string CodeGraph::edge_key(const std::string& source, const std::string& target) {
    std::string key;
    key.reserve(source.size() + target.size() + 1);
    key.append(source).push_back('\0');
    key.append(target);
    return key;
}

bool CodeGraph::add_node(GraphNode node) {
    auto it = node_index_.find(node.id);
    if (it != node_index_.end()) {
        nodes_[it->second] = std::move(node);
        return false;
    }
    node_index_[node.id] = nodes_.size();
    nodes_.push_back(std::move(node));
    return true;
}

bool CodeGraph::add_edge(const std::string& source, const std::string& target,
                         EdgeKind kind, json style) {
    if (!has_node(source) || !has_node(target)) return false;

    std::string key = edge_key(source, target);
    auto it = edge_index_.find(key);
    if (it != edge_index_.end()) {
        edges_[it->second].kind = kind;
        edges_[it->second].style = std::move(style);
        return true;
    }

    edge_index_[key] = edges_.size();
    edges_.push_back({source, target, kind, std::move(style)});
    out_[source].push_back(target);
    in_[target].push_back(source);
    return true;
}

bool CodeGraph::has_node(const std::string& id) const {
    return node_index_.count(id) > 0;
}

bool CodeGraph::has_edge(const std::string& source, const std::string& target) const {
    return edge_index_.count(edge_key(source, target)) > 0;
}

const GraphNode* CodeGraph::get_node(const std::string& id) const {
    auto it = node_index_.find(id);
    return it == node_index_.end() ? nullptr : &nodes_[it->second];
}

GraphNode* CodeGraph::get_node(const std::string& id) {
    auto it = node_index_.find(id);
    return it == node_index_.end() ? nullptr : &nodes_[it->second];
}

const GraphEdge* CodeGraph::get_edge(const std::string& source, const std::string& target) const {
    auto it = edge_index_.find(edge_key(source, target));
    return it == edge_index_.end() ? nullptr : &edges_[it->second];
}

std::vector<std::string> CodeGraph::node_ids() const {
    std::vector<std::string> ids;
    ids.reserve(nodes_.size());
    for (const auto& n : nodes_) ids.push_back(n.id);
    return ids;
}

size_t CodeGraph::degree(const std::string& id) const {
    return successors(id).size() + predecessors(id).size();
}

std::unordered_map<std::string, size_t> CodeGraph::degrees() const {
    std::unordered_map<std::string, size_t> result;
    result.reserve(nodes_.size());
    for (const auto& n : nodes_) result[n.id] = degree(n.id);
    return result;
}

std::vector<std::string> CodeGraph::ids_by_degree() const {
    auto deg = degrees();
    std::vector<std::string> ids = node_ids();
    std::stable_sort(ids.begin(), ids.end(), [&](const std::string& a, const std::string& b) {
        return deg[a] > deg[b];
    });
    return ids;
}

const std::vector<std::string>& CodeGraph::successors(const std::string& id) const {
    auto it = out_.find(id);
    return it == out_.end() ? kNoNeighbours : it->second;
}

const std::vector<std::string>& CodeGraph::predecessors(const std::string& id) const {
    auto it = in_.find(id);
    return it == in_.end() ? kNoNeighbours : it->second;
}

bool CodeGraph::has_path(const std::string& source, const std::string& target) const {
    if (!has_node(source) || !has_node(target)) return false;

    // BFS from the successors of source so that source == target only
    // counts when a cycle leads back to it.
    std::unordered_set<std::string> seen;
    std::deque<std::string> queue;
    for (const auto& next : successors(source)) {
        if (seen.insert(next).second) queue.push_back(next);
    }
    while (!queue.empty()) {
        std::string current = std::move(queue.front());
        queue.pop_front();
        if (current == target) return true;
        for (const auto& next : successors(current)) {
            if (seen.insert(next).second) queue.push_back(next);
        }
    }
    return false;
}

void CodeGraph::clear_edges() {
    edges_.clear();
    edge_index_.clear();
    out_.clear();
    in_.clear();
}

void CodeGraph::clear() {
    clear_edges();
    nodes_.clear();
    node_index_.clear();
}

CodeGraph CodeGraph::induced_subgraph(const std::vector<std::string>& ids) const {
    std::unordered_set<std::string> keep(ids.begin(), ids.end());
    return induced_subgraph(keep);
}

CodeGraph CodeGraph::induced_subgraph(const std::unordered_set<std::string>& ids) const {
    return filtered(
        [&](const GraphNode& n) { return ids.count(n.id) > 0; },
        [](const GraphEdge&) { return true; });
}

CodeGraph CodeGraph::filtered(const std::function<bool(const GraphNode&)>& node_pred,
                              const std::function<bool(const GraphEdge&)>& edge_pred) const {
    CodeGraph sub;
    for (const auto& n : nodes_) {
        if (node_pred(n)) sub.add_node(n);
    }
    for (const auto& e : edges_) {
        if (edge_pred(e)) sub.add_edge(e.source, e.target, e.kind, e.style);
    }
    return sub;
}

json CodeGraph::to_json() const {
    json j_nodes = json::array();
    for (const auto& n : nodes_) j_nodes.push_back(n.to_json());
    json j_edges = json::array();
    for (const auto& e : edges_) j_edges.push_back(e.to_json());
    return json{{"nodes", j_nodes}, {"edges", j_edges}};
}

CodeGraph CodeGraph::from_json(const json& j) {
    CodeGraph graph;
    for (const auto& j_node : j.value("nodes", json::array())) {
        graph.add_node(GraphNode::from_json(j_node));
    }
    for (const auto& j_edge : j.value("edges", json::array())) {
        GraphEdge edge = GraphEdge::from_json(j_edge);
        if (!graph.add_edge(edge.source, edge.target, edge.kind, edge.style)) {
            spdlog::warn("⚠️ Dropping dangling edge {} -> {}", edge.source, edge.target);
        }
    }
    return graph;
}

std::string parent_dir(const std::string& rel_path) {
    size_t slash = rel_path.find_last_of('/');
    if (slash == std::string::npos) return "";
    return rel_path.substr(0, slash);
}

std::string base_name(const std::string& id) {
    size_t slash = id.find_last_of('/');
    if (slash == std::string::npos) return id;
    return id.substr(slash + 1);
}

} // namespace code_atlas
