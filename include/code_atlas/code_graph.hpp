#pragma once

#include <string>
#include <vector>
#include <unordered_set>
#include <unordered_map>
#include <functional>
#include <nlohmann/json.hpp>

namespace code_atlas {

enum class NodeKind { File, Directory, Definition };
enum class EdgeKind { Contains, Include, Dependency, Defines, Calls };

std::string to_string(NodeKind kind);
std::string to_string(EdgeKind kind);
NodeKind node_kind_from_string(const std::string& s);
EdgeKind edge_kind_from_string(const std::string& s);

struct GraphNode {
    std::string id;
    NodeKind kind = NodeKind::File;
    std::string label;
    std::string group;
    double size = 15.0;
    std::string title;          // HTML tooltip
    nlohmann::json attributes = nlohmann::json::object();

    nlohmann::json to_json() const;
    static GraphNode from_json(const nlohmann::json& j);
};

struct GraphEdge {
    std::string source;
    std::string target;
    EdgeKind kind = EdgeKind::Contains;
    nlohmann::json style = nlohmann::json::object();

    nlohmann::json to_json() const;
    static GraphEdge from_json(const nlohmann::json& j);
};

// Directed graph keyed by string ids. Nodes and edges keep insertion order;
// at most one edge exists per ordered (source, target) pair.
class CodeGraph {
public:
    // Inserts the node, or replaces the attributes of an existing one.
    // Returns true when the id was new.
    bool add_node(GraphNode node);

    // Rejects edges whose endpoints are not nodes of this graph.
    // Re-adding an existing pair updates kind and style in place.
    bool add_edge(const std::string& source, const std::string& target,
                  EdgeKind kind, nlohmann::json style = nlohmann::json::object());

    bool has_node(const std::string& id) const;
    bool has_edge(const std::string& source, const std::string& target) const;

    const GraphNode* get_node(const std::string& id) const;
    GraphNode* get_node(const std::string& id);
    const GraphEdge* get_edge(const std::string& source, const std::string& target) const;

    const std::vector<GraphNode>& nodes() const { return nodes_; }
    const std::vector<GraphEdge>& edges() const { return edges_; }
    std::vector<std::string> node_ids() const;

    size_t node_count() const { return nodes_.size(); }
    size_t edge_count() const { return edges_.size(); }
    bool empty() const { return nodes_.empty(); }

    // In-degree plus out-degree.
    size_t degree(const std::string& id) const;
    std::unordered_map<std::string, size_t> degrees() const;

    // Node ids ordered by degree, highest first; ties keep insertion order.
    std::vector<std::string> ids_by_degree() const;

    const std::vector<std::string>& successors(const std::string& id) const;
    const std::vector<std::string>& predecessors(const std::string& id) const;

    // True when a directed path of length >= 1 leads from source to target.
    bool has_path(const std::string& source, const std::string& target) const;

    void clear_edges();
    void clear();

    // Copy of the graph restricted to `ids` with every edge between them.
    CodeGraph induced_subgraph(const std::vector<std::string>& ids) const;
    CodeGraph induced_subgraph(const std::unordered_set<std::string>& ids) const;

    // Nodes matching node_pred, then edges matching edge_pred whose
    // endpoints both survived.
    CodeGraph filtered(const std::function<bool(const GraphNode&)>& node_pred,
                       const std::function<bool(const GraphEdge&)>& edge_pred) const;

    nlohmann::json to_json() const;
    static CodeGraph from_json(const nlohmann::json& j);

private:
    static std::string edge_key(const std::string& source, const std::string& target);

    std::vector<GraphNode> nodes_;
    std::unordered_map<std::string, size_t> node_index_;
    std::vector<GraphEdge> edges_;
    std::unordered_map<std::string, size_t> edge_index_;
    std::unordered_map<std::string, std::vector<std::string>> out_;
    std::unordered_map<std::string, std::vector<std::string>> in_;
};

// Parent directory of a project-relative id ("" for top-level entries).
std::string parent_dir(const std::string& rel_path);
// Last '/'-separated segment of an id.
std::string base_name(const std::string& id);

} // namespace code_atlas
