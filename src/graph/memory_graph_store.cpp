#include "graph/memory_graph_store.hpp"
#include "text/utf8.hpp"
#include <algorithm>
#include <fstream>
#include <queue>
#include <stdexcept>

using json = nlohmann::json;

namespace lore {

// ==========================================
// GraphNode / GraphEdge
// ==========================================

json GraphNode::to_json() const {
    json j;
    j["title"] = title;
    j["labels"] = labels;
    j["text"] = text;
    j["source"] = source;
    return j;
}

GraphNode GraphNode::from_json(const json& j) {
    GraphNode node;
    node.title = j.at("title").get<std::string>();
    if (j.contains("labels") && j["labels"].is_array()) {
        node.labels = j["labels"].get<std::vector<std::string>>();
    }
    if (j.contains("text") && j["text"].is_string()) {
        node.text = j["text"].get<std::string>();
    }
    if (j.contains("source") && j["source"].is_string()) {
        node.source = j["source"].get<std::string>();
    } else if (j.contains("url") && j["url"].is_string()) {
        node.source = j["url"].get<std::string>();
    }
    return node;
}

json GraphEdge::to_json() const {
    return {{"source", source}, {"type", type}, {"target", target}};
}

GraphEdge GraphEdge::from_json(const json& j) {
    GraphEdge edge;
    edge.source = j.at("source").get<std::string>();
    edge.type = j.at("type").get<std::string>();
    edge.target = j.at("target").get<std::string>();
    return edge;
}

// ==========================================
// InMemoryGraphStore Implementation
// ==========================================

InMemoryGraphStore::InMemoryGraphStore(std::set<std::string> info_excluded_relations)
    : info_excluded_relations_(std::move(info_excluded_relations)) {}

void InMemoryGraphStore::add_node(const GraphNode& node) {
    if (node.title.empty()) {
        throw std::invalid_argument("Graph node title must not be empty");
    }
    if (nodes_.count(node.title) == 0) {
        node_order_.push_back(node.title);
    }
    nodes_[node.title] = node;
}

void InMemoryGraphStore::add_relationship(
    const std::string& source,
    const std::string& type,
    const std::string& target
) {
    if (type.empty()) {
        throw std::invalid_argument("Relationship type must not be empty");
    }

    for (const auto* title : {&source, &target}) {
        if (!has_node(*title)) {
            GraphNode bare;
            bare.title = *title;
            add_node(bare);
        }
    }

    const size_t index = edges_.size();
    edges_.push_back({source, type, target});
    incident_[source].push_back(index);
    if (target != source) {
        incident_[target].push_back(index);
    }
}

std::optional<NodeInfo> InMemoryGraphStore::get_node_info(const std::string& title, bool detailed) const {
    auto it = nodes_.find(title);
    if (it == nodes_.end()) {
        return std::nullopt;
    }

    const GraphNode& node = it->second;
    NodeInfo info;
    info.title = node.title;
    info.labels = node.labels;
    info.description = node.text;
    if (!node.source.empty()) {
        info.source_url = node.source;
    }
    info.detailed = detailed;

    if (!detailed) {
        return info;
    }

    auto inc = incident_.find(title);
    if (inc == incident_.end()) {
        return info;
    }

    for (size_t index : inc->second) {
        const GraphEdge& edge = edges_[index];
        if (info_excluded_relations_.count(edge.type) > 0) continue;

        // DISTINCT semantics: a repeated (type, node) pair is listed once
        if (edge.source == title) {
            Relation rel{edge.type, edge.target};
            if (std::find(info.outgoing.begin(), info.outgoing.end(), rel) == info.outgoing.end()) {
                info.outgoing.push_back(rel);
            }
        }
        if (edge.target == title) {
            Relation rel{edge.type, edge.source};
            if (std::find(info.incoming.begin(), info.incoming.end(), rel) == info.incoming.end()) {
                info.incoming.push_back(rel);
            }
        }
    }

    return info;
}

bool InMemoryGraphStore::is_blocked_interior(
    const std::string& title,
    const PathConstraints& constraints
) const {
    if (constraints.excluded_titles.count(title) > 0) {
        return true;
    }

    auto it = nodes_.find(title);
    if (it == nodes_.end()) {
        return false;
    }
    for (const auto& label : it->second.labels) {
        if (constraints.excluded_interior_labels.count(label) > 0) {
            return true;
        }
    }
    return false;
}

std::optional<GraphPath> InMemoryGraphStore::shortest_path(
    const std::string& a,
    const std::string& b,
    int max_hops,
    const PathConstraints& constraints
) const {
    if (a == b || max_hops < 1 || !has_node(a) || !has_node(b)) {
        return std::nullopt;
    }

    // BFS over nodes; parent maps a node to (previous node, edge index)
    std::queue<std::string> frontier;
    std::map<std::string, std::pair<std::string, size_t>> parent;
    std::map<std::string, int> depth;

    frontier.push(a);
    depth[a] = 0;
    bool found = false;

    while (!frontier.empty() && !found) {
        std::string current = frontier.front();
        frontier.pop();

        if (depth[current] >= max_hops) continue;

        auto inc = incident_.find(current);
        if (inc == incident_.end()) continue;

        for (size_t index : inc->second) {
            const GraphEdge& edge = edges_[index];
            if (constraints.excluded_relation_types.count(edge.type) > 0) continue;

            const std::string& next = (edge.source == current) ? edge.target : edge.source;
            if (depth.count(next) > 0) continue;

            if (next == b) {
                parent[next] = {current, index};
                found = true;
                break;
            }

            if (is_blocked_interior(next, constraints)) continue;

            parent[next] = {current, index};
            depth[next] = depth[current] + 1;
            frontier.push(next);
        }
    }

    if (!found) {
        return std::nullopt;
    }

    // Reconstruct path
    GraphPath path;
    std::string current = b;
    while (current != a) {
        const auto& [previous, index] = parent.at(current);
        path.nodes.push_back(current);
        path.relations.push_back(edges_[index].type);
        current = previous;
    }
    path.nodes.push_back(a);

    std::reverse(path.nodes.begin(), path.nodes.end());
    std::reverse(path.relations.begin(), path.relations.end());
    return path;
}

std::optional<std::string> InMemoryGraphStore::neighbor_by_relation(
    const std::string& title,
    const std::string& relation_type
) const {
    auto inc = incident_.find(title);
    if (inc == incident_.end()) {
        return std::nullopt;
    }

    const std::string upper = utf8::to_upper(relation_type);
    for (size_t index : inc->second) {
        const GraphEdge& edge = edges_[index];
        if (utf8::to_upper(edge.type) != upper) continue;
        return edge.source == title ? edge.target : edge.source;
    }
    return std::nullopt;
}

// ==========================================
// Import/Export
// ==========================================

json InMemoryGraphStore::to_json() const {
    json j;
    json nodes = json::array();
    for (const auto& title : node_order_) {
        nodes.push_back(nodes_.at(title).to_json());
    }
    json relationships = json::array();
    for (const auto& edge : edges_) {
        relationships.push_back(edge.to_json());
    }
    j["nodes"] = nodes;
    j["relationships"] = relationships;
    j["metadata"] = {
        {"num_nodes", nodes_.size()},
        {"num_relationships", edges_.size()}
    };
    return j;
}

InMemoryGraphStore InMemoryGraphStore::from_json(
    const json& j,
    std::set<std::string> info_excluded_relations
) {
    InMemoryGraphStore store(std::move(info_excluded_relations));

    if (j.contains("nodes")) {
        for (const auto& node_json : j["nodes"]) {
            store.add_node(GraphNode::from_json(node_json));
        }
    }

    if (j.contains("relationships")) {
        for (const auto& edge_json : j["relationships"]) {
            GraphEdge edge = GraphEdge::from_json(edge_json);
            store.add_relationship(edge.source, edge.type, edge.target);
        }
    }

    return store;
}

void InMemoryGraphStore::save_to_json(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + filename);
    }
    file << to_json().dump(2);
}

InMemoryGraphStore InMemoryGraphStore::load_from_json(
    const std::string& filename,
    std::set<std::string> info_excluded_relations
) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open graph file: " + filename);
    }

    json j;
    file >> j;
    return from_json(j, std::move(info_excluded_relations));
}

} // namespace lore
