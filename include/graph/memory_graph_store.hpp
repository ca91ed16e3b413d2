#ifndef LORE_MEMORY_GRAPH_STORE_HPP
#define LORE_MEMORY_GRAPH_STORE_HPP

#include "graph/graph_store.hpp"
#include <map>
#include <string>
#include <vector>
#include <set>

namespace lore {

/**
 * @brief A node of the in-memory graph
 */
struct GraphNode {
    std::string title;                              // Unique key
    std::vector<std::string> labels;
    std::string text;                               // First paragraph of the article
    std::string source;                             // Article URL, may be empty

    nlohmann::json to_json() const;
    static GraphNode from_json(const nlohmann::json& j);
};

/**
 * @brief A directed, typed relationship between two titles
 */
struct GraphEdge {
    std::string source;
    std::string type;
    std::string target;

    nlohmann::json to_json() const;
    static GraphEdge from_json(const nlohmann::json& j);
};

/**
 * @brief Graph store held entirely in memory
 *
 * Loaded from a JSON snapshot of the form
 * @code
 * {
 *   "nodes": [{"title": "...", "labels": ["..."], "text": "...", "source": "http://..."}],
 *   "relationships": [{"source": "...", "type": "...", "target": "..."}]
 * }
 * @endcode
 *
 * Shortest paths are found by breadth-first search over edges in both
 * directions, so the first path found is a shortest one; ties are broken by
 * edge insertion order. The store is read-only once loaded and may be
 * queried from several threads.
 */
class InMemoryGraphStore : public GraphStore {
public:
    explicit InMemoryGraphStore(
        std::set<std::string> info_excluded_relations = default_info_excluded_relations()
    );

    // ==========================================
    // Construction
    // ==========================================

    /**
     * @brief Add a node, or replace the data of an existing one
     */
    void add_node(const GraphNode& node);

    /**
     * @brief Add a relationship; unknown endpoints are created as bare nodes
     */
    void add_relationship(const std::string& source, const std::string& type, const std::string& target);

    size_t num_nodes() const { return nodes_.size(); }
    size_t num_relationships() const { return edges_.size(); }
    bool has_node(const std::string& title) const { return nodes_.count(title) > 0; }

    // ==========================================
    // GraphStore
    // ==========================================

    std::optional<NodeInfo> get_node_info(const std::string& title, bool detailed) const override;

    std::optional<GraphPath> shortest_path(
        const std::string& a,
        const std::string& b,
        int max_hops,
        const PathConstraints& constraints
    ) const override;

    std::optional<std::string> neighbor_by_relation(
        const std::string& title,
        const std::string& relation_type
    ) const override;

    // ==========================================
    // Import/Export
    // ==========================================

    nlohmann::json to_json() const;
    static InMemoryGraphStore from_json(
        const nlohmann::json& j,
        std::set<std::string> info_excluded_relations = default_info_excluded_relations()
    );

    void save_to_json(const std::string& filename) const;
    static InMemoryGraphStore load_from_json(
        const std::string& filename,
        std::set<std::string> info_excluded_relations = default_info_excluded_relations()
    );

private:
    std::map<std::string, GraphNode> nodes_;
    std::vector<std::string> node_order_;                       // Titles in insertion order
    std::vector<GraphEdge> edges_;
    std::map<std::string, std::vector<size_t>> incident_;       // title -> edge indices
    std::set<std::string> info_excluded_relations_;

    bool is_blocked_interior(const std::string& title, const PathConstraints& constraints) const;
};

} // namespace lore

#endif // LORE_MEMORY_GRAPH_STORE_HPP
