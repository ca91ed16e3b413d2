#ifndef LORE_GRAPH_STORE_HPP
#define LORE_GRAPH_STORE_HPP

#include <string>
#include <vector>
#include <set>
#include <optional>
#include <nlohmann/json.hpp>

namespace lore {

/**
 * @brief A typed edge seen from one of its endpoints
 */
struct Relation {
    std::string type;               // Relationship type, e.g. "ВРАГ"
    std::string node;               // Title of the node at the other end

    bool operator==(const Relation& other) const {
        return type == other.type && node == other.node;
    }
};

/**
 * @brief What the graph store knows about one node
 *
 * Brief info carries title, labels, description and source. Detailed info
 * also lists the node's outgoing and incoming relations, minus the
 * bookkeeping relation types the store is configured to hide.
 */
struct NodeInfo {
    std::string title;
    std::vector<std::string> labels;
    std::string description;
    std::optional<std::string> source_url;
    std::vector<Relation> outgoing;
    std::vector<Relation> incoming;
    bool detailed = false;

    /**
     * @brief Human-readable block used in prompts and CLI output
     */
    std::string to_text() const;

    nlohmann::json to_json() const;
    static NodeInfo from_json(const nlohmann::json& j);
};

/**
 * @brief A path between two nodes: n+1 node titles and n relation types
 */
struct GraphPath {
    std::vector<std::string> nodes;
    std::vector<std::string> relations;

    /**
     * @brief Number of edges
     */
    size_t length() const { return relations.size(); }

    /**
     * @brief Alternating sequence [node0, rel0, node1, ..., nodeN]
     */
    std::vector<std::string> interleaved() const;

    /**
     * @brief Nodes strictly between the two endpoints
     */
    std::vector<std::string> interior() const;

    GraphPath reversed() const;
};

/**
 * @brief Exclusion predicates applied to shortest-path queries
 *
 * No edge of a qualifying path may have an excluded relation type, and no
 * interior node may carry an excluded label or an excluded title. The two
 * endpoints are never checked.
 */
struct PathConstraints {
    std::set<std::string> excluded_relation_types;
    std::set<std::string> excluded_interior_labels;
    std::set<std::string> excluded_titles;

    /**
     * @brief Exclusions used for the lore graph: structural relations,
     *        catch-all category labels and "unknown" placeholder nodes
     */
    static PathConstraints defaults();

    nlohmann::json to_json() const;
    static PathConstraints from_json(const nlohmann::json& j);
};

/**
 * @brief Relation types hidden from detailed node info by default
 */
std::set<std::string> default_info_excluded_relations();

// ============================================================================
// Graph Store Interface
// ============================================================================

/**
 * @brief Read-only query surface of the knowledge graph
 *
 * Nodes are keyed by title. Implementations must allow concurrent calls;
 * the relevance scorer queries from several threads at once. Query
 * failures are reported by throwing a std::exception subclass; the scorer
 * counts anything else thrown as a failed query too.
 */
class GraphStore {
public:
    virtual ~GraphStore() = default;

    /**
     * @brief Look up a node
     * @param title Node title
     * @param detailed Also list outgoing and incoming relations
     * @return Node info, or nullopt if there is no such node
     */
    virtual std::optional<NodeInfo> get_node_info(const std::string& title, bool detailed) const = 0;

    /**
     * @brief Shortest qualifying path between two nodes, ignoring edge direction
     * @param max_hops Upper bound on the path length in edges
     * @return The path oriented from a to b, or nullopt if none qualifies
     */
    virtual std::optional<GraphPath> shortest_path(
        const std::string& a,
        const std::string& b,
        int max_hops,
        const PathConstraints& constraints
    ) const = 0;

    /**
     * @brief One node connected to title by relation_type, in either direction
     *
     * Relation types are compared case-insensitively.
     */
    virtual std::optional<std::string> neighbor_by_relation(
        const std::string& title,
        const std::string& relation_type
    ) const = 0;
};

} // namespace lore

#endif // LORE_GRAPH_STORE_HPP
