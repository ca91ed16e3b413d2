#pragma once

#include "graph/graph_store.hpp"
#include "net/http_client.hpp"
#include <string>
#include <set>

namespace lore {

/**
 * @brief Connection settings for a Neo4j server
 */
struct Neo4jConfig {
    std::string uri = "http://localhost:7474";     // HTTP endpoint, not bolt://
    std::string user = "neo4j";
    std::string password;
    std::string database = "neo4j";
    int timeout_seconds = 30;
};

/**
 * @brief Graph store backed by Neo4j's HTTP transactional endpoint
 *
 * Every query is a single Cypher statement sent to
 * POST {uri}/db/{database}/tx/commit with basic auth. Nodes are matched by
 * their "title" property; descriptions come from "first_paragraph" and source
 * URLs from "source" or "url".
 */
class Neo4jGraphStore : public GraphStore {
public:
    explicit Neo4jGraphStore(
        Neo4jConfig config,
        std::set<std::string> info_excluded_relations = default_info_excluded_relations()
    );

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
    // Cypher and wire format (public for testing)
    // ==========================================

    static std::string node_info_query(bool detailed);

    /**
     * @brief Variable-length path query; the hop bound cannot be a parameter
     */
    static std::string shortest_path_query(int max_hops);

    static std::string neighbor_query();

    /**
     * @brief Request body for a single statement
     */
    static nlohmann::json make_request(const std::string& statement, const nlohmann::json& parameters);

    /**
     * @brief Rows of the first result as column-name -> value objects
     *
     * Throws std::runtime_error if the response carries errors.
     */
    static std::vector<nlohmann::json> parse_response(const nlohmann::json& response);

    /**
     * @brief Build node info from a row of node_info_query
     */
    static NodeInfo node_info_from_row(const nlohmann::json& row, bool detailed);

    /**
     * @brief Build a path from a row of shortest_path_query
     */
    static std::optional<GraphPath> path_from_row(const nlohmann::json& row);

private:
    Neo4jConfig config_;
    std::set<std::string> info_excluded_relations_;
    std::string endpoint_;

    std::vector<nlohmann::json> run(const std::string& statement, const nlohmann::json& parameters) const;
};

} // namespace lore
