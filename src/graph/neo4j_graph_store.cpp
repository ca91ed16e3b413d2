#include "graph/neo4j_graph_store.hpp"
#include <stdexcept>

using json = nlohmann::json;

namespace lore {

namespace {

std::string optional_string(const json& value) {
    return value.is_string() ? value.get<std::string>() : std::string();
}

} // anonymous namespace

Neo4jGraphStore::Neo4jGraphStore(Neo4jConfig config, std::set<std::string> info_excluded_relations)
    : config_(std::move(config)),
      info_excluded_relations_(std::move(info_excluded_relations)) {
    if (config_.uri.empty()) {
        throw std::invalid_argument("Neo4j URI must not be empty");
    }
    if (config_.database.empty()) {
        throw std::invalid_argument("Neo4j database must not be empty");
    }

    std::string base = config_.uri;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    endpoint_ = base + "/db/" + config_.database + "/tx/commit";
}

// ==========================================
// Queries
// ==========================================

std::string Neo4jGraphStore::node_info_query(bool detailed) {
    if (!detailed) {
        return
            "MATCH (n {title: $title}) "
            "RETURN n.title AS title, n.first_paragraph AS text, labels(n) AS labels, "
            "coalesce(n.source, n.url) AS source "
            "LIMIT 1";
    }

    return
        "MATCH (n {title: $title}) "
        "OPTIONAL MATCH (n)-[out_rel]->(out_node) "
        "  WHERE NOT type(out_rel) IN $excluded "
        "OPTIONAL MATCH (in_node)-[in_rel]->(n) "
        "  WHERE NOT type(in_rel) IN $excluded "
        "RETURN n.title AS title, n.first_paragraph AS text, labels(n) AS labels, "
        "coalesce(n.source, n.url) AS source, "
        "collect(DISTINCT {rel: type(out_rel), target: out_node.title}) AS outgoing, "
        "collect(DISTINCT {rel: type(in_rel), source: in_node.title}) AS incoming "
        "LIMIT 1";
}

std::string Neo4jGraphStore::shortest_path_query(int max_hops) {
    return
        "MATCH p=(a {title: $a})-[rels*.." + std::to_string(max_hops) + "]-(b {title: $b}) "
        "WHERE all(r IN rels WHERE NOT type(r) IN $excluded_relations) "
        "  AND NONE(n IN nodes(p)[1..-1] WHERE "
        "        ANY(l IN labels(n) WHERE l IN $excluded_labels) "
        "        OR n.title IN $excluded_titles) "
        "RETURN [n IN nodes(p) | n.title] AS path, "
        "       [r IN relationships(p) | type(r)] AS rels, "
        "       length(p) AS path_length "
        "ORDER BY path_length ASC "
        "LIMIT 1";
}

std::string Neo4jGraphStore::neighbor_query() {
    return
        "MATCH (n {title: $title})-[r]-(m) "
        "WHERE toUpper(type(r)) = toUpper($rel_type) "
        "RETURN m.title AS target_title "
        "LIMIT 1";
}

// ==========================================
// Wire format
// ==========================================

json Neo4jGraphStore::make_request(const std::string& statement, const json& parameters) {
    json stmt;
    stmt["statement"] = statement;
    stmt["parameters"] = parameters;
    return {{"statements", json::array({stmt})}};
}

std::vector<json> Neo4jGraphStore::parse_response(const json& response) {
    if (response.contains("errors") && response["errors"].is_array() && !response["errors"].empty()) {
        const json& error = response["errors"][0];
        throw std::runtime_error(
            "Neo4j error " + error.value("code", std::string("unknown")) +
            ": " + error.value("message", std::string()));
    }

    std::vector<json> rows;
    if (!response.contains("results") || response["results"].empty()) {
        return rows;
    }

    const json& result = response["results"][0];
    const auto columns = result.value("columns", std::vector<std::string>{});

    if (!result.contains("data")) {
        return rows;
    }

    for (const auto& item : result["data"]) {
        const json& values = item.at("row");
        json row = json::object();
        for (size_t i = 0; i < columns.size() && i < values.size(); ++i) {
            row[columns[i]] = values[i];
        }
        rows.push_back(row);
    }
    return rows;
}

NodeInfo Neo4jGraphStore::node_info_from_row(const json& row, bool detailed) {
    NodeInfo info;
    info.title = optional_string(row.value("title", json()));
    info.description = optional_string(row.value("text", json()));
    info.detailed = detailed;

    if (row.contains("labels") && row["labels"].is_array()) {
        info.labels = row["labels"].get<std::vector<std::string>>();
    }

    std::string source = optional_string(row.value("source", json()));
    if (!source.empty()) {
        info.source_url = source;
    }

    if (!detailed) {
        return info;
    }

    // OPTIONAL MATCH yields {rel: null, target: null} when nothing matched
    if (row.contains("outgoing") && row["outgoing"].is_array()) {
        for (const auto& rel : row["outgoing"]) {
            std::string target = optional_string(rel.value("target", json()));
            if (target.empty()) continue;
            info.outgoing.push_back({optional_string(rel.value("rel", json())), target});
        }
    }
    if (row.contains("incoming") && row["incoming"].is_array()) {
        for (const auto& rel : row["incoming"]) {
            std::string source_title = optional_string(rel.value("source", json()));
            if (source_title.empty()) continue;
            info.incoming.push_back({optional_string(rel.value("rel", json())), source_title});
        }
    }

    return info;
}

std::optional<GraphPath> Neo4jGraphStore::path_from_row(const json& row) {
    if (!row.contains("path_length") || row["path_length"].is_null()) {
        return std::nullopt;
    }

    GraphPath path;
    path.nodes = row.at("path").get<std::vector<std::string>>();
    path.relations = row.at("rels").get<std::vector<std::string>>();

    if (path.nodes.size() != path.relations.size() + 1) {
        throw std::runtime_error("Malformed path row: node and relation counts disagree");
    }
    return path;
}

std::vector<json> Neo4jGraphStore::run(const std::string& statement, const json& parameters) const {
    std::vector<std::string> headers = {
        "Content-Type: application/json",
        "Accept: application/json;charset=UTF-8"
    };

    std::string body = http_post(
        endpoint_,
        make_request(statement, parameters).dump(),
        headers,
        config_.timeout_seconds,
        BasicAuth{config_.user, config_.password}
    );

    return parse_response(json::parse(body));
}

// ==========================================
// GraphStore
// ==========================================

std::optional<NodeInfo> Neo4jGraphStore::get_node_info(const std::string& title, bool detailed) const {
    json parameters = {{"title", title}};
    if (detailed) {
        parameters["excluded"] = info_excluded_relations_;
    }

    auto rows = run(node_info_query(detailed), parameters);
    if (rows.empty()) {
        return std::nullopt;
    }
    return node_info_from_row(rows.front(), detailed);
}

std::optional<GraphPath> Neo4jGraphStore::shortest_path(
    const std::string& a,
    const std::string& b,
    int max_hops,
    const PathConstraints& constraints
) const {
    if (a == b || max_hops < 1) {
        return std::nullopt;
    }

    json parameters = {
        {"a", a},
        {"b", b},
        {"excluded_relations", constraints.excluded_relation_types},
        {"excluded_labels", constraints.excluded_interior_labels},
        {"excluded_titles", constraints.excluded_titles}
    };

    auto rows = run(shortest_path_query(max_hops), parameters);
    if (rows.empty()) {
        return std::nullopt;
    }
    return path_from_row(rows.front());
}

std::optional<std::string> Neo4jGraphStore::neighbor_by_relation(
    const std::string& title,
    const std::string& relation_type
) const {
    auto rows = run(neighbor_query(), {{"title", title}, {"rel_type", relation_type}});
    if (rows.empty()) {
        return std::nullopt;
    }

    std::string target = optional_string(rows.front().value("target_title", json()));
    if (target.empty()) {
        return std::nullopt;
    }
    return target;
}

} // namespace lore
