#include <gtest/gtest.h>
#include "graph/graph_store.hpp"
#include "graph/memory_graph_store.hpp"
#include "graph/neo4j_graph_store.hpp"
#include <cstdio>

using namespace lore;
using json = nlohmann::json;

class MemoryGraphStoreTest : public ::testing::Test {
protected:
    InMemoryGraphStore store;

    void SetUp() override {
        // Хорус -ОТЕЦ- Император -СОЗДАЛ- Сангвиний
        //   \-БРАТ- Луперк (labelled noise) -БРАТ- Сангвиний
        store.add_node({"Хорус", {"Персонажи"}, "Магистр войны", "https://wiki/horus"});
        store.add_node({"Император", {"Персонажи"}, "Повелитель человечества", ""});
        store.add_node({"Сангвиний", {"Персонажи"}, "Примарх", "https://wiki/sanguinius"});
        store.add_node({"Луперк", {"Персонажи_"}, "", ""});

        store.add_relationship("Император", "ОТЕЦ", "Хорус");
        store.add_relationship("Император", "СОЗДАЛ", "Сангвиний");
        store.add_relationship("Хорус", "БРАТ", "Луперк");
        store.add_relationship("Луперк", "БРАТ", "Сангвиний");
        store.add_relationship("Хорус", "ССЫЛКА", "Сангвиний");
    }
};

// ==========================================
// Construction Tests
// ==========================================

TEST_F(MemoryGraphStoreTest, Counts) {
    EXPECT_EQ(store.num_nodes(), 4);
    EXPECT_EQ(store.num_relationships(), 5);
    EXPECT_TRUE(store.has_node("Луперк"));
    EXPECT_FALSE(store.has_node("Робаут"));
}

TEST_F(MemoryGraphStoreTest, RelationshipCreatesBareNodes) {
    store.add_relationship("Хорус", "ВРАГ", "Робаут");
    EXPECT_TRUE(store.has_node("Робаут"));

    auto info = store.get_node_info("Робаут", false);
    ASSERT_TRUE(info.has_value());
    EXPECT_TRUE(info->labels.empty());
    EXPECT_FALSE(info->source_url.has_value());
}

TEST_F(MemoryGraphStoreTest, RejectsEmptyTitleAndType) {
    EXPECT_THROW(store.add_node({"", {}, "", ""}), std::invalid_argument);
    EXPECT_THROW(store.add_relationship("Хорус", "", "Император"), std::invalid_argument);
}

// ==========================================
// Node Info Tests
// ==========================================

TEST_F(MemoryGraphStoreTest, BriefInfo) {
    auto info = store.get_node_info("Хорус", false);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->title, "Хорус");
    EXPECT_EQ(info->description, "Магистр войны");
    ASSERT_TRUE(info->source_url.has_value());
    EXPECT_EQ(*info->source_url, "https://wiki/horus");
    EXPECT_FALSE(info->detailed);
    EXPECT_TRUE(info->outgoing.empty());
    EXPECT_TRUE(info->incoming.empty());
}

TEST_F(MemoryGraphStoreTest, DetailedInfoHidesExcludedRelations) {
    auto info = store.get_node_info("Хорус", true);
    ASSERT_TRUE(info.has_value());
    EXPECT_TRUE(info->detailed);

    // ССЫЛКА is hidden by default
    ASSERT_EQ(info->outgoing.size(), 1);
    EXPECT_EQ(info->outgoing[0], (Relation{"БРАТ", "Луперк"}));
    ASSERT_EQ(info->incoming.size(), 1);
    EXPECT_EQ(info->incoming[0], (Relation{"ОТЕЦ", "Император"}));
}

TEST_F(MemoryGraphStoreTest, DetailedInfoListsRepeatedRelationOnce) {
    store.add_relationship("Хорус", "БРАТ", "Луперк");
    auto info = store.get_node_info("Хорус", true);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->outgoing.size(), 1);
}

TEST_F(MemoryGraphStoreTest, UnknownNode) {
    EXPECT_FALSE(store.get_node_info("Робаут", true).has_value());
}

TEST_F(MemoryGraphStoreTest, NodeInfoText) {
    auto info = store.get_node_info("Хорус", true);
    ASSERT_TRUE(info.has_value());
    std::string text = info->to_text();

    EXPECT_EQ(text.rfind("=== Хорус [Персонажи] ===\n", 0), 0);
    EXPECT_NE(text.find("Description: Магистр войны"), std::string::npos);
    EXPECT_NE(text.find("Outgoing relations:\n  - БРАТ: Луперк"), std::string::npos);
    EXPECT_NE(text.find("Incoming relations:\n  - ОТЕЦ: Император"), std::string::npos);
}

TEST_F(MemoryGraphStoreTest, NodeInfoJsonRoundTrip) {
    auto info = store.get_node_info("Хорус", true);
    ASSERT_TRUE(info.has_value());

    NodeInfo copy = NodeInfo::from_json(info->to_json());
    EXPECT_EQ(copy.title, info->title);
    EXPECT_EQ(copy.source_url, info->source_url);
    EXPECT_EQ(copy.outgoing, info->outgoing);
    EXPECT_EQ(copy.incoming, info->incoming);
    EXPECT_TRUE(copy.detailed);
}

// ==========================================
// Shortest Path Tests
// ==========================================

TEST_F(MemoryGraphStoreTest, PathIgnoresEdgeDirection) {
    auto path = store.shortest_path("Хорус", "Сангвиний", 5, PathConstraints::defaults());
    ASSERT_TRUE(path.has_value());

    // ССЫЛКА is excluded and Луперк carries a noise label, so the path goes via the Emperor
    EXPECT_EQ(path->length(), 2);
    std::vector<std::string> expected = {"Хорус", "ОТЕЦ", "Император", "СОЗДАЛ", "Сангвиний"};
    EXPECT_EQ(path->interleaved(), expected);
    EXPECT_EQ(path->interior(), std::vector<std::string>{"Император"});
}

TEST_F(MemoryGraphStoreTest, PathWithoutConstraintsTakesDirectEdge) {
    auto path = store.shortest_path("Хорус", "Сангвиний", 5, PathConstraints{});
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->length(), 1);
    EXPECT_EQ(path->relations[0], "ССЫЛКА");
}

TEST_F(MemoryGraphStoreTest, ExcludedTitleBlocksInterior) {
    PathConstraints constraints = PathConstraints::defaults();
    constraints.excluded_titles.insert("Император");

    // Only the route through the noise-labelled Луперк remains
    EXPECT_FALSE(store.shortest_path("Хорус", "Сангвиний", 5, constraints).has_value());

    constraints.excluded_interior_labels.clear();
    auto path = store.shortest_path("Хорус", "Сангвиний", 5, constraints);
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->interior(), std::vector<std::string>{"Луперк"});
}

TEST_F(MemoryGraphStoreTest, EndpointsAreNeverFiltered) {
    // Луперк carries an excluded label but is an endpoint here
    auto path = store.shortest_path("Хорус", "Луперк", 5, PathConstraints::defaults());
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->length(), 1);
}

TEST_F(MemoryGraphStoreTest, HopBound) {
    EXPECT_FALSE(store.shortest_path("Хорус", "Сангвиний", 1, PathConstraints::defaults()).has_value());
    EXPECT_TRUE(store.shortest_path("Хорус", "Сангвиний", 2, PathConstraints::defaults()).has_value());
    EXPECT_FALSE(store.shortest_path("Хорус", "Сангвиний", 0, PathConstraints{}).has_value());
}

TEST_F(MemoryGraphStoreTest, DegenerateQueries) {
    EXPECT_FALSE(store.shortest_path("Хорус", "Хорус", 5, PathConstraints{}).has_value());
    EXPECT_FALSE(store.shortest_path("Хорус", "Робаут", 5, PathConstraints{}).has_value());
}

TEST_F(MemoryGraphStoreTest, ReversedQueryGivesReversedPath) {
    auto forward = store.shortest_path("Хорус", "Сангвиний", 5, PathConstraints::defaults());
    auto backward = store.shortest_path("Сангвиний", "Хорус", 5, PathConstraints::defaults());
    ASSERT_TRUE(forward.has_value());
    ASSERT_TRUE(backward.has_value());
    EXPECT_EQ(backward->interleaved(), forward->reversed().interleaved());
}

// ==========================================
// Neighbor Tests
// ==========================================

TEST_F(MemoryGraphStoreTest, NeighborByRelationEitherDirection) {
    auto father = store.neighbor_by_relation("Хорус", "ОТЕЦ");
    ASSERT_TRUE(father.has_value());
    EXPECT_EQ(*father, "Император");

    auto son = store.neighbor_by_relation("Император", "ОТЕЦ");
    ASSERT_TRUE(son.has_value());
    EXPECT_EQ(*son, "Хорус");
}

TEST_F(MemoryGraphStoreTest, NeighborMatchesUppercasedType) {
    auto brother = store.neighbor_by_relation("Хорус", "брат");
    ASSERT_TRUE(brother.has_value());
    EXPECT_EQ(*brother, "Луперк");

    EXPECT_FALSE(store.neighbor_by_relation("Хорус", "ВРАГ").has_value());
    EXPECT_FALSE(store.neighbor_by_relation("Робаут", "ОТЕЦ").has_value());
}

TEST_F(MemoryGraphStoreTest, NeighborMatchesMixedCaseStoredType) {
    store.add_relationship("Хорус", "Enemy", "Робаут");

    for (const char* requested : {"Enemy", "enemy", "ENEMY"}) {
        auto enemy = store.neighbor_by_relation("Хорус", requested);
        ASSERT_TRUE(enemy.has_value()) << requested;
        EXPECT_EQ(*enemy, "Робаут");
    }
}

// ==========================================
// Import/Export Tests
// ==========================================

TEST_F(MemoryGraphStoreTest, JsonRoundTrip) {
    InMemoryGraphStore loaded = InMemoryGraphStore::from_json(store.to_json());
    EXPECT_EQ(loaded.num_nodes(), store.num_nodes());
    EXPECT_EQ(loaded.num_relationships(), store.num_relationships());

    auto path = loaded.shortest_path("Хорус", "Сангвиний", 5, PathConstraints::defaults());
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->length(), 2);
}

TEST_F(MemoryGraphStoreTest, SaveAndLoadFile) {
    std::string path = ::testing::TempDir() + "lore_graph.json";
    store.save_to_json(path);

    InMemoryGraphStore loaded = InMemoryGraphStore::load_from_json(path);
    EXPECT_EQ(loaded.num_nodes(), 4);
    std::remove(path.c_str());

    EXPECT_THROW(InMemoryGraphStore::load_from_json("/nonexistent/graph.json"), std::runtime_error);
}

TEST(GraphNodeTest, AcceptsUrlKey) {
    json j = {{"title", "Хорус"}, {"url", "https://wiki/horus"}};
    GraphNode node = GraphNode::from_json(j);
    EXPECT_EQ(node.source, "https://wiki/horus");
}

TEST(PathConstraintsTest, JsonRoundTrip) {
    PathConstraints defaults = PathConstraints::defaults();
    PathConstraints copy = PathConstraints::from_json(defaults.to_json());
    EXPECT_EQ(copy.excluded_relation_types, defaults.excluded_relation_types);
    EXPECT_EQ(copy.excluded_interior_labels, defaults.excluded_interior_labels);
    EXPECT_EQ(copy.excluded_titles, defaults.excluded_titles);
}

// ==========================================
// Neo4j Wire Format Tests
// ==========================================

TEST(Neo4jGraphStoreTest, RejectsEmptySettings) {
    Neo4jConfig config;
    config.uri = "";
    EXPECT_THROW(Neo4jGraphStore store(config), std::invalid_argument);

    config.uri = "http://localhost:7474";
    config.database = "";
    EXPECT_THROW(Neo4jGraphStore store(config), std::invalid_argument);
}

TEST(Neo4jGraphStoreTest, PathQueryEmbedsHopBound) {
    std::string query = Neo4jGraphStore::shortest_path_query(4);
    EXPECT_NE(query.find("[rels*..4]"), std::string::npos);
    EXPECT_NE(query.find("$excluded_relations"), std::string::npos);
    EXPECT_NE(query.find("$excluded_labels"), std::string::npos);
    EXPECT_NE(query.find("$excluded_titles"), std::string::npos);
}

TEST(Neo4jGraphStoreTest, NeighborQueryIgnoresCase) {
    std::string query = Neo4jGraphStore::neighbor_query();
    EXPECT_NE(query.find("toUpper(type(r)) = toUpper($rel_type)"), std::string::npos);
}

TEST(Neo4jGraphStoreTest, RequestBody) {
    json request = Neo4jGraphStore::make_request("RETURN 1", {{"title", "Хорус"}});
    ASSERT_EQ(request["statements"].size(), 1);
    EXPECT_EQ(request["statements"][0]["statement"], "RETURN 1");
    EXPECT_EQ(request["statements"][0]["parameters"]["title"], "Хорус");
}

TEST(Neo4jGraphStoreTest, ParseResponseRows) {
    json response = {
        {"results", json::array({
            {
                {"columns", {"title", "text"}},
                {"data", json::array({
                    {{"row", {"Хорус", "Магистр войны"}}},
                    {{"row", {"Сангвиний", nullptr}}}
                })}
            }
        })},
        {"errors", json::array()}
    };

    auto rows = Neo4jGraphStore::parse_response(response);
    ASSERT_EQ(rows.size(), 2);
    EXPECT_EQ(rows[0]["title"], "Хорус");
    EXPECT_TRUE(rows[1]["text"].is_null());
}

TEST(Neo4jGraphStoreTest, ParseResponseErrorThrows) {
    json response = {
        {"results", json::array()},
        {"errors", json::array({{{"code", "Neo.ClientError.Statement.SyntaxError"}, {"message", "bad"}}})}
    };
    EXPECT_THROW(Neo4jGraphStore::parse_response(response), std::runtime_error);
}

TEST(Neo4jGraphStoreTest, NodeInfoFromRowSkipsEmptyOptionalMatches) {
    json row = {
        {"title", "Хорус"},
        {"text", "Магистр войны"},
        {"labels", json::array({"Персонажи"})},
        {"source", "https://wiki/horus"},
        {"outgoing", json::array({{{"rel", nullptr}, {"target", nullptr}}})},
        {"incoming", json::array({{{"rel", "ОТЕЦ"}, {"source", "Император"}}})}
    };

    NodeInfo info = Neo4jGraphStore::node_info_from_row(row, true);
    EXPECT_EQ(info.title, "Хорус");
    EXPECT_EQ(*info.source_url, "https://wiki/horus");
    EXPECT_TRUE(info.outgoing.empty());
    ASSERT_EQ(info.incoming.size(), 1);
    EXPECT_EQ(info.incoming[0], (Relation{"ОТЕЦ", "Император"}));
}

TEST(Neo4jGraphStoreTest, PathFromRow) {
    json row = {
        {"path", {"Хорус", "Император", "Сангвиний"}},
        {"rels", {"ОТЕЦ", "СОЗДАЛ"}},
        {"path_length", 2}
    };
    auto path = Neo4jGraphStore::path_from_row(row);
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->length(), 2);

    EXPECT_FALSE(Neo4jGraphStore::path_from_row({{"path_length", nullptr}}).has_value());

    row["rels"] = json::array({"ОТЕЦ"});
    EXPECT_THROW(Neo4jGraphStore::path_from_row(row), std::runtime_error);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
