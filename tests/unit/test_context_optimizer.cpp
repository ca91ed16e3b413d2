#include <gtest/gtest.h>
#include "agent/context_optimizer.hpp"
#include "agent/llm_reasoning_engine.hpp"
#include "graph/memory_graph_store.hpp"
#include "graph/relevance_scorer.hpp"
#include <deque>
#include <functional>

using namespace lore;
using json = nlohmann::json;

// Replays a fixed list of decisions; terminal once the list runs out
class ScriptedEngine : public ReasoningEngine {
public:
    std::deque<EngineDecision> script;
    std::vector<std::string> prompts;
    std::vector<size_t> conversation_sizes;
    std::function<void()> on_decide;

    EngineDecision decide(
        const std::string& system_prompt,
        const std::vector<Message>& conversation
    ) override {
        prompts.push_back(system_prompt);
        conversation_sizes.push_back(conversation.size());
        if (on_decide) on_decide();

        if (script.empty()) {
            return EngineDecision{"DONE", {}};
        }
        EngineDecision next = script.front();
        script.pop_front();
        return next;
    }
};

ToolCall call(const std::string& id, const std::string& name, json arguments) {
    return ToolCall{id, name, std::move(arguments)};
}

EngineDecision step(std::vector<ToolCall> calls) {
    return EngineDecision{"", std::move(calls)};
}

class ContextOptimizerTest : public ::testing::Test {
protected:
    InMemoryGraphStore store;
    ScriptedEngine engine;
    OptimizerPayload payload;

    void SetUp() override {
        store.add_node({"Хорус", {"Персонажи"}, "Магистр войны", "https://wiki/horus"});
        store.add_node({"Робаут Жиллиман", {"Персонажи"}, "Примарх Ультрамаринов", "https://wiki/guilliman"});
        store.add_node({"Сангвиний", {"Персонажи"}, "Примарх Кровавых Ангелов", ""});
        store.add_node({"Император", {"Персонажи"}, "Повелитель человечества", ""});
        store.add_node({"Луперкаль", {"Места"}, "Пещера", ""});

        store.add_relationship("Хорус", "ВРАГ", "Робаут Жиллиман");
        store.add_relationship("Император", "ОТЕЦ", "Хорус");
        store.add_relationship("Император", "СОЗДАЛ", "Сангвиний");
        store.add_relationship("Хорус", "ССЫЛКА", "Луперкаль");

        ScorerOptions options;
        options.constraints = PathConstraints{};
        GraphRelevanceScorer scorer(store, options);

        std::vector<std::string> titles = {"Хорус", "Сангвиний", "Император", "Луперкаль"};
        payload = build_payload(titles, scorer.score(titles), store);
    }
};

// ==========================================
// Payload Tests
// ==========================================

TEST_F(ContextOptimizerTest, InitialPayload) {
    ASSERT_EQ(payload.nodes.size(), 4);
    EXPECT_EQ(payload.nodes[0].id, "node_1");
    EXPECT_EQ(payload.nodes[3].id, "node_4");
    EXPECT_EQ(payload.titles(), (std::vector<std::string>{"Хорус", "Сангвиний", "Император", "Луперкаль"}));
    EXPECT_TRUE(payload.nodes[0].info.detailed);
    EXPECT_GT(payload.nodes[0].score, 0.0);
    EXPECT_FALSE(payload.paths.empty());
}

TEST(BuildPayloadTest, CandidatesThenIntermediatesWithPositionalIds) {
    InMemoryGraphStore store;
    store.add_node({"A", {}, "alpha", ""});
    store.add_node({"B", {}, "beta", ""});
    store.add_node({"M", {}, "middle", ""});
    store.add_relationship("A", "REL", "M");

    RelevanceResult relevance;
    relevance.node_scores = {{"A", 1.0 / 3.0}, {"B", 2.0 / 3.0}, {"Missing", 0.0}};
    relevance.intermediate_nodes = {"M"};

    auto result = build_payload({"A", "Missing", "B", "A"}, relevance, store);

    ASSERT_EQ(result.nodes.size(), 3);
    EXPECT_EQ(result.nodes[0].id, "node_1");
    EXPECT_EQ(result.nodes[1].id, "node_3");
    EXPECT_EQ(result.nodes[2].id, "node_4");

    EXPECT_DOUBLE_EQ(result.nodes[0].score, 0.333);
    EXPECT_DOUBLE_EQ(result.nodes[1].score, 0.667);
    EXPECT_DOUBLE_EQ(result.nodes[2].score, 0.0);

    // Candidates are detailed, intermediate nodes brief
    EXPECT_TRUE(result.nodes[0].info.detailed);
    EXPECT_EQ(result.nodes[0].info.outgoing.size(), 1);
    EXPECT_FALSE(result.nodes[2].info.detailed);
    EXPECT_TRUE(result.nodes[2].info.incoming.empty());
}

TEST(PayloadTextTest, NodeBlocks) {
    OptimizerPayload payload;
    PayloadNode node;
    node.id = "node_1";
    node.info.title = "Хорус";
    node.info.description = "Магистр войны";
    node.info.outgoing = {{"ВРАГ", "Робаут"}};
    node.info.incoming = {{"ОТЕЦ", "Император"}};
    payload.nodes.push_back(node);

    PayloadNode bare;
    bare.id = "node_2";
    bare.info.title = "Луперкаль";
    payload.nodes.push_back(bare);

    EXPECT_EQ(payload.to_prompt_text(),
        "\n\n=== NODE: Хорус (ID: node_1) ===\n"
        "DESCRIPTION: Магистр войны\n"
        "AVAILABLE RELATIONS:\n"
        "RELATION: ВРАГ -> TARGET: Робаут\n"
        "RELATION: ОТЕЦ <- SOURCE: Император"
        "\n---\n"
        "=== NODE: Луперкаль (ID: node_2) ===\n"
        "DESCRIPTION: ");

    EXPECT_EQ(OptimizerPayload{}.to_prompt_text(), "The graph is currently empty.");
}

TEST(PayloadJsonTest, NodesAndPaths) {
    OptimizerPayload payload;
    PayloadNode node;
    node.id = "node_1";
    node.score = 0.5;
    node.info.title = "A";
    payload.nodes.push_back(node);
    payload.paths[{"A", "B"}] = {"A", "REL", "B"};

    json j = payload.to_json();
    ASSERT_EQ(j["nodes"].size(), 1);
    EXPECT_EQ(j["nodes"][0]["id"], "node_1");
    EXPECT_EQ(j["nodes"][0]["graph_info"]["title"], "A");
    EXPECT_EQ(j["paths"][0]["from"], "A");
}

// ==========================================
// Loop Tests
// ==========================================

TEST_F(ContextOptimizerTest, IterationCapForcesTermination) {
    engine.script.push_back(step({call("c1", "delete_nodes", {{"node_ids", json::array({"node_4"})}})}));
    engine.script.push_back(step({call("c2", "expand_nodes_via_relation",
        {{"source_node_title", "Хорус"}, {"relation_type", "враг"}})}));
    engine.script.push_back(step({call("c3", "delete_nodes", {{"node_ids", json::array({"node_1"})}})}));

    OptimizerOptions options;
    options.max_iterations = 2;
    ContextOptimizer optimizer(engine, store, options);

    auto result = optimizer.optimize("Кто враг Хоруса?", payload);

    EXPECT_EQ(optimizer.engine_calls(), 2);
    EXPECT_EQ(engine.prompts.size(), 2);
    EXPECT_EQ(engine.script.size(), 1);
    EXPECT_EQ(optimizer.state(), OptimizerState::Done);

    EXPECT_EQ(result.titles(),
        (std::vector<std::string>{"Хорус", "Сангвиний", "Император", "Робаут Жиллиман"}));
    EXPECT_EQ(result.nodes.back().id, "node_Робаут_Жиллиман");
    EXPECT_DOUBLE_EQ(result.nodes.back().score, 0.0);
    EXPECT_TRUE(result.nodes.back().info.detailed);

    const auto& conversation = optimizer.conversation();
    ASSERT_EQ(conversation.size(), 6);
    EXPECT_EQ(conversation[0].role, Message::Role::User);
    EXPECT_EQ(conversation[0].content, "Кто враг Хоруса?");
    EXPECT_EQ(conversation[2].role, Message::Role::Tool);
    EXPECT_EQ(conversation[2].tool_call_id, "c1");
    EXPECT_EQ(conversation[2].content, "Deleted nodes: 1");
    EXPECT_EQ(conversation[4].content, "Added nodes: 1");
    EXPECT_EQ(conversation[5].role, Message::Role::Assistant);
    EXPECT_EQ(conversation[5].content, "DONE");
}

TEST_F(ContextOptimizerTest, PromptReflectsCurrentPayload) {
    engine.script.push_back(step({call("c1", "delete_nodes", {{"node_ids", json::array({"node_4"})}})}));

    ContextOptimizer optimizer(engine, store);
    optimizer.optimize("query", payload);

    ASSERT_EQ(engine.prompts.size(), 2);
    EXPECT_NE(engine.prompts[0].find("(ID: node_4)"), std::string::npos);
    EXPECT_EQ(engine.prompts[1].find("(ID: node_4)"), std::string::npos);
    EXPECT_NE(engine.prompts[1].find("query"), std::string::npos);

    // Each call sees the whole conversation so far
    EXPECT_EQ(engine.conversation_sizes, (std::vector<size_t>{1, 3}));
}

TEST_F(ContextOptimizerTest, TerminalDecisionEndsLoop) {
    ContextOptimizer optimizer(engine, store);
    auto result = optimizer.optimize("query", payload);

    EXPECT_EQ(optimizer.engine_calls(), 1);
    EXPECT_EQ(result.titles(), payload.titles());
}

TEST_F(ContextOptimizerTest, ZeroIterationsNeverCallsEngine) {
    OptimizerOptions options;
    options.max_iterations = 0;
    ContextOptimizer optimizer(engine, store, options);

    auto result = optimizer.optimize("query", payload);
    EXPECT_EQ(optimizer.engine_calls(), 0);
    EXPECT_TRUE(engine.prompts.empty());
    EXPECT_EQ(result.nodes.size(), payload.nodes.size());
}

TEST_F(ContextOptimizerTest, UnknownToolAbortsRun) {
    engine.script.push_back(step({
        call("c1", "delete_nodes", {{"node_ids", json::array({"node_1"})}}),
        call("c2", "summon_daemon", json::object())
    }));

    ContextOptimizer optimizer(engine, store);
    try {
        optimizer.optimize("query", payload);
        FAIL() << "expected ToolNotFoundError";
    } catch (const ToolNotFoundError& e) {
        EXPECT_EQ(e.tool_name(), "summon_daemon");
    }

    // Names are checked before any call of the step is applied
    EXPECT_EQ(optimizer.engine_calls(), 1);
    EXPECT_EQ(optimizer.conversation().back().role, Message::Role::Assistant);
}

TEST_F(ContextOptimizerTest, CancelBeforeRun) {
    ContextOptimizer optimizer(engine, store);
    optimizer.request_cancel();
    EXPECT_TRUE(optimizer.cancel_requested());

    auto result = optimizer.optimize("query", payload);
    EXPECT_EQ(optimizer.engine_calls(), 0);
    EXPECT_EQ(result.nodes.size(), 4);
}

TEST_F(ContextOptimizerTest, CancelTakesEffectAtNextDecision) {
    engine.script.push_back(step({call("c1", "delete_nodes", {{"node_ids", json::array({"node_2"})}})}));
    engine.script.push_back(step({call("c2", "delete_nodes", {{"node_ids", json::array({"node_3"})}})}));

    ContextOptimizer optimizer(engine, store);
    engine.on_decide = [&optimizer]() { optimizer.request_cancel(); };

    auto result = optimizer.optimize("query", payload);

    // The step in flight is still applied
    EXPECT_EQ(optimizer.engine_calls(), 1);
    EXPECT_EQ(result.nodes.size(), 3);
    EXPECT_FALSE(result.has_title("Сангвиний"));
}

TEST_F(ContextOptimizerTest, EngineErrorKeepsAppliedSteps) {
    engine.script.push_back(step({call("c1", "delete_nodes", {{"node_ids", json::array({"node_2"})}})}));

    int calls = 0;
    engine.on_decide = [&calls]() {
        if (++calls == 2) throw std::runtime_error("timeout");
    };

    ContextOptimizer optimizer(engine, store);
    OptimizerPayload result;
    ASSERT_NO_THROW(result = optimizer.optimize("query", payload));

    EXPECT_EQ(result.nodes.size(), 3);
    EXPECT_FALSE(result.has_title("Сангвиний"));
    EXPECT_EQ(optimizer.last_error(), "timeout");
    EXPECT_EQ(optimizer.state(), OptimizerState::Done);
    EXPECT_EQ(optimizer.engine_calls(), 1);

    // A clean run clears the error
    engine.on_decide = nullptr;
    optimizer.optimize("query", payload);
    EXPECT_TRUE(optimizer.last_error().empty());
}

TEST_F(ContextOptimizerTest, BadArgumentsBecomeFailedObservation) {
    engine.script.push_back(step({
        call("c1", "expand_nodes_via_relation", {{"source_node_title", "Хорус"}}),
        call("c2", "delete_nodes", {{"ids", json::array({"node_1"})}})
    }));

    ContextOptimizer optimizer(engine, store);
    auto result = optimizer.optimize("query", payload);

    const auto& conversation = optimizer.conversation();
    ASSERT_GE(conversation.size(), 4);
    EXPECT_EQ(conversation[2].content.rfind("Tool failed", 0), 0);
    EXPECT_EQ(conversation[3].content, "Deleted nodes: 1");
    EXPECT_FALSE(result.has_title("Хорус"));
}

// ==========================================
// Tool Tests
// ==========================================

TEST_F(ContextOptimizerTest, DeleteCountsOnlyRemovedNodes) {
    ContextOptimizer optimizer(engine, store);
    auto result = optimizer.delete_nodes(payload, {"node_1", "node_1", "node_99"});

    EXPECT_EQ(result.count, 1);
    EXPECT_EQ(result.observation(), "Deleted nodes: 1");
    EXPECT_EQ(payload.nodes.size(), 3);

    EXPECT_EQ(optimizer.delete_nodes(payload, {}).count, 0);
}

TEST_F(ContextOptimizerTest, ExpandSkipsPresentNodes) {
    ContextOptimizer optimizer(engine, store);
    auto result = optimizer.expand_nodes_via_relation(payload, "Хорус", "ОТЕЦ");

    EXPECT_EQ(result.count, 0);
    EXPECT_EQ(result.status, "already present");
    EXPECT_EQ(result.observation(), "Added nodes: 0 (already present)");
    EXPECT_EQ(payload.nodes.size(), 4);
}

TEST_F(ContextOptimizerTest, ExpandUnknownRelation) {
    ContextOptimizer optimizer(engine, store);
    auto result = optimizer.expand_nodes_via_relation(payload, "Хорус", "СЫН");

    EXPECT_EQ(result.count, 0);
    EXPECT_EQ(result.status, "relation not found");
    EXPECT_TRUE(result.ok);
}

TEST_F(ContextOptimizerTest, ExpandNormalizesRelationType) {
    ContextOptimizer optimizer(engine, store);
    auto result = optimizer.expand_nodes_via_relation(payload, "Хорус", "('враг')");

    EXPECT_EQ(result.count, 1);
    EXPECT_TRUE(payload.has_title("Робаут Жиллиман"));
}

TEST_F(ContextOptimizerTest, ExpandMatchesMixedCaseStoredType) {
    store.add_node({"Абаддон", {"Персонажи"}, "Магистр войны Хаоса", ""});
    store.add_relationship("Хорус", "Successor", "Абаддон");

    ContextOptimizer optimizer(engine, store);
    auto result = optimizer.expand_nodes_via_relation(payload, "Хорус", "Successor");

    EXPECT_EQ(result.count, 1);
    EXPECT_TRUE(payload.has_title("Абаддон"));
}

TEST(ContextOptimizerStaticTest, NormalizeRelationType) {
    EXPECT_EQ(ContextOptimizer::normalize_relation_type("враг"), "ВРАГ");
    EXPECT_EQ(ContextOptimizer::normalize_relation_type(" [\"Отец\"] "), "ОТЕЦ");
    EXPECT_EQ(ContextOptimizer::normalize_relation_type("('')"), "");
    EXPECT_EQ(ContextOptimizer::normalize_relation_type("ЯВЛЯЮТСЯ_НАСЛЕДНИКАМИ"), "ЯВЛЯЮТСЯ_НАСЛЕДНИКАМИ");
}

TEST(ContextOptimizerStaticTest, ToolSchemas) {
    json tools = ContextOptimizer::tool_schemas();
    ASSERT_EQ(tools.size(), 2);
    EXPECT_EQ(tools[0]["function"]["name"], "delete_nodes");
    EXPECT_EQ(tools[1]["function"]["name"], "expand_nodes_via_relation");
    EXPECT_EQ(tools[1]["function"]["parameters"]["required"].size(), 2);
}

TEST(ToolResultTest, Observations) {
    EXPECT_EQ((ToolResult{"delete", 3, true, ""}).observation(), "Deleted nodes: 3");
    EXPECT_EQ((ToolResult{"expand", 0, true, "relation not found"}).observation(),
              "Added nodes: 0 (relation not found)");
    EXPECT_EQ((ToolResult{"expand", 0, false, "bad"}).observation(), "Tool failed (bad)");
}

// ==========================================
// LLM Reasoning Engine Tests
// ==========================================

class StubProvider : public LLMProvider {
public:
    LLMResponse reply;
    std::vector<Message> last_messages;
    json last_tools;

    LLMResponse complete(const std::string&) override { return reply; }
    LLMResponse chat(const std::vector<Message>&) override { return reply; }
    LLMResponse chat_with_tools(const std::vector<Message>& messages, const json& tools) override {
        last_messages = messages;
        last_tools = tools;
        return reply;
    }

    std::string get_provider_name() const override { return "stub"; }
    std::string get_model() const override { return "stub-model"; }
    bool is_configured() const override { return true; }
    void set_config(const LLMConfig& config) override { config_ = config; }
    LLMConfig get_config() const override { return config_; }
};

TEST(LLMReasoningEngineTest, PrependsSystemPromptAndOffersTools) {
    StubProvider provider;
    provider.reply.success = true;
    provider.reply.content = "";
    provider.reply.tool_calls = {call("c1", "delete_nodes", {{"node_ids", json::array({"node_2"})}})};

    LLMReasoningEngine engine(provider);
    std::vector<Message> conversation = {Message(Message::Role::User, "query")};
    EngineDecision decision = engine.decide("system text", conversation);

    ASSERT_EQ(provider.last_messages.size(), 2);
    EXPECT_EQ(provider.last_messages[0].role, Message::Role::System);
    EXPECT_EQ(provider.last_messages[0].content, "system text");
    EXPECT_EQ(provider.last_tools, ContextOptimizer::tool_schemas());

    EXPECT_FALSE(decision.is_terminal());
    EXPECT_EQ(decision.tool_calls[0].name, "delete_nodes");
}

TEST(LLMReasoningEngineTest, FailedCallThrows) {
    StubProvider provider;
    provider.reply.success = false;
    provider.reply.error_message = "HTTP 500";

    LLMReasoningEngine engine(provider);
    EXPECT_THROW(engine.decide("system", {Message(Message::Role::User, "q")}), std::runtime_error);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
