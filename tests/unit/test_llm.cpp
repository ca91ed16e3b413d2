#include <gtest/gtest.h>
#include "llm/llm_provider.hpp"
#include "llm/query_decomposer.hpp"
#include <stdexcept>

using namespace lore;
using json = nlohmann::json;

// ==========================================
// JSON Repair Tests
// ==========================================

TEST(ParseJsonMarkdownTest, StripsCodeFences) {
    json j = parse_json_markdown("```json\n{\"entities\": [\"Хорус\"]}\n```");
    EXPECT_EQ(j["entities"][0], "Хорус");

    json bare = parse_json_markdown("```\n[1, 2]\n```");
    EXPECT_EQ(bare.size(), 2);
}

TEST(ParseJsonMarkdownTest, RawNewlineInsideString) {
    json j = parse_json_markdown("{\"text\": \"line one\nline two\"}");
    EXPECT_EQ(j["text"], "line one line two");
}

TEST(ParseJsonMarkdownTest, ClosesTruncatedOutput) {
    json j = parse_json_markdown("{\"entities\": [\"A\", \"B\"");
    ASSERT_TRUE(j["entities"].is_array());
    EXPECT_EQ(j["entities"].size(), 2);

    json cut = parse_json_markdown("{\"questions\": [{\"text\": \"Who is Hor");
    EXPECT_EQ(cut["questions"][0]["text"], "Who is Hor");
}

TEST(ParseJsonMarkdownTest, RejectsEmptyAndGarbage) {
    EXPECT_THROW(parse_json_markdown("   \n"), std::runtime_error);
    EXPECT_THROW(parse_json_markdown("I cannot help with that."), std::runtime_error);
}

// ==========================================
// Wire Format Tests
// ==========================================

TEST(OpenAIProviderTest, ParsesContentAndUsage) {
    std::string body = R"({
        "model": "gpt-4o-mini",
        "choices": [{"message": {"role": "assistant", "content": "DONE"}, "finish_reason": "stop"}],
        "usage": {"prompt_tokens": 12, "completion_tokens": 1, "total_tokens": 13}
    })";

    LLMResponse response = OpenAIProvider::parse_chat_completion(body);
    ASSERT_TRUE(response.success);
    EXPECT_EQ(response.content, "DONE");
    EXPECT_TRUE(response.tool_calls.empty());
    EXPECT_EQ(response.model, "gpt-4o-mini");
    EXPECT_EQ(response.total_tokens, 13);
    EXPECT_EQ(response.metadata["finish_reason"], "stop");
}

TEST(OpenAIProviderTest, ParsesToolCalls) {
    std::string body = R"({
        "choices": [{"message": {"role": "assistant", "content": null, "tool_calls": [
            {"id": "call_1", "type": "function",
             "function": {"name": "delete_nodes", "arguments": "{\"node_ids\": [\"node_2\"]}"}},
            {"id": "call_2", "type": "function",
             "function": {"name": "expand_nodes_via_relation", "arguments": "not json"}}
        ]}}]
    })";

    LLMResponse response = OpenAIProvider::parse_chat_completion(body);
    ASSERT_TRUE(response.success);
    EXPECT_TRUE(response.content.empty());
    ASSERT_EQ(response.tool_calls.size(), 2);

    EXPECT_EQ(response.tool_calls[0].id, "call_1");
    EXPECT_EQ(response.tool_calls[0].name, "delete_nodes");
    EXPECT_EQ(response.tool_calls[0].arguments["node_ids"][0], "node_2");

    // Unparseable arguments are kept verbatim
    EXPECT_TRUE(response.tool_calls[1].arguments.is_string());
}

TEST(OpenAIProviderTest, ErrorBodies) {
    LLMResponse api_error = OpenAIProvider::parse_chat_completion(
        R"({"error": {"message": "Invalid API key"}})");
    EXPECT_FALSE(api_error.success);
    EXPECT_EQ(api_error.error_message, "Invalid API key");

    LLMResponse broken = OpenAIProvider::parse_chat_completion("<html>502</html>");
    EXPECT_FALSE(broken.success);
    EXPECT_NE(broken.error_message.find("Failed to parse response"), std::string::npos);

    LLMResponse no_choices = OpenAIProvider::parse_chat_completion(R"({"choices": []})");
    EXPECT_FALSE(no_choices.success);
}

TEST(OpenAIProviderTest, ChatPayloadWithTools) {
    LLMConfig config;
    config.model = "test-model";
    OpenAIProvider provider(config);

    Message assistant(Message::Role::Assistant, "");
    assistant.tool_calls.push_back({"call_1", "delete_nodes", {{"node_ids", json::array({"node_2"})}}});

    std::vector<Message> messages = {
        Message(Message::Role::System, "system"),
        Message(Message::Role::User, "query"),
        assistant,
        Message::tool_result("call_1", "Deleted 1 nodes.")
    };
    json tools = json::array({{{"type", "function"}, {"function", {{"name", "delete_nodes"}}}}});

    json payload = provider.build_chat_payload(messages, tools);
    EXPECT_EQ(payload["model"], "test-model");
    EXPECT_EQ(payload["tool_choice"], "auto");
    ASSERT_EQ(payload["messages"].size(), 4);
    EXPECT_EQ(payload["messages"][0]["role"], "system");

    const json& call = payload["messages"][2]["tool_calls"][0];
    EXPECT_EQ(call["function"]["name"], "delete_nodes");
    // Arguments go over the wire as a JSON-encoded string
    ASSERT_TRUE(call["function"]["arguments"].is_string());
    EXPECT_EQ(json::parse(call["function"]["arguments"].get<std::string>())["node_ids"][0], "node_2");

    EXPECT_EQ(payload["messages"][3]["role"], "tool");
    EXPECT_EQ(payload["messages"][3]["tool_call_id"], "call_1");
}

TEST(OpenAIProviderTest, PlainChatPayloadOmitsTools) {
    LLMConfig config;
    config.model = "test-model";
    OpenAIProvider provider(config);

    json payload = provider.build_chat_payload({Message(Message::Role::User, "hi")}, json());
    EXPECT_FALSE(payload.contains("tools"));
    EXPECT_FALSE(payload.contains("tool_choice"));
    EXPECT_FALSE(payload["messages"][0].contains("tool_calls"));
}

// ==========================================
// Factory Tests
// ==========================================

TEST(LLMProviderFactoryTest, FillsDefaults) {
    LLMConfig config;
    auto openai = LLMProviderFactory::create("OpenAI", config);
    EXPECT_EQ(openai->get_provider_name(), "OpenAI");
    EXPECT_EQ(openai->get_model(), "gpt-4o-mini");
    EXPECT_FALSE(openai->is_configured());

    auto ollama = LLMProviderFactory::create("ollama", config);
    EXPECT_EQ(ollama->get_model(), "llama3.1");
    EXPECT_EQ(ollama->get_config().api_base_url, "http://localhost:11434/v1");
    // Local servers need no key
    EXPECT_TRUE(ollama->is_configured());
}

TEST(LLMProviderFactoryTest, KeepsExplicitSettings) {
    LLMConfig config;
    config.api_key = "sk-test";
    config.model = "anthropic/claude-3-haiku";
    config.api_base_url = "https://proxy.example.org/v1/";

    auto provider = LLMProviderFactory::create("openrouter", config);
    EXPECT_EQ(provider->get_model(), "anthropic/claude-3-haiku");
    EXPECT_EQ(provider->get_config().api_base_url, "https://proxy.example.org/v1");
    EXPECT_TRUE(provider->is_configured());
}

TEST(LLMProviderFactoryTest, UnknownProvider) {
    EXPECT_THROW(LLMProviderFactory::create("gemini", LLMConfig{}), std::invalid_argument);
}

// ==========================================
// Query Decomposer Tests
// ==========================================

class CannedProvider : public LLMProvider {
public:
    LLMResponse reply;
    std::string last_prompt;

    LLMResponse complete(const std::string& prompt) override {
        last_prompt = prompt;
        return reply;
    }
    LLMResponse chat(const std::vector<Message>&) override { return reply; }
    LLMResponse chat_with_tools(const std::vector<Message>&, const json&) override { return reply; }

    std::string get_provider_name() const override { return "canned"; }
    std::string get_model() const override { return "canned"; }
    bool is_configured() const override { return true; }
    void set_config(const LLMConfig& config) override { config_ = config; }
    LLMConfig get_config() const override { return config_; }
};

TEST(QueryDecomposerTest, ParsesObjectsAndStrings) {
    auto result = QueryDecomposer::parse_response(R"({
        "entities": ["  Хорус ", "", "Луперкаль", 42],
        "questions": [{"text": "Кто предал Императора?"}, "  Где был Хорус? ", {"title": "x"}]
    })");

    EXPECT_EQ(result.entities, (std::vector<std::string>{"Хорус", "Луперкаль"}));
    EXPECT_EQ(result.questions, (std::vector<std::string>{"Кто предал Императора?", "Где был Хорус?"}));
}

TEST(QueryDecomposerTest, GarbageYieldsEmptyResult) {
    EXPECT_TRUE(QueryDecomposer::parse_response("no json here").empty());
    EXPECT_TRUE(QueryDecomposer::parse_response("[\"a\", \"b\"]").empty());
    EXPECT_TRUE(QueryDecomposer::parse_response("{\"entities\": \"Хорус\"}").empty());
}

TEST(QueryDecomposerTest, DecomposeUsesProvider) {
    CannedProvider provider;
    provider.reply.success = true;
    provider.reply.content = "```json\n{\"entities\": [\"Хорус\"], \"questions\": [{\"text\": \"Кто такой Хорус?\"}]}\n```";

    QueryDecomposer decomposer(provider);
    auto result = decomposer.decompose("Кто такой Хорус?");

    EXPECT_NE(provider.last_prompt.find("Кто такой Хорус?"), std::string::npos);
    ASSERT_EQ(result.entities.size(), 1);
    EXPECT_EQ(result.entities[0], "Хорус");

    json j = result.to_json();
    EXPECT_EQ(j["questions"][0]["text"], "Кто такой Хорус?");
}

TEST(QueryDecomposerTest, ProviderFailureYieldsEmptyResult) {
    CannedProvider provider;
    provider.reply.success = false;
    provider.reply.error_message = "timeout";

    QueryDecomposer decomposer(provider);
    EXPECT_TRUE(decomposer.decompose("Кто такой Хорус?").empty());
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
