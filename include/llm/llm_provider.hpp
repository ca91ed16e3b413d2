#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>

namespace lore {

// ============================================================================
// Data Structures
// ============================================================================

/**
 * @brief Configuration for LLM provider
 */
struct LLMConfig {
    std::string api_key;                    ///< API key for authentication
    std::string model;                      ///< Model name/ID
    std::string api_base_url;               ///< Base URL for API (optional)
    double temperature = 0.12;              ///< Sampling temperature (0.0-1.0)
    int max_tokens = 2000;                  ///< Maximum tokens in response
    int timeout_seconds = 60;               ///< Request timeout
    int max_retries = 3;                    ///< Max retry attempts on failure
    bool verbose = false;                   ///< Enable verbose logging

    // Additional parameters
    std::map<std::string, std::string> extra_params;
};

/**
 * @brief A function call requested by the model
 */
struct ToolCall {
    std::string id;                         ///< Provider-assigned call id
    std::string name;                       ///< Tool name
    nlohmann::json arguments;               ///< Parsed arguments object
};

/**
 * @brief Message in a conversation
 */
struct Message {
    enum class Role {
        System,
        User,
        Assistant,
        Tool
    };

    Role role;
    std::string content;
    std::string tool_call_id;               ///< Set on Tool messages
    std::vector<ToolCall> tool_calls;       ///< Set on Assistant messages that call tools

    Message(Role r, const std::string& c) : role(r), content(c) {}

    /**
     * @brief Observation returned to the model for one tool call
     */
    static Message tool_result(const std::string& call_id, const std::string& content) {
        Message msg(Role::Tool, content);
        msg.tool_call_id = call_id;
        return msg;
    }

    std::string role_string() const {
        switch (role) {
            case Role::System: return "system";
            case Role::User: return "user";
            case Role::Assistant: return "assistant";
            case Role::Tool: return "tool";
            default: return "user";
        }
    }
};

/**
 * @brief Response from LLM
 */
struct LLMResponse {
    std::string content;                    ///< Generated text
    std::vector<ToolCall> tool_calls;       ///< Requested tool calls, if any
    std::string model;                      ///< Model that generated response
    int prompt_tokens = 0;                  ///< Tokens in prompt
    int completion_tokens = 0;              ///< Tokens in completion
    int total_tokens = 0;                   ///< Total tokens used
    double latency_ms = 0.0;                ///< Response latency
    bool success = false;                   ///< Whether request succeeded
    std::string error_message;              ///< Error message if failed

    // Additional response metadata
    std::map<std::string, std::string> metadata;
};

// ============================================================================
// LLM Provider Interface
// ============================================================================

/**
 * @brief Abstract base class for LLM providers
 *
 * Failures are reported through LLMResponse::success and error_message;
 * providers do not throw from their call methods.
 */
class LLMProvider {
public:
    virtual ~LLMProvider() = default;

    /**
     * @brief Complete a single prompt
     */
    virtual LLMResponse complete(const std::string& prompt) = 0;

    /**
     * @brief Chat completion with message history
     */
    virtual LLMResponse chat(const std::vector<Message>& messages) = 0;

    /**
     * @brief Chat completion offering the model a set of tools
     *
     * @param messages Conversation messages
     * @param tools Array of function schemas in OpenAI "tools" format
     * @return Response whose tool_calls lists what the model wants to run
     */
    virtual LLMResponse chat_with_tools(
        const std::vector<Message>& messages,
        const nlohmann::json& tools
    ) = 0;

    virtual std::string get_provider_name() const = 0;
    virtual std::string get_model() const = 0;
    virtual bool is_configured() const = 0;
    virtual void set_config(const LLMConfig& config) = 0;
    virtual LLMConfig get_config() const = 0;

protected:
    LLMConfig config_;

    /**
     * @brief Retry logic for API calls
     */
    template<typename Func>
    LLMResponse retry_call(Func&& func, const std::string& operation_name);
};

// ============================================================================
// OpenAI-compatible Provider
// ============================================================================

/**
 * @brief Chat completions over the OpenAI wire format
 *
 * Works with any endpoint speaking that format: OpenAI itself, OpenRouter
 * and Ollama's /v1 endpoint. The endpoint is chosen by api_base_url.
 */
class OpenAIProvider : public LLMProvider {
public:
    /**
     * @param config Configuration; an empty api_base_url selects OpenAI
     * @param provider_name Name reported by get_provider_name()
     */
    explicit OpenAIProvider(const LLMConfig& config, const std::string& provider_name = "OpenAI");

    LLMResponse complete(const std::string& prompt) override;
    LLMResponse chat(const std::vector<Message>& messages) override;
    LLMResponse chat_with_tools(
        const std::vector<Message>& messages,
        const nlohmann::json& tools
    ) override;

    std::string get_provider_name() const override { return provider_name_; }
    std::string get_model() const override { return config_.model; }
    bool is_configured() const override;
    void set_config(const LLMConfig& config) override { config_ = config; }
    LLMConfig get_config() const override { return config_; }

    /**
     * @brief Build JSON payload for chat completion
     * @param tools Tool schemas, or null for a plain chat
     */
    nlohmann::json build_chat_payload(
        const std::vector<Message>& messages,
        const nlohmann::json& tools
    ) const;

    /**
     * @brief Parse a chat completion response body
     */
    static LLMResponse parse_chat_completion(const std::string& response_json);

private:
    std::string provider_name_;

    std::string make_request(const std::string& endpoint, const std::string& json_payload);

    LLMResponse send(const std::vector<Message>& messages, const nlohmann::json& tools);
};

// ============================================================================
// LLM Provider Factory
// ============================================================================

/**
 * @brief Factory for creating LLM providers
 */
class LLMProviderFactory {
public:
    enum class ProviderType {
        OpenAI,
        OpenRouter,
        Ollama
    };

    /**
     * @brief Create LLM provider from type
     *
     * Fills in the provider's default base URL and model when the config
     * leaves them empty.
     */
    static std::unique_ptr<LLMProvider> create(
        ProviderType type,
        const LLMConfig& config
    );

    /**
     * @brief Create provider from string name
     *
     * @param provider_name "openai", "openrouter" or "ollama"
     */
    static std::unique_ptr<LLMProvider> create(
        const std::string& provider_name,
        const LLMConfig& config
    );

    /**
     * @brief Create provider from environment variables
     *
     * Looks for:
     * - LORE_LLM_PROVIDER (openai/openrouter/ollama)
     * - LORE_LLM_API_KEY or OPENAI_API_KEY
     * - LORE_LLM_MODEL (optional)
     * - LORE_LLM_BASE_URL (optional)
     *
     * @return Unique pointer to provider, or nullptr if not configured
     */
    static std::unique_ptr<LLMProvider> create_from_env();
};

// ============================================================================
// Prompt Templates
// ============================================================================

/**
 * @brief Prompt templates for the retrieval pipeline
 */
class PromptTemplates {
public:
    /**
     * @brief System prompt for the graph context optimizer
     * @param query The user's question
     * @param graph_text Current node set rendered as text
     */
    static std::string context_optimizer_system_prompt(
        const std::string& query,
        const std::string& graph_text
    );

    /**
     * @brief Prompt asking for sub-questions and entities of a question
     */
    static std::string query_decomposition_prompt(const std::string& question);

    /**
     * @brief Format instructions for JSON output
     */
    static std::string json_format_instructions();
};

// ============================================================================
// Utility Functions
// ============================================================================

/**
 * @brief Parse JSON produced by a model
 *
 * Strips markdown code fences, replaces raw newlines inside strings and
 * closes unbalanced brackets before parsing. Throws std::runtime_error if the
 * text still is not JSON.
 */
nlohmann::json parse_json_markdown(const std::string& text);

/**
 * @brief Read an environment variable, empty if unset
 */
std::string get_env(const std::string& name);

} // namespace lore
