#include "llm/llm_provider.hpp"
#include "net/http_client.hpp"
#include <iostream>
#include <sstream>
#include <chrono>
#include <thread>
#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <algorithm>

using json = nlohmann::json;

namespace lore {

namespace {

const char* kOpenAIBaseUrl = "https://api.openai.com/v1";
const char* kOpenRouterBaseUrl = "https://openrouter.ai/api/v1";
const char* kOllamaBaseUrl = "http://localhost:11434/v1";

json tool_call_to_json(const ToolCall& call) {
    return {
        {"id", call.id},
        {"type", "function"},
        {"function", {
            {"name", call.name},
            {"arguments", call.arguments.is_string() ? call.arguments.get<std::string>()
                                                     : call.arguments.dump()}
        }}
    };
}

ToolCall tool_call_from_json(const json& j) {
    ToolCall call;
    call.id = j.value("id", std::string());

    const json& function = j.at("function");
    call.name = function.value("name", std::string());

    // Arguments arrive as a JSON-encoded string; keep the raw text if it is not JSON
    const json& raw = function.contains("arguments") ? function["arguments"] : json();
    if (raw.is_string()) {
        try {
            call.arguments = json::parse(raw.get<std::string>());
        } catch (const json::parse_error&) {
            call.arguments = raw;
        }
    } else if (raw.is_object()) {
        call.arguments = raw;
    } else {
        call.arguments = json::object();
    }
    return call;
}

} // anonymous namespace

// ============================================================================
// LLMProvider Base Class
// ============================================================================

template<typename Func>
LLMResponse LLMProvider::retry_call(Func&& func, const std::string& operation_name) {
    const int max_attempts = std::max(config_.max_retries, 1);
    int attempts = 0;
    while (attempts < max_attempts) {
        try {
            return func();
        } catch (const std::exception& e) {
            attempts++;
            if (attempts >= max_attempts) {
                LLMResponse error_response;
                error_response.success = false;
                error_response.error_message = std::string("Failed after ") +
                    std::to_string(max_attempts) + " attempts: " + e.what();
                return error_response;
            }

            if (config_.verbose) {
                std::cerr << "Attempt " << attempts << " failed for " << operation_name
                          << ": " << e.what() << ". Retrying..." << std::endl;
            }

            // Exponential backoff
            std::this_thread::sleep_for(
                std::chrono::seconds(static_cast<int>(std::pow(2, attempts - 1)))
            );
        }
    }

    LLMResponse error_response;
    error_response.success = false;
    error_response.error_message = "Max retries exceeded";
    return error_response;
}

// ============================================================================
// OpenAI-compatible Provider
// ============================================================================

OpenAIProvider::OpenAIProvider(const LLMConfig& config, const std::string& provider_name)
    : provider_name_(provider_name) {
    config_ = config;
    if (config_.api_base_url.empty()) {
        config_.api_base_url = kOpenAIBaseUrl;
    }
    while (!config_.api_base_url.empty() && config_.api_base_url.back() == '/') {
        config_.api_base_url.pop_back();
    }
}

bool OpenAIProvider::is_configured() const {
    if (config_.model.empty()) return false;
    // A local Ollama server does not check keys
    return !config_.api_key.empty() || config_.api_base_url == kOllamaBaseUrl;
}

std::string OpenAIProvider::make_request(
    const std::string& endpoint,
    const std::string& json_payload
) {
    std::string url = config_.api_base_url + endpoint;

    std::vector<std::string> headers = {"Content-Type: application/json"};
    if (!config_.api_key.empty()) {
        headers.push_back("Authorization: Bearer " + config_.api_key);
    }

    return http_post(url, json_payload, headers, config_.timeout_seconds);
}

json OpenAIProvider::build_chat_payload(
    const std::vector<Message>& messages,
    const json& tools
) const {
    json j;
    j["model"] = config_.model;
    j["temperature"] = config_.temperature;
    j["max_tokens"] = config_.max_tokens;

    json messages_array = json::array();
    for (const auto& msg : messages) {
        json m = {
            {"role", msg.role_string()},
            {"content", msg.content}
        };
        if (msg.role == Message::Role::Tool) {
            m["tool_call_id"] = msg.tool_call_id;
        }
        if (!msg.tool_calls.empty()) {
            json calls = json::array();
            for (const auto& call : msg.tool_calls) {
                calls.push_back(tool_call_to_json(call));
            }
            m["tool_calls"] = calls;
        }
        messages_array.push_back(m);
    }
    j["messages"] = messages_array;

    if (tools.is_array() && !tools.empty()) {
        j["tools"] = tools;
        j["tool_choice"] = "auto";
    }

    return j;
}

LLMResponse OpenAIProvider::parse_chat_completion(const std::string& response_json) {
    LLMResponse response;

    try {
        json j = json::parse(response_json);

        if (j.contains("error")) {
            response.success = false;
            const json& error = j["error"];
            response.error_message = error.is_object() ? error.value("message", error.dump())
                                                       : error.dump();
            return response;
        }

        const json& message = j.at("choices").at(0).at("message");
        if (message.contains("content") && message["content"].is_string()) {
            response.content = message["content"].get<std::string>();
        }

        if (message.contains("tool_calls") && message["tool_calls"].is_array()) {
            for (const auto& call_json : message["tool_calls"]) {
                response.tool_calls.push_back(tool_call_from_json(call_json));
            }
        }

        response.model = j.value("model", std::string());

        if (j.contains("usage") && j["usage"].is_object()) {
            response.prompt_tokens = j["usage"].value("prompt_tokens", 0);
            response.completion_tokens = j["usage"].value("completion_tokens", 0);
            response.total_tokens = j["usage"].value("total_tokens", 0);
        }

        if (j["choices"][0].contains("finish_reason") && j["choices"][0]["finish_reason"].is_string()) {
            response.metadata["finish_reason"] = j["choices"][0]["finish_reason"].get<std::string>();
        }

        response.success = true;

    } catch (const std::exception& e) {
        response.success = false;
        response.error_message = std::string("Failed to parse response: ") + e.what();
    }

    return response;
}

LLMResponse OpenAIProvider::send(const std::vector<Message>& messages, const json& tools) {
    auto start_time = std::chrono::high_resolution_clock::now();

    auto call_api = [&]() -> LLMResponse {
        std::string payload = build_chat_payload(messages, tools).dump();

        if (config_.verbose) {
            std::cout << provider_name_ << " API Request to " << config_.model << std::endl;
        }

        std::string response_str = make_request("/chat/completions", payload);
        LLMResponse response = parse_chat_completion(response_str);

        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            end_time - start_time
        );
        response.latency_ms = duration.count();

        if (config_.verbose && response.success) {
            std::cout << "  Tokens: " << response.total_tokens
                      << " (prompt: " << response.prompt_tokens
                      << ", completion: " << response.completion_tokens << ")" << std::endl;
            std::cout << "  Latency: " << response.latency_ms << " ms" << std::endl;
        }

        return response;
    };

    return retry_call(call_api, provider_name_ + " chat");
}

LLMResponse OpenAIProvider::complete(const std::string& prompt) {
    std::vector<Message> messages = {
        Message(Message::Role::User, prompt)
    };
    return chat(messages);
}

LLMResponse OpenAIProvider::chat(const std::vector<Message>& messages) {
    return send(messages, json());
}

LLMResponse OpenAIProvider::chat_with_tools(
    const std::vector<Message>& messages,
    const json& tools
) {
    return send(messages, tools);
}

// ============================================================================
// LLM Provider Factory
// ============================================================================

std::unique_ptr<LLMProvider> LLMProviderFactory::create(
    ProviderType type,
    const LLMConfig& config
) {
    LLMConfig resolved = config;

    switch (type) {
        case ProviderType::OpenAI:
            if (resolved.api_base_url.empty()) resolved.api_base_url = kOpenAIBaseUrl;
            if (resolved.model.empty()) resolved.model = "gpt-4o-mini";
            return std::make_unique<OpenAIProvider>(resolved, "OpenAI");

        case ProviderType::OpenRouter:
            if (resolved.api_base_url.empty()) resolved.api_base_url = kOpenRouterBaseUrl;
            if (resolved.model.empty()) resolved.model = "openai/gpt-4o-mini";
            return std::make_unique<OpenAIProvider>(resolved, "OpenRouter");

        case ProviderType::Ollama:
            if (resolved.api_base_url.empty()) resolved.api_base_url = kOllamaBaseUrl;
            if (resolved.model.empty()) resolved.model = "llama3.1";
            return std::make_unique<OpenAIProvider>(resolved, "Ollama");

        default:
            throw std::invalid_argument("Unknown provider type");
    }
}

std::unique_ptr<LLMProvider> LLMProviderFactory::create(
    const std::string& provider_name,
    const LLMConfig& config
) {
    std::string name_lower = provider_name;
    std::transform(name_lower.begin(), name_lower.end(), name_lower.begin(), ::tolower);

    if (name_lower == "openai") {
        return create(ProviderType::OpenAI, config);
    } else if (name_lower == "openrouter") {
        return create(ProviderType::OpenRouter, config);
    } else if (name_lower == "ollama") {
        return create(ProviderType::Ollama, config);
    } else {
        throw std::invalid_argument("Unknown provider name: " + provider_name);
    }
}

std::unique_ptr<LLMProvider> LLMProviderFactory::create_from_env() {
    std::string provider = get_env("LORE_LLM_PROVIDER");
    if (provider.empty()) {
        provider = "openai";  // Default
    }

    LLMConfig config;
    config.api_key = get_env("LORE_LLM_API_KEY");
    if (config.api_key.empty()) {
        config.api_key = get_env("OPENAI_API_KEY");
    }
    config.model = get_env("LORE_LLM_MODEL");
    config.api_base_url = get_env("LORE_LLM_BASE_URL");

    auto llm = create(provider, config);
    if (!llm->is_configured()) {
        return nullptr;
    }
    return llm;
}

// ============================================================================
// Prompt Templates
// ============================================================================

std::string PromptTemplates::context_optimizer_system_prompt(
    const std::string& query,
    const std::string& graph_text
) {
    std::ostringstream out;
    out << "You are a knowledge graph editor.\n"
        << "Keep in the context only what concerns the topic \"" << query
        << "\" and find the facts that are still missing.\n\n"
        << "CURRENT NODE LIST:\n" << graph_text << "\n\n"
        << R"(PROCEDURE:
1. NOISE CHECK: Go through the list. If a node is not relevant to the question, call delete_nodes with its ID.
   Authors, books and other side branches that do not answer the question are noise.
2. COMPLETENESS CHECK: If the remaining nodes do not clearly answer the question, pick the most promising
   relation from "AVAILABLE RELATIONS" and call expand_nodes_via_relation.
3. RESULT: If the nodes contain everything needed for the answer, reply with the single word "DONE"
   without calling any tool.

Keep only nodes whose title or description relates to the question. Everything else is noise.)";
    return out.str();
}

std::string PromptTemplates::query_decomposition_prompt(const std::string& question) {
    return R"(You are an expert at extracting entities for retrieval.

Task:
1. If the question is complex, split it into 2-3 logical sub-questions.
2. If the question is simple and self-contained, keep it as a single sub-question.
3. List every name, term, event and other important entity of the ORIGINAL question,
   in the nominative case.
4. Keep sub-questions short.

Example input: Where did Abaddon fight Guilliman?
Example output:
{
  "entities": ["Abaddon", "Guilliman"],
  "questions": [
    {"text": "Where did Abaddon fight?"},
    {"text": "Where did Guilliman fight?"}
  ]
}

)" + json_format_instructions() + "\n\nUser question:\n" + question;
}

std::string PromptTemplates::json_format_instructions() {
    return R"(IMPORTANT:
- Respond ONLY with valid JSON (no markdown, no explanation)
- Use exactly the keys "entities" and "questions"
- Ensure JSON is complete and properly closed with all brackets)";
}

// ============================================================================
// Utility Functions
// ============================================================================

json parse_json_markdown(const std::string& text) {
    std::string clean_json = text;

    // Trim leading/trailing whitespace
    size_t first = clean_json.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) {
        throw std::runtime_error("Failed to parse JSON: empty input");
    }
    clean_json = clean_json.substr(first);

    // Remove ```json or ``` markers
    if (clean_json.compare(0, 7, "```json") == 0) {
        clean_json = clean_json.substr(7);
    } else if (clean_json.compare(0, 3, "```") == 0) {
        clean_json = clean_json.substr(3);
    }

    // Remove trailing ``` if present
    size_t last_backticks = clean_json.rfind("```");
    if (last_backticks != std::string::npos && last_backticks > 0) {
        clean_json = clean_json.substr(0, last_backticks);
    }

    // Trim again after removing markers
    first = clean_json.find_first_not_of(" \t\n\r");
    if (first != std::string::npos) {
        clean_json = clean_json.substr(first);
    }
    size_t last = clean_json.find_last_not_of(" \t\n\r");
    if (last != std::string::npos) {
        clean_json = clean_json.substr(0, last + 1);
    }

    // Replace unescaped newlines inside strings
    std::string fixed_json;
    fixed_json.reserve(clean_json.size());
    bool in_string = false;
    bool escaped = false;

    for (char c : clean_json) {
        if (escaped) {
            fixed_json += c;
            escaped = false;
            continue;
        }
        if (c == '\\') {
            fixed_json += c;
            escaped = true;
            continue;
        }
        if (c == '"') {
            in_string = !in_string;
            fixed_json += c;
            continue;
        }
        if (in_string && (c == '\n' || c == '\r')) {
            if (c == '\n') {
                fixed_json += ' ';
            }
            continue;
        }
        fixed_json += c;
    }

    try {
        return json::parse(fixed_json);
    } catch (const json::parse_error&) {
        // Fall through to bracket repair for truncated output
    }

    // Close whatever the output left open, innermost first
    std::string repaired_json = fixed_json;
    std::string open_stack;
    in_string = false;
    escaped = false;
    for (char c : repaired_json) {
        if (escaped) { escaped = false; continue; }
        if (c == '\\') { escaped = true; continue; }
        if (c == '"') { in_string = !in_string; continue; }
        if (in_string) continue;
        if (c == '{' || c == '[') {
            open_stack.push_back(c);
        } else if ((c == '}' || c == ']') && !open_stack.empty()) {
            open_stack.pop_back();
        }
    }

    if (in_string) {
        repaired_json += '"';
    }
    while (!open_stack.empty()) {
        repaired_json += (open_stack.back() == '{') ? '}' : ']';
        open_stack.pop_back();
    }

    try {
        return json::parse(repaired_json);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Failed to parse JSON: ") + e.what());
    }
}

std::string get_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : std::string();
}

} // namespace lore
