#include "agent/llm_reasoning_engine.hpp"
#include <stdexcept>

namespace lore {

EngineDecision LLMReasoningEngine::decide(
    const std::string& system_prompt,
    const std::vector<Message>& conversation
) {
    std::vector<Message> messages;
    messages.reserve(conversation.size() + 1);
    messages.emplace_back(Message::Role::System, system_prompt);
    messages.insert(messages.end(), conversation.begin(), conversation.end());

    LLMResponse response = provider_.chat_with_tools(messages, ContextOptimizer::tool_schemas());
    if (!response.success) {
        throw std::runtime_error("Reasoning engine call failed: " + response.error_message);
    }

    EngineDecision decision;
    decision.content = response.content;
    decision.tool_calls = response.tool_calls;
    return decision;
}

} // namespace lore
