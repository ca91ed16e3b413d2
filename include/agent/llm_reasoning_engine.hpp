#pragma once

#include "agent/context_optimizer.hpp"
#include "llm/llm_provider.hpp"

namespace lore {

/**
 * @brief Reasoning engine backed by a tool-calling chat model
 *
 * Each decision is one chat_with_tools request offering the optimizer's
 * tool schemas. A failed request throws std::runtime_error.
 */
class LLMReasoningEngine : public ReasoningEngine {
public:
    explicit LLMReasoningEngine(LLMProvider& provider) : provider_(provider) {}

    EngineDecision decide(
        const std::string& system_prompt,
        const std::vector<Message>& conversation
    ) override;

private:
    LLMProvider& provider_;
};

} // namespace lore
