#pragma once

#include "graph/graph_store.hpp"
#include "graph/relevance_scorer.hpp"
#include "llm/llm_provider.hpp"
#include <atomic>
#include <stdexcept>
#include <string>
#include <vector>

namespace lore {

// ============================================================================
// Payload
// ============================================================================

/**
 * @brief One node of the optimizer's working set
 */
struct PayloadNode {
    std::string id;                 // "node_<n>" or "node_<Title_With_Underscores>"
    double score = 0.0;             // Graph relevance; 0 for intermediate and expanded nodes
    NodeInfo info;

    nlohmann::json to_json() const;
};

/**
 * @brief The node set refined by the context optimizer, plus path traces
 *
 * Owned by a single optimization run; never shared between threads.
 */
struct OptimizerPayload {
    std::vector<PayloadNode> nodes;
    PathRecordMap paths;

    bool has_title(const std::string& title) const;

    std::vector<std::string> titles() const;

    /**
     * @brief Node blocks with ids, descriptions and available relations,
     *        the form the reasoning engine sees
     */
    std::string to_prompt_text() const;

    nlohmann::json to_json() const;
};

/**
 * @brief Build the initial payload for a retrieval
 *
 * Candidate titles come first, then intermediate nodes not among them. Node
 * ids are "node_<position>" counting from 1, so a title the store does not
 * know leaves a gap. Candidates get detailed info and their score rounded to
 * three decimals; intermediate nodes get brief info and score 0.
 */
OptimizerPayload build_payload(
    const std::vector<std::string>& candidate_titles,
    const RelevanceResult& relevance,
    const GraphStore& store,
    bool verbose = false
);

// ============================================================================
// Reasoning engine
// ============================================================================

/**
 * @brief What the reasoning engine wants to do next
 */
struct EngineDecision {
    std::string content;
    std::vector<ToolCall> tool_calls;

    bool is_terminal() const { return tool_calls.empty(); }
};

/**
 * @brief External decision maker driving the optimizer
 */
class ReasoningEngine {
public:
    virtual ~ReasoningEngine() = default;

    /**
     * @brief Decide on the next step
     * @param system_prompt Instructions including the current node set
     * @param conversation User query, earlier decisions and tool observations
     *
     * May throw on transport failure; the optimizer lets that propagate.
     */
    virtual EngineDecision decide(
        const std::string& system_prompt,
        const std::vector<Message>& conversation
    ) = 0;
};

// ============================================================================
// Context Optimizer
// ============================================================================

/**
 * @brief Raised when the engine asks for a tool that does not exist
 */
class ToolNotFoundError : public std::runtime_error {
public:
    explicit ToolNotFoundError(const std::string& tool_name)
        : std::runtime_error("Tool not found: " + tool_name), tool_name_(tool_name) {}

    const std::string& tool_name() const { return tool_name_; }

private:
    std::string tool_name_;
};

enum class OptimizerState {
    Decide,
    Execute,
    Done
};

/**
 * @brief Outcome of one tool call
 */
struct ToolResult {
    std::string action;             // "delete" or "expand"
    size_t count = 0;               // Nodes removed or added
    bool ok = true;                 // False if the call could not be carried out
    std::string status;             // Extra detail for the engine, may be empty

    /**
     * @brief Observation text sent back to the engine
     */
    std::string observation() const;
};

struct OptimizerOptions {
    int max_iterations = 5;         // Upper bound on engine calls per run
    bool verbose = false;
};

/**
 * @brief Bounded prune/expand loop over an optimizer payload
 *
 * State machine:
 *   Decide  - render the payload, ask the engine; tool calls -> Execute,
 *             none -> Done. Once max_iterations engine calls have been made,
 *             Decide goes straight to Done without asking.
 *   Execute - apply every requested tool call in order, then -> Decide.
 *
 * Two tools are offered: delete_nodes(node_ids) and
 * expand_nodes_via_relation(source_node_title, relation_type).
 *
 * request_cancel() may be called from another thread; it takes effect at
 * the next Decide, never in the middle of an Execute step.
 */
class ContextOptimizer {
public:
    ContextOptimizer(ReasoningEngine& engine, const GraphStore& store, OptimizerOptions options = {})
        : engine_(engine), store_(store), options_(options) {}

    /**
     * @brief Run the loop and return the refined payload
     *
     * Throws ToolNotFoundError if the engine requests an unknown tool. The
     * tool names of a step are checked before any of its calls is applied.
     * Any other error raised by the engine ends the run: the payload is
     * returned with the steps applied so far and last_error() is set.
     */
    OptimizerPayload optimize(const std::string& query, OptimizerPayload payload);

    void request_cancel() { cancel_requested_ = true; }
    bool cancel_requested() const { return cancel_requested_; }

    /**
     * @brief Engine invocations made by the last run
     */
    int engine_calls() const { return engine_calls_; }

    OptimizerState state() const { return state_; }

    /**
     * @brief Engine error that ended the last run, empty if none
     */
    const std::string& last_error() const { return last_error_; }

    /**
     * @brief Conversation of the last run
     */
    const std::vector<Message>& conversation() const { return conversation_; }

    // ==========================================
    // Tools
    // ==========================================

    /**
     * @brief Remove every node whose id is listed
     */
    ToolResult delete_nodes(OptimizerPayload& payload, const std::vector<std::string>& ids) const;

    /**
     * @brief Add one neighbour of source_title reached by relation_type
     *
     * The relation type is normalized first. The neighbour is added with
     * detailed info unless a node with the same title is already present.
     */
    ToolResult expand_nodes_via_relation(
        OptimizerPayload& payload,
        const std::string& source_title,
        const std::string& relation_type
    ) const;

    /**
     * @brief Strip surrounding brackets, quotes and spaces, then uppercase
     */
    static std::string normalize_relation_type(const std::string& relation_type);

    /**
     * @brief Function schemas of the two tools in OpenAI "tools" format
     */
    static nlohmann::json tool_schemas();

private:
    ReasoningEngine& engine_;
    const GraphStore& store_;
    OptimizerOptions options_;

    std::atomic<bool> cancel_requested_{false};
    int engine_calls_ = 0;
    OptimizerState state_ = OptimizerState::Done;
    std::string last_error_;
    std::vector<Message> conversation_;

    ToolResult execute(OptimizerPayload& payload, const ToolCall& call) const;
};

} // namespace lore
