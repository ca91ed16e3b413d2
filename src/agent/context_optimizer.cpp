#include "agent/context_optimizer.hpp"
#include "text/utf8.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <set>
#include <sstream>

using json = nlohmann::json;

namespace lore {

namespace {

std::string node_id_for_title(const std::string& title) {
    std::string id = "node_" + title;
    std::replace(id.begin(), id.end(), ' ', '_');
    return id;
}

double round3(double value) {
    return std::round(value * 1000.0) / 1000.0;
}

std::string string_arg(const json& arguments, const char* key) {
    if (!arguments.is_object() || !arguments.contains(key) || !arguments[key].is_string()) {
        throw std::invalid_argument(std::string("missing string argument '") + key + "'");
    }
    return arguments[key].get<std::string>();
}

} // anonymous namespace

// ==========================================
// Payload
// ==========================================

json PayloadNode::to_json() const {
    return {{"id", id}, {"score", score}, {"graph_info", info.to_json()}};
}

bool OptimizerPayload::has_title(const std::string& title) const {
    return std::any_of(nodes.begin(), nodes.end(),
        [&](const PayloadNode& node) { return node.info.title == title; });
}

std::vector<std::string> OptimizerPayload::titles() const {
    std::vector<std::string> out;
    out.reserve(nodes.size());
    for (const auto& node : nodes) {
        out.push_back(node.info.title);
    }
    return out;
}

std::string OptimizerPayload::to_prompt_text() const {
    if (nodes.empty()) {
        return "The graph is currently empty.";
    }

    std::ostringstream out;
    out << "\n\n";
    for (size_t i = 0; i < nodes.size(); ++i) {
        const PayloadNode& node = nodes[i];
        if (i > 0) out << "\n---\n";

        out << "=== NODE: " << node.info.title << " (ID: " << node.id << ") ===\n";
        out << "DESCRIPTION: " << node.info.description;

        if (!node.info.outgoing.empty() || !node.info.incoming.empty()) {
            out << "\nAVAILABLE RELATIONS:";
            for (const auto& rel : node.info.outgoing) {
                out << "\nRELATION: " << rel.type << " -> TARGET: " << rel.node;
            }
            for (const auto& rel : node.info.incoming) {
                out << "\nRELATION: " << rel.type << " <- SOURCE: " << rel.node;
            }
        }
    }
    return out.str();
}

json OptimizerPayload::to_json() const {
    json node_list = json::array();
    for (const auto& node : nodes) {
        node_list.push_back(node.to_json());
    }

    json path_list = json::array();
    for (const auto& [pair, trace] : paths) {
        path_list.push_back({{"from", pair.first}, {"to", pair.second}, {"path", trace}});
    }

    return {{"nodes", node_list}, {"paths", path_list}};
}

OptimizerPayload build_payload(
    const std::vector<std::string>& candidate_titles,
    const RelevanceResult& relevance,
    const GraphStore& store,
    bool verbose
) {
    OptimizerPayload payload;
    payload.paths = relevance.paths;

    std::vector<std::string> titles;
    std::set<std::string> candidates;
    for (const auto& title : candidate_titles) {
        if (candidates.insert(title).second) {
            titles.push_back(title);
        }
    }
    for (const auto& title : relevance.intermediate_nodes) {
        if (candidates.count(title) == 0) {
            titles.push_back(title);
        }
    }

    for (size_t i = 0; i < titles.size(); ++i) {
        const std::string& title = titles[i];
        const bool detailed = candidates.count(title) > 0;

        std::optional<NodeInfo> info;
        try {
            info = store.get_node_info(title, detailed);
        } catch (const std::exception& e) {
            if (verbose) {
                std::cerr << "Node info lookup failed for " << title << ": " << e.what() << "\n";
            }
        }
        if (!info) continue;

        PayloadNode node;
        node.id = "node_" + std::to_string(i + 1);
        node.score = detailed ? round3(relevance.score_of(title)) : 0.0;
        node.info = std::move(*info);
        payload.nodes.push_back(std::move(node));
    }

    return payload;
}

// ==========================================
// ToolResult
// ==========================================

std::string ToolResult::observation() const {
    std::string text;
    if (!ok) {
        text = "Tool failed";
    } else if (action == "delete") {
        text = "Deleted nodes: " + std::to_string(count);
    } else {
        text = "Added nodes: " + std::to_string(count);
    }
    if (!status.empty()) {
        text += " (" + status + ")";
    }
    return text;
}

// ==========================================
// ContextOptimizer Implementation
// ==========================================

OptimizerPayload ContextOptimizer::optimize(const std::string& query, OptimizerPayload payload) {
    engine_calls_ = 0;
    last_error_.clear();
    conversation_.clear();
    conversation_.emplace_back(Message::Role::User, query);
    state_ = OptimizerState::Decide;

    while (state_ != OptimizerState::Done) {
        switch (state_) {
            case OptimizerState::Decide: {
                if (cancel_requested_) {
                    if (options_.verbose) {
                        std::cout << "Context optimizer cancelled after "
                                  << engine_calls_ << " engine call(s)\n";
                    }
                    state_ = OptimizerState::Done;
                    break;
                }

                if (engine_calls_ >= options_.max_iterations) {
                    conversation_.emplace_back(Message::Role::Assistant, "DONE");
                    state_ = OptimizerState::Done;
                    break;
                }

                std::string system_prompt = PromptTemplates::context_optimizer_system_prompt(
                    query, payload.to_prompt_text());

                EngineDecision decision;
                try {
                    decision = engine_.decide(system_prompt, conversation_);
                } catch (const std::exception& e) {
                    // Steps already applied are kept
                    last_error_ = e.what();
                    if (options_.verbose) {
                        std::cerr << "Reasoning engine failed after " << engine_calls_
                                  << " call(s): " << e.what() << "\n";
                    }
                    state_ = OptimizerState::Done;
                    break;
                }
                ++engine_calls_;

                Message reply(Message::Role::Assistant, decision.content);
                reply.tool_calls = decision.tool_calls;
                conversation_.push_back(std::move(reply));

                state_ = decision.is_terminal() ? OptimizerState::Done : OptimizerState::Execute;
                break;
            }

            case OptimizerState::Execute: {
                const std::vector<ToolCall> calls = conversation_.back().tool_calls;

                for (const auto& call : calls) {
                    if (call.name != "delete_nodes" && call.name != "expand_nodes_via_relation") {
                        throw ToolNotFoundError(call.name);
                    }
                }

                for (const auto& call : calls) {
                    ToolResult result = execute(payload, call);
                    if (options_.verbose) {
                        std::cout << "  " << call.name << ": " << result.observation() << "\n";
                    }
                    conversation_.push_back(Message::tool_result(call.id, result.observation()));
                }

                state_ = OptimizerState::Decide;
                break;
            }

            case OptimizerState::Done:
                break;
        }
    }

    if (options_.verbose) {
        std::cout << "Context optimizer finished: " << payload.nodes.size() << " nodes, "
                  << engine_calls_ << " engine call(s)\n";
    }

    return payload;
}

ToolResult ContextOptimizer::execute(OptimizerPayload& payload, const ToolCall& call) const {
    ToolResult result;
    result.action = (call.name == "delete_nodes") ? "delete" : "expand";

    try {
        if (call.name == "delete_nodes") {
            const json& arguments = call.arguments;
            const char* key = arguments.is_object() && arguments.contains("node_ids") ? "node_ids" : "ids";
            if (!arguments.is_object() || !arguments.contains(key) || !arguments[key].is_array()) {
                throw std::invalid_argument("missing array argument 'node_ids'");
            }

            std::vector<std::string> ids;
            for (const auto& id : arguments[key]) {
                if (id.is_string()) ids.push_back(id.get<std::string>());
            }
            return delete_nodes(payload, ids);
        }

        return expand_nodes_via_relation(
            payload,
            string_arg(call.arguments, "source_node_title"),
            string_arg(call.arguments, "relation_type"));

    } catch (const std::exception& e) {
        if (options_.verbose) {
            std::cerr << "Tool " << call.name << " failed: " << e.what() << "\n";
        }
        result.ok = false;
        result.status = e.what();
        return result;
    }
}

ToolResult ContextOptimizer::delete_nodes(
    OptimizerPayload& payload,
    const std::vector<std::string>& ids
) const {
    const std::set<std::string> targets(ids.begin(), ids.end());
    const size_t before = payload.nodes.size();

    payload.nodes.erase(
        std::remove_if(payload.nodes.begin(), payload.nodes.end(),
            [&](const PayloadNode& node) { return targets.count(node.id) > 0; }),
        payload.nodes.end());

    ToolResult result;
    result.action = "delete";
    result.count = before - payload.nodes.size();
    return result;
}

ToolResult ContextOptimizer::expand_nodes_via_relation(
    OptimizerPayload& payload,
    const std::string& source_title,
    const std::string& relation_type
) const {
    ToolResult result;
    result.action = "expand";

    const std::string clean = normalize_relation_type(relation_type);
    std::optional<std::string> neighbor = store_.neighbor_by_relation(source_title, clean);
    if (!neighbor) {
        result.status = "relation not found";
        return result;
    }

    std::optional<NodeInfo> info = store_.get_node_info(*neighbor, true);
    if (!info) {
        result.status = "node not found";
        return result;
    }

    if (payload.has_title(info->title)) {
        result.status = "already present";
        return result;
    }

    PayloadNode node;
    node.id = node_id_for_title(info->title);
    node.info = std::move(*info);
    payload.nodes.push_back(std::move(node));
    result.count = 1;
    return result;
}

std::string ContextOptimizer::normalize_relation_type(const std::string& relation_type) {
    static const std::string kStrip = "()[]'\" ";

    size_t begin = relation_type.find_first_not_of(kStrip);
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = relation_type.find_last_not_of(kStrip);
    return utf8::to_upper(relation_type.substr(begin, end - begin + 1));
}

json ContextOptimizer::tool_schemas() {
    json delete_tool = {
        {"type", "function"},
        {"function", {
            {"name", "delete_nodes"},
            {"description",
             "Context optimization: removes nodes that do not help answer the current question. "
             "Use it to clear side branches unrelated to the question."},
            {"parameters", {
                {"type", "object"},
                {"properties", {
                    {"node_ids", {
                        {"type", "array"},
                        {"items", {{"type", "string"}}},
                        {"description", "IDs of the nodes to delete, e.g. \"node_3\""}
                    }}
                }},
                {"required", json::array({"node_ids"})}
            }}
        }}
    };

    json expand_tool = {
        {"type", "function"},
        {"function", {
            {"name", "expand_nodes_via_relation"},
            {"description",
             "Fetches the node connected to a node of the list by the given relation. "
             "Use a relation type from AVAILABLE RELATIONS."},
            {"parameters", {
                {"type", "object"},
                {"properties", {
                    {"source_node_title", {
                        {"type", "string"},
                        {"description", "Title of the node, as in the === NODE: ... === header"}
                    }},
                    {"relation_type", {
                        {"type", "string"},
                        {"description", "Relation type, e.g. 'ВРАГ'"}
                    }}
                }},
                {"required", json::array({"source_node_title", "relation_type"})}
            }}
        }}
    };

    return json::array({delete_tool, expand_tool});
}

} // namespace lore
