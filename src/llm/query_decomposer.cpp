#include "llm/query_decomposer.hpp"
#include "text/utf8.hpp"
#include <iostream>

using json = nlohmann::json;

namespace lore {

json DecomposedQuery::to_json() const {
    json question_list = json::array();
    for (const auto& question : questions) {
        question_list.push_back({{"text", question}});
    }
    return {{"entities", entities}, {"questions", question_list}};
}

DecomposedQuery QueryDecomposer::parse_response(const std::string& text) {
    DecomposedQuery result;

    json j;
    try {
        j = parse_json_markdown(text);
    } catch (const std::exception&) {
        return result;
    }
    if (!j.is_object()) {
        return result;
    }

    if (j.contains("entities") && j["entities"].is_array()) {
        for (const auto& entity : j["entities"]) {
            if (!entity.is_string()) continue;
            std::string clean = utf8::trim(entity.get<std::string>());
            if (!clean.empty()) result.entities.push_back(clean);
        }
    }

    if (j.contains("questions") && j["questions"].is_array()) {
        for (const auto& question : j["questions"]) {
            std::string raw;
            if (question.is_string()) {
                raw = question.get<std::string>();
            } else if (question.is_object() && question.contains("text") && question["text"].is_string()) {
                raw = question["text"].get<std::string>();
            }
            std::string clean = utf8::trim(raw);
            if (!clean.empty()) result.questions.push_back(clean);
        }
    }

    return result;
}

DecomposedQuery QueryDecomposer::decompose(const std::string& question) {
    LLMResponse response = provider_.complete(PromptTemplates::query_decomposition_prompt(question));

    if (!response.success) {
        if (verbose_) {
            std::cerr << "Query decomposition failed: " << response.error_message << "\n";
        }
        return {};
    }

    DecomposedQuery result = parse_response(response.content);
    if (verbose_) {
        std::cout << "Decomposed query into " << result.questions.size() << " question(s) and "
                  << result.entities.size() << " entit" << (result.entities.size() == 1 ? "y" : "ies")
                  << "\n";
    }
    return result;
}

} // namespace lore
