#pragma once

#include "llm/llm_provider.hpp"
#include <string>
#include <vector>

namespace lore {

/**
 * @brief A question split into sub-questions plus the entities it names
 */
struct DecomposedQuery {
    std::vector<std::string> entities;
    std::vector<std::string> questions;

    bool empty() const { return entities.empty() && questions.empty(); }

    nlohmann::json to_json() const;
};

/**
 * @brief Asks the LLM to decompose a user question
 *
 * Never throws: transport errors and unparseable replies yield an empty
 * result so that retrieval can fall back to plain similarity search.
 */
class QueryDecomposer {
public:
    explicit QueryDecomposer(LLMProvider& provider, bool verbose = false)
        : provider_(provider), verbose_(verbose) {}

    DecomposedQuery decompose(const std::string& question);

    /**
     * @brief Parse a model reply of the form
     *        {"entities": [...], "questions": [{"text": ...}, ...]}
     *
     * Plain strings are also accepted as questions. Entries are trimmed and
     * empty ones dropped. Anything unparseable yields an empty result.
     */
    static DecomposedQuery parse_response(const std::string& text);

private:
    LLMProvider& provider_;
    bool verbose_;
};

} // namespace lore
