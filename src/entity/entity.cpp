#include "entity/entity.hpp"
#include "text/utf8.hpp"

namespace lore {

size_t CandidateSpan::text_length() const {
    return utf8::length(text);
}

nlohmann::json CandidateSpan::to_json() const {
    nlohmann::json j;
    j["text"] = text;
    j["span"] = {start, end};
    j["canonical"] = canonical.has_value() ? nlohmann::json(*canonical) : nlohmann::json(nullptr);
    j["score"] = score.has_value() ? nlohmann::json(*score) : nlohmann::json(nullptr);
    j["source"] = source;
    return j;
}

nlohmann::json spans_to_json(const std::vector<CandidateSpan>& spans) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& span : spans) {
        arr.push_back(span.to_json());
    }
    return arr;
}

} // namespace lore
