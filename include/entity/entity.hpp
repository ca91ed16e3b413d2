#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstddef>
#include <nlohmann/json.hpp>

namespace lore {

/**
 * @brief A candidate entity mention in a source text
 *
 * [start, end) is a half-open byte interval into the original UTF-8 text and
 * start < end always holds. Candidates may overlap until they are resolved.
 */
struct CandidateSpan {
    std::string text;                       // Exact-cased surface form
    size_t start = 0;
    size_t end = 0;
    std::optional<std::string> canonical;   // Gazetteer form, if known
    std::optional<double> score;            // Similarity on a 0-100 scale
    std::string source = "gazetteer";       // Which matcher produced it

    /**
     * @brief Length of the surface form in codepoints
     */
    size_t text_length() const;

    /**
     * @brief Half-open interval intersection test
     */
    bool overlaps(const CandidateSpan& other) const {
        return start < other.end && other.start < end;
    }

    nlohmann::json to_json() const;
};

using ResolvedSpanSet = std::vector<CandidateSpan>;

nlohmann::json spans_to_json(const std::vector<CandidateSpan>& spans);

} // namespace lore
