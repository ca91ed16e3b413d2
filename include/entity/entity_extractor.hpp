#pragma once

#include "entity/entity.hpp"
#include "entity/gazetteer.hpp"
#include "entity/morphology.hpp"
#include "entity/span_matcher.hpp"
#include "entity/span_resolver.hpp"
#include <string>

namespace lore {

/**
 * @brief Gazetteer-based entity extraction and text canonicalization
 *
 * Ties together the fuzzy matcher, the span resolver and the inflection
 * adapter. The gazetteer and the analyzer are borrowed and must outlive the
 * extractor.
 */
class EntityExtractor {
public:
    /**
     * @param gazetteer Dictionary of canonical names
     * @param morphology Analyzer used by normalize_text; nullptr disables
     *                   re-inflection and canonical forms are inserted as-is
     */
    EntityExtractor(
        const Gazetteer& gazetteer,
        const Morphology* morphology,
        MatcherOptions options = {},
        bool verbose = false
    );

    // The inflector may refer to passthrough_, so copies would dangle
    EntityExtractor(const EntityExtractor&) = delete;
    EntityExtractor& operator=(const EntityExtractor&) = delete;

    /**
     * @brief Non-overlapping entity mentions, ordered by start offset
     */
    ResolvedSpanSet extract(const std::string& text) const;

    /**
     * @brief Replace every recognized mention with its canonical form
     *
     * Replacements run from the rightmost span to the leftmost so that the
     * offsets of the remaining spans stay valid while the text is rewritten.
     */
    std::string normalize_text(const std::string& text) const;

    const FuzzySpanMatcher& matcher() const { return matcher_; }

private:
    FuzzySpanMatcher matcher_;
    SpanResolver resolver_;
    PassthroughMorphology passthrough_;
    InflectionAdapter inflector_;
    bool verbose_;
};

} // namespace lore
