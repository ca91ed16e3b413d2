#include "entity/entity_extractor.hpp"
#include <algorithm>
#include <iostream>

namespace lore {

EntityExtractor::EntityExtractor(
    const Gazetteer& gazetteer,
    const Morphology* morphology,
    MatcherOptions options,
    bool verbose
)
    : matcher_(gazetteer, options),
      inflector_(morphology ? *morphology : passthrough_, verbose),
      verbose_(verbose) {}

ResolvedSpanSet EntityExtractor::extract(const std::string& text) const {
    return resolver_.resolve(matcher_.match(text));
}

std::string EntityExtractor::normalize_text(const std::string& text) const {
    ResolvedSpanSet spans = extract(text);
    if (spans.empty()) {
        return text;
    }

    std::stable_sort(spans.begin(), spans.end(),
        [](const CandidateSpan& a, const CandidateSpan& b) { return a.start > b.start; });

    std::string corrected = text;
    size_t replaced = 0;
    for (const auto& span : spans) {
        if (!span.canonical) continue;

        std::string original = corrected.substr(span.start, span.end - span.start);
        std::string replacement = inflector_.inflect_to_match(original, *span.canonical);
        corrected.replace(span.start, span.end - span.start, replacement);
        ++replaced;
    }

    if (verbose_) {
        std::cout << "Normalized " << replaced << " entity mention(s)\n";
    }

    return corrected;
}

} // namespace lore
