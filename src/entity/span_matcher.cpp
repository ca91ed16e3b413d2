#include "entity/span_matcher.hpp"
#include "text/fuzzy.hpp"
#include "text/tokenizer.hpp"
#include "text/utf8.hpp"
#include <algorithm>

namespace lore {

std::vector<CandidateSpan> FuzzySpanMatcher::match(const std::string& text) const {
    return match(text, options_.cutoff);
}

std::vector<CandidateSpan> FuzzySpanMatcher::match(const std::string& text, double cutoff) const {
    std::vector<CandidateSpan> spans;
    if (text.empty() || gazetteer_.empty() || options_.max_window == 0) {
        return spans;
    }

    const std::vector<Token> tokens = tokenize(text);

    std::vector<std::u32string> lowered;
    lowered.reserve(tokens.size());
    for (const auto& token : tokens) {
        lowered.push_back(utf8::decode(utf8::to_lower(token.text)));
    }

    const auto& entries = gazetteer_.entries();

    for (size_t i = 0; i < tokens.size(); ++i) {
        const size_t last = std::min(i + options_.max_window, tokens.size());
        std::u32string fragment;

        for (size_t j = i + 1; j <= last; ++j) {
            if (j > i + 1) fragment.push_back(U' ');
            fragment += lowered[j - 1];

            const size_t start = tokens[i].start;
            const size_t end = tokens[j - 1].end;

            for (size_t index : gazetteer_.candidates(fragment.size(), cutoff)) {
                const GazetteerEntry& entry = entries[index];
                double score = fuzzy::ratio(fragment, entry.key_chars);
                if (score < cutoff) continue;

                CandidateSpan span;
                span.text = text.substr(start, end - start);
                span.start = start;
                span.end = end;
                span.canonical = entry.canonical;
                span.score = score;
                span.source = "gazetteer";
                spans.push_back(std::move(span));
            }
        }
    }

    return spans;
}

} // namespace lore
