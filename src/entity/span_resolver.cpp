#include "entity/span_resolver.hpp"
#include "text/utf8.hpp"
#include <algorithm>
#include <map>
#include <tuple>

namespace lore {

namespace {

using DedupKey = std::tuple<std::string, size_t, size_t, std::string>;

std::pair<double, size_t> quality(const CandidateSpan& span) {
    return {span.score.value_or(0.0), span.text_length()};
}

} // anonymous namespace

std::vector<CandidateSpan> SpanResolver::deduplicate(const std::vector<CandidateSpan>& candidates) {
    std::vector<CandidateSpan> unique;
    std::map<DedupKey, size_t> position;

    for (const auto& candidate : candidates) {
        DedupKey key{utf8::to_lower(candidate.text), candidate.start, candidate.end, candidate.source};
        auto it = position.find(key);
        if (it != position.end()) {
            unique[it->second] = candidate;
        } else {
            position.emplace(std::move(key), unique.size());
            unique.push_back(candidate);
        }
    }

    return unique;
}

ResolvedSpanSet SpanResolver::resolve(const std::vector<CandidateSpan>& candidates) const {
    std::vector<CandidateSpan> ordered = deduplicate(candidates);

    std::stable_sort(ordered.begin(), ordered.end(),
        [](const CandidateSpan& a, const CandidateSpan& b) {
            if (a.start != b.start) return a.start < b.start;
            return a.end > b.end;
        });

    ResolvedSpanSet result;
    for (auto& candidate : ordered) {
        bool overlapped = false;

        for (auto it = result.begin(); it != result.end(); ++it) {
            if (!candidate.overlaps(*it)) continue;

            if (quality(candidate) > quality(*it)) {
                result.erase(it);
                result.push_back(std::move(candidate));
            }
            overlapped = true;
            break;
        }

        if (!overlapped) {
            result.push_back(std::move(candidate));
        }
    }

    return result;
}

bool is_non_overlapping(const std::vector<CandidateSpan>& spans) {
    for (size_t i = 0; i < spans.size(); ++i) {
        for (size_t j = i + 1; j < spans.size(); ++j) {
            if (spans[i].overlaps(spans[j])) return false;
        }
    }
    return true;
}

} // namespace lore
