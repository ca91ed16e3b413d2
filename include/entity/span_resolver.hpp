#pragma once

#include "entity/entity.hpp"
#include <vector>

namespace lore {

/**
 * @brief Turns overlapping candidate spans into a non-overlapping set
 *
 * 1. Deduplicate on (lowercased text, start, end, source); a later duplicate
 *    replaces the earlier value but keeps its position.
 * 2. Stable-sort by start ascending, then end descending.
 * 3. Greedy scan: a candidate overlapping an accepted span is compared with
 *    the first such span by (score or 0, text length); it replaces that span
 *    only if strictly better, otherwise it is dropped for good.
 *
 * A dropped candidate is never reconsidered, even if the span that beat it is
 * displaced later. That can leave text uncovered although a non-overlapping
 * candidate existed for it.
 */
class SpanResolver {
public:
    ResolvedSpanSet resolve(const std::vector<CandidateSpan>& candidates) const;

    /**
     * @brief Step 1 only, exposed for testing
     */
    static std::vector<CandidateSpan> deduplicate(const std::vector<CandidateSpan>& candidates);
};

/**
 * @brief True if no two spans in the set intersect
 */
bool is_non_overlapping(const std::vector<CandidateSpan>& spans);

} // namespace lore
