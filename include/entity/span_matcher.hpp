#pragma once

#include "entity/entity.hpp"
#include "entity/gazetteer.hpp"
#include <string>
#include <vector>

namespace lore {

/**
 * @brief Options for the fuzzy gazetteer matcher
 */
struct MatcherOptions {
    double cutoff = 82.0;           ///< Minimum similarity (0-100) to emit a span
    size_t max_window = 5;          ///< Maximum window width in tokens
};

/**
 * @brief Finds near-matches of gazetteer names inside a text
 *
 * Every window of 1..max_window consecutive tokens is lowercased, joined with
 * single spaces and scored against each gazetteer key that can still reach the
 * cutoff. Each (window, entry) pair scoring at least the cutoff becomes a
 * candidate span carrying the entry's canonical form.
 *
 * The matcher only reads its gazetteer and keeps no per-call state.
 */
class FuzzySpanMatcher {
public:
    explicit FuzzySpanMatcher(const Gazetteer& gazetteer, MatcherOptions options = {})
        : gazetteer_(gazetteer), options_(options) {}

    /**
     * @brief Match with the configured cutoff
     */
    std::vector<CandidateSpan> match(const std::string& text) const;

    /**
     * @brief Match with an explicit cutoff
     *
     * Candidates are emitted in (start token, window width, gazetteer order).
     */
    std::vector<CandidateSpan> match(const std::string& text, double cutoff) const;

    const MatcherOptions& options() const { return options_; }

private:
    const Gazetteer& gazetteer_;
    MatcherOptions options_;
};

} // namespace lore
