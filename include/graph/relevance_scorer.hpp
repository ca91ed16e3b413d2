#pragma once

#include "graph/graph_store.hpp"
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace lore {

/**
 * @brief Path traces keyed by ordered title pair
 *
 * Each trace alternates node titles and relation types. A pair found
 * connected is stored under (a, b) oriented a -> b and under (b, a)
 * oriented b -> a, so one entry is the reverse of the other.
 */
using PathRecordMap = std::map<std::pair<std::string, std::string>, std::vector<std::string>>;

/**
 * @brief Options for the graph relevance scorer
 */
struct ScorerOptions {
    int max_hops = 5;                   // Longest path that still counts
    size_t max_workers = 8;             // Concurrent path queries; 0 or 1 runs inline
    PathConstraints constraints = PathConstraints::defaults();
    bool verbose = false;
};

/**
 * @brief Output of one scoring run
 */
struct RelevanceResult {
    std::map<std::string, double> node_scores;      // Every input title, 0.0 if unconnected
    PathRecordMap paths;
    std::set<std::string> intermediate_nodes;       // Interior path nodes not among the inputs
    size_t pairs_evaluated = 0;
    size_t failed_queries = 0;                      // Pair queries that threw; counted as no path

    double score_of(const std::string& title) const;

    nlohmann::json to_json() const;
};

/**
 * @brief Scores candidate titles by how closely the graph connects them
 *
 * For every unordered pair of distinct titles the store is asked for the
 * shortest qualifying path of at most max_hops edges. A path of length d adds
 * 1/(1+d) to both endpoints; an unconnected pair adds nothing.
 *
 * Pair queries run on a bounded pool of worker threads. Each pair writes to
 * its own slot and the slots are reduced in pair order afterwards, so the
 * result does not depend on the number of workers.
 */
class GraphRelevanceScorer {
public:
    GraphRelevanceScorer(const GraphStore& store, ScorerOptions options = {})
        : store_(store), options_(std::move(options)) {}

    /**
     * @brief Score titles with the configured hop bound
     *
     * Duplicate titles are ignored after their first occurrence.
     */
    RelevanceResult score(const std::vector<std::string>& titles) const;

    RelevanceResult score(const std::vector<std::string>& titles, int max_hops) const;

    const ScorerOptions& options() const { return options_; }

private:
    const GraphStore& store_;
    ScorerOptions options_;
};

} // namespace lore
