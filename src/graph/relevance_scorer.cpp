#include "graph/relevance_scorer.hpp"
#include <algorithm>
#include <atomic>
#include <iostream>
#include <optional>
#include <thread>

using json = nlohmann::json;

namespace lore {

namespace {

struct PairOutcome {
    std::optional<GraphPath> path;
    bool failed = false;
    std::string error;
};

} // anonymous namespace

double RelevanceResult::score_of(const std::string& title) const {
    auto it = node_scores.find(title);
    return it != node_scores.end() ? it->second : 0.0;
}

json RelevanceResult::to_json() const {
    json j;
    j["node_scores"] = node_scores;

    json path_list = json::array();
    for (const auto& [pair, trace] : paths) {
        path_list.push_back({{"from", pair.first}, {"to", pair.second}, {"path", trace}});
    }
    j["paths"] = path_list;
    j["intermediate_nodes"] = intermediate_nodes;
    j["pairs_evaluated"] = pairs_evaluated;
    j["failed_queries"] = failed_queries;
    return j;
}

RelevanceResult GraphRelevanceScorer::score(const std::vector<std::string>& titles) const {
    return score(titles, options_.max_hops);
}

RelevanceResult GraphRelevanceScorer::score(const std::vector<std::string>& titles, int max_hops) const {
    RelevanceResult result;

    std::vector<std::string> unique;
    for (const auto& title : titles) {
        if (result.node_scores.emplace(title, 0.0).second) {
            unique.push_back(title);
        }
    }

    std::vector<std::pair<size_t, size_t>> pairs;
    for (size_t i = 0; i < unique.size(); ++i) {
        for (size_t j = i + 1; j < unique.size(); ++j) {
            pairs.emplace_back(i, j);
        }
    }
    result.pairs_evaluated = pairs.size();

    if (pairs.empty()) {
        return result;
    }

    // Phase 1: query every pair, one slot per pair
    std::vector<PairOutcome> outcomes(pairs.size());
    std::atomic<size_t> next_pair{0};

    auto worker = [&]() {
        for (size_t k = next_pair++; k < pairs.size(); k = next_pair++) {
            const auto& a = unique[pairs[k].first];
            const auto& b = unique[pairs[k].second];
            try {
                outcomes[k].path = store_.shortest_path(a, b, max_hops, options_.constraints);
            } catch (const std::exception& e) {
                outcomes[k].failed = true;
                outcomes[k].error = e.what();
            } catch (...) {
                // Must not escape the worker thread
                outcomes[k].failed = true;
                outcomes[k].error = "non-standard exception";
            }
        }
    };

    const size_t num_workers = std::min(std::max<size_t>(options_.max_workers, 1), pairs.size());
    if (num_workers == 1) {
        worker();
    } else {
        std::vector<std::thread> threads;
        threads.reserve(num_workers);
        for (size_t w = 0; w < num_workers; ++w) {
            threads.emplace_back(worker);
        }
        for (auto& thread : threads) {
            thread.join();
        }
    }

    // Phase 2: reduce in pair order
    const std::set<std::string> inputs(unique.begin(), unique.end());

    for (size_t k = 0; k < pairs.size(); ++k) {
        const auto& a = unique[pairs[k].first];
        const auto& b = unique[pairs[k].second];
        const PairOutcome& outcome = outcomes[k];

        if (outcome.failed) {
            ++result.failed_queries;
            if (options_.verbose) {
                std::cerr << "Path query failed for (" << a << ", " << b << "): "
                          << outcome.error << "\n";
            }
            continue;
        }
        if (!outcome.path) continue;

        const GraphPath& path = *outcome.path;
        const double contribution = 1.0 / (1.0 + static_cast<double>(path.length()));
        result.node_scores[a] += contribution;
        result.node_scores[b] += contribution;

        result.paths[{a, b}] = path.interleaved();
        result.paths[{b, a}] = path.reversed().interleaved();

        for (const auto& node : path.interior()) {
            if (inputs.count(node) == 0) {
                result.intermediate_nodes.insert(node);
            }
        }
    }

    if (options_.verbose) {
        std::cout << "Scored " << unique.size() << " titles over " << pairs.size()
                  << " pairs (" << result.paths.size() / 2 << " connected, "
                  << result.failed_queries << " failed)\n";
    }

    return result;
}

} // namespace lore
