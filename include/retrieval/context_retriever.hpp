#pragma once

#include "agent/context_optimizer.hpp"
#include "entity/entity_extractor.hpp"
#include "graph/relevance_scorer.hpp"
#include "llm/query_decomposer.hpp"
#include <map>
#include <string>
#include <vector>

namespace lore {

/**
 * @brief A stored text chunk with its metadata ("title", "source", ...)
 */
struct DocumentChunk {
    std::string content;
    std::map<std::string, std::string> metadata;

    /**
     * @brief Title metadata, or "Untitled"
     */
    std::string title() const;

    /**
     * @brief "source" metadata, else "url", else empty
     */
    std::string source() const;
};

struct ScoredChunk {
    DocumentChunk chunk;
    double similarity = 0.0;
};

/**
 * @brief External vector similarity search
 */
class VectorIndex {
public:
    virtual ~VectorIndex() = default;

    virtual std::vector<ScoredChunk> similarity_search(const std::string& text, size_t k) const = 0;
};

/**
 * @brief Search hits grouped by document title, first-seen title order
 */
struct TitleChunks {
    std::vector<std::string> order;
    std::map<std::string, std::vector<ScoredChunk>> by_title;

    size_t chunk_count(const std::string& title) const;
    bool contains(const std::string& title) const { return by_title.count(title) > 0; }
};

/**
 * @brief A context block handed to answer generation
 */
struct ContextDocument {
    std::string content;
    std::map<std::string, std::string> metadata;

    nlohmann::json to_json() const;
};

struct RetrieverOptions {
    size_t top_k_vector = 6;        // Hits per similarity search
    size_t top_k_final = 10;        // Titles kept for the graph stage
    bool verbose = false;
};

/**
 * @brief Hybrid retrieval: vector search, graph relevance and context optimization
 *
 * retrieve(query):
 *   1. decompose the query into sub-questions and entities
 *   2. search every sub-question and the raw query, then every entity after
 *      canonicalizing it
 *   3. merge hits per title and keep the most relevant titles
 *   4. build the optimizer payload and let the optimizer prune/expand it
 *   5. assemble one context document per surviving node with an http source
 *
 * The decomposer, extractor and engine are optional. Without a decomposer
 * only the raw query is searched; without an extractor entities are searched
 * as given; without an engine the payload is used unoptimized.
 */
class ContextRetriever {
public:
    ContextRetriever(
        const VectorIndex& index,
        const GraphStore& store,
        const GraphRelevanceScorer& scorer,
        QueryDecomposer* decomposer = nullptr,
        const EntityExtractor* extractor = nullptr,
        ReasoningEngine* engine = nullptr,
        RetrieverOptions options = {},
        OptimizerOptions optimizer_options = {}
    );

    std::vector<ContextDocument> retrieve(const std::string& query);

    /**
     * @brief Group hits by title, dropping repeated (title, trimmed content) pairs
     */
    static TitleChunks merge_chunks(const std::vector<ScoredChunk>& hits);

    /**
     * @brief Titles with a positive graph score or more than one chunk
     *
     * More than top_k_final qualifying titles are cut down by score plus
     * chunk count. If none qualify, every title is kept.
     */
    std::vector<std::string> filter_top_k(const TitleChunks& chunks, const RelevanceResult& relevance) const;

    /**
     * @brief One document per node that has an http source and some text
     */
    std::vector<ContextDocument> assemble_context(const OptimizerPayload& payload, const TitleChunks& chunks) const;

    const OptimizerPayload& last_payload() const { return last_payload_; }

private:
    const VectorIndex& index_;
    const GraphStore& store_;
    const GraphRelevanceScorer& scorer_;
    QueryDecomposer* decomposer_;
    const EntityExtractor* extractor_;
    ReasoningEngine* engine_;
    RetrieverOptions options_;
    OptimizerOptions optimizer_options_;
    OptimizerPayload last_payload_;
};

} // namespace lore
