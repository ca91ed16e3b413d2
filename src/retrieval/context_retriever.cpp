#include "retrieval/context_retriever.hpp"
#include "text/utf8.hpp"
#include <algorithm>
#include <iostream>
#include <set>

using json = nlohmann::json;

namespace lore {

namespace {

bool is_http(const std::string& url) {
    return url.compare(0, 4, "http") == 0;
}

} // anonymous namespace

// ==========================================
// Value types
// ==========================================

std::string DocumentChunk::title() const {
    auto it = metadata.find("title");
    return (it != metadata.end() && !it->second.empty()) ? it->second : "Untitled";
}

std::string DocumentChunk::source() const {
    for (const char* key : {"source", "url"}) {
        auto it = metadata.find(key);
        if (it != metadata.end() && !it->second.empty()) {
            return it->second;
        }
    }
    return "";
}

size_t TitleChunks::chunk_count(const std::string& title) const {
    auto it = by_title.find(title);
    return it != by_title.end() ? it->second.size() : 0;
}

json ContextDocument::to_json() const {
    return {{"content", content}, {"metadata", metadata}};
}

// ==========================================
// ContextRetriever Implementation
// ==========================================

ContextRetriever::ContextRetriever(
    const VectorIndex& index,
    const GraphStore& store,
    const GraphRelevanceScorer& scorer,
    QueryDecomposer* decomposer,
    const EntityExtractor* extractor,
    ReasoningEngine* engine,
    RetrieverOptions options,
    OptimizerOptions optimizer_options
)
    : index_(index),
      store_(store),
      scorer_(scorer),
      decomposer_(decomposer),
      extractor_(extractor),
      engine_(engine),
      options_(options),
      optimizer_options_(optimizer_options) {}

TitleChunks ContextRetriever::merge_chunks(const std::vector<ScoredChunk>& hits) {
    TitleChunks merged;
    std::set<std::pair<std::string, std::string>> seen;

    for (const auto& hit : hits) {
        const std::string title = hit.chunk.title();
        if (!seen.emplace(title, utf8::trim(hit.chunk.content)).second) {
            continue;
        }

        auto& list = merged.by_title[title];
        if (list.empty()) {
            merged.order.push_back(title);
        }
        list.push_back(hit);
    }

    return merged;
}

std::vector<std::string> ContextRetriever::filter_top_k(
    const TitleChunks& chunks,
    const RelevanceResult& relevance
) const {
    std::vector<std::string> filtered;
    for (const auto& title : chunks.order) {
        if (relevance.score_of(title) > 0.0 || chunks.chunk_count(title) > 1) {
            filtered.push_back(title);
        }
    }

    if (filtered.size() > options_.top_k_final) {
        auto weight = [&](const std::string& title) {
            return relevance.score_of(title) + static_cast<double>(chunks.chunk_count(title));
        };
        std::stable_sort(filtered.begin(), filtered.end(),
            [&](const std::string& a, const std::string& b) { return weight(a) > weight(b); });
        filtered.resize(options_.top_k_final);
    }

    if (filtered.empty()) {
        filtered = chunks.order;
    }
    return filtered;
}

std::vector<ContextDocument> ContextRetriever::assemble_context(
    const OptimizerPayload& payload,
    const TitleChunks& chunks
) const {
    std::vector<ContextDocument> documents;

    for (const auto& node : payload.nodes) {
        const std::string& title = node.info.title;
        if (title.empty()) continue;

        const std::string description = utf8::trim(node.info.description);
        auto it = chunks.by_title.find(title);
        const bool has_chunks = it != chunks.by_title.end() && !it->second.empty();

        ContextDocument doc;
        std::string source_url;
        if (has_chunks) {
            doc.metadata = it->second.front().chunk.metadata;
            source_url = it->second.front().chunk.source();
        }
        if (source_url.empty() && node.info.source_url) {
            source_url = *node.info.source_url;
        }
        if (!has_chunks) {
            doc.metadata = {{"title", title}, {"source", source_url}};
        }

        if (!is_http(source_url)) {
            if (options_.verbose) {
                std::cerr << "Skipping node " << title << ": no valid HTTP source found\n";
            }
            continue;
        }

        if (description.empty() && !has_chunks) {
            continue;
        }

        std::vector<std::string> parts;
        parts.push_back("=== ENTITY: " + title + " ===");
        if (!description.empty()) {
            parts.push_back("[DESCRIPTION]: " + description);
        }
        if (has_chunks) {
            parts.push_back("[ADDITIONAL ARCHIVE DATA]:");
            size_t n = 1;
            for (const auto& hit : it->second) {
                parts.push_back("Fragment " + std::to_string(n++) + ":\n" + hit.chunk.content);
            }
        }

        for (size_t i = 0; i < parts.size(); ++i) {
            if (i > 0) doc.content += "\n\n";
            doc.content += parts[i];
        }
        documents.push_back(std::move(doc));
    }

    return documents;
}

std::vector<ContextDocument> ContextRetriever::retrieve(const std::string& query) {
    // Step 1: decompose
    DecomposedQuery decomposed;
    if (decomposer_) {
        decomposed = decomposer_->decompose(query);
    }

    // Step 2: vector search
    std::vector<ScoredChunk> hits;
    auto search = [&](const std::string& text) {
        std::string clean = utf8::trim(text);
        if (clean.empty()) return;
        auto results = index_.similarity_search(clean, options_.top_k_vector);
        hits.insert(hits.end(), results.begin(), results.end());
    };

    for (const auto& question : decomposed.questions) {
        search(question);
    }
    search(query);

    for (const auto& entity : decomposed.entities) {
        search(extractor_ ? extractor_->normalize_text(entity) : entity);
    }

    // Step 3: merge and rank titles
    TitleChunks chunks = merge_chunks(hits);
    RelevanceResult relevance = scorer_.score(chunks.order);
    std::vector<std::string> titles = filter_top_k(chunks, relevance);

    if (options_.verbose) {
        std::cout << "Retrieved " << hits.size() << " hits over " << chunks.order.size()
                  << " titles; keeping " << titles.size() << "\n";
    }

    // Step 4: optimize
    OptimizerPayload payload = build_payload(titles, relevance, store_, options_.verbose);
    if (engine_) {
        ContextOptimizer optimizer(*engine_, store_, optimizer_options_);
        try {
            payload = optimizer.optimize(query, payload);
            if (!optimizer.last_error().empty()) {
                std::cerr << "Context optimizer stopped early: " << optimizer.last_error() << "\n";
            }
        } catch (const ToolNotFoundError& e) {
            std::cerr << "Context optimizer aborted: " << e.what() << "\n";
        } catch (const std::exception& e) {
            std::cerr << "Context optimizer failed: " << e.what() << "\n";
        }
    }
    last_payload_ = payload;

    // Step 5: assemble
    return assemble_context(payload, chunks);
}

} // namespace lore
