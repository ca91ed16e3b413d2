#pragma once

#include "graph/graph_store.hpp"
#include "graph/neo4j_graph_store.hpp"
#include "llm/llm_provider.hpp"
#include <set>
#include <string>

namespace lore {

/**
 * @brief Application configuration
 *
 * Loaded from a JSON file whose keys match the field names, or from
 * LORE_* environment variables. Unknown keys are ignored.
 */
struct AppConfig {
    // Entity layer
    std::string gazetteer_path = "gazetteer.json";      ///< Gazetteer cache
    std::string corpus_path;                            ///< Corpus for rebuilding the gazetteer
    std::string stop_words_path;                        ///< One stop word per line
    double match_cutoff = 82.0;                         ///< Fuzzy match cutoff (0-100)
    int max_window = 5;                                 ///< Longest matched window in tokens
    std::string morphology_url;                         ///< Morphology service; empty = passthrough

    // Graph store
    std::string graph_backend = "memory";               ///< "memory" or "neo4j"
    std::string graph_path = "graph.json";              ///< Snapshot for the memory backend
    std::string neo4j_uri = "http://localhost:7474";
    std::string neo4j_user = "neo4j";
    std::string neo4j_password;
    std::string neo4j_database = "neo4j";
    int graph_timeout_seconds = 30;

    // Relevance scoring
    int max_hops = 5;
    int scorer_workers = 8;
    std::set<std::string> path_excluded_relations = PathConstraints::defaults().excluded_relation_types;
    std::set<std::string> info_excluded_relations = default_info_excluded_relations();
    std::set<std::string> noise_labels = PathConstraints::defaults().excluded_interior_labels;
    std::set<std::string> placeholder_titles = PathConstraints::defaults().excluded_titles;

    // LLM Configuration
    std::string llm_provider = "openai";                ///< "openai", "openrouter" or "ollama"
    std::string llm_api_key;
    std::string llm_model;                              ///< Empty = provider default
    std::string llm_base_url;                           ///< Empty = provider default
    double llm_temperature = 0.12;
    int llm_max_tokens = 2000;
    int llm_timeout_seconds = 60;
    int llm_max_retries = 3;

    // Optimizer and retrieval
    int optimizer_max_iterations = 5;
    int top_k_vector = 6;
    int top_k_final = 10;

    bool verbose = false;

    /**
     * @brief Load configuration from JSON file
     */
    static AppConfig from_json_file(const std::string& path);

    static AppConfig from_json(const nlohmann::json& j);

    /**
     * @brief Save configuration to JSON file; secrets are redacted
     */
    void to_json_file(const std::string& path) const;

    nlohmann::json to_json() const;

    /**
     * @brief Load from environment variables
     */
    static AppConfig from_environment();

    /**
     * @brief Validate configuration
     */
    bool validate(std::string& error_message) const;

    PathConstraints path_constraints() const;
    LLMConfig llm_config() const;
    Neo4jConfig neo4j_config() const;
};

/**
 * @brief Load configuration from file with fallback to environment
 *
 * Tries config_path, then .lore_config.json in the current directory and
 * its two parents. The first file that parses wins; an empty API key in it
 * is filled from the environment. With no usable file the environment alone
 * is used.
 */
AppConfig load_config_with_fallback(const std::string& config_path = "");

} // namespace lore
