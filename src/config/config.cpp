#include "config/config.hpp"
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <sys/stat.h>

using json = nlohmann::json;

namespace lore {

namespace {

const char* kRedacted = "***REDACTED***";

template<typename T>
void read_field(const json& j, const char* key, T& field) {
    if (j.contains(key) && !j[key].is_null()) {
        field = j[key].get<T>();
    }
}

bool file_exists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

} // anonymous namespace

// ============================================================================
// AppConfig
// ============================================================================

AppConfig AppConfig::from_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    json j;
    file >> j;
    return from_json(j);
}

AppConfig AppConfig::from_json(const json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("Config must be a JSON object");
    }

    AppConfig config;

    // Entity layer
    read_field(j, "gazetteer_path", config.gazetteer_path);
    read_field(j, "corpus_path", config.corpus_path);
    read_field(j, "stop_words_path", config.stop_words_path);
    read_field(j, "match_cutoff", config.match_cutoff);
    read_field(j, "max_window", config.max_window);
    read_field(j, "morphology_url", config.morphology_url);

    // Graph store
    read_field(j, "graph_backend", config.graph_backend);
    read_field(j, "graph_path", config.graph_path);
    read_field(j, "neo4j_uri", config.neo4j_uri);
    read_field(j, "neo4j_user", config.neo4j_user);
    read_field(j, "neo4j_password", config.neo4j_password);
    read_field(j, "neo4j_database", config.neo4j_database);
    read_field(j, "graph_timeout_seconds", config.graph_timeout_seconds);

    // Relevance scoring
    read_field(j, "max_hops", config.max_hops);
    read_field(j, "scorer_workers", config.scorer_workers);
    read_field(j, "path_excluded_relations", config.path_excluded_relations);
    read_field(j, "info_excluded_relations", config.info_excluded_relations);
    read_field(j, "noise_labels", config.noise_labels);
    read_field(j, "placeholder_titles", config.placeholder_titles);

    // LLM config - accepts the short keys of a bare LLM config file too
    if (j.contains("llm_provider")) read_field(j, "llm_provider", config.llm_provider);
    else read_field(j, "provider", config.llm_provider);

    if (j.contains("llm_api_key")) read_field(j, "llm_api_key", config.llm_api_key);
    else read_field(j, "api_key", config.llm_api_key);

    if (j.contains("llm_model")) read_field(j, "llm_model", config.llm_model);
    else read_field(j, "model", config.llm_model);

    read_field(j, "llm_base_url", config.llm_base_url);
    read_field(j, "llm_temperature", config.llm_temperature);
    read_field(j, "llm_max_tokens", config.llm_max_tokens);
    read_field(j, "llm_timeout_seconds", config.llm_timeout_seconds);
    read_field(j, "llm_max_retries", config.llm_max_retries);

    // Optimizer and retrieval
    read_field(j, "optimizer_max_iterations", config.optimizer_max_iterations);
    read_field(j, "top_k_vector", config.top_k_vector);
    read_field(j, "top_k_final", config.top_k_final);

    read_field(j, "verbose", config.verbose);

    // A redacted secret written by to_json_file is not a secret
    if (config.llm_api_key == kRedacted) config.llm_api_key.clear();
    if (config.neo4j_password == kRedacted) config.neo4j_password.clear();

    return config;
}

json AppConfig::to_json() const {
    json j;

    j["gazetteer_path"] = gazetteer_path;
    j["corpus_path"] = corpus_path;
    j["stop_words_path"] = stop_words_path;
    j["match_cutoff"] = match_cutoff;
    j["max_window"] = max_window;
    j["morphology_url"] = morphology_url;

    j["graph_backend"] = graph_backend;
    j["graph_path"] = graph_path;
    j["neo4j_uri"] = neo4j_uri;
    j["neo4j_user"] = neo4j_user;
    j["neo4j_password"] = neo4j_password.empty() ? "" : kRedacted;
    j["neo4j_database"] = neo4j_database;
    j["graph_timeout_seconds"] = graph_timeout_seconds;

    j["max_hops"] = max_hops;
    j["scorer_workers"] = scorer_workers;
    j["path_excluded_relations"] = path_excluded_relations;
    j["info_excluded_relations"] = info_excluded_relations;
    j["noise_labels"] = noise_labels;
    j["placeholder_titles"] = placeholder_titles;

    j["llm_provider"] = llm_provider;
    j["llm_api_key"] = llm_api_key.empty() ? "" : kRedacted;
    j["llm_model"] = llm_model;
    j["llm_base_url"] = llm_base_url;
    j["llm_temperature"] = llm_temperature;
    j["llm_max_tokens"] = llm_max_tokens;
    j["llm_timeout_seconds"] = llm_timeout_seconds;
    j["llm_max_retries"] = llm_max_retries;

    j["optimizer_max_iterations"] = optimizer_max_iterations;
    j["top_k_vector"] = top_k_vector;
    j["top_k_final"] = top_k_final;

    j["verbose"] = verbose;
    return j;
}

void AppConfig::to_json_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + path);
    }
    file << to_json().dump(2);
}

AppConfig AppConfig::from_environment() {
    AppConfig config;

    auto set_from = [](const char* name, std::string& field) {
        std::string value = get_env(name);
        if (!value.empty()) field = value;
    };

    set_from("LORE_LLM_PROVIDER", config.llm_provider);
    set_from("OPENAI_API_KEY", config.llm_api_key);
    set_from("LORE_LLM_API_KEY", config.llm_api_key);
    set_from("LORE_LLM_MODEL", config.llm_model);
    set_from("LORE_LLM_BASE_URL", config.llm_base_url);

    set_from("LORE_NEO4J_URI", config.neo4j_uri);
    set_from("LORE_NEO4J_USER", config.neo4j_user);
    set_from("LORE_NEO4J_PASSWORD", config.neo4j_password);
    if (!get_env("LORE_NEO4J_URI").empty()) {
        config.graph_backend = "neo4j";
    }

    set_from("LORE_GRAPH_PATH", config.graph_path);
    set_from("LORE_GAZETTEER_PATH", config.gazetteer_path);
    set_from("LORE_MORPHOLOGY_URL", config.morphology_url);

    return config;
}

bool AppConfig::validate(std::string& error_message) const {
    if (match_cutoff < 0.0 || match_cutoff > 100.0) {
        error_message = "Match cutoff must be between 0 and 100";
        return false;
    }

    if (max_window < 1) {
        error_message = "Max window must be at least 1";
        return false;
    }

    if (graph_backend != "memory" && graph_backend != "neo4j") {
        error_message = "Graph backend must be 'memory' or 'neo4j'";
        return false;
    }

    if (graph_backend == "neo4j" && neo4j_uri.empty()) {
        error_message = "Neo4j URI is required for the neo4j backend";
        return false;
    }

    if (max_hops < 1) {
        error_message = "Max hops must be at least 1";
        return false;
    }

    if (scorer_workers < 1) {
        error_message = "Scorer workers must be at least 1";
        return false;
    }

    if (llm_provider != "openai" && llm_provider != "openrouter" && llm_provider != "ollama") {
        error_message = "LLM provider must be 'openai', 'openrouter' or 'ollama'";
        return false;
    }

    if (llm_temperature < 0.0 || llm_temperature > 2.0) {
        error_message = "LLM temperature must be between 0.0 and 2.0";
        return false;
    }

    if (optimizer_max_iterations < 0) {
        error_message = "Optimizer max iterations must not be negative";
        return false;
    }

    if (top_k_vector < 1 || top_k_final < 1) {
        error_message = "top_k values must be at least 1";
        return false;
    }

    return true;
}

PathConstraints AppConfig::path_constraints() const {
    PathConstraints constraints;
    constraints.excluded_relation_types = path_excluded_relations;
    constraints.excluded_interior_labels = noise_labels;
    constraints.excluded_titles = placeholder_titles;
    return constraints;
}

LLMConfig AppConfig::llm_config() const {
    LLMConfig config;
    config.api_key = llm_api_key;
    config.model = llm_model;
    config.api_base_url = llm_base_url;
    config.temperature = llm_temperature;
    config.max_tokens = llm_max_tokens;
    config.timeout_seconds = llm_timeout_seconds;
    config.max_retries = llm_max_retries;
    config.verbose = verbose;
    return config;
}

Neo4jConfig AppConfig::neo4j_config() const {
    Neo4jConfig config;
    config.uri = neo4j_uri;
    config.user = neo4j_user;
    config.password = neo4j_password;
    config.database = neo4j_database;
    config.timeout_seconds = graph_timeout_seconds;
    return config;
}

AppConfig load_config_with_fallback(const std::string& config_path) {
    std::vector<std::string> paths_to_try;

    // If specific path provided, try it first
    if (!config_path.empty()) {
        paths_to_try.push_back(config_path);
    }

    paths_to_try.push_back(".lore_config.json");
    paths_to_try.push_back("../.lore_config.json");
    paths_to_try.push_back("../../.lore_config.json");

    for (const auto& path : paths_to_try) {
        if (!file_exists(path)) continue;

        try {
            AppConfig config = AppConfig::from_json_file(path);
            if (config.llm_api_key.empty()) {
                config.llm_api_key = AppConfig::from_environment().llm_api_key;
            }
            return config;
        } catch (const std::exception& e) {
            std::cerr << "Ignoring config file " << path << ": " << e.what() << "\n";
        }
    }

    // Fallback to environment
    return AppConfig::from_environment();
}

} // namespace lore
