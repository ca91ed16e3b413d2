#include "cli/cli.hpp"
#include "config/config.hpp"
#include "entity/entity_extractor.hpp"
#include "entity/gazetteer.hpp"
#include "graph/memory_graph_store.hpp"
#include "graph/neo4j_graph_store.hpp"
#include "graph/relevance_scorer.hpp"
#include "agent/context_optimizer.hpp"
#include "agent/llm_reasoning_engine.hpp"
#include "llm/query_decomposer.hpp"
#include <iostream>
#include <fstream>
#include <chrono>
#include <iomanip>
#include <memory>
#include <sstream>

using namespace lore;
using namespace lore::cli;

// ============== Helper Functions ==============

// Config file from --config, falling back to .lore_config.json and the environment
AppConfig load_config(const Args& args) {
    AppConfig config = load_config_with_fallback(args.get("config").str());
    if (args.has("verbose")) {
        config.verbose = true;
    }

    std::string error;
    if (!config.validate(error)) {
        throw std::runtime_error("Invalid configuration: " + error);
    }
    return config;
}

std::unique_ptr<GraphStore> make_graph_store(const AppConfig& config) {
    if (config.graph_backend == "neo4j") {
        if (config.verbose) {
            std::cout << "Using Neo4j graph at " << config.neo4j_uri << "\n";
        }
        return std::make_unique<Neo4jGraphStore>(config.neo4j_config(), config.info_excluded_relations);
    }

    if (config.verbose) {
        std::cout << "Loading graph snapshot from: " << config.graph_path << "\n";
    }
    auto store = std::make_unique<InMemoryGraphStore>(
        InMemoryGraphStore::load_from_json(config.graph_path, config.info_excluded_relations));
    if (config.verbose) {
        std::cout << "Loaded " << store->num_nodes() << " nodes and "
                  << store->num_relationships() << " relationships\n";
    }
    return store;
}

// Cached gazetteer; rebuilt from the corpus when the cache is missing and a corpus is configured
Gazetteer load_gazetteer(const AppConfig& config, const Morphology& morphology) {
    if (config.corpus_path.empty()) {
        return Gazetteer::load_from_json(config.gazetteer_path);
    }

    return Gazetteer::build_or_load(config.gazetteer_path, [&]() {
        std::set<std::string> stop_words;
        if (!config.stop_words_path.empty()) {
            stop_words = load_stop_words(config.stop_words_path);
        }
        GazetteerBuilder builder(morphology, std::move(stop_words));
        return builder.build(load_corpus(config.corpus_path));
    }, config.verbose);
}

MatcherOptions matcher_options(const AppConfig& config, const Args& args) {
    MatcherOptions options;
    options.cutoff = args.get("cutoff").as_double(config.match_cutoff);
    options.max_window = static_cast<size_t>(config.max_window);
    return options;
}

ScorerOptions scorer_options(const AppConfig& config, const Args& args) {
    ScorerOptions options;
    options.max_hops = args.get("max-hops").as_int(config.max_hops);
    options.max_workers = static_cast<size_t>(config.scorer_workers);
    options.constraints = config.path_constraints();
    options.verbose = config.verbose;
    return options;
}

std::vector<std::string> titles_from(const Args& args) {
    std::vector<std::string> titles = args.get("title").split('|');
    for (const auto& word : args.positional) {
        titles.push_back(word);
    }
    if (titles.empty()) {
        throw std::runtime_error("No titles given; use --title or positional arguments");
    }
    return titles;
}

std::unique_ptr<LLMProvider> make_provider(const AppConfig& config) {
    auto provider = LLMProviderFactory::create(config.llm_provider, config.llm_config());
    if (!provider->is_configured()) {
        throw std::runtime_error("LLM provider '" + config.llm_provider +
                                 "' is not configured; set LORE_LLM_API_KEY or llm_api_key");
    }
    return provider;
}

void write_output(const nlohmann::json& j, const Args& args) {
    std::string output_path = args.get("output").str();
    if (output_path.empty()) {
        std::cout << j.dump(2) << "\n";
        return;
    }

    std::ofstream file(output_path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + output_path);
    }
    file << j.dump(2);
    std::cout << "Wrote " << output_path << "\n";
}

std::string format_duration(std::chrono::steady_clock::duration d) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
    std::stringstream ss;
    if (ms >= 1000) {
        ss << std::fixed << std::setprecision(2) << (ms / 1000.0) << "s";
    } else {
        ss << ms << "ms";
    }
    return ss.str();
}

// ============== lore build-gazetteer ==============
int cmd_build_gazetteer(const Args& args) {
    AppConfig config = load_config(args);
    std::string corpus_path = args.get("corpus").str(config.corpus_path);
    std::string output_path = args.get("output").str(config.gazetteer_path);
    std::string stop_words_path = args.get("stop-words").str(config.stop_words_path);

    if (corpus_path.empty()) {
        throw std::runtime_error("No corpus given; use --corpus or corpus_path in the config");
    }

    auto start = std::chrono::steady_clock::now();
    auto morphology = create_morphology(config.morphology_url);
    if (config.morphology_url.empty()) {
        std::cerr << "Warning: no morphology_url configured; every title and link word "
                     "that is not a stop word is kept, nouns or not\n";
    }

    std::set<std::string> stop_words;
    if (!stop_words_path.empty()) {
        stop_words = load_stop_words(stop_words_path);
    }

    std::cout << "Loading corpus from: " << corpus_path << "\n";
    auto records = load_corpus(corpus_path);
    std::cout << "Loaded " << records.size() << " records, " << stop_words.size() << " stop words\n";

    GazetteerBuilder builder(*morphology, std::move(stop_words));
    Gazetteer gazetteer = builder.build(records);
    gazetteer.save_to_json(output_path);

    std::cout << "Saved " << gazetteer.size() << " entries to " << output_path
              << " (" << format_duration(std::chrono::steady_clock::now() - start) << ")\n";
    return 0;
}

// ============== lore extract ==============
int cmd_extract(const Args& args) {
    AppConfig config = load_config(args);
    std::string text = args.input_text();

    auto morphology = create_morphology(config.morphology_url);
    Gazetteer gazetteer = load_gazetteer(config, *morphology);
    EntityExtractor extractor(gazetteer, morphology.get(), matcher_options(config, args), config.verbose);

    ResolvedSpanSet spans = args.has("all")
        ? extractor.matcher().match(text)
        : extractor.extract(text);

    write_output(spans_to_json(spans), args);
    return 0;
}

// ============== lore normalize ==============
int cmd_normalize(const Args& args) {
    AppConfig config = load_config(args);
    std::string text = args.input_text();

    auto morphology = create_morphology(config.morphology_url);
    Gazetteer gazetteer = load_gazetteer(config, *morphology);
    EntityExtractor extractor(gazetteer, morphology.get(), matcher_options(config, args), config.verbose);

    std::cout << extractor.normalize_text(text) << "\n";
    return 0;
}

// ============== lore score ==============
int cmd_score(const Args& args) {
    AppConfig config = load_config(args);
    std::vector<std::string> titles = titles_from(args);

    auto store = make_graph_store(config);
    GraphRelevanceScorer scorer(*store, scorer_options(config, args));

    auto start = std::chrono::steady_clock::now();
    RelevanceResult result = scorer.score(titles);

    if (config.verbose) {
        std::cout << "Evaluated " << result.pairs_evaluated << " pairs in "
                  << format_duration(std::chrono::steady_clock::now() - start)
                  << " (" << result.failed_queries << " failed)\n";
    }

    write_output(result.to_json(), args);
    return 0;
}

// ============== lore path ==============
int cmd_path(const Args& args) {
    AppConfig config = load_config(args);
    std::string from = args.require("from");
    std::string to = args.require("to");
    int max_hops = args.get("max-hops").as_int(config.max_hops);

    auto store = make_graph_store(config);
    auto path = store->shortest_path(from, to, max_hops, config.path_constraints());
    if (!path) {
        std::cout << "No path between " << from << " and " << to
                  << " within " << max_hops << " hops\n";
        return 1;
    }

    std::cout << "Length " << path->length() << ":";
    for (const auto& part : path->interleaved()) {
        std::cout << " " << part;
    }
    std::cout << "\n";
    return 0;
}

// ============== lore node ==============
int cmd_node(const Args& args) {
    AppConfig config = load_config(args);
    std::string title = args.require("title");

    auto store = make_graph_store(config);
    auto info = store->get_node_info(title, !args.has("brief"));
    if (!info) {
        std::cerr << "Node not found: " << title << "\n";
        return 1;
    }

    if (args.has("json")) {
        std::cout << info->to_json().dump(2) << "\n";
    } else {
        std::cout << info->to_text() << "\n";
    }
    return 0;
}

// ============== lore decompose ==============
int cmd_decompose(const Args& args) {
    AppConfig config = load_config(args);
    std::string question = args.input_text();

    auto provider = make_provider(config);
    QueryDecomposer decomposer(*provider, config.verbose);
    write_output(decomposer.decompose(question).to_json(), args);
    return 0;
}

// ============== lore optimize ==============
int cmd_optimize(const Args& args) {
    AppConfig config = load_config(args);
    std::string query = args.require("query");
    std::vector<std::string> titles = titles_from(args);

    auto store = make_graph_store(config);
    GraphRelevanceScorer scorer(*store, scorer_options(config, args));
    RelevanceResult relevance = scorer.score(titles);
    OptimizerPayload payload = build_payload(titles, relevance, *store, config.verbose);

    std::cout << "Initial payload: " << payload.nodes.size() << " nodes\n";

    auto provider = make_provider(config);
    LLMReasoningEngine engine(*provider);

    OptimizerOptions options;
    options.max_iterations = args.get("max-iterations").as_int(config.optimizer_max_iterations);
    options.verbose = config.verbose;

    ContextOptimizer optimizer(engine, *store, options);
    auto start = std::chrono::steady_clock::now();
    OptimizerPayload optimized = optimizer.optimize(query, std::move(payload));

    std::cout << "Optimized payload: " << optimized.nodes.size() << " nodes after "
              << optimizer.engine_calls() << " engine calls ("
              << format_duration(std::chrono::steady_clock::now() - start) << ")\n";

    write_output(optimized.to_json(), args);
    return 0;
}

// ============== lore config ==============
int cmd_config(const Args& args) {
    AppConfig config = load_config_with_fallback(args.get("config").str());

    std::string error;
    bool valid = config.validate(error);

    std::string output_path = args.get("output").str();
    if (!output_path.empty()) {
        config.to_json_file(output_path);
        std::cout << "Wrote " << output_path << "\n";
    } else {
        std::cout << config.to_json().dump(2) << "\n";
    }

    if (!valid) {
        std::cerr << "Invalid configuration: " << error << "\n";
        return 1;
    }
    return 0;
}

// ============== Main ==============
int main(int argc, char** argv) {
    CLI cli("lore", "1.0.0");

    const ArgDef config_arg{"config", "c", "Path to JSON config file (optional)", ArgKind::Value};
    const ArgDef verbose_arg{"verbose", "v", "Print progress details", ArgKind::Flag};
    const ArgDef output_arg{"output", "o", "Write JSON here instead of stdout", ArgKind::Value};
    const ArgDef text_arg{"text", "t", "Input text", ArgKind::Value};
    const ArgDef input_arg{"input", "i", "Read input text from file ('-' for stdin)", ArgKind::Value};
    const ArgDef cutoff_arg{"cutoff", "", "Similarity cutoff 0-100 (default: from config)", ArgKind::Value};
    const ArgDef title_arg{"title", "n", "Candidate title; '|' separates several", ArgKind::List};
    const ArgDef hops_arg{"max-hops", "m", "Longest path counted (default: from config)", ArgKind::Value};

    // lore build-gazetteer
    cli.register_command({
        "build-gazetteer",
        "Build the entity gazetteer from a corpus of articles. Only nouns are kept when "
        "morphology_url is configured; without it every word except stop words is kept",
        {
            {"corpus", "i", "Corpus JSON file (default: corpus_path from config)", ArgKind::Value},
            {"output", "o", "Gazetteer JSON file (default: gazetteer_path from config)", ArgKind::Value},
            {"stop-words", "s", "Stop word list, one per line", ArgKind::Value},
            config_arg,
            verbose_arg
        },
        cmd_build_gazetteer
    });

    // lore extract
    cli.register_command({
        "extract",
        "Find entity mentions in text",
        {
            text_arg, input_arg, cutoff_arg,
            {"all", "a", "Print every candidate before overlap resolution", ArgKind::Flag},
            output_arg, config_arg, verbose_arg
        },
        cmd_extract
    });

    // lore normalize
    cli.register_command({
        "normalize",
        "Replace entity mentions with their canonical names",
        {text_arg, input_arg, cutoff_arg, config_arg, verbose_arg},
        cmd_normalize
    });

    // lore score
    cli.register_command({
        "score",
        "Rank titles by how closely the graph connects them",
        {title_arg, hops_arg, output_arg, config_arg, verbose_arg},
        cmd_score
    });

    // lore path
    cli.register_command({
        "path",
        "Print the shortest qualifying path between two titles",
        {
            {"from", "f", "Start title", ArgKind::Value, true},
            {"to", "t", "End title", ArgKind::Value, true},
            hops_arg, config_arg, verbose_arg
        },
        cmd_path
    });

    // lore node
    cli.register_command({
        "node",
        "Print what the graph knows about a title",
        {
            {"title", "n", "Node title", ArgKind::Value, true},
            {"brief", "b", "Omit relations", ArgKind::Flag},
            {"json", "j", "Print JSON instead of text", ArgKind::Flag},
            config_arg, verbose_arg
        },
        cmd_node
    });

    // lore decompose
    cli.register_command({
        "decompose",
        "Split a question into sub-questions and entities with the LLM",
        {text_arg, input_arg, output_arg, config_arg, verbose_arg},
        cmd_decompose
    });

    // lore optimize
    cli.register_command({
        "optimize",
        "Score titles, then let the LLM prune and expand the node set",
        {
            {"query", "q", "User question", ArgKind::Value, true},
            title_arg, hops_arg,
            {"max-iterations", "k", "Engine calls allowed (default: from config)", ArgKind::Value},
            output_arg, config_arg, verbose_arg
        },
        cmd_optimize
    });

    // lore config
    cli.register_command({
        "config",
        "Print the effective configuration (secrets redacted)",
        {
            {"output", "o", "Write the configuration to this file", ArgKind::Value},
            config_arg
        },
        cmd_config
    });

    return cli.run(argc, argv);
}
