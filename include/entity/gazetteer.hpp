#ifndef LORE_GAZETTEER_HPP
#define LORE_GAZETTEER_HPP

#include "entity/morphology.hpp"
#include <string>
#include <vector>
#include <map>
#include <set>
#include <unordered_map>
#include <functional>
#include <nlohmann/json.hpp>

namespace lore {

/**
 * @brief A canonical entity name and its lookup key
 */
struct GazetteerEntry {
    std::string canonical;          // Stored (preferred) spelling
    std::string key;                // Lowercased canonical form
    std::u32string key_chars;       // key decoded to codepoints, for scoring
};

/**
 * @brief Read-only dictionary of canonical entity names
 *
 * Entries keep insertion order. Besides the key lookup, entries are bucketed
 * by codepoint length so the fuzzy matcher only scores entries that can
 * still reach its cutoff.
 *
 * A Gazetteer is built once and never modified afterwards, so a single
 * instance can be shared by any number of concurrent extractions.
 */
class Gazetteer {
public:
    Gazetteer() = default;

    /**
     * @brief Build from canonical names
     *
     * Empty names and exact duplicates are skipped. Names differing only in
     * case are kept as separate entries sharing the same key.
     */
    explicit Gazetteer(const std::vector<std::string>& names);

    const std::vector<GazetteerEntry>& entries() const { return entries_; }

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    /**
     * @brief First entry whose lowercase key equals the lowercased name
     */
    const GazetteerEntry* find(const std::string& name) const;

    bool contains(const std::string& name) const { return find(name) != nullptr; }

    /**
     * @brief Indices of entries a fragment of this length may match
     * @param fragment_length Fragment length in codepoints
     * @param cutoff Similarity cutoff on a 0-100 scale
     * @return Entry indices in ascending (insertion) order
     *
     * An entry of length L is kept iff 200*min(l, L)/(l + L) >= cutoff, the
     * best similarity two strings of those lengths can have.
     */
    std::vector<size_t> candidates(size_t fragment_length, double cutoff) const;

    // ==========================================
    // Import/Export
    // ==========================================

    nlohmann::json to_json() const;
    static Gazetteer from_json(const nlohmann::json& j);

    void save_to_json(const std::string& filename) const;
    static Gazetteer load_from_json(const std::string& filename);

    /**
     * @brief Load the cached gazetteer, or build it and write the cache
     * @param cache_path JSON cache file
     * @param builder Called only when the cache cannot be read
     */
    static Gazetteer build_or_load(
        const std::string& cache_path,
        const std::function<Gazetteer()>& builder,
        bool verbose = false
    );

private:
    std::vector<GazetteerEntry> entries_;
    std::set<std::string> canonicals_;
    std::unordered_map<std::string, size_t> by_key_;         // key -> first entry index
    std::map<size_t, std::vector<size_t>> by_length_;        // codepoint length -> entry indices

    void add(const std::string& name);
};

// ============================================================================
// Gazetteer construction from a corpus
// ============================================================================

/**
 * @brief One article of the source corpus
 */
struct CorpusRecord {
    std::string original_title;
    std::string final_title;
    std::string entities;           // Comma-separated linked entity names

    static CorpusRecord from_json(const nlohmann::json& j);
};

/**
 * @brief Load a JSON array of corpus records
 */
std::vector<CorpusRecord> load_corpus(const std::string& filename);

/**
 * @brief Load stop words, one per line; blank lines and '#' comments ignored
 */
std::set<std::string> load_stop_words(const std::string& filename);

/**
 * @brief Builds a gazetteer from article titles and entity links
 *
 * Title words are kept capitalized ("Хорус"); words of entity links are kept
 * in their normal form ("хорус"). In both cases a word must be longer than one
 * character, not a stop word, and not rejected as a non-noun by the analyzer.
 * Words the analyzer leaves untagged are accepted.
 */
class GazetteerBuilder {
public:
    GazetteerBuilder(const Morphology& morphology, std::set<std::string> stop_words)
        : morphology_(morphology), stop_words_(std::move(stop_words)) {}

    Gazetteer build(const std::vector<CorpusRecord>& records) const;

    /**
     * @brief Names the builder extracts, in first-seen order
     */
    std::vector<std::string> collect_names(const std::vector<CorpusRecord>& records) const;

private:
    const Morphology& morphology_;
    std::set<std::string> stop_words_;

    bool accept(const std::string& lowered, const MorphParse& parse) const;
};

} // namespace lore

#endif // LORE_GAZETTEER_HPP
