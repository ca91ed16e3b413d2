#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>

namespace lore {

/**
 * @brief Morphological analysis of a single word
 *
 * Grammeme fields are empty when the analyzer has no opinion.
 */
struct MorphParse {
    std::string word;
    std::string normal_form;                ///< Dictionary (lemma) form
    std::string pos;                        ///< Part of speech, e.g. "NOUN"
    std::string number;                     ///< e.g. "sing", "plur"
    std::string grammatical_case;           ///< e.g. "nomn", "gent"
    std::string gender;                     ///< e.g. "masc", "femn"

    bool is_noun() const { return pos == "NOUN"; }

    /**
     * @brief The number/case/gender grammemes that are set
     */
    std::vector<std::string> agreement_features() const;
};

// ============================================================================
// Morphology Interface
// ============================================================================

/**
 * @brief External morphological analyzer
 *
 * Implementations must be safe to call from several threads.
 */
class Morphology {
public:
    virtual ~Morphology() = default;

    /**
     * @brief Most probable parse of a word
     */
    virtual MorphParse parse(const std::string& word) const = 0;

    /**
     * @brief Re-inflect a word to carry the given grammemes
     * @return The inflected form, or nullopt if the analyzer cannot produce it
     */
    virtual std::optional<std::string> inflect(
        const std::string& word,
        const std::vector<std::string>& grammemes
    ) const = 0;
};

/**
 * @brief Analyzer used when no morphology service is configured
 *
 * Normal form is the lowercased word, no grammemes, no inflection.
 */
class PassthroughMorphology : public Morphology {
public:
    MorphParse parse(const std::string& word) const override;
    std::optional<std::string> inflect(
        const std::string& word,
        const std::vector<std::string>& grammemes
    ) const override;
};

/**
 * @brief Morphology service reached over HTTP
 *
 * POST {base_url}/parse   {"word": "..."}
 *   -> {"normal_form": "...", "pos": "NOUN", "number": "sing", "case": "gent", "gender": "masc"}
 * POST {base_url}/inflect {"word": "...", "grammemes": ["plur", "datv"]}
 *   -> {"word": "..."} or {"word": null}
 */
class HttpMorphology : public Morphology {
public:
    explicit HttpMorphology(const std::string& base_url, int timeout_seconds = 10);

    MorphParse parse(const std::string& word) const override;
    std::optional<std::string> inflect(
        const std::string& word,
        const std::vector<std::string>& grammemes
    ) const override;

private:
    std::string base_url_;
    int timeout_seconds_;
};

/**
 * @brief Create an HTTP analyzer for url, or a passthrough one if url is empty
 */
std::unique_ptr<Morphology> create_morphology(const std::string& url, int timeout_seconds = 10);

// ============================================================================
// Inflection Adapter
// ============================================================================

/**
 * @brief Re-inflects canonical entity names to agree with the text they replace
 */
class InflectionAdapter {
public:
    explicit InflectionAdapter(const Morphology& morphology, bool verbose = false)
        : morphology_(morphology), verbose_(verbose) {}

    /**
     * @brief Inflect canonical to the number, case and gender of source_word
     *
     * Falls back to the unmodified canonical form when the analyzer cannot
     * inflect or fails. The result starts with an uppercase letter if either
     * source_word or canonical does.
     */
    std::string inflect_to_match(const std::string& source_word, const std::string& canonical) const;

private:
    const Morphology& morphology_;
    bool verbose_;
};

} // namespace lore
