#include "entity/morphology.hpp"
#include "net/http_client.hpp"
#include "text/utf8.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace lore {

namespace {

std::string string_field(const json& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return "";
}

std::string strip_trailing_slash(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

} // anonymous namespace

std::vector<std::string> MorphParse::agreement_features() const {
    std::vector<std::string> features;
    if (!number.empty()) features.push_back(number);
    if (!grammatical_case.empty()) features.push_back(grammatical_case);
    if (!gender.empty()) features.push_back(gender);
    return features;
}

// ============================================================================
// PassthroughMorphology
// ============================================================================

MorphParse PassthroughMorphology::parse(const std::string& word) const {
    MorphParse result;
    result.word = word;
    result.normal_form = utf8::to_lower(word);
    return result;
}

std::optional<std::string> PassthroughMorphology::inflect(
    const std::string& /*word*/,
    const std::vector<std::string>& /*grammemes*/
) const {
    return std::nullopt;
}

// ============================================================================
// HttpMorphology
// ============================================================================

HttpMorphology::HttpMorphology(const std::string& base_url, int timeout_seconds)
    : base_url_(strip_trailing_slash(base_url)), timeout_seconds_(timeout_seconds) {
    if (base_url_.empty()) {
        throw std::invalid_argument("Morphology service URL is empty");
    }
}

MorphParse HttpMorphology::parse(const std::string& word) const {
    json request = {{"word", word}};
    std::string body = http_post(
        base_url_ + "/parse",
        request.dump(),
        {"Content-Type: application/json"},
        timeout_seconds_
    );

    json j = json::parse(body);

    MorphParse result;
    result.word = word;
    result.normal_form = string_field(j, "normal_form");
    if (result.normal_form.empty()) {
        result.normal_form = utf8::to_lower(word);
    }
    result.pos = string_field(j, "pos");
    result.number = string_field(j, "number");
    result.grammatical_case = string_field(j, "case");
    result.gender = string_field(j, "gender");
    return result;
}

std::optional<std::string> HttpMorphology::inflect(
    const std::string& word,
    const std::vector<std::string>& grammemes
) const {
    json request = {{"word", word}, {"grammemes", grammemes}};
    std::string body = http_post(
        base_url_ + "/inflect",
        request.dump(),
        {"Content-Type: application/json"},
        timeout_seconds_
    );

    json j = json::parse(body);
    if (j.contains("word") && j["word"].is_string()) {
        return j["word"].get<std::string>();
    }
    return std::nullopt;
}

std::unique_ptr<Morphology> create_morphology(const std::string& url, int timeout_seconds) {
    if (url.empty()) {
        return std::make_unique<PassthroughMorphology>();
    }
    return std::make_unique<HttpMorphology>(url, timeout_seconds);
}

// ============================================================================
// InflectionAdapter
// ============================================================================

std::string InflectionAdapter::inflect_to_match(
    const std::string& source_word,
    const std::string& canonical
) const {
    if (canonical.empty()) return canonical;

    std::string result = canonical;
    try {
        MorphParse source = morphology_.parse(source_word);
        auto inflected = morphology_.inflect(canonical, source.agreement_features());
        if (inflected && !inflected->empty()) {
            result = *inflected;
        }
    } catch (const std::exception& e) {
        if (verbose_) {
            std::cerr << "Inflection failed for '" << canonical << "': " << e.what()
                      << ". Using canonical form.\n";
        }
    }

    if (utf8::starts_upper(canonical) || utf8::starts_upper(source_word)) {
        result = utf8::capitalize_first(result);
    }
    return result;
}

} // namespace lore
