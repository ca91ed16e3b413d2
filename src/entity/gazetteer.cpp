#include "entity/gazetteer.hpp"
#include "text/fuzzy.hpp"
#include "text/utf8.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace lore {

namespace {

// Maximal runs of word characters; no joiners, unlike tokenize()
std::vector<std::string> word_runs(const std::string& text) {
    std::vector<std::string> words;
    std::string current;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t start = pos;
        char32_t cp = utf8::decode_next(text, pos);
        if (utf8::is_word_char(cp)) {
            current.append(text, start, pos - start);
        } else if (!current.empty()) {
            words.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) {
        words.push_back(current);
    }
    return words;
}

std::vector<std::string> split_commas(const std::string& text) {
    std::vector<std::string> parts;
    size_t begin = 0;
    while (begin <= text.size()) {
        size_t comma = text.find(',', begin);
        if (comma == std::string::npos) comma = text.size();
        std::string part = utf8::trim(text.substr(begin, comma - begin));
        if (!part.empty()) parts.push_back(part);
        begin = comma + 1;
    }
    return parts;
}

} // anonymous namespace

// ==========================================
// Gazetteer Implementation
// ==========================================

Gazetteer::Gazetteer(const std::vector<std::string>& names) {
    for (const auto& name : names) {
        add(name);
    }
}

void Gazetteer::add(const std::string& name) {
    if (name.empty() || canonicals_.count(name) > 0) {
        return;
    }

    GazetteerEntry entry;
    entry.canonical = name;
    entry.key = utf8::to_lower(name);
    entry.key_chars = utf8::decode(entry.key);

    const size_t index = entries_.size();
    by_key_.emplace(entry.key, index);
    by_length_[entry.key_chars.size()].push_back(index);
    canonicals_.insert(name);
    entries_.push_back(std::move(entry));
}

const GazetteerEntry* Gazetteer::find(const std::string& name) const {
    auto it = by_key_.find(utf8::to_lower(name));
    return it != by_key_.end() ? &entries_[it->second] : nullptr;
}

std::vector<size_t> Gazetteer::candidates(size_t fragment_length, double cutoff) const {
    std::vector<size_t> result;

    for (const auto& [length, indices] : by_length_) {
        if (fuzzy::ratio_upper_bound(fragment_length, length) >= cutoff) {
            result.insert(result.end(), indices.begin(), indices.end());
        }
    }

    std::sort(result.begin(), result.end());
    return result;
}

json Gazetteer::to_json() const {
    json j;
    json names = json::array();
    for (const auto& entry : entries_) {
        names.push_back(entry.canonical);
    }
    j["entries"] = names;
    j["metadata"] = {{"num_entries", entries_.size()}};
    return j;
}

Gazetteer Gazetteer::from_json(const json& j) {
    if (j.is_array()) {
        return Gazetteer(j.get<std::vector<std::string>>());
    }
    return Gazetteer(j.at("entries").get<std::vector<std::string>>());
}

void Gazetteer::save_to_json(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + filename);
    }
    file << to_json().dump(2);
}

Gazetteer Gazetteer::load_from_json(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open gazetteer file: " + filename);
    }

    json j;
    file >> j;
    return from_json(j);
}

Gazetteer Gazetteer::build_or_load(
    const std::string& cache_path,
    const std::function<Gazetteer()>& builder,
    bool verbose
) {
    std::ifstream cached(cache_path);
    if (cached.is_open()) {
        cached.close();
        Gazetteer gazetteer = load_from_json(cache_path);
        if (verbose) {
            std::cout << "Loaded gazetteer from " << cache_path
                      << " (" << gazetteer.size() << " entries)\n";
        }
        return gazetteer;
    }

    Gazetteer gazetteer = builder();
    try {
        gazetteer.save_to_json(cache_path);
        if (verbose) {
            std::cout << "Saved gazetteer to " << cache_path
                      << " (" << gazetteer.size() << " entries)\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Could not write gazetteer cache: " << e.what() << "\n";
    }
    return gazetteer;
}

// ==========================================
// Corpus loading
// ==========================================

CorpusRecord CorpusRecord::from_json(const json& j) {
    CorpusRecord record;
    if (j.contains("original_title") && j["original_title"].is_string()) {
        record.original_title = j["original_title"].get<std::string>();
    }
    if (j.contains("final_title") && j["final_title"].is_string()) {
        record.final_title = j["final_title"].get<std::string>();
    }
    if (j.contains("entities") && j["entities"].is_string()) {
        record.entities = j["entities"].get<std::string>();
    }
    return record;
}

std::vector<CorpusRecord> load_corpus(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open corpus file: " + filename);
    }

    json j;
    file >> j;

    if (!j.is_array()) {
        throw std::runtime_error("Corpus file must contain a JSON array: " + filename);
    }

    std::vector<CorpusRecord> records;
    records.reserve(j.size());
    for (const auto& item : j) {
        records.push_back(CorpusRecord::from_json(item));
    }
    return records;
}

std::set<std::string> load_stop_words(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open stop words file: " + filename);
    }

    std::set<std::string> words;
    std::string line;
    while (std::getline(file, line)) {
        line = utf8::trim(line);
        if (line.empty() || line[0] == '#') continue;
        words.insert(utf8::to_lower(line));
    }
    return words;
}

// ==========================================
// GazetteerBuilder Implementation
// ==========================================

bool GazetteerBuilder::accept(const std::string& lowered, const MorphParse& parse) const {
    if (utf8::length(lowered) <= 1) return false;
    if (stop_words_.count(lowered) > 0) return false;
    return parse.pos.empty() || parse.is_noun();
}

std::vector<std::string> GazetteerBuilder::collect_names(
    const std::vector<CorpusRecord>& records
) const {
    std::vector<std::string> names;
    std::set<std::string> seen;

    auto keep = [&](const std::string& name) {
        if (seen.insert(name).second) {
            names.push_back(name);
        }
    };

    for (const auto& record : records) {
        for (const auto* title : {&record.original_title, &record.final_title}) {
            std::string clean = utf8::trim(*title);
            if (clean.empty()) continue;

            for (const auto& word : word_runs(clean)) {
                std::string lowered = utf8::to_lower(word);
                if (utf8::length(lowered) <= 1 || stop_words_.count(lowered) > 0) continue;
                if (accept(lowered, morphology_.parse(word))) {
                    keep(utf8::capitalize_word(word));
                }
            }
        }

        for (const auto& link : split_commas(record.entities)) {
            for (const auto& word : word_runs(link)) {
                std::string lowered = utf8::to_lower(word);
                if (utf8::length(lowered) <= 1 || stop_words_.count(lowered) > 0) continue;
                MorphParse parse = morphology_.parse(lowered);
                if (accept(lowered, parse)) {
                    keep(parse.normal_form.empty() ? lowered : parse.normal_form);
                }
            }
        }
    }

    return names;
}

Gazetteer GazetteerBuilder::build(const std::vector<CorpusRecord>& records) const {
    return Gazetteer(collect_names(records));
}

} // namespace lore
