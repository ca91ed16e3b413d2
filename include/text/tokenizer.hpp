#pragma once

#include <string>
#include <vector>
#include <cstddef>

namespace lore {

/**
 * @brief A word or punctuation token with byte offsets into the source text
 *
 * [start, end) is half-open; text == source.substr(start, end - start).
 */
struct Token {
    std::string text;
    size_t start = 0;
    size_t end = 0;
};

/**
 * @brief Split UTF-8 text into word and punctuation tokens
 *
 * Words are maximal runs of word characters. A single '-' or '\'' between two
 * word characters stays inside the word ("Жиль-де", "don't"). A run of the same
 * punctuation character ("??", "...") forms one token. Whitespace is dropped.
 */
std::vector<Token> tokenize(const std::string& text);

/**
 * @brief Only the word tokens of tokenize(text), as strings
 */
std::vector<std::string> split_words(const std::string& text);

} // namespace lore
