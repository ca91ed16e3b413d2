#pragma once

#include <string>
#include <cstddef>

namespace lore {
namespace utf8 {

/**
 * @brief Decode the codepoint starting at byte offset pos and advance pos past it
 *
 * Malformed sequences decode to U+FFFD and consume a single byte.
 */
char32_t decode_next(const std::string& text, size_t& pos);

/**
 * @brief Decode a UTF-8 string into codepoints
 */
std::u32string decode(const std::string& text);

/**
 * @brief Encode codepoints as UTF-8
 */
std::string encode(const std::u32string& text);

/**
 * @brief Append one codepoint to a UTF-8 string
 */
void append(std::string& out, char32_t cp);

/**
 * @brief Number of codepoints in a UTF-8 string
 */
size_t length(const std::string& text);

// Simple case mapping for ASCII, Latin-1, Greek and Cyrillic
char32_t to_lower(char32_t cp);
char32_t to_upper(char32_t cp);

std::string to_lower(const std::string& text);
std::string to_upper(const std::string& text);

bool is_upper(char32_t cp);
bool is_space(char32_t cp);

/**
 * @brief Letters, digits, underscore and combining marks
 */
bool is_word_char(char32_t cp);

/**
 * @brief True if the first codepoint of text is an uppercase letter
 */
bool starts_upper(const std::string& text);

/**
 * @brief Uppercase the first codepoint, leave the rest untouched
 */
std::string capitalize_first(const std::string& text);

/**
 * @brief Uppercase the first codepoint and lowercase the rest
 *
 * Used for gazetteer title words, which are stored as "Word".
 */
std::string capitalize_word(const std::string& text);

/**
 * @brief Strip ASCII whitespace from both ends
 */
std::string trim(const std::string& text);

} // namespace utf8
} // namespace lore
