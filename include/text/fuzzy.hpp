#pragma once

#include <string>
#include <cstddef>

namespace lore {
namespace fuzzy {

/**
 * @brief Length of the longest common subsequence of two codepoint strings
 */
size_t lcs_length(const std::u32string& a, const std::u32string& b);

/**
 * @brief Normalized Indel similarity on a 0-100 scale
 *
 * ratio = 100 * (1 - indel(a, b) / (|a| + |b|)) = 200 * LCS / (|a| + |b|).
 * Symmetric; two empty strings score 100.
 */
double ratio(const std::u32string& a, const std::u32string& b);

/**
 * @brief ratio() over UTF-8 strings, compared by codepoint
 */
double ratio(const std::string& a, const std::string& b);

/**
 * @brief Best ratio any two strings of these lengths can reach
 *
 * Used to skip gazetteer entries that cannot pass a cutoff.
 */
double ratio_upper_bound(size_t len_a, size_t len_b);

} // namespace fuzzy
} // namespace lore
