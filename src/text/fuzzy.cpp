#include "text/fuzzy.hpp"
#include "text/utf8.hpp"
#include <algorithm>
#include <vector>

namespace lore {
namespace fuzzy {

size_t lcs_length(const std::u32string& a, const std::u32string& b) {
    if (a.empty() || b.empty()) return 0;

    const std::u32string& outer = a.size() >= b.size() ? a : b;
    const std::u32string& inner = a.size() >= b.size() ? b : a;

    std::vector<size_t> prev(inner.size() + 1, 0);
    std::vector<size_t> curr(inner.size() + 1, 0);

    for (size_t i = 1; i <= outer.size(); ++i) {
        for (size_t j = 1; j <= inner.size(); ++j) {
            if (outer[i - 1] == inner[j - 1]) {
                curr[j] = prev[j - 1] + 1;
            } else {
                curr[j] = std::max(prev[j], curr[j - 1]);
            }
        }
        std::swap(prev, curr);
    }

    return prev[inner.size()];
}

double ratio(const std::u32string& a, const std::u32string& b) {
    const size_t total = a.size() + b.size();
    if (total == 0) return 100.0;
    return 200.0 * static_cast<double>(lcs_length(a, b)) / static_cast<double>(total);
}

double ratio(const std::string& a, const std::string& b) {
    return ratio(utf8::decode(a), utf8::decode(b));
}

double ratio_upper_bound(size_t len_a, size_t len_b) {
    const size_t total = len_a + len_b;
    if (total == 0) return 100.0;
    return 200.0 * static_cast<double>(std::min(len_a, len_b)) / static_cast<double>(total);
}

} // namespace fuzzy
} // namespace lore
