#pragma once

/**
 * @file levenshtein.hpp
 * @brief Levenshtein edit distance over arbitrary token sequences
 */

#include <algorithm>
#include <cstddef>
#include <numeric>
#include <span>
#include <vector>

namespace graphmat::star {

/**
 * Edit distance with unit insert, delete and substitute costs.
 *
 * Two-row dynamic programming: O(|s| * |t|) time, O(min(|s|, |t|)) memory.
 */
template <typename T>
[[nodiscard]] std::size_t levenshtein(std::span<const T> s, std::span<const T> t)
{
    if (s.size() < t.size()) {
        std::swap(s, t);
    }
    if (t.empty()) {
        return s.size();
    }

    const std::size_t n = t.size();
    std::vector<std::size_t> prev(n + 1);
    std::vector<std::size_t> curr(n + 1);
    std::iota(prev.begin(), prev.end(), std::size_t{0});

    for (std::size_t i = 0; i < s.size(); ++i) {
        curr[0] = i + 1;
        for (std::size_t j = 0; j < n; ++j) {
            const std::size_t deletion = prev[j + 1] + 1;
            const std::size_t insertion = curr[j] + 1;
            const std::size_t substitution = prev[j] + (s[i] == t[j] ? 0 : 1);
            curr[j + 1] = std::min({deletion, insertion, substitution});
        }
        std::swap(prev, curr);
    }
    return prev[n];
}

}  // namespace graphmat::star
