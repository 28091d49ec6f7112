#pragma once

/**
 * @file correspondence.hpp
 * @brief Seed matching and the growing vertex correspondence
 */

#include "graphmat/common.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <unordered_map>
#include <vector>

namespace graphmat::match {

/**
 * @brief Externally supplied, trusted partial matching (A id, B id)
 */
struct SeedMatching
{
    std::vector<VertexPair> pairs;
};

/**
 * @brief Partial injective mapping from graph A to graph B
 *
 * Pairs are only ever added: there is no way to retract or rebind a
 * confirmed pair, and a pair that would break injectivity is refused.
 */
class Correspondence
{
public:
    struct Entry
    {
        VertexId b = 0;
        double score = 0.0;  ///< Star score at confirmation time
    };

    /**
     * @brief Record a pair
     * @return false when a or b is already matched (nothing changes)
     */
    [[nodiscard]] bool confirm(VertexId a, VertexId b, double score);

    [[nodiscard]] bool contains_a(VertexId a) const noexcept { return m_forward.contains(a); }
    [[nodiscard]] bool contains_b(VertexId b) const noexcept { return m_reverse.contains(b); }

    [[nodiscard]] std::optional<VertexId> partner_of_a(VertexId a) const;
    [[nodiscard]] std::optional<VertexId> partner_of_b(VertexId b) const;
    [[nodiscard]] std::optional<double> score_of(VertexId a) const;

    [[nodiscard]] std::size_t size() const noexcept { return m_forward.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_forward.empty(); }

    /// Pairs keyed by A id, ascending.
    [[nodiscard]] const std::map<VertexId, Entry>& pairs() const noexcept { return m_forward; }

private:
    std::map<VertexId, Entry> m_forward;
    std::unordered_map<VertexId, VertexId> m_reverse;
};

}  // namespace graphmat::match
