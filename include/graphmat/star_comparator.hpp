#pragma once

/**
 * @file star_comparator.hpp
 * @brief Similarity of two vertices from opcode edit distance and degree
 */

#include "graphmat/call_graph.hpp"
#include "graphmat/config.hpp"

#include <cstddef>
#include <span>
#include <string>

namespace graphmat::star {

struct StarWeights
{
    double opcode = 0.75;
    double structural = 0.25;

    [[nodiscard]] static StarWeights from_config(const config::MatcherConfig& config) noexcept
    {
        return StarWeights{.opcode = config.opcode_weight, .structural = config.structural_weight};
    }
};

/**
 * @brief Breakdown of one star comparison
 */
struct StarScore
{
    std::size_t opcode_distance = 0;     ///< Levenshtein distance of the opcode sequences
    double opcode_similarity = 1.0;      ///< 1 - distance / max(len_a, len_b, 1)
    double structural_similarity = 1.0;  ///< Mean of in- and out-degree similarity
    double score = 1.0;                  ///< Weighted combination, in [0, 1]
};

/**
 * @brief Compares a vertex of graph A with a vertex of graph B
 *
 * Pure and total: any two vertices, including ones without code, compare.
 */
class StarComparator
{
public:
    explicit StarComparator(StarWeights weights = {}) noexcept;

    [[nodiscard]] StarScore compare(const graph::Vertex& a, const graph::Vertex& b) const;

    [[nodiscard]] double score(const graph::Vertex& a, const graph::Vertex& b) const
    {
        return compare(a, b).score;
    }

    /**
     * Highest score two vertices with these opcode counts can reach, assuming
     * a perfect structural term. Used to prune before running the DP.
     */
    [[nodiscard]] double best_possible_score(std::size_t len_a, std::size_t len_b) const noexcept;

    [[nodiscard]] const StarWeights& weights() const noexcept { return m_weights; }

    [[nodiscard]] static double opcode_similarity(std::span<const std::string> a,
                                                  std::span<const std::string> b);

    [[nodiscard]] static double degree_similarity(std::size_t a, std::size_t b) noexcept;

    /// Upper bound of opcode_similarity from the lengths alone.
    [[nodiscard]] static double opcode_upper_bound(std::size_t len_a, std::size_t len_b) noexcept;

private:
    [[nodiscard]] double combine(double opcode, double structural) const noexcept;

    StarWeights m_weights;
};

}  // namespace graphmat::star
