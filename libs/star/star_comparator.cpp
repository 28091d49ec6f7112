/**
 * @file star_comparator.cpp
 * @brief Star comparison of two vertices
 */

#include "graphmat/star_comparator.hpp"

#include "levenshtein.hpp"

#include <algorithm>

namespace graphmat::star {

namespace {

[[nodiscard]] double similarity_from_distance(std::size_t distance, std::size_t longest) noexcept
{
    const auto denominator = static_cast<double>(std::max<std::size_t>(longest, 1));
    return 1.0 - (static_cast<double>(distance) / denominator);
}

}  // namespace

StarComparator::StarComparator(StarWeights weights) noexcept
    : m_weights(weights)
{}

StarScore StarComparator::compare(const graph::Vertex& a, const graph::Vertex& b) const
{
    const auto& ops_a = a.opcodes();
    const auto& ops_b = b.opcodes();

    StarScore result;
    result.opcode_distance =
        levenshtein<std::string>(std::span<const std::string>(ops_a),
                                 std::span<const std::string>(ops_b));
    result.opcode_similarity =
        similarity_from_distance(result.opcode_distance, std::max(ops_a.size(), ops_b.size()));
    result.structural_similarity =
        (degree_similarity(a.callees().size(), b.callees().size())
         + degree_similarity(a.callers().size(), b.callers().size()))
        / 2.0;
    result.score = combine(result.opcode_similarity, result.structural_similarity);
    return result;
}

double StarComparator::best_possible_score(std::size_t len_a, std::size_t len_b) const noexcept
{
    return combine(opcode_upper_bound(len_a, len_b), 1.0);
}

double StarComparator::opcode_similarity(std::span<const std::string> a,
                                         std::span<const std::string> b)
{
    return similarity_from_distance(levenshtein<std::string>(a, b), std::max(a.size(), b.size()));
}

double StarComparator::degree_similarity(std::size_t a, std::size_t b) noexcept
{
    const std::size_t diff = a > b ? a - b : b - a;
    return similarity_from_distance(diff, std::max(a, b));
}

double StarComparator::opcode_upper_bound(std::size_t len_a, std::size_t len_b) noexcept
{
    // Levenshtein distance is at least the length difference.
    const std::size_t diff = len_a > len_b ? len_a - len_b : len_b - len_a;
    return similarity_from_distance(diff, std::max(len_a, len_b));
}

double StarComparator::combine(double opcode, double structural) const noexcept
{
    const double total = m_weights.opcode + m_weights.structural;
    if (total <= 0.0) {
        return opcode;
    }
    return ((m_weights.opcode * opcode) + (m_weights.structural * structural)) / total;
}

}  // namespace graphmat::star
