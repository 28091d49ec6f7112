#pragma once

/**
 * @file candidate_heuristics.hpp
 * @brief Local one-to-one resolution of competing neighbour pairs
 *
 * Around a confirmed anchor pair (a0, b0) the unmatched callees of a0 compete
 * for the unmatched callees of b0 (and likewise for callers). Each neighbour
 * is labelled with cheap features, implausible pairs are pruned, the rest are
 * star-scored and resolved greedily, best score first.
 */

#include "graphmat/call_graph.hpp"
#include "graphmat/config.hpp"
#include "graphmat/correspondence.hpp"
#include "graphmat/star_comparator.hpp"

#include <cstddef>
#include <span>
#include <vector>

namespace graphmat::heuristics {

/**
 * Which neighbourhood of the anchor is being resolved.
 *
 * Naming convention: kPascalCase for enum constants (Google C++ Style Guide)
 */
enum class Direction {
    kCallees,
    kCallers
};

/**
 * @brief Features of one neighbour, relative to its anchor
 */
struct NeighborLabel
{
    VertexId id = 0;
    std::size_t ordinal = 0;         ///< Index in the anchor's neighbour order
    double relative_position = 0.0;  ///< ordinal / (n - 1), 0 for a single neighbour
    double relative_size = 0.0;      ///< opcode count / largest opcode count among neighbours
    std::size_t opcode_count = 0;
    bool recursive = false;
    bool external = false;
};

/**
 * @brief A scored (a, b) pair of one propagation step
 */
struct Candidate
{
    VertexId a = 0;
    VertexId b = 0;
    double similarity = 0.0;  ///< Star score
    double belief = 0.0;      ///< Agreement of position and relative size, in [0, 1]
};

using CandidateSet = std::vector<Candidate>;

struct Resolution
{
    std::vector<Candidate> confirmed;   ///< In selection order
    std::vector<VertexId> residual_a;   ///< Unmatched neighbours of a0 left over
    std::vector<VertexId> residual_b;   ///< Unmatched neighbours of b0 left over
    std::size_t scored = 0;             ///< Pairs that went through star comparison
    std::size_t pruned = 0;             ///< Pairs rejected by labels alone
    bool oversized = false;             ///< A side exceeded max_candidate_set; pairs were windowed
};

/**
 * Total order used for greedy selection: similarity desc, belief desc,
 * then a asc, b asc. Independent of the order candidates were produced in.
 */
[[nodiscard]] bool ranks_before(const Candidate& lhs, const Candidate& rhs) noexcept;

/**
 * Greedy highest-score-first assignment with conflict removal. Candidates
 * below the threshold are never selected.
 */
[[nodiscard]] std::vector<Candidate> select_greedy(CandidateSet candidates, double threshold);

class CandidateHeuristics
{
public:
    CandidateHeuristics(const graph::CallGraph& graph_a,
                        const graph::CallGraph& graph_b,
                        const star::StarComparator& comparator,
                        const config::MatcherConfig& config);

    /**
     * @brief Resolve the neighbourhoods of an anchor pair
     *
     * @param neighbors_a Neighbours of a0 in anchor order (callees in call
     *        order, callers ascending); matched ones still count for labels
     * @param neighbors_b Neighbours of b0 in the same order convention
     * @param matched Current correspondence; read only
     */
    [[nodiscard]] Resolution resolve(std::span<const VertexId> neighbors_a,
                                     std::span<const VertexId> neighbors_b,
                                     const match::Correspondence& matched) const;

    /// Neighbours of the anchor vertex in the given direction.
    [[nodiscard]] static std::span<const VertexId> neighbors(const graph::Vertex& anchor,
                                                             Direction direction) noexcept;

    [[nodiscard]] static std::vector<NeighborLabel> label(const graph::CallGraph& graph,
                                                          std::span<const VertexId> neighbors);

    /// Cheap feature filter applied before star scoring.
    [[nodiscard]] bool plausible(const NeighborLabel& a, const NeighborLabel& b) const noexcept;

    [[nodiscard]] static double belief(const NeighborLabel& a, const NeighborLabel& b) noexcept;

private:
    const graph::CallGraph& m_graph_a;
    const graph::CallGraph& m_graph_b;
    const star::StarComparator& m_comparator;
    config::MatcherConfig m_config;
};

}  // namespace graphmat::heuristics
