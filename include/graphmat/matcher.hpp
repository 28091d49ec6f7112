#pragma once

/**
 * @file matcher.hpp
 * @brief Seeded belief-propagation matching of two call graphs
 *
 * Error-tolerant graph matching in linear cost from an initial partial
 * matching: every confirmed pair becomes an anchor whose unmatched callees
 * and callers are resolved against each other, and every pair confirmed
 * there becomes an anchor in turn. Vertices not reachable from a seed stay
 * unmatched.
 */

#include "graphmat/call_graph.hpp"
#include "graphmat/candidate_heuristics.hpp"
#include "graphmat/common.hpp"
#include "graphmat/config.hpp"
#include "graphmat/correspondence.hpp"
#include "graphmat/star_comparator.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <queue>
#include <string_view>
#include <vector>

namespace graphmat::match {

/**
 * Matcher life cycle. Transitions only move forward:
 * Idle -> Seeded -> Propagating -> Converged -> Finalized.
 *
 * Naming convention: kPascalCase for enum constants (Google C++ Style Guide)
 */
enum class MatcherState {
    kIdle,         ///< Constructed, no seed yet
    kSeeded,       ///< Seed installed, nothing propagated
    kPropagating,  ///< Worklist being processed
    kConverged,    ///< Worklist empty
    kFinalized     ///< Result handed out
};

enum class StopReason {
    kConverged,      ///< Worklist ran empty
    kCancelled,      ///< Cancellation check fired between iterations
    kBudgetExceeded  ///< budget.max_iterations anchors processed
};

struct MatchStats
{
    std::uint64_t seed_pairs = 0;
    std::uint64_t anchors_processed = 0;
    std::uint64_t pairs_scored = 0;
    std::uint64_t pairs_pruned = 0;
    std::uint64_t pairs_confirmed = 0;  ///< Confirmed by propagation, seeds excluded
    std::uint64_t oversized_neighborhoods = 0;
};

struct MatchResult
{
    Correspondence correspondence;
    StopReason stop_reason = StopReason::kConverged;
    MatchStats stats;
};

/// Returns true to stop propagation before the next anchor.
using CancelCheck = std::function<bool()>;

[[nodiscard]] std::string_view to_string(MatcherState state) noexcept;
[[nodiscard]] std::string_view to_string(StopReason reason) noexcept;

/**
 * Check that a seed is injective in both directions (exact duplicate pairs
 * are tolerated) and that every id exists in its graph.
 *
 * @return Empty on success, InvalidSeed otherwise
 */
[[nodiscard]] graphmat::VoidResult validate_seed(const SeedMatching& seed,
                                                 const graph::CallGraph& graph_a,
                                                 const graph::CallGraph& graph_b);

class BeliefPropagationMatcher
{
public:
    /// Both graphs are borrowed and must outlive the matcher.
    BeliefPropagationMatcher(const graph::CallGraph& graph_a,
                             const graph::CallGraph& graph_b,
                             config::MatcherConfig config = {});

    BeliefPropagationMatcher(const BeliefPropagationMatcher&) = delete;
    BeliefPropagationMatcher& operator=(const BeliefPropagationMatcher&) = delete;
    BeliefPropagationMatcher(BeliefPropagationMatcher&&) = delete;
    BeliefPropagationMatcher& operator=(BeliefPropagationMatcher&&) = delete;
    ~BeliefPropagationMatcher() = default;

    /**
     * @brief Install the seed (Idle -> Seeded)
     *
     * Fails with InvalidSeed before any state changes. When either graph is
     * empty the matcher moves straight to Converged with nothing matched.
     */
    [[nodiscard]] graphmat::VoidResult seed(const SeedMatching& seed);

    /**
     * @brief Process one anchor from the worklist
     * @return Whether work remains, or InvalidState outside Seeded/Propagating/Converged
     */
    [[nodiscard]] graphmat::Result<bool> step();

    /**
     * @brief Step until the worklist is empty, the budget is spent or
     *        should_cancel returns true
     */
    [[nodiscard]] graphmat::VoidResult run(const CancelCheck& should_cancel = {});

    /**
     * @brief Freeze and hand out the result (-> Finalized)
     *
     * Allowed once converged, or after run() stopped early.
     */
    [[nodiscard]] graphmat::Result<MatchResult> finalize();

    [[nodiscard]] MatcherState state() const noexcept { return m_state; }
    [[nodiscard]] const Correspondence& correspondence() const noexcept { return m_correspondence; }
    [[nodiscard]] const MatchStats& stats() const noexcept { return m_stats; }
    [[nodiscard]] std::size_t pending() const noexcept;

private:
    struct WorkItem
    {
        VertexId a = 0;
        VertexId b = 0;
        double score = 0.0;
    };

    /// Heap order: highest score on top, then lowest (a, b).
    struct LowerPriority
    {
        [[nodiscard]] bool operator()(const WorkItem& lhs, const WorkItem& rhs) const noexcept;
    };

    void enqueue(const WorkItem& item);
    [[nodiscard]] std::optional<WorkItem> pop();
    void resolve_neighborhood(const graph::Vertex& vertex_a,
                              const graph::Vertex& vertex_b,
                              heuristics::Direction direction);

    const graph::CallGraph& m_graph_a;
    const graph::CallGraph& m_graph_b;
    config::MatcherConfig m_config;
    star::StarComparator m_comparator;
    heuristics::CandidateHeuristics m_heuristics;

    Correspondence m_correspondence;
    std::deque<WorkItem> m_fifo;
    std::priority_queue<WorkItem, std::vector<WorkItem>, LowerPriority> m_heap;

    MatcherState m_state = MatcherState::kIdle;
    std::optional<StopReason> m_stop_reason;
    MatchStats m_stats;
};

/**
 * Seed, propagate to convergence (or cancellation/budget) and finalize.
 */
[[nodiscard]] graphmat::Result<MatchResult> match(const graph::CallGraph& graph_a,
                                                  const graph::CallGraph& graph_b,
                                                  const SeedMatching& seed,
                                                  const config::MatcherConfig& config = {},
                                                  const CancelCheck& should_cancel = {});

}  // namespace graphmat::match
