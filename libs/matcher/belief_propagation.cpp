/**
 * @file belief_propagation.cpp
 * @brief Worklist-driven propagation of a seed matching across two call graphs
 */

#include "graphmat/matcher.hpp"

#include <format>
#include <unordered_map>
#include <utility>

namespace graphmat::match {

namespace {

[[nodiscard]] graphmat::Error invalid_seed(std::string message)
{
    return Error::make("InvalidSeed", std::move(message));
}

[[nodiscard]] graphmat::Error invalid_state(std::string_view operation, MatcherState state)
{
    return Error::make("InvalidState",
                       std::format("{} is not allowed in state {}", operation, to_string(state)));
}

/// Injectivity in both directions; exact repeats of a pair are fine.
[[nodiscard]] graphmat::VoidResult check_injective(const SeedMatching& seed)
{
    std::unordered_map<VertexId, VertexId> forward;
    std::unordered_map<VertexId, VertexId> reverse;
    for (const auto& [a, b] : seed.pairs) {
        auto [fwd, fwd_inserted] = forward.emplace(a, b);
        if (!fwd_inserted && fwd->second != b) {
            return std::unexpected(invalid_seed(std::format(
                "Seed maps A vertex {:#x} to both {:#x} and {:#x}", a, fwd->second, b)));
        }
        auto [rev, rev_inserted] = reverse.emplace(b, a);
        if (!rev_inserted && rev->second != a) {
            return std::unexpected(invalid_seed(std::format(
                "Seed maps A vertices {:#x} and {:#x} to the same B vertex {:#x}", rev->second, a, b)));
        }
    }
    return {};
}

/// An empty graph has no members to check against; its side of each pair is
/// not inspected.
[[nodiscard]] graphmat::VoidResult check_members(const SeedMatching& seed,
                                                 const graph::CallGraph& graph_a,
                                                 const graph::CallGraph& graph_b)
{
    for (const auto& [a, b] : seed.pairs) {
        if (!graph_a.empty() && !graph_a.contains(a)) {
            return std::unexpected(
                invalid_seed(std::format("Seed vertex {:#x} is not part of graph A", a)));
        }
        if (!graph_b.empty() && !graph_b.contains(b)) {
            return std::unexpected(
                invalid_seed(std::format("Seed vertex {:#x} is not part of graph B", b)));
        }
    }
    return {};
}

}  // namespace

std::string_view to_string(MatcherState state) noexcept
{
    switch (state) {
        case MatcherState::kIdle:
            return "Idle";
        case MatcherState::kSeeded:
            return "Seeded";
        case MatcherState::kPropagating:
            return "Propagating";
        case MatcherState::kConverged:
            return "Converged";
        case MatcherState::kFinalized:
            return "Finalized";
    }
    return "Unknown";
}

std::string_view to_string(StopReason reason) noexcept
{
    switch (reason) {
        case StopReason::kConverged:
            return "Converged";
        case StopReason::kCancelled:
            return "Cancelled";
        case StopReason::kBudgetExceeded:
            return "BudgetExceeded";
    }
    return "Unknown";
}

graphmat::VoidResult validate_seed(const SeedMatching& seed,
                                   const graph::CallGraph& graph_a,
                                   const graph::CallGraph& graph_b)
{
    if (auto result = check_injective(seed); !result) {
        return result;
    }
    return check_members(seed, graph_a, graph_b);
}

bool BeliefPropagationMatcher::LowerPriority::operator()(const WorkItem& lhs,
                                                         const WorkItem& rhs) const noexcept
{
    if (lhs.score != rhs.score) {
        return lhs.score < rhs.score;
    }
    if (lhs.a != rhs.a) {
        return lhs.a > rhs.a;
    }
    return lhs.b > rhs.b;
}

BeliefPropagationMatcher::BeliefPropagationMatcher(const graph::CallGraph& graph_a,
                                                   const graph::CallGraph& graph_b,
                                                   config::MatcherConfig config)
    : m_graph_a(graph_a)
    , m_graph_b(graph_b)
    , m_config(std::move(config))
    , m_comparator(star::StarWeights::from_config(m_config))
    , m_heuristics(m_graph_a, m_graph_b, m_comparator, m_config)
{}

std::size_t BeliefPropagationMatcher::pending() const noexcept
{
    return m_config.worklist_order == config::WorklistOrder::kBestFirst ? m_heap.size()
                                                                         : m_fifo.size();
}

void BeliefPropagationMatcher::enqueue(const WorkItem& item)
{
    if (m_config.worklist_order == config::WorklistOrder::kBestFirst) {
        m_heap.push(item);
    } else {
        m_fifo.push_back(item);
    }
}

std::optional<BeliefPropagationMatcher::WorkItem> BeliefPropagationMatcher::pop()
{
    if (m_config.worklist_order == config::WorklistOrder::kBestFirst) {
        if (m_heap.empty()) {
            return std::nullopt;
        }
        WorkItem item = m_heap.top();
        m_heap.pop();
        return item;
    }
    if (m_fifo.empty()) {
        return std::nullopt;
    }
    WorkItem item = m_fifo.front();
    m_fifo.pop_front();
    return item;
}

graphmat::VoidResult BeliefPropagationMatcher::seed(const SeedMatching& seed)
{
    if (m_state != MatcherState::kIdle) {
        return std::unexpected(invalid_state("seed", m_state));
    }
    if (auto result = check_injective(seed); !result) {
        return result;
    }
    if (auto result = check_members(seed, m_graph_a, m_graph_b); !result) {
        return result;
    }
    if (m_graph_a.empty() || m_graph_b.empty()) {
        m_state = MatcherState::kConverged;
        return {};
    }

    for (const auto& [a, b] : seed.pairs) {
        const double score = m_comparator.score(*m_graph_a.find(a), *m_graph_b.find(b));
        if (m_correspondence.confirm(a, b, score)) {
            ++m_stats.seed_pairs;
            enqueue(WorkItem{.a = a, .b = b, .score = score});
        }
    }
    m_state = MatcherState::kSeeded;
    return {};
}

void BeliefPropagationMatcher::resolve_neighborhood(const graph::Vertex& vertex_a,
                                                    const graph::Vertex& vertex_b,
                                                    heuristics::Direction direction)
{
    auto resolution = m_heuristics.resolve(heuristics::CandidateHeuristics::neighbors(vertex_a, direction),
                                           heuristics::CandidateHeuristics::neighbors(vertex_b, direction),
                                           m_correspondence);
    m_stats.pairs_scored += resolution.scored;
    m_stats.pairs_pruned += resolution.pruned;
    if (resolution.oversized) {
        ++m_stats.oversized_neighborhoods;
    }
    for (const auto& candidate : resolution.confirmed) {
        if (m_correspondence.confirm(candidate.a, candidate.b, candidate.similarity)) {
            ++m_stats.pairs_confirmed;
            enqueue(WorkItem{.a = candidate.a, .b = candidate.b, .score = candidate.similarity});
        }
    }
}

graphmat::Result<bool> BeliefPropagationMatcher::step()
{
    switch (m_state) {
        case MatcherState::kConverged:
            return false;
        case MatcherState::kSeeded:
        case MatcherState::kPropagating:
            break;
        case MatcherState::kIdle:
        case MatcherState::kFinalized:
            return std::unexpected(invalid_state("step", m_state));
    }

    auto item = pop();
    if (!item) {
        m_state = MatcherState::kConverged;
        return false;
    }
    m_state = MatcherState::kPropagating;
    ++m_stats.anchors_processed;

    const auto* vertex_a = m_graph_a.find(item->a);
    const auto* vertex_b = m_graph_b.find(item->b);
    if (vertex_a != nullptr && vertex_b != nullptr) {
        resolve_neighborhood(*vertex_a, *vertex_b, heuristics::Direction::kCallees);
        resolve_neighborhood(*vertex_a, *vertex_b, heuristics::Direction::kCallers);
    }

    if (pending() == 0) {
        m_state = MatcherState::kConverged;
        return false;
    }
    return true;
}

graphmat::VoidResult BeliefPropagationMatcher::run(const CancelCheck& should_cancel)
{
    if (m_state == MatcherState::kIdle || m_state == MatcherState::kFinalized) {
        return std::unexpected(invalid_state("run", m_state));
    }

    const auto& max_iterations = m_config.budget.max_iterations;
    while (m_state != MatcherState::kConverged) {
        if (max_iterations && m_stats.anchors_processed >= *max_iterations) {
            m_stop_reason = StopReason::kBudgetExceeded;
            return {};
        }
        if (should_cancel && should_cancel()) {
            m_stop_reason = StopReason::kCancelled;
            return {};
        }
        auto more = step();
        if (!more) {
            return std::unexpected(more.error());
        }
    }
    m_stop_reason = StopReason::kConverged;
    return {};
}

graphmat::Result<MatchResult> BeliefPropagationMatcher::finalize()
{
    const bool stopped = m_state == MatcherState::kConverged || m_stop_reason.has_value();
    if (m_state == MatcherState::kIdle || m_state == MatcherState::kFinalized || !stopped) {
        return std::unexpected(invalid_state("finalize", m_state));
    }

    MatchResult result{.correspondence = std::move(m_correspondence),
                       .stop_reason = m_stop_reason.value_or(StopReason::kConverged),
                       .stats = m_stats};
    m_correspondence = Correspondence{};
    m_state = MatcherState::kFinalized;
    return result;
}

graphmat::Result<MatchResult> match(const graph::CallGraph& graph_a,
                                    const graph::CallGraph& graph_b,
                                    const SeedMatching& seed,
                                    const config::MatcherConfig& config,
                                    const CancelCheck& should_cancel)
{
    if (auto valid = config::validate(config); !valid) {
        return std::unexpected(valid.error());
    }

    BeliefPropagationMatcher matcher(graph_a, graph_b, config);
    if (auto seeded = matcher.seed(seed); !seeded) {
        return std::unexpected(seeded.error());
    }
    if (auto ran = matcher.run(should_cancel); !ran) {
        return std::unexpected(ran.error());
    }
    return matcher.finalize();
}

}  // namespace graphmat::match
