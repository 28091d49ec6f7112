/**
 * @file candidate_heuristics.cpp
 * @brief Labelling, pruning and greedy resolution of neighbour candidates
 */

#include "graphmat/candidate_heuristics.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <ranges>
#include <unordered_set>
#include <utility>

namespace graphmat::heuristics {

namespace {

[[nodiscard]] std::vector<VertexId> ids_of(const std::vector<const NeighborLabel*>& labels)
{
    std::vector<VertexId> ids;
    ids.reserve(labels.size());
    for (const auto* entry : labels) {
        ids.push_back(entry->id);
    }
    return ids;
}

/**
 * Index range [first, last) of at most `width` entries of `open_b`, centred on
 * the entry whose relative position is nearest to `position`. `open_b` is in
 * anchor order, so relative positions ascend.
 */
[[nodiscard]] std::pair<std::size_t, std::size_t> window_around(
    const std::vector<const NeighborLabel*>& open_b,
    double position,
    std::size_t width)
{
    if (open_b.size() <= width) {
        return {0, open_b.size()};
    }
    const auto nearest = std::ranges::lower_bound(open_b, position, {}, [](const NeighborLabel* entry) {
        return entry->relative_position;
    });
    auto centre = static_cast<std::size_t>(std::distance(open_b.begin(), nearest));
    if (centre > 0
        && (centre == open_b.size()
            || position - open_b[centre - 1]->relative_position
                   <= open_b[centre]->relative_position - position)) {
        --centre;
    }
    const std::size_t first = std::min(centre > width / 2 ? centre - (width / 2) : 0,
                                       open_b.size() - width);
    return {first, first + width};
}

}  // namespace

bool ranks_before(const Candidate& lhs, const Candidate& rhs) noexcept
{
    if (lhs.similarity != rhs.similarity) {
        return lhs.similarity > rhs.similarity;
    }
    if (lhs.belief != rhs.belief) {
        return lhs.belief > rhs.belief;
    }
    if (lhs.a != rhs.a) {
        return lhs.a < rhs.a;
    }
    return lhs.b < rhs.b;
}

std::vector<Candidate> select_greedy(CandidateSet candidates, double threshold)
{
    std::erase_if(candidates, [threshold](const Candidate& c) { return c.similarity < threshold; });
    std::ranges::sort(candidates, ranks_before);

    std::vector<Candidate> selected;
    std::unordered_set<VertexId> taken_a;
    std::unordered_set<VertexId> taken_b;
    for (const auto& candidate : candidates) {
        if (taken_a.contains(candidate.a) || taken_b.contains(candidate.b)) {
            continue;
        }
        taken_a.insert(candidate.a);
        taken_b.insert(candidate.b);
        selected.push_back(candidate);
    }
    return selected;
}

CandidateHeuristics::CandidateHeuristics(const graph::CallGraph& graph_a,
                                         const graph::CallGraph& graph_b,
                                         const star::StarComparator& comparator,
                                         const config::MatcherConfig& config)
    : m_graph_a(graph_a)
    , m_graph_b(graph_b)
    , m_comparator(comparator)
    , m_config(config)
{}

std::span<const VertexId> CandidateHeuristics::neighbors(const graph::Vertex& anchor,
                                                         Direction direction) noexcept
{
    return direction == Direction::kCallees ? std::span<const VertexId>(anchor.callees())
                                            : std::span<const VertexId>(anchor.callers());
}

std::vector<NeighborLabel> CandidateHeuristics::label(const graph::CallGraph& graph,
                                                      std::span<const VertexId> neighbors)
{
    std::vector<NeighborLabel> labels;
    labels.reserve(neighbors.size());

    std::size_t largest = 0;
    for (auto [ordinal, id] : std::views::enumerate(neighbors)) {
        NeighborLabel entry{.id = id, .ordinal = static_cast<std::size_t>(ordinal)};
        if (const auto* vertex = graph.find(id)) {
            entry.opcode_count = vertex->opcodes().size();
            entry.recursive = vertex->is_recursive();
            entry.external = vertex->is_external();
        } else {
            entry.external = true;
        }
        largest = std::max(largest, entry.opcode_count);
        labels.push_back(entry);
    }

    const std::size_t last = neighbors.empty() ? 0 : neighbors.size() - 1;
    for (auto& entry : labels) {
        entry.relative_position =
            last == 0 ? 0.0 : static_cast<double>(entry.ordinal) / static_cast<double>(last);
        entry.relative_size = largest == 0 ? 0.0
                                           : static_cast<double>(entry.opcode_count)
                                                 / static_cast<double>(largest);
    }
    return labels;
}

bool CandidateHeuristics::plausible(const NeighborLabel& a, const NeighborLabel& b) const noexcept
{
    if (a.recursive != b.recursive || a.external != b.external) {
        return false;
    }
    if (std::abs(a.relative_position - b.relative_position) > m_config.max_position_skew) {
        return false;
    }
    return m_comparator.best_possible_score(a.opcode_count, b.opcode_count)
           >= m_config.acceptance_threshold;
}

double CandidateHeuristics::belief(const NeighborLabel& a, const NeighborLabel& b) noexcept
{
    const double position_gap = std::abs(a.relative_position - b.relative_position);
    const double size_gap = std::abs(a.relative_size - b.relative_size);
    return 1.0 - ((position_gap + size_gap) / 2.0);
}

Resolution CandidateHeuristics::resolve(std::span<const VertexId> neighbors_a,
                                        std::span<const VertexId> neighbors_b,
                                        const match::Correspondence& matched) const
{
    const auto labels_a = label(m_graph_a, neighbors_a);
    const auto labels_b = label(m_graph_b, neighbors_b);

    std::vector<const NeighborLabel*> open_a;
    std::vector<const NeighborLabel*> open_b;
    for (const auto& entry : labels_a) {
        if (!matched.contains_a(entry.id)) {
            open_a.push_back(&entry);
        }
    }
    for (const auto& entry : labels_b) {
        if (!matched.contains_b(entry.id)) {
            open_b.push_back(&entry);
        }
    }

    Resolution resolution;
    if (open_a.empty() || open_b.empty()) {
        resolution.residual_a = ids_of(open_a);
        resolution.residual_b = ids_of(open_b);
        return resolution;
    }
    // Hub neighbourhoods: each A neighbour only meets the B neighbours in its
    // positional window, keeping a step at O(|A| * max_candidate_set).
    resolution.oversized =
        open_a.size() > m_config.max_candidate_set || open_b.size() > m_config.max_candidate_set;

    CandidateSet candidates;
    const std::span<const NeighborLabel* const> all_b(open_b);
    for (const auto* label_a : open_a) {
        const auto* vertex_a = m_graph_a.find(label_a->id);
        const auto [first, last] =
            window_around(open_b, label_a->relative_position, m_config.max_candidate_set);
        for (const auto* label_b : all_b.subspan(first, last - first)) {
            const auto* vertex_b = m_graph_b.find(label_b->id);
            if (vertex_a == nullptr || vertex_b == nullptr || !plausible(*label_a, *label_b)) {
                ++resolution.pruned;
                continue;
            }
            ++resolution.scored;
            candidates.push_back(Candidate{.a = label_a->id,
                                           .b = label_b->id,
                                           .similarity = m_comparator.score(*vertex_a, *vertex_b),
                                           .belief = belief(*label_a, *label_b)});
        }
    }

    resolution.confirmed = select_greedy(std::move(candidates), m_config.acceptance_threshold);

    std::unordered_set<VertexId> taken_a;
    std::unordered_set<VertexId> taken_b;
    for (const auto& candidate : resolution.confirmed) {
        taken_a.insert(candidate.a);
        taken_b.insert(candidate.b);
    }
    for (const auto* entry : open_a) {
        if (!taken_a.contains(entry->id)) {
            resolution.residual_a.push_back(entry->id);
        }
    }
    for (const auto* entry : open_b) {
        if (!taken_b.contains(entry->id)) {
            resolution.residual_b.push_back(entry->id);
        }
    }
    return resolution;
}

}  // namespace graphmat::heuristics
