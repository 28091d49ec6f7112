/**
 * @file edit_sequence.cpp
 * @brief Building an edit sequence from a finalized correspondence
 */

#include "graphmat/edit_sequence.hpp"

namespace graphmat::edit {

namespace {

void count_edges(const graph::CallGraph& graph_a,
                 const graph::CallGraph& graph_b,
                 const match::Correspondence& correspondence,
                 EditSummary& summary)
{
    for (const auto& vertex : graph_a.vertices()) {
        const auto caller_b = correspondence.partner_of_a(vertex.id());
        for (VertexId callee : vertex.callees()) {
            const auto callee_b = correspondence.partner_of_a(callee);
            if (caller_b && callee_b && graph_b.has_edge(*caller_b, *callee_b)) {
                ++summary.preserved_edges;
            } else {
                ++summary.removed_edges;
            }
        }
    }
    // The correspondence is injective, so preserved A edges have distinct images.
    summary.added_edges = graph_b.edge_count() - summary.preserved_edges;
}

}  // namespace

EditSequence EditSequenceBuilder::build(const graph::CallGraph& graph_a,
                                        const graph::CallGraph& graph_b,
                                        const match::Correspondence& correspondence)
{
    EditSequence sequence;
    sequence.operations.reserve(graph_a.size() + graph_b.size());

    for (const auto& [a, entry] : correspondence.pairs()) {
        sequence.operations.push_back(EditOperation{
            .kind = OperationKind::kMatch, .a = a, .b = entry.b, .score = entry.score});
    }
    sequence.summary.matched = correspondence.size();

    for (const auto& vertex : graph_a.vertices()) {
        if (!correspondence.contains_a(vertex.id())) {
            sequence.operations.push_back(
                EditOperation{.kind = OperationKind::kInsertA, .a = vertex.id(), .b = std::nullopt});
            ++sequence.summary.inserted_a;
        }
    }
    for (const auto& vertex : graph_b.vertices()) {
        if (!correspondence.contains_b(vertex.id())) {
            sequence.operations.push_back(
                EditOperation{.kind = OperationKind::kInsertB, .a = std::nullopt, .b = vertex.id()});
            ++sequence.summary.inserted_b;
        }
    }

    count_edges(graph_a, graph_b, correspondence, sequence.summary);
    return sequence;
}

}  // namespace graphmat::edit
