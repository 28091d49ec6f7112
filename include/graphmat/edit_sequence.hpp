#pragma once

/**
 * @file edit_sequence.hpp
 * @brief Edit sequence between two call graphs and its serializations
 */

#include "graphmat/call_graph.hpp"
#include "graphmat/common.hpp"
#include "graphmat/correspondence.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace graphmat::edit {

/**
 * Naming convention: kPascalCase for enum constants (Google C++ Style Guide)
 */
enum class OperationKind {
    kMatch,    ///< a in A corresponds to b in B
    kInsertA,  ///< a exists only in A
    kInsertB   ///< b exists only in B
};

struct EditOperation
{
    OperationKind kind = OperationKind::kMatch;
    std::optional<VertexId> a;  ///< Set for kMatch and kInsertA
    std::optional<VertexId> b;  ///< Set for kMatch and kInsertB
    double score = 0.0;         ///< Star score of a match, 0 for inserts

    friend bool operator==(const EditOperation&, const EditOperation&) = default;
};

/**
 * @brief Vertex and edge consistency counts
 *
 * An A edge (u, v) is preserved when both endpoints are matched and
 * (m(u), m(v)) is an edge of B; any other A edge is removed, and every B edge
 * that is not the image of a preserved edge is added.
 */
struct EditSummary
{
    std::size_t matched = 0;
    std::size_t inserted_a = 0;
    std::size_t inserted_b = 0;
    std::size_t preserved_edges = 0;
    std::size_t removed_edges = 0;
    std::size_t added_edges = 0;

    friend bool operator==(const EditSummary&, const EditSummary&) = default;
};

/**
 * @brief Ordered operations: matches by ascending A id, then A-only vertices
 *        by ascending id, then B-only vertices by ascending id
 */
struct EditSequence
{
    std::vector<EditOperation> operations;
    EditSummary summary;
};

class EditSequenceBuilder
{
public:
    [[nodiscard]] static EditSequence build(const graph::CallGraph& graph_a,
                                            const graph::CallGraph& graph_b,
                                            const match::Correspondence& correspondence);
};

[[nodiscard]] std::string_view to_string(OperationKind kind) noexcept;

/**
 * CSV mapping table: "address_a,address_b,operation" header, then one row per
 * operation. Addresses are printed as 0x-prefixed upper-case hex with each
 * graph's base address added; the missing side of an insert is left empty.
 */
[[nodiscard]] std::string to_csv(const EditSequence& sequence,
                                 std::uint64_t base_address_a = 0,
                                 std::uint64_t base_address_b = 0);

/**
 * edit_sequence.v1 document. Scores are emitted as integer parts per million
 * so the document stays canonicalizable.
 */
[[nodiscard]] nlohmann::json to_json(const EditSequence& sequence);

/// Star score in parts per million, rounded to nearest.
[[nodiscard]] std::int64_t score_to_ppm(double score) noexcept;

}  // namespace graphmat::edit
