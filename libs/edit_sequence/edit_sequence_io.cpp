/**
 * @file edit_sequence_io.cpp
 * @brief CSV and JSON renderings of an edit sequence
 */

#include "graphmat/edit_sequence.hpp"

#include "graphmat/version.hpp"

#include <cmath>
#include <format>
#include <iterator>

namespace graphmat::edit {

namespace {

[[nodiscard]] std::string hex_address(const std::optional<VertexId>& id, std::uint64_t base)
{
    if (!id) {
        return {};
    }
    return std::format("0x{:X}", base + *id);
}

}  // namespace

std::string_view to_string(OperationKind kind) noexcept
{
    switch (kind) {
        case OperationKind::kMatch:
            return "match";
        case OperationKind::kInsertA:
            return "insert_a";
        case OperationKind::kInsertB:
            return "insert_b";
    }
    return "unknown";
}

std::int64_t score_to_ppm(double score) noexcept
{
    return std::llround(score * 1'000'000.0);
}

std::string to_csv(const EditSequence& sequence,
                   std::uint64_t base_address_a,
                   std::uint64_t base_address_b)
{
    std::string out = "address_a,address_b,operation\n";
    for (const auto& op : sequence.operations) {
        std::format_to(std::back_inserter(out),
                       "{},{},{}\n",
                       hex_address(op.a, base_address_a),
                       hex_address(op.b, base_address_b),
                       to_string(op.kind));
    }
    return out;
}

nlohmann::json to_json(const EditSequence& sequence)
{
    nlohmann::json operations = nlohmann::json::array();
    for (const auto& op : sequence.operations) {
        nlohmann::json item = {
            {"op", std::string(to_string(op.kind))}
        };
        if (op.a) {
            item["a"] = *op.a;
        }
        if (op.b) {
            item["b"] = *op.b;
        }
        if (op.kind == OperationKind::kMatch) {
            item["score_ppm"] = score_to_ppm(op.score);
        }
        operations.push_back(std::move(item));
    }

    const auto& summary = sequence.summary;
    return nlohmann::json{
        {"schema_version", kEditSequenceSchemaVersion},
        {    "operations",                  operations},
        {       "summary",
         {{"matched", summary.matched},
         {"inserted_a", summary.inserted_a},
         {"inserted_b", summary.inserted_b},
         {"preserved_edges", summary.preserved_edges},
         {"removed_edges", summary.removed_edges},
         {"added_edges", summary.added_edges}}      }
    };
}

}  // namespace graphmat::edit
