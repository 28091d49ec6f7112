/**
 * @file test_edit_sequence.cpp
 * @brief Edit sequence construction and CSV/JSON rendering tests
 */

#include "graphmat/canonical_json.hpp"
#include "graphmat/edit_sequence.hpp"
#include "graphmat/matcher.hpp"
#include "graphmat/version.hpp"

#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace graphmat::edit::test {

namespace {

graph::CallGraph build(graph::CallGraphBuilder builder)
{
    auto graph = std::move(builder).build();
    EXPECT_TRUE(graph) << (graph ? "" : graph.error().message);
    return graph ? std::move(*graph) : graph::CallGraph{};
}

/// A: 1 -> 2, 1 -> 3      B: 10 -> 20, 10 -> 40, plus 30
class EditSequenceTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        graph::CallGraphBuilder a;
        a.add_function(1, {"call", "call", "ret"})
            .add_function(2, {"ret"})
            .add_function(3, {"nop", "ret"})
            .add_call(1, 2)
            .add_call(1, 3)
            .set_base_address(0x400000);
        m_graph_a = build(std::move(a));

        graph::CallGraphBuilder b;
        b.add_function(10, {"call", "call", "ret"})
            .add_function(20, {"ret"})
            .add_function(30, {"nop", "ret"})
            .add_function(40, {"int3"})
            .add_call(10, 20)
            .add_call(10, 40)
            .set_base_address(0x500000);
        m_graph_b = build(std::move(b));

        ASSERT_TRUE(m_correspondence.confirm(1, 10, 1.0));
        ASSERT_TRUE(m_correspondence.confirm(2, 20, 0.5));
        ASSERT_TRUE(m_correspondence.confirm(3, 30, 0.75));
    }

    graph::CallGraph m_graph_a;
    graph::CallGraph m_graph_b;
    match::Correspondence m_correspondence;
};

}  // namespace

TEST(EditSequenceBuilderTest, EmptySecondGraphInsertsEverything)
{
    graph::CallGraphBuilder a;
    a.add_function(0x30, {"ret"}).add_function(0x10, {"ret"}).add_function(0x20, {"ret"});
    auto graph_a = build(std::move(a));
    graph::CallGraph graph_b;
    match::Correspondence none;

    auto sequence = EditSequenceBuilder::build(graph_a, graph_b, none);
    ASSERT_EQ(sequence.operations.size(), 3U);
    std::vector<VertexId> ids;
    for (const auto& op : sequence.operations) {
        EXPECT_EQ(op.kind, OperationKind::kInsertA);
        ASSERT_TRUE(op.a);
        EXPECT_FALSE(op.b);
        ids.push_back(*op.a);
    }
    EXPECT_EQ(ids, (std::vector<VertexId>{0x10, 0x20, 0x30}));
    EXPECT_EQ(sequence.summary.inserted_a, 3U);
    EXPECT_EQ(sequence.summary.matched, 0U);
}

TEST(EditSequenceBuilderTest, MatchAgainstEmptyGraphInsertsEverything)
{
    graph::CallGraphBuilder a;
    a.add_function(0x10, {"call", "ret"})
        .add_function(0x20, {"ret"})
        .add_function(0x30, {"ret"})
        .add_call(0x10, 0x20)
        .set_entry(0x10);
    auto graph_a = build(std::move(a));
    graph::CallGraph graph_b;

    auto result = match::match(graph_a, graph_b, match::SeedMatching{.pairs = {{0x10, 0x10}}});
    ASSERT_TRUE(result) << result.error().message;
    EXPECT_EQ(result->stop_reason, match::StopReason::kConverged);
    EXPECT_TRUE(result->correspondence.empty());

    auto sequence = EditSequenceBuilder::build(graph_a, graph_b, result->correspondence);
    ASSERT_EQ(sequence.operations.size(), 3U);
    for (const auto& op : sequence.operations) {
        EXPECT_EQ(op.kind, OperationKind::kInsertA);
    }
    EXPECT_EQ(sequence.summary.inserted_a, 3U);
    EXPECT_EQ(sequence.summary.removed_edges, 1U);
}

TEST(EditSequenceBuilderTest, BothEmpty)
{
    graph::CallGraph empty;
    match::Correspondence none;
    auto sequence = EditSequenceBuilder::build(empty, empty, none);
    EXPECT_TRUE(sequence.operations.empty());
    EXPECT_EQ(sequence.summary, EditSummary{});
}

TEST_F(EditSequenceTest, OperationOrder)
{
    auto sequence = EditSequenceBuilder::build(m_graph_a, m_graph_b, m_correspondence);
    std::vector<EditOperation> expected = {
        {.kind = OperationKind::kMatch,   .a = 1,            .b = 10,           .score = 1.0 },
        {.kind = OperationKind::kMatch,   .a = 2,            .b = 20,           .score = 0.5 },
        {.kind = OperationKind::kMatch,   .a = 3,            .b = 30,           .score = 0.75},
        {.kind = OperationKind::kInsertB, .a = std::nullopt, .b = 40,           .score = 0.0 },
    };
    EXPECT_EQ(sequence.operations, expected);
}

TEST_F(EditSequenceTest, EdgeConsistencySummary)
{
    auto sequence = EditSequenceBuilder::build(m_graph_a, m_graph_b, m_correspondence);
    const auto& summary = sequence.summary;
    EXPECT_EQ(summary.matched, 3U);
    EXPECT_EQ(summary.inserted_a, 0U);
    EXPECT_EQ(summary.inserted_b, 1U);
    // 1->2 maps onto 10->20; 1->3 has no image 10->30
    EXPECT_EQ(summary.preserved_edges, 1U);
    EXPECT_EQ(summary.removed_edges, 1U);
    // 10->40
    EXPECT_EQ(summary.added_edges, 1U);
}

TEST_F(EditSequenceTest, CsvWithBaseAddresses)
{
    auto sequence = EditSequenceBuilder::build(m_graph_a, m_graph_b, m_correspondence);
    auto csv = to_csv(sequence, m_graph_a.base_address(), m_graph_b.base_address());
    EXPECT_EQ(csv,
              "address_a,address_b,operation\n"
              "0x400001,0x50000A,match\n"
              "0x400002,0x500014,match\n"
              "0x400003,0x50001E,match\n"
              ",0x500028,insert_b\n");
}

TEST_F(EditSequenceTest, CsvWithoutBase)
{
    match::Correspondence none;
    auto sequence = EditSequenceBuilder::build(m_graph_a, m_graph_b, none);
    auto csv = to_csv(sequence);
    EXPECT_NE(csv.find("0x1,,insert_a\n"), std::string::npos);
    EXPECT_NE(csv.find(",0x28,insert_b\n"), std::string::npos);
}

TEST_F(EditSequenceTest, JsonDocumentIsCanonical)
{
    auto sequence = EditSequenceBuilder::build(m_graph_a, m_graph_b, m_correspondence);
    auto document = to_json(sequence);

    EXPECT_EQ(document.at("schema_version"), kEditSequenceSchemaVersion);
    const auto& operations = document.at("operations");
    ASSERT_EQ(operations.size(), 4U);
    EXPECT_EQ(operations[1].at("op"), "match");
    EXPECT_EQ(operations[1].at("score_ppm"), 500'000);
    EXPECT_EQ(operations[3].at("op"), "insert_b");
    EXPECT_FALSE(operations[3].contains("a"));
    EXPECT_FALSE(operations[3].contains("score_ppm"));
    EXPECT_EQ(document.at("summary").at("preserved_edges"), 1);

    auto canonical = canonical::canonicalize(document);
    ASSERT_TRUE(canonical) << canonical.error().message;
    EXPECT_EQ(canonical->find(' '), std::string::npos);
}

TEST(EditSequenceFormatTest, ScoreToPpm)
{
    EXPECT_EQ(score_to_ppm(1.0), 1'000'000);
    EXPECT_EQ(score_to_ppm(0.0), 0);
    EXPECT_EQ(score_to_ppm(2.0 / 3.0), 666'667);
}

TEST(EditSequenceFormatTest, OperationNames)
{
    EXPECT_EQ(to_string(OperationKind::kMatch), "match");
    EXPECT_EQ(to_string(OperationKind::kInsertA), "insert_a");
    EXPECT_EQ(to_string(OperationKind::kInsertB), "insert_b");
}

}  // namespace graphmat::edit::test
