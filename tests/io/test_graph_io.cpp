/**
 * @file test_graph_io.cpp
 * @brief Call graph and seed document loading
 */

#include "graphmat/graph_io.hpp"

#include "graphmat/json_io.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace graphmat::io::test {

namespace {

std::filesystem::path ensure_temp_dir(const std::string& name)
{
    auto temp_dir = std::filesystem::temp_directory_path() / name;
    std::error_code ec;
    std::filesystem::remove_all(temp_dir, ec);
    std::filesystem::create_directories(temp_dir, ec);
    return temp_dir;
}

nlohmann::json make_call_graph_json()
{
    return nlohmann::json{
        {"schema_version",                                                   "call_graph.v1"},
        {  "base_address",                                                          0x401000},
        {         "entry",                                                              0x10},
        {     "functions",
         nlohmann::json::array(
         {{{"address", 0x10}, {"opcodes", {"push", "call", "call", "ret"}}, {"calls", {0x30, 0x20, 0x30}}},
         {{"address", 0x20}, {"opcodes", {"ret"}}},
         {{"address", 0x30}}})                                                              }
    };
}

}  // namespace

TEST(GraphIoTest, CallGraphFromJson)
{
    auto graph = call_graph_from_json(make_call_graph_json());
    ASSERT_TRUE(graph) << graph.error().message;

    EXPECT_EQ(graph->size(), 3U);
    EXPECT_EQ(graph->base_address(), 0x401000U);
    EXPECT_EQ(graph->entry(), VertexId{0x10});
    const auto* main_fn = graph->find(0x10);
    ASSERT_NE(main_fn, nullptr);
    EXPECT_EQ(main_fn->opcodes().size(), 4U);
    EXPECT_EQ(main_fn->call_sites(), (std::vector<VertexId>{0x30, 0x20, 0x30}));
    EXPECT_EQ(main_fn->callees(), (std::vector<VertexId>{0x30, 0x20}));
    EXPECT_TRUE(graph->find(0x30)->is_external());
}

TEST(GraphIoTest, DanglingCallRejected)
{
    auto j = make_call_graph_json();
    j["functions"][1]["calls"] = {0x99};
    auto graph = call_graph_from_json(j);
    ASSERT_FALSE(graph);
    EXPECT_EQ(graph.error().code, "InvalidGraph");
}

TEST(GraphIoTest, DuplicateFunctionRejected)
{
    auto j = make_call_graph_json();
    j["functions"].push_back({
        {"address", 0x20}
    });
    auto graph = call_graph_from_json(j);
    ASSERT_FALSE(graph);
    EXPECT_EQ(graph.error().code, "InvalidGraph");
}

TEST(GraphIoTest, MalformedAddressRejected)
{
    auto j = make_call_graph_json();
    j["functions"][2]["address"] = "0x30";
    auto graph = call_graph_from_json(j);
    ASSERT_FALSE(graph);
    EXPECT_NE(graph.error().message.find("functions[2]"), std::string::npos);
}

TEST(GraphIoTest, ToJsonRebuildsSameGraph)
{
    auto graph = call_graph_from_json(make_call_graph_json());
    ASSERT_TRUE(graph);
    auto rebuilt = call_graph_from_json(to_json(*graph));
    ASSERT_TRUE(rebuilt) << rebuilt.error().message;

    EXPECT_EQ(rebuilt->size(), graph->size());
    EXPECT_EQ(rebuilt->edge_count(), graph->edge_count());
    EXPECT_EQ(rebuilt->entry(), graph->entry());
    EXPECT_EQ(rebuilt->find(0x10)->call_sites(), graph->find(0x10)->call_sites());
}

TEST(GraphIoTest, LoadCallGraphFile)
{
    auto dir = ensure_temp_dir("graphmat_graph_io_test");
    auto path = (dir / "first.json").string();
    ASSERT_TRUE(common::write_text_file(path, make_call_graph_json().dump(2)));

    auto graph = load_call_graph(path, GRAPHMAT_SCHEMA_DIR);
    ASSERT_TRUE(graph) << graph.error().message;
    EXPECT_EQ(graph->size(), 3U);
}

TEST(GraphIoTest, LoadRejectsWrongDocumentKind)
{
    auto dir = ensure_temp_dir("graphmat_graph_io_kind_test");
    auto path = (dir / "seed.json").string();
    nlohmann::json seed = {
        {"schema_version",           "seed.v1"},
        {         "pairs", nlohmann::json::array()}
    };
    ASSERT_TRUE(common::write_text_file(path, seed.dump()));

    auto graph = load_call_graph(path, GRAPHMAT_SCHEMA_DIR);
    ASSERT_FALSE(graph);
    EXPECT_EQ(graph.error().code, "SchemaValidationFailed");
}

TEST(GraphIoTest, LoadRejectsBrokenJson)
{
    auto dir = ensure_temp_dir("graphmat_graph_io_parse_test");
    auto path = dir / "broken.json";
    {
        std::ofstream out(path);
        out << R"({"schema_version": "call_graph.v1", "functions": [)";
    }
    auto graph = load_call_graph(path.string(), GRAPHMAT_SCHEMA_DIR);
    ASSERT_FALSE(graph);
    EXPECT_EQ(graph.error().code, "ParseError");
}

TEST(GraphIoTest, LoadGraphWithDanglingCall)
{
    auto dir = ensure_temp_dir("graphmat_graph_io_dangling_test");
    auto path = (dir / "dangling.json").string();
    auto j = make_call_graph_json();
    j["functions"][2]["calls"] = {0x40};
    ASSERT_TRUE(common::write_text_file(path, j.dump()));

    // Schema-valid but structurally broken
    auto graph = load_call_graph(path, GRAPHMAT_SCHEMA_DIR);
    ASSERT_FALSE(graph);
    EXPECT_EQ(graph.error().code, "InvalidGraph");
    EXPECT_NE(graph.error().message.find(path), std::string::npos);
}

TEST(GraphIoTest, SeedFromJsonKeepsOrder)
{
    nlohmann::json j = {
        {"schema_version",                                                      "seed.v1"},
        {         "pairs", {{{"a", 0x30}, {"b", 0x130}}, {{"a", 0x10}, {"b", 0x110}}}}
    };
    auto seed = seed_from_json(j);
    ASSERT_TRUE(seed);
    ASSERT_EQ(seed->pairs.size(), 2U);
    EXPECT_EQ(seed->pairs[0], (VertexPair{0x30, 0x130}));
    EXPECT_EQ(seed->pairs[1], (VertexPair{0x10, 0x110}));
}

TEST(GraphIoTest, SeedPairNeedsAddresses)
{
    nlohmann::json j = {
        {"pairs", {{{"a", 0x30}}}}
    };
    auto seed = seed_from_json(j);
    ASSERT_FALSE(seed);
    EXPECT_EQ(seed.error().code, "InvalidSeed");
}

TEST(GraphIoTest, LoadSeedFile)
{
    auto dir = ensure_temp_dir("graphmat_seed_io_test");
    auto path = (dir / "seed.json").string();
    nlohmann::json j = {
        {"schema_version",                                  "seed.v1"},
        {         "pairs", {{{"a", 0x10}, {"b", 0x110}}}}
    };
    ASSERT_TRUE(common::write_text_file(path, j.dump()));

    auto seed = load_seed(path, GRAPHMAT_SCHEMA_DIR);
    ASSERT_TRUE(seed) << seed.error().message;
    ASSERT_EQ(seed->pairs.size(), 1U);
    EXPECT_EQ(seed->pairs[0].second, 0x110U);
}

TEST(GraphIoTest, EntrySeed)
{
    auto with_entry = call_graph_from_json(make_call_graph_json());
    ASSERT_TRUE(with_entry);

    auto seed = entry_seed(*with_entry, *with_entry);
    ASSERT_TRUE(seed);
    ASSERT_EQ(seed->pairs.size(), 1U);
    EXPECT_EQ(seed->pairs[0], (VertexPair{0x10, 0x10}));

    auto j = make_call_graph_json();
    j.erase("entry");
    auto without_entry = call_graph_from_json(j);
    ASSERT_TRUE(without_entry);
    auto missing = entry_seed(*with_entry, *without_entry);
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, "InvalidSeed");
}

}  // namespace graphmat::io::test
