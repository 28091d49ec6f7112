/**
 * @file test_matcher_config.cpp
 * @brief Matcher configuration parsing, validation and file loading
 */

#include "graphmat/config.hpp"

#include "graphmat/json_io.hpp"

#include <filesystem>
#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace graphmat::config::test {

namespace {

std::filesystem::path ensure_temp_dir(const std::string& name)
{
    auto temp_dir = std::filesystem::temp_directory_path() / name;
    std::error_code ec;
    std::filesystem::remove_all(temp_dir, ec);
    std::filesystem::create_directories(temp_dir, ec);
    return temp_dir;
}

}  // namespace

TEST(MatcherConfigTest, Defaults)
{
    MatcherConfig config;
    EXPECT_DOUBLE_EQ(config.opcode_weight, 0.75);
    EXPECT_DOUBLE_EQ(config.structural_weight, 0.25);
    EXPECT_DOUBLE_EQ(config.acceptance_threshold, 0.5);
    EXPECT_DOUBLE_EQ(config.max_position_skew, 0.75);
    EXPECT_EQ(config.max_candidate_set, 256U);
    EXPECT_EQ(config.worklist_order, WorklistOrder::kFifo);
    EXPECT_FALSE(config.budget.max_iterations);
    EXPECT_TRUE(validate(config));
}

TEST(MatcherConfigTest, FromJsonOverridesGivenKeys)
{
    nlohmann::json j = {
        {      "schema_version", "matcher_config.v1"},
        {"acceptance_threshold",                 0.4},
        {      "worklist_order",        "best_first"},
        {              "budget", {{"max_iterations", 50}}}
    };
    auto config = config_from_json(j);
    ASSERT_TRUE(config) << config.error().message;
    EXPECT_DOUBLE_EQ(config->acceptance_threshold, 0.4);
    EXPECT_EQ(config->worklist_order, WorklistOrder::kBestFirst);
    ASSERT_TRUE(config->budget.max_iterations);
    EXPECT_EQ(*config->budget.max_iterations, 50U);
    // Untouched keys keep their defaults
    EXPECT_DOUBLE_EQ(config->opcode_weight, 0.75);
    EXPECT_EQ(config->max_candidate_set, 256U);
}

TEST(MatcherConfigTest, IntegerWeightsAccepted)
{
    nlohmann::json j = {
        {    "opcode_weight", 3},
        {"structural_weight", 1}
    };
    auto config = config_from_json(j);
    ASSERT_TRUE(config);
    EXPECT_DOUBLE_EQ(config->opcode_weight, 3.0);
}

TEST(MatcherConfigTest, RejectsOutOfRange)
{
    MatcherConfig config;
    config.acceptance_threshold = -0.1;
    EXPECT_FALSE(validate(config));

    config = MatcherConfig{};
    config.max_position_skew = 1.5;
    EXPECT_FALSE(validate(config));

    config = MatcherConfig{};
    config.opcode_weight = 0.0;
    config.structural_weight = 0.0;
    auto result = validate(config);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, "InvalidConfig");

    config = MatcherConfig{};
    config.max_candidate_set = 0;
    EXPECT_FALSE(validate(config));
}

TEST(MatcherConfigTest, RejectsWrongTypes)
{
    EXPECT_FALSE(config_from_json(nlohmann::json::array()));
    EXPECT_FALSE(config_from_json(nlohmann::json{
        {"opcode_weight", "heavy"}
    }));
    EXPECT_FALSE(config_from_json(nlohmann::json{
        {"worklist_order", "lifo"}
    }));
    EXPECT_FALSE(config_from_json(nlohmann::json{
        {"max_candidate_set", -4}
    }));
}

TEST(MatcherConfigTest, WorklistOrderNames)
{
    EXPECT_EQ(to_string(WorklistOrder::kFifo), "fifo");
    EXPECT_EQ(to_string(WorklistOrder::kBestFirst), "best_first");
    EXPECT_EQ(parse_worklist_order("best_first"), WorklistOrder::kBestFirst);
    EXPECT_FALSE(parse_worklist_order("random"));
}

TEST(MatcherConfigTest, JsonRoundTripKeepsValues)
{
    MatcherConfig config;
    config.structural_weight = 0.5;
    config.worklist_order = WorklistOrder::kBestFirst;
    config.budget.max_iterations = 7;

    auto restored = config_from_json(to_json(config));
    ASSERT_TRUE(restored);
    EXPECT_DOUBLE_EQ(restored->structural_weight, 0.5);
    EXPECT_EQ(restored->worklist_order, WorklistOrder::kBestFirst);
    EXPECT_EQ(restored->budget.max_iterations, std::uint64_t{7});
}

TEST(MatcherConfigTest, LoadFromFile)
{
    auto dir = ensure_temp_dir("graphmat_config_test");
    auto path = (dir / "config.json").string();
    nlohmann::json j = {
        {   "schema_version", "matcher_config.v1"},
        {"max_position_skew",                 0.5}
    };
    ASSERT_TRUE(common::write_text_file(path, j.dump()));

    auto config = load_matcher_config(path, GRAPHMAT_SCHEMA_DIR);
    ASSERT_TRUE(config) << config.error().message;
    EXPECT_DOUBLE_EQ(config->max_position_skew, 0.5);
}

TEST(MatcherConfigTest, LoadRejectsSchemaViolation)
{
    auto dir = ensure_temp_dir("graphmat_config_invalid_test");
    auto path = (dir / "config.json").string();
    nlohmann::json j = {
        {"schema_version", "matcher_config.v1"},
        {   "turbo_mode",                true}
    };
    ASSERT_TRUE(common::write_text_file(path, j.dump()));

    auto config = load_matcher_config(path, GRAPHMAT_SCHEMA_DIR);
    ASSERT_FALSE(config);
    EXPECT_EQ(config.error().code, "SchemaValidationFailed");
}

TEST(MatcherConfigTest, LoadMissingFile)
{
    auto config = load_matcher_config("/nonexistent/graphmat/config.json", GRAPHMAT_SCHEMA_DIR);
    ASSERT_FALSE(config);
    EXPECT_EQ(config.error().code, "IOError");
}

}  // namespace graphmat::config::test
