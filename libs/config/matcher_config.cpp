/**
 * @file matcher_config.cpp
 * @brief Matcher configuration loading and validation
 */

#include "graphmat/config.hpp"

#include "graphmat/json_io.hpp"
#include "graphmat/version.hpp"

#include <format>

namespace graphmat::config {

namespace {

[[nodiscard]] graphmat::Result<double> read_number(const nlohmann::json& j,
                                                   std::string_view key,
                                                   double fallback)
{
    const std::string name(key);
    if (!j.contains(name)) {
        return fallback;
    }
    const auto& value = j.at(name);
    if (!value.is_number()) {
        return std::unexpected(
            Error::make("InvalidConfig", std::format("'{}' must be a number", key)));
    }
    return value.get<double>();
}

[[nodiscard]] graphmat::VoidResult check_unit_interval(double value, std::string_view key)
{
    if (value < 0.0 || value > 1.0) {
        return std::unexpected(Error::make(
            "InvalidConfig", std::format("'{}' must lie in [0, 1], got {}", key, value)));
    }
    return {};
}

}  // namespace

std::string_view to_string(WorklistOrder order) noexcept
{
    switch (order) {
        case WorklistOrder::kFifo:
            return "fifo";
        case WorklistOrder::kBestFirst:
            return "best_first";
    }
    return "fifo";
}

std::optional<WorklistOrder> parse_worklist_order(std::string_view text) noexcept
{
    if (text == "fifo") {
        return WorklistOrder::kFifo;
    }
    if (text == "best_first") {
        return WorklistOrder::kBestFirst;
    }
    return std::nullopt;
}

graphmat::VoidResult validate(const MatcherConfig& config)
{
    if (config.opcode_weight < 0.0 || config.structural_weight < 0.0) {
        return std::unexpected(Error::make("InvalidConfig", "Weights must be non-negative"));
    }
    if (config.opcode_weight + config.structural_weight <= 0.0) {
        return std::unexpected(Error::make("InvalidConfig", "At least one weight must be positive"));
    }
    if (auto result = check_unit_interval(config.acceptance_threshold, "acceptance_threshold");
        !result) {
        return result;
    }
    if (auto result = check_unit_interval(config.max_position_skew, "max_position_skew"); !result) {
        return result;
    }
    if (config.max_candidate_set == 0) {
        return std::unexpected(Error::make("InvalidConfig", "'max_candidate_set' must be positive"));
    }
    return {};
}

graphmat::Result<MatcherConfig> config_from_json(const nlohmann::json& j)
{
    if (!j.is_object()) {
        return std::unexpected(Error::make("InvalidConfig", "Configuration must be a JSON object"));
    }

    MatcherConfig config;
    const MatcherConfig defaults;

    auto opcode_weight = read_number(j, "opcode_weight", defaults.opcode_weight);
    if (!opcode_weight) {
        return std::unexpected(opcode_weight.error());
    }
    config.opcode_weight = *opcode_weight;

    auto structural_weight = read_number(j, "structural_weight", defaults.structural_weight);
    if (!structural_weight) {
        return std::unexpected(structural_weight.error());
    }
    config.structural_weight = *structural_weight;

    auto threshold = read_number(j, "acceptance_threshold", defaults.acceptance_threshold);
    if (!threshold) {
        return std::unexpected(threshold.error());
    }
    config.acceptance_threshold = *threshold;

    auto skew = read_number(j, "max_position_skew", defaults.max_position_skew);
    if (!skew) {
        return std::unexpected(skew.error());
    }
    config.max_position_skew = *skew;

    if (j.contains("max_candidate_set")) {
        const auto& value = j.at("max_candidate_set");
        if (!value.is_number_unsigned()) {
            return std::unexpected(
                Error::make("InvalidConfig", "'max_candidate_set' must be a positive integer"));
        }
        config.max_candidate_set = value.get<std::size_t>();
    }

    if (j.contains("worklist_order")) {
        const auto& value = j.at("worklist_order");
        auto order = value.is_string() ? parse_worklist_order(value.get<std::string>())
                                       : std::nullopt;
        if (!order) {
            return std::unexpected(Error::make("InvalidConfig",
                                               "'worklist_order' must be \"fifo\" or \"best_first\""));
        }
        config.worklist_order = *order;
    }

    if (j.contains("budget")) {
        const auto& budget = j.at("budget");
        if (budget.contains("max_iterations")) {
            const auto& value = budget.at("max_iterations");
            if (!value.is_number_unsigned()) {
                return std::unexpected(Error::make(
                    "InvalidConfig", "'budget.max_iterations' must be a non-negative integer"));
            }
            config.budget.max_iterations = value.get<std::uint64_t>();
        }
    }

    if (auto valid = validate(config); !valid) {
        return std::unexpected(valid.error());
    }
    return config;
}

graphmat::Result<MatcherConfig> load_matcher_config(const std::string& path,
                                                    const std::string& schema_dir)
{
    auto document = common::read_versioned_document(path, kMatcherConfigSchemaVersion, schema_dir);
    if (!document) {
        return std::unexpected(document.error());
    }
    return config_from_json(*document);
}

nlohmann::json to_json(const MatcherConfig& config)
{
    nlohmann::json j = {
        {      "schema_version", kMatcherConfigSchemaVersion},
        {       "opcode_weight",        config.opcode_weight},
        {   "structural_weight",    config.structural_weight},
        {"acceptance_threshold", config.acceptance_threshold},
        {   "max_position_skew",    config.max_position_skew},
        {   "max_candidate_set",    config.max_candidate_set},
        {      "worklist_order", std::string(to_string(config.worklist_order))}
    };
    if (config.budget.max_iterations) {
        j["budget"] = {
            {"max_iterations", *config.budget.max_iterations}
        };
    }
    return j;
}

}  // namespace graphmat::config
