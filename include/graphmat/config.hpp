#pragma once

/**
 * @file config.hpp
 * @brief Tunable matcher constants and their JSON configuration file
 */

#include "graphmat/common.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace graphmat::config {

/**
 * Order in which confirmed pairs are taken from the worklist.
 *
 * Naming convention: kPascalCase for enum constants (Google C++ Style Guide)
 */
enum class WorklistOrder {
    kFifo,      ///< Breadth-first from the seed
    kBestFirst  ///< Highest star score first, ties by (a, b)
};

struct MatcherConfig
{
    /// Weight of the opcode edit-distance term in a star score.
    double opcode_weight = 0.75;
    /// Weight of the in/out degree term in a star score.
    double structural_weight = 0.25;
    /// Candidates scoring below this are never confirmed.
    double acceptance_threshold = 0.5;
    /// Largest difference of relative call-site position still considered plausible.
    double max_position_skew = 0.75;
    /// Width of the positional window each neighbour is compared against in large neighbourhoods.
    std::size_t max_candidate_set = 256;
    WorklistOrder worklist_order = WorklistOrder::kFifo;
    struct Budget
    {
        std::optional<std::uint64_t> max_iterations;
    } budget{};
};

[[nodiscard]] std::string_view to_string(WorklistOrder order) noexcept;

[[nodiscard]] std::optional<WorklistOrder> parse_worklist_order(std::string_view text) noexcept;

/**
 * Check value ranges: weights non-negative and not both zero, threshold and
 * skew within [0, 1], candidate set size positive.
 */
[[nodiscard]] graphmat::VoidResult validate(const MatcherConfig& config);

/**
 * Build a configuration from a matcher_config.v1 document. Missing keys keep
 * their defaults.
 */
[[nodiscard]] graphmat::Result<MatcherConfig> config_from_json(const nlohmann::json& j);

/**
 * Read, schema-validate and convert a configuration file.
 */
[[nodiscard]] graphmat::Result<MatcherConfig> load_matcher_config(const std::string& path,
                                                                  const std::string& schema_dir);

[[nodiscard]] nlohmann::json to_json(const MatcherConfig& config);

}  // namespace graphmat::config
