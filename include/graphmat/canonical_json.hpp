#pragma once

/**
 * @file canonical_json.hpp
 * @brief Canonical JSON serialization for byte-identical output
 *
 * Rules:
 * - Object keys in lexicographic order
 * - No whitespace (minimal representation)
 * - Integers only (no floating point, scores are emitted as ppm)
 */

#include "graphmat/common.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace graphmat::canonical {

/**
 * Serialize JSON to canonical form
 * @param j JSON value
 * @return Canonical byte string or error
 */
[[nodiscard]] graphmat::Result<std::string> canonicalize(const nlohmann::json& j);

/**
 * Validate JSON for canonical form requirements (no floating point)
 * @param j JSON value
 * @return Empty on success, error naming the offending path on failure
 */
[[nodiscard]] graphmat::VoidResult validate_for_canonical(const nlohmann::json& j);

}  // namespace graphmat::canonical
