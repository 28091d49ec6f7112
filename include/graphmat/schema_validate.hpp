#pragma once

/**
 * @file schema_validate.hpp
 * @brief JSON Schema validation of input documents
 */

#include "graphmat/common.hpp"

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace graphmat::common {

/**
 * Path of the schema file for a document kind.
 *
 * @param schema_dir Directory holding the *.schema.json files
 * @param schema_version Document version tag, e.g. "call_graph.v1"
 * @return "<schema_dir>/<schema_version>.schema.json"
 */
[[nodiscard]] std::string schema_path_for(std::string_view schema_dir,
                                          std::string_view schema_version);

/**
 * Validate JSON against a JSON Schema file.
 *
 * References of the form "graphmat:schema/<name>" resolve to sibling files
 * named "<name>.schema.json".
 *
 * @param j JSON document to validate
 * @param schema_path Path to JSON Schema file
 * @return Empty on success, error on failure
 */
[[nodiscard]] graphmat::VoidResult validate_json(const nlohmann::json& j,
                                                 const std::string& schema_path);

}  // namespace graphmat::common
