#pragma once

/**
 * @file json_io.hpp
 * @brief Reading JSON documents and writing output files
 */

#include "graphmat/common.hpp"

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace graphmat::common {

/**
 * Parse a JSON file.
 * @return Document, or IOError / ParseError
 */
[[nodiscard]] graphmat::Result<nlohmann::json> read_json_file(const std::string& path);

/**
 * Read a JSON file and validate it against the schema named by its
 * "schema_version" member, which must equal expected_version.
 */
[[nodiscard]] graphmat::Result<nlohmann::json>
read_versioned_document(const std::string& path,
                        std::string_view expected_version,
                        const std::string& schema_dir);

/**
 * Write text to a file, replacing previous contents.
 */
[[nodiscard]] graphmat::VoidResult write_text_file(const std::string& path, std::string_view text);

}  // namespace graphmat::common
