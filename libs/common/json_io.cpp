/**
 * @file json_io.cpp
 * @brief Reading JSON documents and writing output files
 */

#include "graphmat/json_io.hpp"

#include "graphmat/schema_validate.hpp"

#include <format>
#include <fstream>

namespace graphmat::common {

graphmat::Result<nlohmann::json> read_json_file(const std::string& path)
{
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(Error::make("IOError", "Failed to open JSON file: " + path));
    }
    nlohmann::json payload;
    try {
        in >> payload;
    } catch (const std::exception& ex) {
        return std::unexpected(
            Error::make("ParseError", "Failed to parse JSON file: " + path + ": " + ex.what()));
    }
    return payload;
}

graphmat::Result<nlohmann::json> read_versioned_document(const std::string& path,
                                                         std::string_view expected_version,
                                                         const std::string& schema_dir)
{
    auto document = read_json_file(path);
    if (!document) {
        return std::unexpected(document.error());
    }
    if (!document->is_object() || !document->contains("schema_version")
        || !document->at("schema_version").is_string()) {
        return std::unexpected(
            Error::make("SchemaValidationFailed", "Missing schema_version in: " + path));
    }
    const auto& version = document->at("schema_version").get_ref<const std::string&>();
    if (version != expected_version) {
        return std::unexpected(Error::make(
            "SchemaValidationFailed",
            std::format("{}: expected schema_version {}, found {}", path, expected_version, version)));
    }
    if (auto valid = validate_json(*document, schema_path_for(schema_dir, expected_version));
        !valid) {
        return std::unexpected(Error::make(valid.error().code, path + ": " + valid.error().message));
    }
    return document;
}

graphmat::VoidResult write_text_file(const std::string& path, std::string_view text)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return std::unexpected(Error::make("IOError", "Failed to open output file: " + path));
    }
    out.write(text.data(), static_cast<std::streamsize>(text.size()));
    if (!out) {
        return std::unexpected(Error::make("IOError", "Failed to write output file: " + path));
    }
    return {};
}

}  // namespace graphmat::common
