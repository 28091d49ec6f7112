/**
 * @file schema_validate.cpp
 * @brief JSON Schema validation using valijson
 */

#include "graphmat/schema_validate.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <memory>
#include <vector>

#include <valijson/adapters/nlohmann_json_adapter.hpp>
#include <valijson/schema.hpp>
#include <valijson/schema_parser.hpp>
#include <valijson/validator.hpp>

namespace graphmat::common {

namespace {

constexpr std::string_view kSchemaUriPrefix = "graphmat:schema/";

// valijson only understands draft-07 "definitions".
void rewrite_defs(nlohmann::json& schema)
{
    if (schema.is_array()) {
        for (auto& value : schema) {
            rewrite_defs(value);
        }
        return;
    }
    if (!schema.is_object()) {
        return;
    }
    if (schema.contains("$defs") && !schema.contains("definitions")) {
        schema["definitions"] = schema["$defs"];
        schema.erase("$defs");
    }
    for (auto& [key, value] : schema.items()) {
        if (key == "$ref" && value.is_string()) {
            constexpr std::string_view kDefsPrefix = "#/$defs/";
            auto ref = value.get<std::string>();
            if (ref.starts_with(kDefsPrefix)) {
                value = "#/definitions/" + ref.substr(kDefsPrefix.size());
            }
            continue;
        }
        rewrite_defs(value);
    }
}

[[nodiscard]] graphmat::Result<nlohmann::json> read_schema(const std::filesystem::path& path)
{
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(
            Error::make("SchemaFileOpenFailed", "Failed to open schema file: " + path.string()));
    }
    nlohmann::json schema;
    try {
        in >> schema;
    } catch (const std::exception& ex) {
        return std::unexpected(Error::make(
            "SchemaParseFailed",
            std::format("Failed to parse schema JSON {}: {}", path.string(), ex.what())));
    }
    rewrite_defs(schema);
    return schema;
}

[[nodiscard]] std::string describe_errors(valijson::ValidationResults& results)
{
    std::string text;
    valijson::ValidationResults::Error error;
    while (results.popError(error)) {
        std::string context;
        for (const auto& part : error.context) {
            context += "/" + part;
        }
        if (!text.empty()) {
            text += '\n';
        }
        text += std::format("{}: {}", context.empty() ? "/" : context, error.description);
    }
    return text.empty() ? "Schema validation failed." : text;
}

}  // namespace

std::string schema_path_for(std::string_view schema_dir, std::string_view schema_version)
{
    return (std::filesystem::path(schema_dir) / (std::string(schema_version) + ".schema.json"))
        .string();
}

graphmat::VoidResult validate_json(const nlohmann::json& j, const std::string& schema_path)
{
    auto schema_json = read_schema(schema_path);
    if (!schema_json) {
        return std::unexpected(schema_json.error());
    }

    const auto schema_dir = std::filesystem::path(schema_path).parent_path();
    std::vector<std::unique_ptr<nlohmann::json>> fetched;
    const auto fetch_doc = [&schema_dir, &fetched](const std::string& uri) -> const nlohmann::json* {
        if (!uri.starts_with(kSchemaUriPrefix)) {
            return nullptr;
        }
        auto name = uri.substr(kSchemaUriPrefix.size());
        auto doc = read_schema(schema_dir / (name + ".schema.json"));
        if (!doc) {
            return nullptr;
        }
        fetched.push_back(std::make_unique<nlohmann::json>(std::move(*doc)));
        return fetched.back().get();
    };
    const auto free_doc = [](const nlohmann::json*) {};

    valijson::Schema schema;
    try {
        valijson::SchemaParser parser;
        valijson::adapters::NlohmannJsonAdapter schema_adapter(*schema_json);
        parser.populateSchema(schema_adapter, schema, fetch_doc, free_doc);
    } catch (const std::exception& ex) {
        return std::unexpected(
            Error::make("SchemaBuildFailed", std::string("Failed to build schema: ") + ex.what()));
    }

    valijson::Validator validator;
    valijson::ValidationResults results;
    valijson::adapters::NlohmannJsonAdapter target(j);
    if (!validator.validate(schema, target, &results)) {
        return std::unexpected(Error::make("SchemaValidationFailed", describe_errors(results)));
    }
    return {};
}

}  // namespace graphmat::common
