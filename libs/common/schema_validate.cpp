/**
 * @file schema_validate.cpp
 * @brief JSON Schema validation using valijson
 */

#include "ecv/schema_validate.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <valijson/adapters/nlohmann_json_adapter.hpp>
#include <valijson/schema.hpp>
#include <valijson/schema_parser.hpp>
#include <valijson/validator.hpp>

namespace ecv::common {

namespace {

constexpr std::string_view kSchemaUriPrefix = "ecv:schema/";
constexpr std::string_view kSchemaSuffix = ".schema.json";

[[nodiscard]] ecv::Result<nlohmann::json> read_schema(const std::filesystem::path& path)
{
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(
            Error::make("SchemaFileOpenFailed", "Failed to open schema file: " + path.string()));
    }
    nlohmann::json schema;
    try {
        in >> schema;
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(Error::make(
            "SchemaParseFailed", "Failed to parse schema " + path.string() + ": " + ex.what()));
    }
    return schema;
}

// valijson understands draft-07 "definitions"; our schemas use "$defs".
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
            auto ref = value.get<std::string>();
            constexpr std::string_view kDefsRef = "#/$defs/";
            if (ref.starts_with(kDefsRef)) {
                value = "#/definitions/" + ref.substr(kDefsRef.size());
            }
            continue;
        }
        rewrite_defs(value);
    }
}

[[nodiscard]] std::string describe_errors(valijson::ValidationResults& results)
{
    std::string out;
    valijson::ValidationResults::Error error;
    while (results.popError(error)) {
        std::string where;
        for (const auto& part : error.context) {
            where += "/" + part;
        }
        if (!out.empty()) {
            out += '\n';
        }
        out += (where.empty() ? std::string("/") : where) + ": " + error.description;
    }
    return out.empty() ? std::string("Schema validation failed.") : out;
}

}  // namespace

ecv::VoidResult validate_json(const nlohmann::json& j, const std::filesystem::path& schema_path)
{
    auto schema_json = read_schema(schema_path);
    if (!schema_json) {
        return std::unexpected(schema_json.error());
    }
    rewrite_defs(*schema_json);

    const auto schema_dir = schema_path.parent_path();
    std::vector<std::unique_ptr<nlohmann::json>> referenced;
    const auto fetch_doc = [&schema_dir, &referenced](const std::string& uri) -> const nlohmann::json* {
        if (!uri.starts_with(kSchemaUriPrefix)) {
            return nullptr;
        }
        const auto name = uri.substr(kSchemaUriPrefix.size());
        auto doc = read_schema(schema_dir / (name + std::string(kSchemaSuffix)));
        if (!doc) {
            return nullptr;
        }
        rewrite_defs(*doc);
        referenced.push_back(std::make_unique<nlohmann::json>(std::move(*doc)));
        return referenced.back().get();
    };
    // Documents are owned by `referenced`; valijson must not free them.
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

ecv::VoidResult validate_document(const nlohmann::json& j,
                                  const std::filesystem::path& schema_dir,
                                  std::string_view schema_name)
{
    return validate_json(j, schema_dir / (std::string(schema_name) + std::string(kSchemaSuffix)));
}

}  // namespace ecv::common
