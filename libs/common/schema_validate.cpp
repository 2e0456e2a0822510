/**
 * @file schema_validate.cpp
 * @brief JSON Schema validation using valijson
 */

#include "cpaudit/schema_validate.hpp"

#include <exception>
#include <format>
#include <fstream>
#include <memory>
#include <vector>

#include <valijson/adapters/nlohmann_json_adapter.hpp>
#include <valijson/schema.hpp>
#include <valijson/schema_parser.hpp>
#include <valijson/validator.hpp>

namespace cpaudit::common {

namespace {

constexpr std::string_view kSchemaUriPrefix = "cpaudit:schema/";
constexpr std::size_t kMaxReportedErrors = 5;

// valijson understands draft-07 "definitions" only
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

[[nodiscard]] cpaudit::Result<nlohmann::json> load_schema(const std::filesystem::path& path)
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
    std::size_t count = 0;
    valijson::ValidationResults::Error error;
    while (results.popError(error)) {
        if (++count > kMaxReportedErrors) {
            continue;
        }
        std::string pointer;
        for (const auto& part : error.context) {
            pointer += "/" + part;
        }
        if (!text.empty()) {
            text += '\n';
        }
        text += std::format("{}: {}", pointer.empty() ? "/" : pointer, error.description);
    }
    if (count > kMaxReportedErrors) {
        text += std::format("\n... {} more", count - kMaxReportedErrors);
    }
    return text;
}

}  // namespace

cpaudit::VoidResult validate_json(const nlohmann::json& j, const std::string& schema_path)
{
    auto schema_json = load_schema(schema_path);
    if (!schema_json) {
        return std::unexpected(schema_json.error());
    }

    const auto schema_dir = std::filesystem::path(schema_path).parent_path();
    std::vector<std::unique_ptr<nlohmann::json>> referenced;
    const auto fetch_doc = [&schema_dir,
                            &referenced](const std::string& uri) -> const nlohmann::json* {
        if (!uri.starts_with(kSchemaUriPrefix)) {
            return nullptr;
        }
        auto loaded =
            load_schema(schema_dir / (uri.substr(kSchemaUriPrefix.size()) + ".schema.json"));
        if (!loaded) {
            return nullptr;
        }
        referenced.push_back(std::make_unique<nlohmann::json>(std::move(*loaded)));
        return referenced.back().get();
    };
    const auto free_doc = [](const nlohmann::json* schema_ptr) { (void)schema_ptr; };

    valijson::Schema schema;
    valijson::SchemaParser parser;
    try {
        valijson::adapters::NlohmannJsonAdapter schema_adapter(*schema_json);
        parser.populateSchema(schema_adapter, schema, fetch_doc, free_doc);
    } catch (const std::exception& ex) {
        return std::unexpected(
            Error::make("SchemaBuildFailed", std::string("Failed to build schema: ") + ex.what()));
    }

    valijson::Validator validator;
    valijson::ValidationResults results;
    valijson::adapters::NlohmannJsonAdapter target_adapter(j);
    if (!validator.validate(schema, target_adapter, &results)) {
        std::string error = describe_errors(results);
        if (error.empty()) {
            error = "Schema validation failed.";
        }
        return std::unexpected(Error::make("SchemaValidationFailed", std::move(error)));
    }
    return {};
}

cpaudit::VoidResult validate_document(const nlohmann::json& j,
                                      const std::filesystem::path& schema_dir,
                                      std::string_view schema_name,
                                      std::string_view label)
{
    const auto schema_path = schema_dir / (std::string(schema_name) + ".schema.json");
    auto validation = validate_json(j, schema_path.string());
    if (!validation) {
        return std::unexpected(Error::make(
            "SchemaInvalid",
            std::format("{} failed {} validation: {}", label, schema_name, validation.error().message)));
    }
    return {};
}

}  // namespace cpaudit::common
