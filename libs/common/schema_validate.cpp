/**
 * @file schema_validate.cpp
 * @brief JSON Schema validation using valijson
 */

#include "apiguard/schema_validate.hpp"

#include <exception>
#include <format>
#include <fstream>
#include <string>
#include <string_view>

#include <valijson/adapters/nlohmann_json_adapter.hpp>
#include <valijson/schema.hpp>
#include <valijson/schema_parser.hpp>
#include <valijson/validator.hpp>

namespace apiguard::common {

namespace {

[[nodiscard]] apiguard::Result<nlohmann::json> read_schema(const std::filesystem::path& path)
{
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(apiguard::Error::make("SchemaFileOpenFailed",
                                                     "Failed to open schema file: " + path.string()));
    }
    nlohmann::json schema;
    try {
        in >> schema;
    } catch (const std::exception& ex) {
        return std::unexpected(apiguard::Error::make(
            "SchemaParseFailed",
            std::format("Failed to parse schema JSON {}: {}", path.string(), ex.what())));
    }
    return schema;
}

// valijson (draft 7) resolves "#/definitions/..." but not "#/$defs/...".
// NOLINTNEXTLINE(misc-no-recursion)
void rewrite_defs(nlohmann::json& schema)
{
    if (schema.is_array()) {
        for (auto& item : schema) {
            rewrite_defs(item);
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
            const auto& ref = value.get_ref<const std::string&>();
            if (ref.starts_with(kDefsPrefix)) {
                value = "#/definitions/" + ref.substr(kDefsPrefix.size());
            }
            continue;
        }
        rewrite_defs(value);
    }
}

[[nodiscard]] std::string describe_errors(valijson::ValidationResults& results)
{
    std::string described;
    valijson::ValidationResults::Error error;
    while (results.popError(error)) {
        std::string pointer;
        for (const auto& part : error.context) {
            pointer += "/" + part;
        }
        if (!described.empty()) {
            described += '\n';
        }
        described += std::format("{}: {}", pointer.empty() ? "/" : pointer, error.description);
    }
    return described;
}

}  // namespace

apiguard::VoidResult validate_json(const nlohmann::json& j, const std::filesystem::path& schema_path)
{
    auto schema_json = read_schema(schema_path);
    if (!schema_json) {
        return std::unexpected(schema_json.error());
    }
    rewrite_defs(*schema_json);

    valijson::Schema schema;
    try {
        valijson::SchemaParser parser;
        valijson::adapters::NlohmannJsonAdapter schema_adapter(*schema_json);
        parser.populateSchema(schema_adapter, schema);
    } catch (const std::exception& ex) {
        return std::unexpected(
            apiguard::Error::make("SchemaBuildFailed", std::string("Failed to build schema: ") + ex.what()));
    }

    valijson::Validator validator;
    valijson::ValidationResults results;
    valijson::adapters::NlohmannJsonAdapter target_adapter(j);
    if (!validator.validate(schema, target_adapter, &results)) {
        std::string described = describe_errors(results);
        if (described.empty()) {
            described = "Schema validation failed.";
        }
        return std::unexpected(apiguard::Error::make("SchemaValidationFailed", std::move(described)));
    }
    return {};
}

}  // namespace apiguard::common
