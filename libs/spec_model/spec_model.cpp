/**
 * @file spec_model.cpp
 * @brief Spec document loading (YAML/JSON) and baseline resolution
 */

#include "apiguard/spec_model.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <format>
#include <fstream>
#include <iterator>
#include <ranges>
#include <system_error>
#include <utility>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace apiguard::spec {

namespace {

constexpr std::array<std::string_view, 8> kHttpMethods =
    {"get", "put", "post", "delete", "options", "head", "patch", "trace"};

constexpr std::string_view kDefaultLocation = "query";

constexpr std::string_view kNonPlainTag = "!";
constexpr std::string_view kStrTag = "tag:yaml.org,2002:str";

[[nodiscard]] apiguard::Error invalid_spec(std::string_view source, std::string_view detail)
{
    return apiguard::Error::make(apiguard::error_code::kInvalidSpec,
                                 std::format("Invalid spec document {}: {}", source, detail));
}

[[nodiscard]] std::string to_upper(std::string_view input)
{
    std::string result(input);
    std::ranges::transform(result, result.begin(), [](unsigned char c) noexcept {
        return static_cast<char>(std::toupper(c));
    });
    return result;
}

[[nodiscard]] bool looks_numeric(std::string_view scalar)
{
    if (scalar.empty()) {
        return false;
    }
    const char first = scalar.front();
    return std::isdigit(static_cast<unsigned char>(first)) != 0 || first == '-' || first == '+'
           || first == '.';
}

[[nodiscard]] nlohmann::json plain_scalar_to_json(const std::string& scalar)
{
    if (scalar == "true" || scalar == "True" || scalar == "TRUE") {
        return true;
    }
    if (scalar == "false" || scalar == "False" || scalar == "FALSE") {
        return false;
    }
    if (!looks_numeric(scalar)) {
        return scalar;
    }
    std::int64_t as_int = 0;
    const char* begin = scalar.data();
    const char* end = scalar.data() + scalar.size();
    if (*begin == '+') {
        ++begin;
    }
    if (auto [ptr, ec] = std::from_chars(begin, end, as_int); ec == std::errc{} && ptr == end) {
        return as_int;
    }
    char* parsed_end = nullptr;
    const double as_double = std::strtod(scalar.c_str(), &parsed_end);
    if (parsed_end != nullptr && *parsed_end == '\0') {
        return as_double;
    }
    return scalar;
}

// NOLINTNEXTLINE(misc-no-recursion) - Document trees are bounded by yaml-cpp's depth guard.
[[nodiscard]] apiguard::Result<nlohmann::json> node_to_json(const YAML::Node& node,
                                                            std::string_view source,
                                                            const std::string& location)
{
    if (!node.IsDefined() || node.IsNull()) {
        return nlohmann::json(nullptr);
    }
    if (node.IsScalar()) {
        // Quoted scalars carry the "!" tag; those and "!!str" always stay strings.
        if (node.Tag() == kNonPlainTag || node.Tag() == kStrTag) {
            return nlohmann::json(node.Scalar());
        }
        return plain_scalar_to_json(node.Scalar());
    }
    if (node.IsSequence()) {
        nlohmann::json array = nlohmann::json::array();
        std::size_t index = 0;
        for (const auto& item : node) {
            auto converted = node_to_json(item, source, std::format("{}[{}]", location, index));
            if (!converted) {
                return std::unexpected(converted.error());
            }
            array.push_back(std::move(*converted));
            ++index;
        }
        return array;
    }
    if (node.IsMap()) {
        nlohmann::json object = nlohmann::json::object();
        for (const auto& pair : node) {
            if (!pair.first.IsScalar()) {
                return std::unexpected(
                    invalid_spec(source, std::format("non-scalar mapping key at {}", location)));
            }
            const std::string key = pair.first.Scalar();
            if (object.contains(key)) {
                return std::unexpected(invalid_spec(
                    source, std::format("duplicate key '{}' at {}", key, location)));
            }
            auto converted = node_to_json(pair.second, source, location + "." + key);
            if (!converted) {
                return std::unexpected(converted.error());
            }
            object[key] = std::move(*converted);
        }
        return object;
    }
    return std::unexpected(invalid_spec(source, std::format("unsupported node at {}", location)));
}

[[nodiscard]] apiguard::Result<std::string> read_text_file(const std::filesystem::path& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(apiguard::Error::make(apiguard::error_code::kIOError,
                                                     "Failed to open spec file: " + path.string()));
    }
    std::string text{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    if (in.bad()) {
        return std::unexpected(apiguard::Error::make(apiguard::error_code::kIOError,
                                                     "Failed to read spec file: " + path.string()));
    }
    return text;
}

[[nodiscard]] apiguard::Result<std::string> extract_version_text(const nlohmann::json& document,
                                                                 std::string_view source)
{
    const nlohmann::json* field = nullptr;
    if (document.contains("info")) {
        const auto& info = document.at("info");
        if (!info.is_object()) {
            return std::unexpected(invalid_spec(source, "info must be a mapping"));
        }
        if (info.contains("version")) {
            field = &info.at("version");
        }
    }
    if (field == nullptr && document.contains("version")) {
        field = &document.at("version");
    }
    if (field == nullptr) {
        return std::unexpected(invalid_spec(source, "missing version field"));
    }
    if (field->is_number() || field->is_boolean()) {
        return std::unexpected(apiguard::Error::make(
            apiguard::error_code::kInvalidVersion,
            std::format("Invalid version in {}: {} is not a semantic version string", source, field->dump())));
    }
    if (!field->is_string()) {
        return std::unexpected(invalid_spec(source, "version must be a string"));
    }
    return field->get<std::string>();
}

[[nodiscard]] apiguard::Result<ParamType> extract_param_type(const nlohmann::json& param,
                                                             std::string_view source,
                                                             std::string_view where)
{
    const nlohmann::json* type_field = nullptr;
    if (param.contains("schema")) {
        const auto& schema = param.at("schema");
        if (!schema.is_object()) {
            return std::unexpected(
                invalid_spec(source, std::format("{}: schema must be a mapping", where)));
        }
        if (schema.contains("type")) {
            type_field = &schema.at("type");
        }
    }
    if (type_field == nullptr && param.contains("type")) {
        type_field = &param.at("type");
    }
    if (type_field == nullptr || type_field->is_null()) {
        return ParamType::kUnspecified;
    }

    std::string type_name;
    if (type_field->is_string()) {
        type_name = type_field->get<std::string>();
    } else if (type_field->is_array()) {
        // OpenAPI 3.1 nullable form: [<type>, "null"]
        std::vector<std::string> non_null;
        for (const auto& entry : *type_field) {
            if (!entry.is_string()) {
                return std::unexpected(
                    invalid_spec(source, std::format("{}: type entries must be strings", where)));
            }
            if (entry.get_ref<const std::string&>() != "null") {
                non_null.push_back(entry.get<std::string>());
            }
        }
        if (non_null.size() != 1) {
            return std::unexpected(
                invalid_spec(source, std::format("{}: ambiguous type list", where)));
        }
        type_name = std::move(non_null.front());
    } else {
        return std::unexpected(invalid_spec(source, std::format("{}: type must be a string", where)));
    }

    auto type = parse_param_type(type_name);
    if (!type) {
        return std::unexpected(
            invalid_spec(source, std::format("{}: unknown type '{}'", where, type_name)));
    }
    return *type;
}

/// nullopt for parameters given only by $ref
[[nodiscard]] apiguard::Result<std::optional<Parameter>>
parse_parameter(const nlohmann::json& param, std::string_view source, std::string_view where)
{
    if (!param.is_object()) {
        return std::unexpected(
            invalid_spec(source, std::format("{}: parameter must be a mapping", where)));
    }
    if (param.contains("$ref") && !param.contains("name")) {
        return std::optional<Parameter>{};
    }
    if (!param.contains("name") || !param.at("name").is_string()
        || param.at("name").get_ref<const std::string&>().empty()) {
        return std::unexpected(
            invalid_spec(source, std::format("{}: parameter name must be a non-empty string", where)));
    }

    Parameter parameter;
    parameter.name = param.at("name").get<std::string>();
    parameter.location = std::string(kDefaultLocation);
    if (param.contains("in")) {
        if (!param.at("in").is_string()) {
            return std::unexpected(invalid_spec(
                source, std::format("{}: parameter '{}' location must be a string", where, parameter.name)));
        }
        parameter.location = param.at("in").get<std::string>();
    }
    if (param.contains("required")) {
        if (!param.at("required").is_boolean()) {
            return std::unexpected(invalid_spec(
                source, std::format("{}: parameter '{}' required must be a boolean", where, parameter.name)));
        }
        parameter.required = param.at("required").get<bool>();
    }
    if (parameter.location == "path") {
        parameter.required = true;
    }
    auto type = extract_param_type(param, source, std::format("{} parameter '{}'", where, parameter.name));
    if (!type) {
        return std::unexpected(type.error());
    }
    parameter.type = *type;
    return std::optional<Parameter>{std::move(parameter)};
}

[[nodiscard]] apiguard::Result<std::map<std::string, Parameter>>
parse_parameter_list(const nlohmann::json& list, std::string_view source, std::string_view where)
{
    if (!list.is_array()) {
        return std::unexpected(invalid_spec(source, std::format("{}: parameters must be a list", where)));
    }
    std::map<std::string, Parameter> parameters;
    for (const auto& entry : list) {
        auto parsed = parse_parameter(entry, source, where);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        if (!parsed->has_value()) {
            continue;
        }
        auto name = (*parsed)->name;
        if (!parameters.emplace(name, std::move(**parsed)).second) {
            return std::unexpected(
                invalid_spec(source, std::format("{}: duplicate parameter '{}'", where, name)));
        }
    }
    return parameters;
}

[[nodiscard]] apiguard::Result<std::map<std::string, Response>>
parse_responses(const nlohmann::json& responses, std::string_view source, std::string_view where)
{
    if (!responses.is_object()) {
        return std::unexpected(invalid_spec(source, std::format("{}: responses must be a mapping", where)));
    }
    std::map<std::string, Response> result;
    for (const auto& [code, _] : responses.items()) {
        result.emplace(code, Response{.status_code = code});
    }
    return result;
}

[[nodiscard]] apiguard::Result<Endpoint> parse_operation(const nlohmann::json& operation,
                                                         const std::map<std::string, Parameter>& shared,
                                                         const EndpointKey& key,
                                                         std::string_view source)
{
    const std::string where = std::format("{} {}", key.method, key.path);
    if (!operation.is_object()) {
        return std::unexpected(invalid_spec(source, where + ": operation must be a mapping"));
    }
    Endpoint endpoint{.path = key.path, .method = key.method, .parameters = shared, .responses = {}};
    if (operation.contains("parameters") && !operation.at("parameters").is_null()) {
        auto own = parse_parameter_list(operation.at("parameters"), source, where);
        if (!own) {
            return std::unexpected(own.error());
        }
        // Operation-level parameters override path-level ones of the same name.
        for (auto& [name, parameter] : *own) {
            endpoint.parameters.insert_or_assign(name, std::move(parameter));
        }
    }
    if (operation.contains("responses") && !operation.at("responses").is_null()) {
        auto responses = parse_responses(operation.at("responses"), source, where);
        if (!responses) {
            return std::unexpected(responses.error());
        }
        endpoint.responses = std::move(*responses);
    }
    return endpoint;
}

[[nodiscard]] apiguard::VoidResult parse_path_item(const std::string& path,
                                                   const nlohmann::json& item,
                                                   std::string_view source,
                                                   std::map<EndpointKey, Endpoint>& endpoints)
{
    if (!item.is_object()) {
        return std::unexpected(invalid_spec(source, std::format("path '{}' must be a mapping", path)));
    }
    std::map<std::string, Parameter> shared;
    if (item.contains("parameters") && !item.at("parameters").is_null()) {
        auto parsed = parse_parameter_list(item.at("parameters"), source, path);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        shared = std::move(*parsed);
    }
    for (auto method : kHttpMethods) {
        const std::string method_key(method);
        if (!item.contains(method_key)) {
            continue;
        }
        EndpointKey key{.path = path, .method = to_upper(method)};
        auto endpoint = parse_operation(item.at(method_key), shared, key, source);
        if (!endpoint) {
            return std::unexpected(endpoint.error());
        }
        if (!endpoints.emplace(std::move(key), std::move(*endpoint)).second) {
            return std::unexpected(invalid_spec(
                source, std::format("duplicate endpoint {} {}", to_upper(method), path)));
        }
    }
    return {};
}

}  // namespace

std::string_view param_type_name(ParamType type)
{
    switch (type) {
        case ParamType::kString:
            return "string";
        case ParamType::kInteger:
            return "integer";
        case ParamType::kNumber:
            return "number";
        case ParamType::kBoolean:
            return "boolean";
        case ParamType::kArray:
            return "array";
        case ParamType::kObject:
            return "object";
        case ParamType::kUnspecified:
            break;
    }
    return "unspecified";
}

std::optional<ParamType> parse_param_type(std::string_view name)
{
    if (name == "string") {
        return ParamType::kString;
    }
    if (name == "integer") {
        return ParamType::kInteger;
    }
    if (name == "number") {
        return ParamType::kNumber;
    }
    if (name == "boolean") {
        return ParamType::kBoolean;
    }
    if (name == "array") {
        return ParamType::kArray;
    }
    if (name == "object") {
        return ParamType::kObject;
    }
    return std::nullopt;
}

apiguard::Result<nlohmann::json> yaml_to_json(std::string_view text, std::string_view source)
{
    YAML::Node root;
    try {
        root = YAML::Load(std::string(text));
    } catch (const YAML::Exception& ex) {
        return std::unexpected(invalid_spec(source, std::string("parse failed: ") + ex.what()));
    }
    return node_to_json(root, source, "$");
}

apiguard::Result<SpecDocument> build_spec_document(const nlohmann::json& document,
                                                   std::string source_file)
{
    if (!document.is_object()) {
        return std::unexpected(invalid_spec(source_file, "top level must be a mapping"));
    }

    auto version_text = extract_version_text(document, source_file);
    if (!version_text) {
        return std::unexpected(version_text.error());
    }
    auto version = semver::parse(*version_text);
    if (!version) {
        return std::unexpected(apiguard::Error::make(
            version.error().code, std::format("{} (in {})", version.error().message, source_file)));
    }

    SpecDocument spec{.source_file = std::move(source_file),
                      .version_text = std::move(*version_text),
                      .version = std::move(*version),
                      .endpoints = {}};

    if (!document.contains("paths") || document.at("paths").is_null()) {
        return spec;
    }
    const auto& paths = document.at("paths");
    if (!paths.is_object()) {
        return std::unexpected(invalid_spec(spec.source_file, "paths must be a mapping"));
    }
    for (const auto& [path, item] : paths.items()) {
        if (auto parsed = parse_path_item(path, item, spec.source_file, spec.endpoints); !parsed) {
            return std::unexpected(parsed.error());
        }
    }
    return spec;
}

apiguard::Result<SpecDocument> load_spec_document(const std::filesystem::path& path)
{
    auto text = read_text_file(path);
    if (!text) {
        return std::unexpected(text.error());
    }
    auto document = yaml_to_json(*text, path.string());
    if (!document) {
        return std::unexpected(document.error());
    }
    return build_spec_document(*document, path.string());
}

SpecPair resolve_pair(SpecDocument first, SpecDocument second)
{
    bool first_is_baseline = true;
    if (auto cmp = semver::compare(first.version, second.version); cmp != 0) {
        first_is_baseline = cmp < 0;
    } else if (first.source_file != second.source_file) {
        first_is_baseline = first.source_file < second.source_file;
    } else {
        first_is_baseline = first.version_text <= second.version_text;
    }
    if (first_is_baseline) {
        return SpecPair{.baseline = std::move(first), .candidate = std::move(second)};
    }
    return SpecPair{.baseline = std::move(second), .candidate = std::move(first)};
}

}  // namespace apiguard::spec
