#pragma once

/**
 * @file spec_model.hpp
 * @brief In-memory model of one API version and baseline/candidate resolution
 */

#include "apiguard/common.hpp"
#include "apiguard/semver.hpp"

#include <compare>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace apiguard::spec {

/**
 * Declared parameter type
 *
 * kUnspecified is used when a document declares no type; it never compares
 * as a type change.
 */
enum class ParamType {
    kUnspecified,
    kString,
    kInteger,
    kNumber,
    kBoolean,
    kArray,
    kObject
};

[[nodiscard]] std::string_view param_type_name(ParamType type);

[[nodiscard]] std::optional<ParamType> parse_param_type(std::string_view name);

struct Parameter
{
    std::string name;
    std::string location;  ///< OpenAPI "in": path, query, header, cookie, body, ...
    bool required = false;
    ParamType type = ParamType::kUnspecified;
};

struct Response
{
    std::string status_code;
};

/**
 * @brief (path, method) identity of an endpoint; method is uppercase
 */
struct EndpointKey
{
    std::string path;
    std::string method;

    auto operator<=>(const EndpointKey&) const = default;
};

struct Endpoint
{
    std::string path;
    std::string method;
    std::map<std::string, Parameter> parameters;  ///< Keyed by parameter name
    std::map<std::string, Response> responses;    ///< Keyed by status code

    [[nodiscard]] EndpointKey key() const { return EndpointKey{.path = path, .method = method}; }
};

/**
 * @brief One API version, read-only after construction
 */
struct SpecDocument
{
    std::string source_file;      ///< Path as given on the command line
    std::string version_text;     ///< Declared version string, verbatim
    semver::Version version;      ///< Parsed declared version
    std::map<EndpointKey, Endpoint> endpoints;
};

/**
 * @brief Baseline/candidate assignment produced before any diffing
 */
struct SpecPair
{
    SpecDocument baseline;
    SpecDocument candidate;
};

/**
 * Convert a YAML (or JSON) text into a JSON tree.
 * Quoted scalars stay strings; repeated mapping keys are rejected.
 * @param text Document text
 * @param source Label used in error messages
 */
[[nodiscard]] apiguard::Result<nlohmann::json> yaml_to_json(std::string_view text,
                                                            std::string_view source);

/**
 * Build the model from an already parsed document tree.
 * @param document Parsed document
 * @param source_file Path recorded as the document's origin
 * @return Model, or InvalidSpec / InvalidVersion error
 */
[[nodiscard]] apiguard::Result<SpecDocument> build_spec_document(const nlohmann::json& document,
                                                                 std::string source_file);

/**
 * Read, parse and build a spec document from a file.
 */
[[nodiscard]] apiguard::Result<SpecDocument> load_spec_document(const std::filesystem::path& path);

/**
 * Order two documents: lower declared version becomes the baseline.
 * Equal versions fall back to lexical order of the source path, so swapping
 * the arguments never changes the assignment.
 */
[[nodiscard]] SpecPair resolve_pair(SpecDocument first, SpecDocument second);

}  // namespace apiguard::spec
