#pragma once

/**
 * @file schema_validate.hpp
 * @brief JSON Schema validation utilities
 */

#include "apiguard/common.hpp"

#include <filesystem>
#include <string_view>

#include <nlohmann/json.hpp>

namespace apiguard::common {

/// File name of the report schema inside a schema directory
inline constexpr std::string_view kViolationsSchema = "violations.v1.schema.json";

/// File name of the usage log schema inside a schema directory
inline constexpr std::string_view kUsageLogSchema = "usage_log.v1.schema.json";

/**
 * Validate JSON against a JSON Schema file.
 * Only document-local references ("#/$defs/...") are supported.
 *
 * @param j JSON document to validate
 * @param schema_path Path to JSON Schema file
 * @return Empty on success, error on failure
 */
[[nodiscard]] apiguard::VoidResult validate_json(const nlohmann::json& j,
                                                 const std::filesystem::path& schema_path);

}  // namespace apiguard::common
