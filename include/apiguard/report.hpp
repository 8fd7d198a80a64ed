#pragma once

/**
 * @file report.hpp
 * @brief Violation ordering and the violation-list wire format
 */

#include "apiguard/common.hpp"
#include "apiguard/rules.hpp"

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace apiguard::report {

/**
 * Order violations by (rule name, path, method, message).
 */
void sort_violations(std::vector<rules::Violation>& violations);

[[nodiscard]] nlohmann::json to_json(const rules::Violation& violation);

/**
 * Sorted JSON array of violations; an empty input yields an empty array.
 */
[[nodiscard]] nlohmann::json build_report(std::vector<rules::Violation> violations);

/**
 * Serialize a report with sorted keys. @p pretty indents by two spaces.
 */
[[nodiscard]] apiguard::Result<std::string> serialize_report(const nlohmann::json& report,
                                                             bool pretty = false);

/**
 * Validate a report against violations.v1.schema.json in @p schema_dir.
 */
[[nodiscard]] apiguard::VoidResult validate_report(const nlohmann::json& report,
                                                   const std::filesystem::path& schema_dir);

}  // namespace apiguard::report
