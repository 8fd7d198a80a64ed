/**
 * @file violation_report.cpp
 * @brief Deterministic ordering and serialization of violations
 */

#include "apiguard/report.hpp"

#include "apiguard/schema_validate.hpp"

#include <algorithm>
#include <exception>
#include <ranges>
#include <tuple>
#include <utility>

namespace apiguard::report {

void sort_violations(std::vector<rules::Violation>& violations)
{
    std::ranges::stable_sort(violations, [](const rules::Violation& lhs, const rules::Violation& rhs) {
        return std::tuple(rules::rule_name(lhs.rule), std::string_view(lhs.path),
                          std::string_view(lhs.method), std::string_view(lhs.message))
               < std::tuple(rules::rule_name(rhs.rule), std::string_view(rhs.path),
                            std::string_view(rhs.method), std::string_view(rhs.message));
    });
}

nlohmann::json to_json(const rules::Violation& violation)
{
    return nlohmann::json{
        {    "rule", std::string(rules::rule_name(violation.rule))},
        {    "path",                                violation.path},
        {  "method",                              violation.method},
        { "message",                             violation.message},
        {"severity", std::string(rules::severity_name(violation.severity))},
        {  "object",                              violation.object}
    };
}

nlohmann::json build_report(std::vector<rules::Violation> violations)
{
    sort_violations(violations);
    nlohmann::json report = nlohmann::json::array();
    for (const auto& violation : violations) {
        report.push_back(to_json(violation));
    }
    return report;
}

apiguard::Result<std::string> serialize_report(const nlohmann::json& report, bool pretty)
{
    try {
        // nlohmann::json objects are std::map backed, so keys come out sorted.
        return report.dump(pretty ? 2 : -1, ' ', false, nlohmann::json::error_handler_t::strict);
    } catch (const std::exception& ex) {
        return std::unexpected(apiguard::Error::make(
            "SerializationFailed", std::string("Failed to serialize report: ") + ex.what()));
    }
}

apiguard::VoidResult validate_report(const nlohmann::json& report, const std::filesystem::path& schema_dir)
{
    return common::validate_json(report, schema_dir / common::kViolationsSchema);
}

}  // namespace apiguard::report
