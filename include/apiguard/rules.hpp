#pragma once

/**
 * @file rules.hpp
 * @brief Compatibility rules, severities and the rule classifier
 */

#include "apiguard/diff.hpp"
#include "apiguard/spec_model.hpp"
#include "apiguard/usage.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace apiguard::rules {

/**
 * Closed rule set
 *
 * Naming convention: kPascalCase for enum constants (Google C++ Style Guide)
 */
enum class Rule {
    kEndpointRemoved,
    kParamRequiredAdded,
    kParamTypeChanged,
    kResponse200Removed,
    kSemverMismatch
};

enum class Severity {
    kLow,
    kMedium,
    kHigh
};

/// Wire name, e.g. "ENDPOINT_REMOVED"
[[nodiscard]] std::string_view rule_name(Rule rule);

/// "LOW", "MEDIUM" or "HIGH"
[[nodiscard]] std::string_view severity_name(Severity severity);

[[nodiscard]] Severity base_severity(Rule rule);

/**
 * Usage-based escalation: one level up when the endpoint saw traffic,
 * capped at kHigh.
 */
[[nodiscard]] constexpr Severity escalate(Severity base, bool was_used) noexcept
{
    if (!was_used || base == Severity::kHigh) {
        return base;
    }
    return base == Severity::kLow ? Severity::kMedium : Severity::kHigh;
}

/**
 * @brief Identifiers carried in every violation's evidence object
 */
struct RunContext
{
    std::string baseline_file;
    std::string candidate_file;
    std::string baseline_version;
    std::string candidate_version;

    [[nodiscard]] static RunContext from_pair(const spec::SpecPair& pair);

    /// Evidence object holding the four identifiers
    [[nodiscard]] nlohmann::json evidence() const;
};

struct Violation
{
    Rule rule = Rule::kEndpointRemoved;
    std::string path;    ///< Empty for document-level rules
    std::string method;  ///< Empty for document-level rules
    std::string message;
    Severity severity = Severity::kHigh;
    nlohmann::json object = nlohmann::json::object();  ///< Evidence
};

/**
 * Rule a raw change triggers, if any.
 * Additions, removals of non-200 responses and parameter relaxations trigger none.
 */
[[nodiscard]] std::optional<Rule> rule_for(const diff::Change& change);

/**
 * Turn raw changes into violations, one per triggering change, escalating
 * severity from observed usage.
 */
[[nodiscard]] std::vector<Violation> classify(const std::vector<diff::Change>& changes,
                                              const usage::UsageIndex& usage,
                                              const RunContext& context);

}  // namespace apiguard::rules
