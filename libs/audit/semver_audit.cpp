/**
 * @file semver_audit.cpp
 * @brief Required version bump derivation and SEMVER_MISMATCH emission
 */

#include "apiguard/audit.hpp"

#include <format>
#include <string>
#include <utility>
#include <variant>

namespace apiguard::audit {

bool is_additive(const diff::Change& change)
{
    if (std::holds_alternative<diff::EndpointAdded>(change)
        || std::holds_alternative<diff::ResponseAdded>(change)) {
        return true;
    }
    if (const auto* added = std::get_if<diff::ParameterAdded>(&change)) {
        return !added->parameter.required;
    }
    return false;
}

ChangeSignals collect_signals(const std::vector<diff::Change>& changes)
{
    ChangeSignals signals;
    for (const auto& change : changes) {
        if (rules::rule_for(change)) {
            signals.breaking = true;
        } else if (is_additive(change)) {
            signals.additive = true;
        }
    }
    return signals;
}

semver::BumpLevel required_bump(const ChangeSignals& signals)
{
    if (signals.breaking) {
        return semver::BumpLevel::kMajor;
    }
    if (signals.additive) {
        return semver::BumpLevel::kMinor;
    }
    return semver::BumpLevel::kPatch;
}

bool bump_satisfies(semver::BumpLevel required, semver::BumpLevel actual)
{
    if (required == semver::BumpLevel::kPatch) {
        return true;
    }
    return actual >= required;
}

std::optional<rules::Violation> audit_versions(const spec::SpecPair& pair,
                                               const std::vector<diff::Change>& changes,
                                               const rules::RunContext& context)
{
    const auto required = required_bump(collect_signals(changes));
    const auto actual = semver::actual_bump(pair.baseline.version, pair.candidate.version);
    if (bump_satisfies(required, actual)) {
        return std::nullopt;
    }

    std::string message = std::format("expected {}", semver::bump_name(required));
    if (actual != semver::BumpLevel::kNone) {
        message += std::format(" got {}", semver::bump_name(actual));
    }

    nlohmann::json object = context.evidence();
    object["required_bump"] = std::string(semver::bump_name(required));
    object["actual_bump"] = std::string(semver::bump_name(actual));

    return rules::Violation{
        .rule = rules::Rule::kSemverMismatch,
        .path = std::string{},
        .method = std::string{},
        .message = std::move(message),
        .severity = rules::base_severity(rules::Rule::kSemverMismatch),
        .object = std::move(object),
    };
}

}  // namespace apiguard::audit
