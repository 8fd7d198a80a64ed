/**
 * @file classifier.cpp
 * @brief Maps raw diff records to compatibility rule violations
 */

#include "apiguard/rules.hpp"

#include <cstdint>
#include <format>
#include <utility>

namespace apiguard::rules {

namespace {

constexpr std::string_view kSuccessStatus = "200";

template <class... Ts>
struct Overloaded : Ts...
{
    using Ts::operator()...;
};

struct Finding
{
    std::string message;
    nlohmann::json extra = nlohmann::json::object();
};

[[nodiscard]] Finding describe(const diff::EndpointRemoved& change, std::uint64_t usage_count)
{
    return Finding{
        .message = std::format("endpoint removed: {} {}", change.endpoint.method, change.endpoint.path),
        .extra = {{"usage_count", usage_count}}};
}

[[nodiscard]] Finding describe_required(const spec::Parameter& parameter, std::string_view previous)
{
    return Finding{.message = std::format("required parameter added: {}", parameter.name),
                   .extra = {{"parameter", parameter.name},
                             {"location", parameter.location},
                             {"previous", std::string(previous)}}};
}

[[nodiscard]] Finding describe(const diff::ParameterTypeChanged& change)
{
    const auto old_type = spec::param_type_name(change.before.type);
    const auto new_type = spec::param_type_name(change.after.type);
    return Finding{.message = std::format("parameter type changed: {} from {} to {}",
                                          change.after.name,
                                          old_type,
                                          new_type),
                   .extra = {{"parameter", change.after.name},
                             {"location", change.after.location},
                             {"old_type", std::string(old_type)},
                             {"new_type", std::string(new_type)}}};
}

[[nodiscard]] Finding describe(const diff::ResponseRemoved& change)
{
    return Finding{.message = std::format("success response removed: {}", change.status_code),
                   .extra = {{"status_code", change.status_code}}};
}

[[nodiscard]] Finding describe_change(const diff::Change& change, const usage::UsageIndex& usage)
{
    return std::visit(
        Overloaded{
            [&usage](const diff::EndpointRemoved& removed) {
                return describe(removed, usage.count(removed.endpoint.path, removed.endpoint.method));
            },
            [](const diff::ParameterAdded& added) {
                return describe_required(added.parameter, "absent");
            },
            [](const diff::ParameterRequirednessChanged& changed) {
                return describe_required(changed.after, "optional");
            },
            [](const diff::ParameterTypeChanged& changed) { return describe(changed); },
            [](const diff::ResponseRemoved& removed) { return describe(removed); },
            [](const auto&) { return Finding{}; },
        },
        change);
}

}  // namespace

std::string_view rule_name(Rule rule)
{
    switch (rule) {
        case Rule::kEndpointRemoved:
            return "ENDPOINT_REMOVED";
        case Rule::kParamRequiredAdded:
            return "PARAM_REQUIRED_ADDED";
        case Rule::kParamTypeChanged:
            return "PARAM_TYPE_CHANGED";
        case Rule::kResponse200Removed:
            return "RESPONSE_200_REMOVED";
        case Rule::kSemverMismatch:
            return "SEMVER_MISMATCH";
    }
    return "UNKNOWN";
}

std::string_view severity_name(Severity severity)
{
    switch (severity) {
        case Severity::kLow:
            return "LOW";
        case Severity::kMedium:
            return "MEDIUM";
        case Severity::kHigh:
            return "HIGH";
    }
    return "UNKNOWN";
}

Severity base_severity(Rule rule)
{
    switch (rule) {
        case Rule::kEndpointRemoved:
            return Severity::kMedium;
        case Rule::kParamRequiredAdded:
        case Rule::kParamTypeChanged:
        case Rule::kResponse200Removed:
        case Rule::kSemverMismatch:
            return Severity::kHigh;
    }
    return Severity::kHigh;
}

RunContext RunContext::from_pair(const spec::SpecPair& pair)
{
    return RunContext{.baseline_file = pair.baseline.source_file,
                      .candidate_file = pair.candidate.source_file,
                      .baseline_version = pair.baseline.version_text,
                      .candidate_version = pair.candidate.version_text};
}

nlohmann::json RunContext::evidence() const
{
    return nlohmann::json{
        {    "baseline_file",     baseline_file},
        {   "candidate_file",    candidate_file},
        { "baseline_version",  baseline_version},
        {"candidate_version", candidate_version}
    };
}

std::optional<Rule> rule_for(const diff::Change& change)
{
    return std::visit(
        Overloaded{
            [](const diff::EndpointRemoved&) -> std::optional<Rule> { return Rule::kEndpointRemoved; },
            [](const diff::ParameterAdded& added) -> std::optional<Rule> {
                if (added.parameter.required) {
                    return Rule::kParamRequiredAdded;
                }
                return std::nullopt;
            },
            [](const diff::ParameterRequirednessChanged& changed) -> std::optional<Rule> {
                if (!changed.before.required && changed.after.required) {
                    return Rule::kParamRequiredAdded;
                }
                return std::nullopt;
            },
            [](const diff::ParameterTypeChanged&) -> std::optional<Rule> {
                return Rule::kParamTypeChanged;
            },
            [](const diff::ResponseRemoved& removed) -> std::optional<Rule> {
                if (removed.status_code == kSuccessStatus) {
                    return Rule::kResponse200Removed;
                }
                return std::nullopt;
            },
            [](const auto&) -> std::optional<Rule> { return std::nullopt; },
        },
        change);
}

std::vector<Violation> classify(const std::vector<diff::Change>& changes,
                                const usage::UsageIndex& usage,
                                const RunContext& context)
{
    std::vector<Violation> violations;
    for (const auto& change : changes) {
        auto rule = rule_for(change);
        if (!rule) {
            continue;
        }
        const auto& endpoint = diff::endpoint_of(change);
        auto finding = describe_change(change, usage);

        nlohmann::json object = context.evidence();
        object.update(finding.extra);

        violations.push_back(Violation{
            .rule = *rule,
            .path = endpoint.path,
            .method = endpoint.method,
            .message = std::move(finding.message),
            .severity = escalate(base_severity(*rule), usage.was_used(endpoint.path, endpoint.method)),
            .object = std::move(object),
        });
    }
    return violations;
}

}  // namespace apiguard::rules
