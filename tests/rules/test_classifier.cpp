/**
 * @file test_classifier.cpp
 * @brief Rule classification, severity and escalation tests
 */

#include "apiguard/rules.hpp"

#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

namespace apiguard::rules::test {

namespace {

spec::EndpointKey orders_get()
{
    return spec::EndpointKey{.path = "/orders", .method = "GET"};
}

spec::Parameter param(std::string name, bool required, spec::ParamType type)
{
    return spec::Parameter{.name = std::move(name), .location = "query", .required = required, .type = type};
}

RunContext context()
{
    return RunContext{.baseline_file = "baseline.yaml",
                      .candidate_file = "candidate.yaml",
                      .baseline_version = "1.2.0",
                      .candidate_version = "1.2.1"};
}

}  // namespace

TEST(RuleNamesTest, WireNames)
{
    EXPECT_EQ(rule_name(Rule::kEndpointRemoved), "ENDPOINT_REMOVED");
    EXPECT_EQ(rule_name(Rule::kParamRequiredAdded), "PARAM_REQUIRED_ADDED");
    EXPECT_EQ(rule_name(Rule::kParamTypeChanged), "PARAM_TYPE_CHANGED");
    EXPECT_EQ(rule_name(Rule::kResponse200Removed), "RESPONSE_200_REMOVED");
    EXPECT_EQ(rule_name(Rule::kSemverMismatch), "SEMVER_MISMATCH");
    EXPECT_EQ(severity_name(Severity::kLow), "LOW");
    EXPECT_EQ(severity_name(Severity::kMedium), "MEDIUM");
    EXPECT_EQ(severity_name(Severity::kHigh), "HIGH");
}

TEST(SeverityTest, BaseSeverities)
{
    EXPECT_EQ(base_severity(Rule::kEndpointRemoved), Severity::kMedium);
    EXPECT_EQ(base_severity(Rule::kParamRequiredAdded), Severity::kHigh);
    EXPECT_EQ(base_severity(Rule::kParamTypeChanged), Severity::kHigh);
    EXPECT_EQ(base_severity(Rule::kResponse200Removed), Severity::kHigh);
    EXPECT_EQ(base_severity(Rule::kSemverMismatch), Severity::kHigh);
}

TEST(ViolationTest, DefaultConstructedValuesAreDefined)
{
    const Violation violation;
    EXPECT_EQ(violation.rule, Rule::kEndpointRemoved);
    EXPECT_EQ(violation.severity, Severity::kHigh);
    EXPECT_TRUE(violation.object.is_object());
    EXPECT_TRUE(violation.object.empty());
    EXPECT_TRUE(violation.path.empty());
    EXPECT_TRUE(violation.method.empty());
}

TEST(SeverityTest, EscalationIsOneStepCappedAtHigh)
{
    static_assert(escalate(Severity::kMedium, true) == Severity::kHigh);
    EXPECT_EQ(escalate(Severity::kLow, true), Severity::kMedium);
    EXPECT_EQ(escalate(Severity::kMedium, true), Severity::kHigh);
    EXPECT_EQ(escalate(Severity::kHigh, true), Severity::kHigh);
    EXPECT_EQ(escalate(Severity::kLow, false), Severity::kLow);
    EXPECT_EQ(escalate(Severity::kMedium, false), Severity::kMedium);
}

TEST(RuleForTest, OnlyBreakingChangesTriggerRules)
{
    const auto key = orders_get();
    EXPECT_EQ(rule_for(diff::EndpointRemoved{.endpoint = key}), Rule::kEndpointRemoved);
    EXPECT_FALSE(rule_for(diff::EndpointAdded{.endpoint = key}));

    EXPECT_EQ(rule_for(diff::ParameterAdded{.endpoint = key,
                                            .parameter = param("q", true, spec::ParamType::kString)}),
              Rule::kParamRequiredAdded);
    EXPECT_FALSE(rule_for(
        diff::ParameterAdded{.endpoint = key, .parameter = param("q", false, spec::ParamType::kString)}));
    EXPECT_FALSE(rule_for(
        diff::ParameterRemoved{.endpoint = key, .parameter = param("q", true, spec::ParamType::kString)}));

    EXPECT_EQ(rule_for(diff::ParameterRequirednessChanged{
                  .endpoint = key,
                  .before = param("q", false, spec::ParamType::kString),
                  .after = param("q", true, spec::ParamType::kString)}),
              Rule::kParamRequiredAdded);
    EXPECT_FALSE(rule_for(
        diff::ParameterRequirednessChanged{.endpoint = key,
                                           .before = param("q", true, spec::ParamType::kString),
                                           .after = param("q", false, spec::ParamType::kString)}));

    EXPECT_EQ(rule_for(diff::ParameterTypeChanged{.endpoint = key,
                                                  .before = param("q", false, spec::ParamType::kString),
                                                  .after = param("q", false, spec::ParamType::kInteger)}),
              Rule::kParamTypeChanged);

    EXPECT_EQ(rule_for(diff::ResponseRemoved{.endpoint = key, .status_code = "200"}),
              Rule::kResponse200Removed);
    EXPECT_FALSE(rule_for(diff::ResponseRemoved{.endpoint = key, .status_code = "404"}));
    EXPECT_FALSE(rule_for(diff::ResponseAdded{.endpoint = key, .status_code = "200"}));
}

TEST(ClassifierTest, EndpointRemovedEscalatesWithUsage)
{
    std::vector<diff::Change> changes = {diff::EndpointRemoved{.endpoint = orders_get()}};

    usage::UsageIndex unused;
    auto quiet = classify(changes, unused, context());
    ASSERT_EQ(quiet.size(), 1U);
    EXPECT_EQ(quiet[0].severity, Severity::kMedium);
    EXPECT_EQ(quiet[0].object.at("usage_count"), 0);

    usage::UsageIndex used;
    used.record("/orders", "GET", 3);
    auto busy = classify(changes, used, context());
    ASSERT_EQ(busy.size(), 1U);
    const auto& violation = busy[0];
    EXPECT_EQ(violation.rule, Rule::kEndpointRemoved);
    EXPECT_EQ(violation.severity, Severity::kHigh);
    EXPECT_EQ(violation.path, "/orders");
    EXPECT_EQ(violation.method, "GET");
    EXPECT_EQ(violation.message, "endpoint removed: GET /orders");
    EXPECT_EQ(violation.object.at("usage_count"), 3);
    EXPECT_EQ(violation.object.at("baseline_file"), "baseline.yaml");
    EXPECT_EQ(violation.object.at("candidate_file"), "candidate.yaml");
    EXPECT_EQ(violation.object.at("baseline_version"), "1.2.0");
    EXPECT_EQ(violation.object.at("candidate_version"), "1.2.1");
}

TEST(ClassifierTest, MessagesAndEvidencePerRule)
{
    const auto key = orders_get();
    std::vector<diff::Change> changes = {
        diff::ParameterAdded{.endpoint = key, .parameter = param("tenant", true, spec::ParamType::kString)},
        diff::ParameterRequirednessChanged{.endpoint = key,
                                           .before = param("limit", false, spec::ParamType::kInteger),
                                           .after = param("limit", true, spec::ParamType::kInteger)},
        diff::ParameterTypeChanged{.endpoint = key,
                                   .before = param("limit", true, spec::ParamType::kInteger),
                                   .after = param("limit", true, spec::ParamType::kString)},
        diff::ResponseRemoved{.endpoint = key, .status_code = "200"},
        diff::ParameterAdded{.endpoint = key, .parameter = param("expand", false, spec::ParamType::kBoolean)},
        diff::EndpointAdded{.endpoint = spec::EndpointKey{.path = "/reports", .method = "GET"}},
    };
    auto violations = classify(changes, usage::UsageIndex{}, context());
    ASSERT_EQ(violations.size(), 4U);

    EXPECT_EQ(violations[0].rule, Rule::kParamRequiredAdded);
    EXPECT_EQ(violations[0].message, "required parameter added: tenant");
    EXPECT_EQ(violations[0].object.at("previous"), "absent");
    EXPECT_EQ(violations[0].severity, Severity::kHigh);

    EXPECT_EQ(violations[1].rule, Rule::kParamRequiredAdded);
    EXPECT_EQ(violations[1].message, "required parameter added: limit");
    EXPECT_EQ(violations[1].object.at("previous"), "optional");
    EXPECT_EQ(violations[1].object.at("location"), "query");

    EXPECT_EQ(violations[2].rule, Rule::kParamTypeChanged);
    EXPECT_EQ(violations[2].message, "parameter type changed: limit from integer to string");
    EXPECT_EQ(violations[2].object.at("old_type"), "integer");
    EXPECT_EQ(violations[2].object.at("new_type"), "string");

    EXPECT_EQ(violations[3].rule, Rule::kResponse200Removed);
    EXPECT_EQ(violations[3].message, "success response removed: 200");
    EXPECT_EQ(violations[3].object.at("status_code"), "200");
}

}  // namespace apiguard::rules::test
