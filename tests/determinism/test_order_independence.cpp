/**
 * @file test_order_independence.cpp
 * @brief Argument order must never change the report
 *
 * Runs every analysis twice with the spec documents swapped and compares the
 * serialized reports byte for byte.
 */

#include "apiguard/analyzer.hpp"
#include "apiguard/diff.hpp"
#include "apiguard/report.hpp"
#include "apiguard/rules.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace apiguard::determinism::tests {
namespace {

namespace fs = std::filesystem;
using Json = nlohmann::json;

const fs::path kFixtureDir = APIGUARD_FIXTURE_DIR;

constexpr std::string_view kOrdersV120 = R"(
info:
  version: 1.2.0
paths:
  /orders:
    get:
      responses:
        "200": {description: ok}
  /orders/{id}:
    get:
      parameters:
        - name: id
          in: path
          schema: {type: string}
      responses:
        "200": {description: ok}
)";

constexpr std::string_view kOrdersV121 = R"(
info:
  version: 1.2.1
paths:
  /orders/{id}:
    get:
      parameters:
        - name: id
          in: path
          schema: {type: string}
      responses:
        "200": {description: ok}
)";

constexpr std::string_view kReportsV200 = R"(
info:
  version: 2.0.0
paths:
  /orders:
    get:
      responses:
        "200": {description: ok}
)";

constexpr std::string_view kReportsV201 = R"(
info:
  version: 2.0.1
paths:
  /orders:
    get:
      responses:
        "200": {description: ok}
  /reports:
    get:
      responses:
        "200": {description: ok}
)";

spec::SpecDocument make_document(std::string_view text, std::string source)
{
    auto tree = spec::yaml_to_json(text, source);
    EXPECT_TRUE(tree) << tree.error().message;
    auto document = spec::build_spec_document(*tree, std::move(source));
    EXPECT_TRUE(document) << document.error().message;
    return *document;
}

usage::UsageIndex make_usage(std::string_view log)
{
    auto records = usage::parse_usage_log(log, "logs.json");
    EXPECT_TRUE(records) << records.error().message;
    auto index = usage::build_usage_index(*records, "logs.json");
    EXPECT_TRUE(index) << index.error().message;
    return *index;
}

std::string render(const analyzer::AnalysisResult& result)
{
    auto text = report::serialize_report(report::build_report(result.violations));
    EXPECT_TRUE(text) << text.error().message;
    return *text;
}

std::string render_both_orders(std::string_view first_text,
                               std::string_view second_text,
                               const usage::UsageIndex& usage)
{
    auto forward = analyzer::analyze_documents(make_document(first_text, "a.yaml"),
                                               make_document(second_text, "b.yaml"),
                                               usage);
    auto backward = analyzer::analyze_documents(make_document(second_text, "b.yaml"),
                                                make_document(first_text, "a.yaml"),
                                                usage);
    const std::string forward_text = render(forward);
    EXPECT_EQ(forward_text, render(backward));
    return forward_text;
}

}  // namespace

TEST(OrderIndependenceTest, RemovedUsedEndpointWithPatchBump)
{
    const auto usage = make_usage(R"([{"path": "/orders", "method": "GET"}])");
    const Json report = Json::parse(render_both_orders(kOrdersV120, kOrdersV121, usage));

    ASSERT_EQ(report.size(), 2U);
    EXPECT_EQ(report[0]["rule"], "ENDPOINT_REMOVED");
    EXPECT_EQ(report[0]["path"], "/orders");
    EXPECT_EQ(report[0]["method"], "GET");
    EXPECT_EQ(report[0]["severity"], "HIGH");
    EXPECT_EQ(report[1]["rule"], "SEMVER_MISMATCH");
    EXPECT_EQ(report[1]["message"], "expected major got patch");
    EXPECT_EQ(report[1]["object"]["baseline_version"], "1.2.0");
    EXPECT_EQ(report[1]["object"]["candidate_version"], "1.2.1");
}

TEST(OrderIndependenceTest, AdditiveChangeWithPatchBump)
{
    const usage::UsageIndex empty;
    const Json report = Json::parse(render_both_orders(kReportsV201, kReportsV200, empty));

    ASSERT_EQ(report.size(), 1U);
    EXPECT_EQ(report[0]["rule"], "SEMVER_MISMATCH");
    EXPECT_EQ(report[0]["message"], "expected minor got patch");
}

TEST(OrderIndependenceTest, IdenticalDocumentsProduceEmptyReport)
{
    const usage::UsageIndex empty;
    EXPECT_EQ(render_both_orders(kOrdersV120, kOrdersV120, empty), "[]");
}

TEST(OrderIndependenceTest, ViolationCountIsClassifierCountPlusAudit)
{
    const usage::UsageIndex empty;
    auto result = analyzer::analyze_documents(make_document(kOrdersV121, "b.yaml"),
                                              make_document(kOrdersV120, "a.yaml"),
                                              empty);
    auto pair = spec::resolve_pair(make_document(kOrdersV120, "a.yaml"),
                                   make_document(kOrdersV121, "b.yaml"));
    const auto changes = diff::diff_specs(pair.baseline, pair.candidate);
    const auto classified = rules::classify(changes, empty, rules::RunContext::from_pair(pair));

    EXPECT_EQ(result.change_count, changes.size());
    EXPECT_GE(result.violations.size(), classified.size());
    EXPECT_LE(result.violations.size(), classified.size() + 1);
}

TEST(OrderIndependenceTest, FixtureFilesInBothOrders)
{
    for (const std::string_view sample :
         {"sample1", "sample2", "sample3", "sample4", "sample5", "sample6", "sample7"}) {
        const fs::path dir = kFixtureDir / sample;
        const auto log = dir / "logs.json";
        const std::optional<fs::path> usage_log =
            fs::exists(log) ? std::optional<fs::path>(log) : std::nullopt;

        auto forward = analyzer::analyze({.first_spec = dir / "baseline.yaml",
                                          .second_spec = dir / "candidate.yaml",
                                          .usage_log = usage_log,
                                          .schema_dir = std::nullopt});
        auto backward = analyzer::analyze({.first_spec = dir / "candidate.yaml",
                                           .second_spec = dir / "baseline.yaml",
                                           .usage_log = usage_log,
                                           .schema_dir = std::nullopt});
        ASSERT_TRUE(forward) << sample << ": " << forward.error().message;
        ASSERT_TRUE(backward) << sample << ": " << backward.error().message;
        EXPECT_EQ(render(*forward), render(*backward)) << sample;
    }
}

}  // namespace apiguard::determinism::tests
