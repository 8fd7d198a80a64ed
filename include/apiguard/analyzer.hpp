#pragma once

/**
 * @file analyzer.hpp
 * @brief End-to-end compatibility analysis: load, diff, classify, audit
 */

#include "apiguard/common.hpp"
#include "apiguard/rules.hpp"
#include "apiguard/semver.hpp"
#include "apiguard/spec_model.hpp"
#include "apiguard/usage.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <vector>

namespace apiguard::analyzer {

struct AnalyzeOptions
{
    std::filesystem::path first_spec;
    std::filesystem::path second_spec;
    std::optional<std::filesystem::path> usage_log;
    std::optional<std::filesystem::path> schema_dir;  ///< Enables usage log schema validation
};

struct AnalysisResult
{
    rules::RunContext context;
    std::size_t change_count = 0;
    semver::BumpLevel required_bump = semver::BumpLevel::kPatch;
    semver::BumpLevel actual_bump = semver::BumpLevel::kNone;
    std::vector<rules::Violation> violations;  ///< Sorted report order
};

/**
 * Analyze two already loaded documents in either order.
 */
[[nodiscard]] AnalysisResult analyze_documents(spec::SpecDocument first,
                                               spec::SpecDocument second,
                                               const usage::UsageIndex& usage);

/**
 * Load inputs from disk and analyze them. Any load failure aborts the run.
 */
[[nodiscard]] apiguard::Result<AnalysisResult> analyze(const AnalyzeOptions& options);

}  // namespace apiguard::analyzer
