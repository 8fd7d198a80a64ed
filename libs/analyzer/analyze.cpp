/**
 * @file analyze.cpp
 * @brief load -> resolve -> diff -> classify -> audit -> sort
 */

#include "apiguard/analyzer.hpp"

#include "apiguard/audit.hpp"
#include "apiguard/diff.hpp"
#include "apiguard/report.hpp"

#include <utility>

namespace apiguard::analyzer {

AnalysisResult analyze_documents(spec::SpecDocument first,
                                 spec::SpecDocument second,
                                 const usage::UsageIndex& usage)
{
    const auto pair = spec::resolve_pair(std::move(first), std::move(second));
    auto context = rules::RunContext::from_pair(pair);

    const auto changes = diff::diff_specs(pair.baseline, pair.candidate);
    auto violations = rules::classify(changes, usage, context);
    if (auto mismatch = audit::audit_versions(pair, changes, context)) {
        violations.push_back(std::move(*mismatch));
    }
    report::sort_violations(violations);

    return AnalysisResult{
        .context = std::move(context),
        .change_count = changes.size(),
        .required_bump = audit::required_bump(audit::collect_signals(changes)),
        .actual_bump = semver::actual_bump(pair.baseline.version, pair.candidate.version),
        .violations = std::move(violations),
    };
}

apiguard::Result<AnalysisResult> analyze(const AnalyzeOptions& options)
{
    auto first = spec::load_spec_document(options.first_spec);
    if (!first) {
        return std::unexpected(first.error());
    }
    auto second = spec::load_spec_document(options.second_spec);
    if (!second) {
        return std::unexpected(second.error());
    }

    usage::UsageIndex usage;
    if (options.usage_log) {
        auto loaded = usage::load_usage_log(*options.usage_log, options.schema_dir);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        usage = std::move(*loaded);
    }

    return analyze_documents(std::move(*first), std::move(*second), usage);
}

}  // namespace apiguard::analyzer
