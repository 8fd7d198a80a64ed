#pragma once

/**
 * @file audit.hpp
 * @brief Semver audit: required bump vs. declared version delta
 */

#include "apiguard/diff.hpp"
#include "apiguard/rules.hpp"
#include "apiguard/semver.hpp"
#include "apiguard/spec_model.hpp"

#include <optional>
#include <vector>

namespace apiguard::audit {

struct ChangeSignals
{
    bool breaking = false;  ///< Some change triggers a rule
    bool additive = false;  ///< New endpoint, new optional parameter or new response code
};

/**
 * True for changes that extend the surface without breaking clients:
 * a new endpoint, a new optional parameter, or a new response code.
 */
[[nodiscard]] bool is_additive(const diff::Change& change);

[[nodiscard]] ChangeSignals collect_signals(const std::vector<diff::Change>& changes);

/**
 * major if breaking, else minor if additive, else patch
 */
[[nodiscard]] semver::BumpLevel required_bump(const ChangeSignals& signals);

/**
 * Whether the declared bump covers the required one. A required patch bump
 * is satisfied by an unchanged version; larger bumps are always accepted.
 */
[[nodiscard]] bool bump_satisfies(semver::BumpLevel required, semver::BumpLevel actual);

/**
 * Emit a SEMVER_MISMATCH violation when the candidate's version bump is
 * smaller than the changes require.
 */
[[nodiscard]] std::optional<rules::Violation> audit_versions(const spec::SpecPair& pair,
                                                             const std::vector<diff::Change>& changes,
                                                             const rules::RunContext& context);

}  // namespace apiguard::audit
