#pragma once

/**
 * @file semver.hpp
 * @brief Semantic version parsing, precedence and bump classification
 */

#include "apiguard/common.hpp"

#include <compare>
#include <string>
#include <string_view>

namespace apiguard::semver {

/**
 * @brief Parsed MAJOR.MINOR.PATCH[-prerelease][+build] version
 */
struct Version
{
    int major = 0;
    int minor = 0;
    int patch = 0;
    std::string prerelease;  ///< Dot-separated identifiers, empty for a release
    std::string build;       ///< Build metadata, ignored for precedence

    [[nodiscard]] std::string to_string() const;
};

/**
 * Version bump levels, ordered kNone < kPatch < kMinor < kMajor
 *
 * Naming convention: kPascalCase for enum constants (Google C++ Style Guide)
 */
enum class BumpLevel {
    kNone,
    kPatch,
    kMinor,
    kMajor
};

/**
 * Parse a semantic version string.
 * A leading 'v' or 'V' and surrounding whitespace are accepted.
 * @return Parsed version or an InvalidVersion error
 */
[[nodiscard]] apiguard::Result<Version> parse(std::string_view text);

/**
 * Compare two versions by SemVer 2.0.0 precedence (build metadata ignored)
 */
[[nodiscard]] std::strong_ordering compare(const Version& lhs, const Version& rhs);

/**
 * Most significant numeric component that increased from @p from to @p to.
 * kNone when no component increased (equal or pre-release-only difference).
 */
[[nodiscard]] BumpLevel actual_bump(const Version& from, const Version& to);

/**
 * "major", "minor", "patch" or "none"
 */
[[nodiscard]] std::string_view bump_name(BumpLevel level);

}  // namespace apiguard::semver
