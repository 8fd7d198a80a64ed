/**
 * @file semver.cpp
 * @brief Semantic version parsing and precedence (SemVer 2.0.0)
 */

#include "apiguard/semver.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>
#include <ranges>
#include <system_error>
#include <vector>

namespace apiguard::semver {

namespace {

[[nodiscard]] std::string_view trim(std::string_view input)
{
    while (!input.empty() && std::isspace(static_cast<unsigned char>(input.front())) != 0) {
        input.remove_prefix(1);
    }
    while (!input.empty() && std::isspace(static_cast<unsigned char>(input.back())) != 0) {
        input.remove_suffix(1);
    }
    return input;
}

[[nodiscard]] apiguard::Error invalid_version(std::string_view text, std::string_view reason)
{
    return apiguard::Error::make(apiguard::error_code::kInvalidVersion,
                                 std::format("Invalid semantic version '{}': {}", text, reason));
}

[[nodiscard]] bool is_numeric(std::string_view part)
{
    return !part.empty() && std::ranges::all_of(part, [](unsigned char c) noexcept {
        return std::isdigit(c) != 0;
    });
}

[[nodiscard]] bool is_identifier(std::string_view part)
{
    return !part.empty() && std::ranges::all_of(part, [](unsigned char c) noexcept {
        return std::isalnum(c) != 0 || c == '-';
    });
}

[[nodiscard]] std::vector<std::string_view> split_dots(std::string_view text)
{
    std::vector<std::string_view> parts;
    for (auto part : text | std::views::split('.')) {
        parts.emplace_back(part.begin(), part.end());
    }
    return parts;
}

[[nodiscard]] apiguard::Result<int> parse_component(std::string_view part, std::string_view text)
{
    if (!is_numeric(part)) {
        return std::unexpected(invalid_version(text, "components must be non-negative integers"));
    }
    if (part.size() > 1 && part.front() == '0') {
        return std::unexpected(invalid_version(text, "numeric components must not have leading zeros"));
    }
    int value = 0;
    auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), value);
    if (ec != std::errc{} || ptr != part.data() + part.size()) {
        return std::unexpected(invalid_version(text, "numeric component out of range"));
    }
    return value;
}

[[nodiscard]] apiguard::VoidResult validate_identifiers(std::string_view section,
                                                        std::string_view text,
                                                        bool reject_leading_zero)
{
    if (section.empty()) {
        return std::unexpected(invalid_version(text, "empty pre-release or build section"));
    }
    for (auto part : split_dots(section)) {
        if (!is_identifier(part)) {
            return std::unexpected(invalid_version(text, "malformed pre-release or build identifier"));
        }
        if (reject_leading_zero && is_numeric(part) && part.size() > 1 && part.front() == '0') {
            return std::unexpected(
                invalid_version(text, "numeric pre-release identifiers must not have leading zeros"));
        }
    }
    return {};
}

[[nodiscard]] std::strong_ordering compare_identifier(std::string_view lhs, std::string_view rhs)
{
    const bool lhs_numeric = is_numeric(lhs);
    const bool rhs_numeric = is_numeric(rhs);
    if (lhs_numeric && rhs_numeric) {
        if (lhs.size() != rhs.size()) {
            return lhs.size() <=> rhs.size();
        }
        return lhs <=> rhs;
    }
    // Numeric identifiers have lower precedence than alphanumeric ones.
    if (lhs_numeric != rhs_numeric) {
        return lhs_numeric ? std::strong_ordering::less : std::strong_ordering::greater;
    }
    return lhs <=> rhs;
}

}  // namespace

std::string Version::to_string() const
{
    std::string result = std::format("{}.{}.{}", major, minor, patch);
    if (!prerelease.empty()) {
        result += "-" + prerelease;
    }
    if (!build.empty()) {
        result += "+" + build;
    }
    return result;
}

apiguard::Result<Version> parse(std::string_view text)
{
    std::string_view input = trim(text);
    if (input.empty()) {
        return std::unexpected(invalid_version(text, "empty version string"));
    }
    if (input.front() == 'v' || input.front() == 'V') {
        input.remove_prefix(1);
    }

    Version version;
    if (auto plus = input.find('+'); plus != std::string_view::npos) {
        std::string_view build = input.substr(plus + 1);
        if (auto valid = validate_identifiers(build, text, false); !valid) {
            return std::unexpected(valid.error());
        }
        version.build = std::string(build);
        input = input.substr(0, plus);
    }
    if (auto dash = input.find('-'); dash != std::string_view::npos) {
        std::string_view prerelease = input.substr(dash + 1);
        if (auto valid = validate_identifiers(prerelease, text, true); !valid) {
            return std::unexpected(valid.error());
        }
        version.prerelease = std::string(prerelease);
        input = input.substr(0, dash);
    }

    auto core = split_dots(input);
    if (core.size() != 3) {
        return std::unexpected(invalid_version(text, "expected MAJOR.MINOR.PATCH"));
    }
    auto major = parse_component(core[0], text);
    if (!major) {
        return std::unexpected(major.error());
    }
    auto minor = parse_component(core[1], text);
    if (!minor) {
        return std::unexpected(minor.error());
    }
    auto patch = parse_component(core[2], text);
    if (!patch) {
        return std::unexpected(patch.error());
    }
    version.major = *major;
    version.minor = *minor;
    version.patch = *patch;
    return version;
}

std::strong_ordering compare(const Version& lhs, const Version& rhs)
{
    if (auto cmp = lhs.major <=> rhs.major; cmp != 0) {
        return cmp;
    }
    if (auto cmp = lhs.minor <=> rhs.minor; cmp != 0) {
        return cmp;
    }
    if (auto cmp = lhs.patch <=> rhs.patch; cmp != 0) {
        return cmp;
    }
    // A release has higher precedence than any of its pre-releases.
    if (lhs.prerelease.empty() || rhs.prerelease.empty()) {
        if (lhs.prerelease.empty() && rhs.prerelease.empty()) {
            return std::strong_ordering::equal;
        }
        return lhs.prerelease.empty() ? std::strong_ordering::greater : std::strong_ordering::less;
    }
    auto lhs_parts = split_dots(lhs.prerelease);
    auto rhs_parts = split_dots(rhs.prerelease);
    const std::size_t common = std::min(lhs_parts.size(), rhs_parts.size());
    for (std::size_t i = 0; i < common; ++i) {
        if (auto cmp = compare_identifier(lhs_parts[i], rhs_parts[i]); cmp != 0) {
            return cmp;
        }
    }
    return lhs_parts.size() <=> rhs_parts.size();
}

BumpLevel actual_bump(const Version& from, const Version& to)
{
    if (to.major > from.major) {
        return BumpLevel::kMajor;
    }
    if (to.major < from.major) {
        return BumpLevel::kNone;
    }
    if (to.minor > from.minor) {
        return BumpLevel::kMinor;
    }
    if (to.minor < from.minor) {
        return BumpLevel::kNone;
    }
    if (to.patch > from.patch) {
        return BumpLevel::kPatch;
    }
    return BumpLevel::kNone;
}

std::string_view bump_name(BumpLevel level)
{
    switch (level) {
        case BumpLevel::kMajor:
            return "major";
        case BumpLevel::kMinor:
            return "minor";
        case BumpLevel::kPatch:
            return "patch";
        case BumpLevel::kNone:
            break;
    }
    return "none";
}

}  // namespace apiguard::semver
