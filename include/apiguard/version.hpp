#pragma once

/**
 * @file version.hpp
 * @brief apiguard version information
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */

namespace apiguard {

/// apiguard version string
constexpr const char* kVersion = "0.1.0";

/// Build identifier
constexpr const char* kBuildId = "dev";

/// Rule set version (changes when a rule, severity or message template changes)
constexpr const char* kRuleSetVersion = "rules.v1";

/// Report wire format version
constexpr const char* kReportFormatVersion = "violations.v1";

}  // namespace apiguard
