#pragma once

/**
 * @file common.hpp
 * @brief Common types: error values and Result aliases
 */

#include <expected>
#include <string>
#include <utility>

namespace apiguard {

/**
 * @brief Error information for Result types
 */
struct Error
{
    std::string code;     ///< Machine-readable error code
    std::string message;  ///< Human-readable error message

    [[nodiscard]] static Error make(std::string code, std::string message)
    {
        return Error{.code = std::move(code), .message = std::move(message)};
    }
};

/**
 * @brief Result type using std::expected (C++23)
 * @tparam T Success value type
 */
template <typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Result type for void success using std::expected (C++23)
 */
using VoidResult = std::expected<void, Error>;

/// Error codes shared across modules
namespace error_code {

inline constexpr const char* kIOError = "IOError";
inline constexpr const char* kInvalidSpec = "InvalidSpec";
inline constexpr const char* kInvalidVersion = "InvalidVersion";
inline constexpr const char* kLogParse = "LogParse";

}  // namespace error_code

}  // namespace apiguard
