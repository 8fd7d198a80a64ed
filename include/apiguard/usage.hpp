#pragma once

/**
 * @file usage.hpp
 * @brief Observed traffic index: (path, method) -> call count
 */

#include "apiguard/common.hpp"

#include <compare>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace apiguard::usage {

/**
 * @brief Aggregated observations for one (path, method)
 */
struct UsageRecord
{
    std::string path;
    std::string method;  ///< Uppercase HTTP verb
    std::uint64_t count = 0;
};

class UsageIndex
{
public:
    /// Add @p count observations; the method is uppercased
    void record(std::string_view path, std::string_view method, std::uint64_t count = 1);

    /**
     * Observed calls for an endpoint.
     * A path with "{name}" segments also counts every logged concrete path
     * that matches it segment by segment.
     */
    [[nodiscard]] std::uint64_t count(std::string_view path, std::string_view method) const;

    /// True iff count(path, method) > 0
    [[nodiscard]] bool was_used(std::string_view path, std::string_view method) const;

    [[nodiscard]] bool empty() const { return m_counts.empty(); }

    /// Aggregated records ordered by (path, method)
    [[nodiscard]] std::vector<UsageRecord> records() const;

private:
    struct Key
    {
        std::string path;
        std::string method;

        auto operator<=>(const Key&) const = default;
    };

    std::map<Key, std::uint64_t> m_counts;
};

/**
 * Split a usage log text into records.
 * Accepts a JSON array of records or JSON Lines (one record per line).
 * @return JSON array of the raw records, or a LogParse error
 */
[[nodiscard]] apiguard::Result<nlohmann::json> parse_usage_log(std::string_view text,
                                                               std::string_view source);

/**
 * Fold raw records into an index. Every record must be an object with
 * string "path" and "method".
 */
[[nodiscard]] apiguard::Result<UsageIndex> build_usage_index(const nlohmann::json& records,
                                                             std::string_view source);

/**
 * Read a usage log file.
 * @param path Log file
 * @param schema_dir When set, records are validated against usage_log.v1.schema.json
 */
[[nodiscard]] apiguard::Result<UsageIndex>
load_usage_log(const std::filesystem::path& path,
               const std::optional<std::filesystem::path>& schema_dir = std::nullopt);

}  // namespace apiguard::usage
