/**
 * @file usage_index.cpp
 * @brief Usage log parsing and (path, method) lookup
 */

#include "apiguard/usage.hpp"

#include "apiguard/schema_validate.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <format>
#include <fstream>
#include <iterator>
#include <ranges>
#include <utility>

namespace apiguard::usage {

namespace {

[[nodiscard]] apiguard::Error log_error(std::string_view source, std::string_view detail)
{
    return apiguard::Error::make(apiguard::error_code::kLogParse,
                                 std::format("Invalid usage log {}: {}", source, detail));
}

[[nodiscard]] std::string to_upper(std::string_view input)
{
    std::string result(input);
    std::ranges::transform(result, result.begin(), [](unsigned char c) noexcept {
        return static_cast<char>(std::toupper(c));
    });
    return result;
}

[[nodiscard]] bool is_blank(std::string_view line)
{
    return std::ranges::all_of(line, [](unsigned char c) noexcept { return std::isspace(c) != 0; });
}

[[nodiscard]] std::vector<std::string_view> split_segments(std::string_view path)
{
    std::vector<std::string_view> segments;
    for (auto part : path | std::views::split('/')) {
        segments.emplace_back(part.begin(), part.end());
    }
    return segments;
}

[[nodiscard]] bool is_template_segment(std::string_view segment)
{
    return segment.size() >= 2 && segment.front() == '{' && segment.back() == '}';
}

[[nodiscard]] bool matches_template(std::string_view templ, std::string_view concrete)
{
    auto templ_segments = split_segments(templ);
    auto concrete_segments = split_segments(concrete);
    if (templ_segments.size() != concrete_segments.size()) {
        return false;
    }
    for (std::size_t i = 0; i < templ_segments.size(); ++i) {
        if (is_template_segment(templ_segments[i])) {
            if (concrete_segments[i].empty()) {
                return false;
            }
            continue;
        }
        if (templ_segments[i] != concrete_segments[i]) {
            return false;
        }
    }
    return true;
}

[[nodiscard]] apiguard::Result<nlohmann::json> parse_json_lines(std::string_view text,
                                                                std::string_view source)
{
    nlohmann::json records = nlohmann::json::array();
    std::size_t line_no = 0;
    for (auto part : text | std::views::split('\n')) {
        ++line_no;
        std::string_view line(part.begin(), part.end());
        if (is_blank(line)) {
            continue;
        }
        try {
            records.push_back(nlohmann::json::parse(line.begin(), line.end()));
        } catch (const std::exception& ex) {
            return std::unexpected(
                log_error(source, std::format("line {} is not valid JSON: {}", line_no, ex.what())));
        }
    }
    return records;
}

}  // namespace

void UsageIndex::record(std::string_view path, std::string_view method, std::uint64_t count)
{
    m_counts[Key{.path = std::string(path), .method = to_upper(method)}] += count;
}

std::uint64_t UsageIndex::count(std::string_view path, std::string_view method) const
{
    const std::string wanted_method = to_upper(method);
    if (!std::ranges::any_of(split_segments(path), is_template_segment)) {
        auto it = m_counts.find(Key{.path = std::string(path), .method = wanted_method});
        return it == m_counts.end() ? 0 : it->second;
    }
    std::uint64_t total = 0;
    for (const auto& [key, observed] : m_counts) {
        if (key.method == wanted_method && matches_template(path, key.path)) {
            total += observed;
        }
    }
    return total;
}

bool UsageIndex::was_used(std::string_view path, std::string_view method) const
{
    return count(path, method) > 0;
}

std::vector<UsageRecord> UsageIndex::records() const
{
    std::vector<UsageRecord> result;
    result.reserve(m_counts.size());
    for (const auto& [key, observed] : m_counts) {
        result.push_back(UsageRecord{.path = key.path, .method = key.method, .count = observed});
    }
    return result;
}

apiguard::Result<nlohmann::json> parse_usage_log(std::string_view text, std::string_view source)
{
    if (is_blank(text)) {
        return nlohmann::json::array();
    }
    nlohmann::json document;
    try {
        document = nlohmann::json::parse(text.begin(), text.end());
    } catch (const std::exception&) {
        // Not a single JSON value: JSON Lines.
        return parse_json_lines(text, source);
    }
    if (document.is_array()) {
        return document;
    }
    if (document.is_object()) {
        return nlohmann::json::array({std::move(document)});
    }
    return std::unexpected(log_error(source, "expected an array of records or JSON Lines"));
}

apiguard::Result<UsageIndex> build_usage_index(const nlohmann::json& records, std::string_view source)
{
    if (!records.is_array()) {
        return std::unexpected(log_error(source, "records must be an array"));
    }
    UsageIndex index;
    std::size_t position = 0;
    for (const auto& entry : records) {
        if (!entry.is_object()) {
            return std::unexpected(log_error(source, std::format("record {} is not an object", position)));
        }
        if (!entry.contains("path") || !entry.at("path").is_string()) {
            return std::unexpected(
                log_error(source, std::format("record {} has no string 'path'", position)));
        }
        if (!entry.contains("method") || !entry.at("method").is_string()) {
            return std::unexpected(
                log_error(source, std::format("record {} has no string 'method'", position)));
        }
        const auto& path = entry.at("path").get_ref<const std::string&>();
        const auto& method = entry.at("method").get_ref<const std::string&>();
        if (path.empty() || method.empty()) {
            return std::unexpected(
                log_error(source, std::format("record {} has an empty 'path' or 'method'", position)));
        }
        index.record(path, method);
        ++position;
    }
    return index;
}

apiguard::Result<UsageIndex> load_usage_log(const std::filesystem::path& path,
                                            const std::optional<std::filesystem::path>& schema_dir)
{
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(apiguard::Error::make(apiguard::error_code::kIOError,
                                                     "Failed to open usage log: " + path.string()));
    }
    std::string text{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    if (in.bad()) {
        return std::unexpected(apiguard::Error::make(apiguard::error_code::kIOError,
                                                     "Failed to read usage log: " + path.string()));
    }

    auto records = parse_usage_log(text, path.string());
    if (!records) {
        return std::unexpected(records.error());
    }
    if (schema_dir) {
        auto schema_path = *schema_dir / common::kUsageLogSchema;
        if (auto valid = common::validate_json(*records, schema_path); !valid) {
            if (valid.error().code != "SchemaValidationFailed") {
                return std::unexpected(valid.error());
            }
            return std::unexpected(log_error(path.string(), valid.error().message));
        }
    }
    return build_usage_index(*records, path.string());
}

}  // namespace apiguard::usage
