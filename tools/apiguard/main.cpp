/**
 * @file main.cpp
 * @brief apiguard CLI entry point
 *
 * Usage: apiguard [options] <file1> <file2> [logs_file]
 *
 * The two spec files may be given in either order; the one with the lower
 * declared version is the baseline.
 */

#include "apiguard/analyzer.hpp"
#include "apiguard/common.hpp"
#include "apiguard/report.hpp"
#include "apiguard/version.hpp"

#include <exception>
#include <filesystem>
#include <fstream>
#include <optional>
#include <print>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

void print_version()
{
    std::println("apiguard {} ({})", apiguard::kVersion, apiguard::kBuildId);
    std::println("  rules:  {}", apiguard::kRuleSetVersion);
    std::println("  report: {}", apiguard::kReportFormatVersion);
}

void print_help()
{
    std::print(R"(apiguard - API compatibility checker

Usage: apiguard [options] <file1> <file2> [logs_file]

  <file1> <file2>     API spec documents (YAML or JSON) in either order;
                      the lower declared version is the baseline
  [logs_file]         Optional usage log (JSON array or JSON Lines of
                      {"path": ..., "method": ...} records)

Options:
  --output FILE, -o   Write the JSON report to FILE instead of stdout
  --pretty            Indent the JSON report
  --schema-dir DIR    Validate the usage log and the report against the
                      schemas in DIR
  --verbose           Print progress to stderr
  --help, -h          Show this help message
  --version, -v       Show version information

Exit status: 0 on success (with or without violations), 1 on analysis
failure, 2 on usage error.
)");
}

struct CliOptions
{
    std::vector<std::string> positional;
    std::optional<std::string> output;
    std::optional<std::string> schema_dir;
    bool pretty;
    bool verbose;
    bool show_help;
    bool show_version;
};

// CLI parsing signature is stable.
// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
[[nodiscard]] auto read_option_value(std::span<char*> args,
                                     std::size_t index,
                                     std::string_view option) -> apiguard::Result<std::string>
{
    const std::size_t value_index = index + 1;
    if (value_index >= args.size() || args[value_index] == nullptr) {
        return std::unexpected(
            apiguard::Error::make("MissingArgument",
                                  std::string("Missing value for option: ") + std::string(option)));
    }
    return std::string(args[value_index]);
}

[[nodiscard]] apiguard::Result<CliOptions> parse_args(std::span<char*> args)
{
    CliOptions options{.positional = {},
                       .output = std::nullopt,
                       .schema_dir = std::nullopt,
                       .pretty = false,
                       .verbose = false,
                       .show_help = false,
                       .show_version = false};
    bool options_done = false;
    for (std::size_t idx = 0; idx < args.size(); ++idx) {
        if (args[idx] == nullptr) {
            continue;
        }
        std::string_view arg(args[idx]);
        if (options_done || !arg.starts_with("-") || arg == "-") {
            options.positional.emplace_back(arg);
            continue;
        }
        if (arg == "--") {
            options_done = true;
            continue;
        }
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        if (arg == "--version" || arg == "-v") {
            options.show_version = true;
            continue;
        }
        if (arg == "--pretty") {
            options.pretty = true;
            continue;
        }
        if (arg == "--verbose") {
            options.verbose = true;
            continue;
        }
        if (arg == "--output" || arg == "-o" || arg == "--schema-dir") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            if (arg == "--schema-dir") {
                options.schema_dir = *value;
            } else {
                options.output = *value;
            }
            ++idx;
            continue;
        }
        return std::unexpected(
            apiguard::Error::make("InvalidArgument", "Unknown option: " + std::string(arg)));
    }
    return options;
}

[[nodiscard]] apiguard::VoidResult write_output(const std::filesystem::path& path,
                                                const std::string& text)
{
    std::ofstream out(path);
    if (!out) {
        return std::unexpected(
            apiguard::Error::make(apiguard::error_code::kIOError,
                                  "Failed to open output file: " + path.string()));
    }
    out << text << "\n";
    if (!out) {
        return std::unexpected(
            apiguard::Error::make(apiguard::error_code::kIOError,
                                  "Failed to write output file: " + path.string()));
    }
    return {};
}

[[nodiscard]] int run_analysis(const CliOptions& options)
{
    apiguard::analyzer::AnalyzeOptions analyze_options{
        .first_spec = options.positional.at(0),
        .second_spec = options.positional.at(1),
        .usage_log = options.positional.size() > 2
                         ? std::optional<std::filesystem::path>(options.positional.at(2))
                         : std::nullopt,
        .schema_dir = options.schema_dir ? std::optional<std::filesystem::path>(*options.schema_dir)
                                         : std::nullopt,
    };

    auto result = apiguard::analyzer::analyze(analyze_options);
    if (!result) {
        std::println(stderr, "Error: {} ({})", result.error().message, result.error().code);
        return kExitFailure;
    }
    if (options.verbose) {
        std::println(stderr,
                     "[load] baseline {} ({}), candidate {} ({})",
                     result->context.baseline_file,
                     result->context.baseline_version,
                     result->context.candidate_file,
                     result->context.candidate_version);
        std::println(stderr, "[diff] {} change(s)", result->change_count);
        std::println(stderr,
                     "[audit] required {}, declared {}",
                     apiguard::semver::bump_name(result->required_bump),
                     apiguard::semver::bump_name(result->actual_bump));
        std::println(stderr, "[report] {} violation(s)", result->violations.size());
    }

    auto report = apiguard::report::build_report(std::move(result->violations));
    if (options.schema_dir) {
        if (auto valid = apiguard::report::validate_report(report, *options.schema_dir); !valid) {
            std::println(stderr, "Error: report failed schema validation: {}", valid.error().message);
            return kExitFailure;
        }
    }
    auto text = apiguard::report::serialize_report(report, options.pretty);
    if (!text) {
        std::println(stderr, "Error: {}", text.error().message);
        return kExitFailure;
    }

    if (options.output) {
        if (auto written = write_output(*options.output, *text); !written) {
            std::println(stderr, "Error: {}", written.error().message);
            return kExitFailure;
        }
        return kExitOk;
    }
    std::println("{}", *text);
    return kExitOk;
}

[[nodiscard]] int run_cli(int argc, char** argv)
{
    try {
        auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
        auto options = parse_args(args.empty() ? args : args.subspan(1));
        if (!options) {
            std::println(stderr, "Error: {}", options.error().message);
            print_help();
            return kExitUsage;
        }
        if (options->show_help) {
            print_help();
            return kExitOk;
        }
        if (options->show_version) {
            print_version();
            return kExitOk;
        }
        if (options->positional.size() < 2 || options->positional.size() > 3) {
            std::println(stderr, "Error: expected two spec files and an optional usage log");
            print_help();
            return kExitUsage;
        }
        return run_analysis(*options);
    } catch (const std::exception& ex) {
        try {
            std::println(stderr, "Error: {}", ex.what());
        } catch (...) {
            std::terminate();
        }
        return kExitFailure;
    } catch (...) {
        try {
            std::println(stderr, "Error: unknown exception");
        } catch (...) {
            std::terminate();
        }
        return kExitFailure;
    }
}

}  // namespace

int main(int argc, char** argv)
{
    return run_cli(argc, argv);
}
