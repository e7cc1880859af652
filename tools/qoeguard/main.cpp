/**
 * @file main.cpp
 * @brief QoE-Guard CLI entry point
 *
 * Commands:
 *   compare       - Score a candidate payload against a baseline
 *   diff          - Print the change list only
 *   check-config  - Validate a configuration file
 *   version       - Show version information
 *
 * Exit codes: 0 = PASS, 1 = WARN, 2 = FAIL, 3 = error
 */

#include "qoeguard/canonical_json.hpp"
#include "qoeguard/common.hpp"
#include "qoeguard/config.hpp"
#include "qoeguard/diff.hpp"
#include "qoeguard/json_value.hpp"
#include "qoeguard/pipeline.hpp"
#include "qoeguard/report.hpp"
#include "qoeguard/require_cpp23.hpp"
#include "qoeguard/version.hpp"

#include <cstdio>
#include <exception>
#include <filesystem>
#include <optional>
#include <print>
#include <ranges>
#include <span>
#include <string>
#include <string_view>

namespace {

constexpr int kExitPass = 0;
constexpr int kExitWarn = 1;
constexpr int kExitFail = 2;
constexpr int kExitError = 3;

void print_version()
{
    std::println("qoeguard {} ({})", qoeguard::kVersion, qoeguard::kBuildId);
    std::println("  config: {}", qoeguard::kConfigSchemaVersion);
    std::println("  report: {}", qoeguard::kReportSchemaVersion);
}

void print_help()
{
    std::print(R"(QoE-Guard - API response drift gate for streaming clients

Usage: qoeguard <command> [options]

Commands:
  compare       Score a candidate payload against a baseline
  diff          Print the structural change list
  check-config  Validate a configuration file
  version       Show version information

Global Options:
  --help, -h          Show this help message
  --version, -v       Show version information

Exit codes:
  0 = PASS, 1 = WARN, 2 = FAIL, 3 = error

Run 'qoeguard <command> --help' for command-specific options.
)");
}

void print_compare_help()
{
    std::print(R"(Usage: qoeguard compare [options]

Score a candidate payload against a baseline

Options:
  --baseline FILE, -b       Baseline JSON payload (required)
  --candidate FILE, -c      Candidate JSON payload (required)
  --config FILE             Configuration file (qoeguard.config.v1)
  --policy NAME             Policy preset: default, strict, permissive
  --schema-dir DIR          Path to schema directory (default: ./schemas)
  --format FMT, -f FMT      summary, json or github (default: summary)
  --out FILE, -o FILE       Write output to FILE instead of stdout
  --fail-on-warn            Exit with 2 (FAIL) on WARN
  --help, -h                Show this help
)");
}

void print_diff_help()
{
    std::print(R"(Usage: qoeguard diff [options]

Print the structural change list between two payloads

Options:
  --baseline FILE, -b       Baseline JSON payload (required)
  --candidate FILE, -c      Candidate JSON payload (required)
  --out FILE, -o FILE       Write canonical JSON to FILE instead of stdout
  --help, -h                Show this help
)");
}

void print_check_config_help()
{
    std::print(R"(Usage: qoeguard check-config [options]

Validate a configuration file against the schema and semantic rules

Options:
  --config FILE             Configuration file (required)
  --schema-dir DIR          Path to schema directory (default: ./schemas)
  --help, -h                Show this help
)");
}

struct CompareOptions
{
    std::string baseline;
    std::string candidate;
    std::optional<std::string> config;
    std::optional<std::string> policy;
    std::string schema_dir;
    qoeguard::report::OutputFormat format;
    std::optional<std::string> output;
    bool fail_on_warn;
    bool show_help;
};

struct DiffOptions
{
    std::string baseline;
    std::string candidate;
    std::optional<std::string> output;
    bool show_help;
};

struct CheckConfigOptions
{
    std::string config;
    std::string schema_dir;
    bool show_help;
};

// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
[[nodiscard]] auto read_option_value(std::span<char*> args,
                                     std::size_t index,
                                     std::string_view option) -> qoeguard::Result<std::string>
{
    const std::size_t value_index = index + 1;
    if (value_index >= args.size() || args[value_index] == nullptr) {
        return std::unexpected(
            qoeguard::Error::make("MissingArgument",
                                  std::string("Missing value for option: ") + std::string(option)));
    }
    return std::string(args[value_index]);
}

[[nodiscard]] auto set_compare_option(std::string_view arg,
                                      std::span<char*> args,
                                      std::size_t idx,
                                      CompareOptions& options) -> qoeguard::Result<bool>
{
    const auto take = [&](std::string& target) -> qoeguard::Result<bool> {
        auto value = read_option_value(args, idx, arg);
        if (!value) {
            return std::unexpected(value.error());
        }
        target = *value;
        return true;
    };
    const auto take_optional = [&](std::optional<std::string>& target) -> qoeguard::Result<bool> {
        auto value = read_option_value(args, idx, arg);
        if (!value) {
            return std::unexpected(value.error());
        }
        target = *value;
        return true;
    };

    if (arg == "--baseline" || arg == "-b") {
        return take(options.baseline);
    }
    if (arg == "--candidate" || arg == "-c") {
        return take(options.candidate);
    }
    if (arg == "--config") {
        return take_optional(options.config);
    }
    if (arg == "--policy") {
        return take_optional(options.policy);
    }
    if (arg == "--schema-dir") {
        return take(options.schema_dir);
    }
    if (arg == "--out" || arg == "-o") {
        return take_optional(options.output);
    }
    if (arg == "--format" || arg == "-f") {
        auto value = read_option_value(args, idx, arg);
        if (!value) {
            return std::unexpected(value.error());
        }
        auto format = qoeguard::report::output_format_from_name(*value);
        if (!format) {
            return std::unexpected(qoeguard::Error::make(
                "InvalidArgument", "Invalid --format value: " + *value + " (summary|json|github)"));
        }
        options.format = *format;
        return true;
    }
    return false;
}

[[nodiscard]] qoeguard::Result<CompareOptions> parse_compare_args(std::span<char*> args)
{
    CompareOptions options{.baseline = std::string{},
                           .candidate = std::string{},
                           .config = std::nullopt,
                           .policy = std::nullopt,
                           .schema_dir = "schemas",
                           .format = qoeguard::report::OutputFormat::kSummary,
                           .output = std::nullopt,
                           .fail_on_warn = false,
                           .show_help = false};
    bool skip_next = false;
    for (auto [i, arg_ptr] : std::views::enumerate(args)) {
        if (skip_next) {
            skip_next = false;
            continue;
        }
        if (arg_ptr == nullptr) {
            continue;
        }
        std::string_view arg(arg_ptr);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        if (arg == "--fail-on-warn") {
            options.fail_on_warn = true;
            continue;
        }
        auto consumed = set_compare_option(arg, args, static_cast<std::size_t>(i), options);
        if (!consumed) {
            return std::unexpected(consumed.error());
        }
        if (!*consumed) {
            return std::unexpected(
                qoeguard::Error::make("InvalidArgument", "Unknown option: " + std::string(arg)));
        }
        skip_next = true;
    }
    return options;
}

[[nodiscard]] qoeguard::Result<DiffOptions> parse_diff_args(std::span<char*> args)
{
    DiffOptions options{.baseline = std::string{},
                        .candidate = std::string{},
                        .output = std::nullopt,
                        .show_help = false};
    bool skip_next = false;
    for (auto [i, arg_ptr] : std::views::enumerate(args)) {
        if (skip_next) {
            skip_next = false;
            continue;
        }
        if (arg_ptr == nullptr) {
            continue;
        }
        const auto idx = static_cast<std::size_t>(i);
        std::string_view arg(arg_ptr);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        if (arg == "--baseline" || arg == "-b" || arg == "--candidate" || arg == "-c"
            || arg == "--out" || arg == "-o") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            if (arg == "--baseline" || arg == "-b") {
                options.baseline = *value;
            } else if (arg == "--candidate" || arg == "-c") {
                options.candidate = *value;
            } else {
                options.output = *value;
            }
            skip_next = true;
            continue;
        }
        return std::unexpected(
            qoeguard::Error::make("InvalidArgument", "Unknown option: " + std::string(arg)));
    }
    return options;
}

[[nodiscard]] qoeguard::Result<CheckConfigOptions> parse_check_config_args(std::span<char*> args)
{
    CheckConfigOptions options{.config = std::string{}, .schema_dir = "schemas", .show_help = false};
    bool skip_next = false;
    for (auto [i, arg_ptr] : std::views::enumerate(args)) {
        if (skip_next) {
            skip_next = false;
            continue;
        }
        if (arg_ptr == nullptr) {
            continue;
        }
        const auto idx = static_cast<std::size_t>(i);
        std::string_view arg(arg_ptr);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        if (arg == "--config" || arg == "--schema-dir") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            (arg == "--config" ? options.config : options.schema_dir) = *value;
            skip_next = true;
            continue;
        }
        return std::unexpected(
            qoeguard::Error::make("InvalidArgument", "Unknown option: " + std::string(arg)));
    }
    return options;
}

[[nodiscard]] qoeguard::Result<qoeguard::config::Config> resolve_config(const CompareOptions& options)
{
    qoeguard::config::Config config;
    if (options.config) {
        auto loaded = qoeguard::config::load_config_file(*options.config, options.schema_dir);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        config = std::move(*loaded);
    }
    if (options.policy) {
        auto preset = qoeguard::config::PolicyConfig::preset(*options.policy);
        if (!preset) {
            return std::unexpected(qoeguard::Error::make(
                "InvalidArgument", "Unknown policy preset: " + *options.policy));
        }
        config.policy = std::move(*preset);
    }
    return config;
}

[[nodiscard]] int exit_code_for(qoeguard::config::Verdict verdict, bool fail_on_warn)
{
    switch (verdict) {
        case qoeguard::config::Verdict::kPass:
            return kExitPass;
        case qoeguard::config::Verdict::kWarn:
            return fail_on_warn ? kExitFail : kExitWarn;
        case qoeguard::config::Verdict::kFail:
            return kExitFail;
    }
    return kExitError;
}

[[nodiscard]] qoeguard::VoidResult emit_json(const std::optional<std::string>& output,
                                             const nlohmann::json& payload)
{
    if (output) {
        return qoeguard::report::write_json_output(*output, payload);
    }
    auto canonical = qoeguard::canonical::canonicalize(payload);
    if (!canonical) {
        return std::unexpected(canonical.error());
    }
    std::println("{}", *canonical);
    return {};
}

[[nodiscard]] int run_compare(const CompareOptions& options)
{
    auto config = resolve_config(options);
    if (!config) {
        std::println(stderr, "Error: {}", config.error().message);
        return kExitError;
    }
    auto baseline = qoeguard::json::read_file(options.baseline);
    if (!baseline) {
        std::println(stderr, "Error: baseline: {}", baseline.error().message);
        return kExitError;
    }
    auto candidate = qoeguard::json::read_file(options.candidate);
    if (!candidate) {
        std::println(stderr, "Error: candidate: {}", candidate.error().message);
        return kExitError;
    }

    const auto policy = config->policy;
    auto evaluator = qoeguard::pipeline::Evaluator::create(std::move(*config));
    if (!evaluator) {
        std::println(stderr, "Error: {}", evaluator.error().message);
        return kExitError;
    }
    const auto evaluation = evaluator->evaluate(*baseline, *candidate);

    const std::optional<std::filesystem::path> output_path =
        options.output ? std::optional<std::filesystem::path>(*options.output) : std::nullopt;
    qoeguard::VoidResult written;
    switch (options.format) {
        case qoeguard::report::OutputFormat::kJson:
            written = emit_json(options.output,
                                qoeguard::report::evaluation_to_json(evaluation, policy));
            break;
        case qoeguard::report::OutputFormat::kGithub:
            written = qoeguard::report::write_text_output(
                output_path, qoeguard::report::render_github(evaluation));
            break;
        case qoeguard::report::OutputFormat::kSummary:
            written = qoeguard::report::write_text_output(
                output_path, qoeguard::report::render_summary(evaluation, policy));
            break;
    }
    if (!written) {
        std::println(stderr, "Error: compare output failed: {}", written.error().message);
        return kExitError;
    }
    if (options.output) {
        std::println("[compare] {} (risk {:.4f})",
                     qoeguard::config::verdict_name(evaluation.decision.verdict),
                     evaluation.decision.risk);
        std::println("  output: {}", *options.output);
    }
    return exit_code_for(evaluation.decision.verdict, options.fail_on_warn);
}

[[nodiscard]] int run_diff(const DiffOptions& options)
{
    auto baseline = qoeguard::json::read_file(options.baseline);
    if (!baseline) {
        std::println(stderr, "Error: baseline: {}", baseline.error().message);
        return kExitError;
    }
    auto candidate = qoeguard::json::read_file(options.candidate);
    if (!candidate) {
        std::println(stderr, "Error: candidate: {}", candidate.error().message);
        return kExitError;
    }
    const auto changes = qoeguard::diff::diff(*baseline, *candidate);
    if (auto written = emit_json(options.output, qoeguard::report::changes_to_json(changes));
        !written) {
        std::println(stderr, "Error: diff output failed: {}", written.error().message);
        return kExitError;
    }
    if (options.output) {
        std::println("[diff] {} changes", changes.size());
        std::println("  output: {}", *options.output);
    }
    return kExitPass;
}

[[nodiscard]] int run_check_config(const CheckConfigOptions& options)
{
    auto config = qoeguard::config::load_config_file(options.config, options.schema_dir);
    if (!config) {
        std::println(stderr, "Error: {}: {}", config.error().code, config.error().message);
        return kExitError;
    }
    if (auto evaluator = qoeguard::pipeline::Evaluator::create(*config); !evaluator) {
        std::println(stderr, "Error: {}: {}", evaluator.error().code, evaluator.error().message);
        return kExitError;
    }
    std::println("[check-config] {} OK", options.config);
    std::println("  criticality rules: {}", config->criticality.rules().size());
    std::println("  policy: {} (warn {:.2f}, fail {:.2f}, overrides {})",
                 config->policy.name(),
                 config->policy.warn_threshold(),
                 config->policy.fail_threshold(),
                 config->policy.overrides().size());
    std::println("  model: {}",
                 config->model.kind == qoeguard::config::ModelKind::kLinear ? "linear"
                                                                             : "decision_tree");
    std::println("  ignore_paths: {}", config->ignore_paths.size());
    return kExitPass;
}

int cmd_compare(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_compare_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return kExitError;
    }
    if (options->show_help) {
        print_compare_help();
        return kExitPass;
    }
    if (options->baseline.empty() || options->candidate.empty()) {
        std::println(stderr, "Error: --baseline and --candidate are required");
        print_compare_help();
        return kExitError;
    }
    return run_compare(*options);
}

int cmd_diff(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_diff_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return kExitError;
    }
    if (options->show_help) {
        print_diff_help();
        return kExitPass;
    }
    if (options->baseline.empty() || options->candidate.empty()) {
        std::println(stderr, "Error: --baseline and --candidate are required");
        print_diff_help();
        return kExitError;
    }
    return run_diff(*options);
}

int cmd_check_config(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_check_config_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return kExitError;
    }
    if (options->show_help) {
        print_check_config_help();
        return kExitPass;
    }
    if (options->config.empty()) {
        std::println(stderr, "Error: --config is required");
        print_check_config_help();
        return kExitError;
    }
    return run_check_config(*options);
}

[[nodiscard]] int run_cli(int argc, char** argv)
{
    try {
        if (argc < 2) {
            print_help();
            return kExitError;
        }

        std::string_view cmd = argv[1];

        if (cmd == "--help" || cmd == "-h" || cmd == "help") {
            print_help();
            return kExitPass;
        }
        if (cmd == "--version" || cmd == "-v" || cmd == "version") {
            print_version();
            return kExitPass;
        }

        int sub_argc = argc - 2;
        char** sub_argv = argv + 2;

        if (cmd == "compare") {
            return cmd_compare(sub_argc, sub_argv);
        }
        if (cmd == "diff") {
            return cmd_diff(sub_argc, sub_argv);
        }
        if (cmd == "check-config") {
            return cmd_check_config(sub_argc, sub_argv);
        }

        std::println(stderr, "Unknown command: {}", cmd);
        print_help();
        return kExitError;
    } catch (const std::exception& ex) {
        try {
            std::println(stderr, "Error: {}", ex.what());
        } catch (...) {
            std::terminate();
        }
        return kExitError;
    } catch (...) {
        try {
            std::println(stderr, "Error: unknown exception");
        } catch (...) {
            std::terminate();
        }
        return kExitError;
    }
}

}  // namespace

int main(int argc, char** argv)
{
    return run_cli(argc, argv);
}
