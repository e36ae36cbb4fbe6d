/**
 * @file main.cpp
 * @brief ECV CLI entry point
 *
 * Commands:
 *   verify    - Enforce effects and verify contracts
 *   effects   - Infer and check effects only
 *   version   - Show version information
 *
 * Exit codes: 0 success, 1 error diagnostics emitted, 2 input or internal error.
 */

#include "ecv/ast.hpp"
#include "ecv/canonical_json.hpp"
#include "ecv/common.hpp"
#include "ecv/config.hpp"
#include "ecv/json_file.hpp"
#include "ecv/manifest.hpp"
#include "ecv/pipeline.hpp"
#include "ecv/print.hpp"
#include "ecv/report.hpp"
#include "ecv/smt_verifier.hpp"
#include "ecv/version.hpp"

#include <charconv>
#include <chrono>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <format>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFindings = 1;
constexpr int kExitFailure = 2;

void print_version()
{
    std::println("ecv {} ({})", ecv::kVersion, ecv::kBuildId);
    std::println("  effect_semantics: {}", ecv::kEffectSemanticsVersion);
    std::println("  proof_system:     {}", ecv::kProofSystemVersion);
    std::println("  report_schema:    {}", ecv::kReportSchemaVersion);
    std::println("  z3:               {}", ecv::smt::solver_version());
}

void print_help()
{
    std::print(R"(ECV - Effect and Contract Verification

Usage: ecv <command> [options]

Commands:
  verify      Enforce declared effects and verify contracts
  effects     Infer and check effects only
  version     Show version information

Run 'ecv <command> --help' for command-specific options.
)");
}

void print_verify_help()
{
    std::print(R"(Usage: ecv verify [options]

Enforce declared effects and verify contracts

Options:
  --input FILE, -i          Program snapshot (program.v1 JSON, required)
  --manifest FILE           Effect manifest (repeatable, later files win)
  --config FILE             Configuration file (config.v1 JSON)
  --schema-dir DIR          Path to schema directory (default: ./schemas)
  --strict                  Unknown external calls are errors (default)
  --permissive              Unknown external calls assume all effects
  --no-effects              Disable effect enforcement
  --no-static               Disable static contract verification
  --timeout-ms N            Solver budget per function
  --disproven-error         Report disproven contracts as errors
  --cache DIR               Proof cache directory
  --jobs N, -j N            Number of parallel jobs (default: auto)
  --format text|json        Output format on stdout (default: text)
  --output FILE, -o         Also write the JSON report to FILE
  --verbose                 Show the contract ledger
  --help, -h                Show this help
)");
}

void print_effects_help()
{
    std::print(R"(Usage: ecv effects [options]

Infer and check effects only

Options:
  --input FILE, -i          Program snapshot (program.v1 JSON, required)
  --manifest FILE           Effect manifest (repeatable, later files win)
  --config FILE             Configuration file (config.v1 JSON)
  --schema-dir DIR          Path to schema directory (default: ./schemas)
  --strict                  Unknown external calls are errors (default)
  --permissive              Unknown external calls assume all effects
  --jobs N, -j N            Number of parallel jobs (default: auto)
  --format text|json        Output format on stdout (default: text)
  --output FILE, -o         Also write the JSON report to FILE
  --help, -h                Show this help
)");
}

struct CliOptions
{
    std::string input;
    std::vector<std::string> manifests;
    std::optional<std::string> config_path;
    std::string schema_dir = "schemas";
    std::optional<ecv::effects::UnknownMode> unknown_mode;
    bool no_effects = false;
    bool no_static = false;
    std::optional<std::uint64_t> timeout_ms;
    bool disproven_error = false;
    std::optional<std::string> cache_dir;
    std::optional<std::size_t> jobs;
    ecv::report::ReportFormat format = ecv::report::ReportFormat::kText;
    std::optional<std::string> output;
    bool verbose = false;
    bool show_help = false;
};

[[nodiscard]] auto read_option_value(std::span<char*> args,
                                     std::size_t index,
                                     std::string_view option) -> ecv::Result<std::string>
{
    const std::size_t value_index = index + 1;
    if (value_index >= args.size() || args[value_index] == nullptr) {
        return std::unexpected(ecv::Error::make(
            "MissingArgument", std::format("Missing value for option: {}", option)));
    }
    return std::string(args[value_index]);
}

[[nodiscard]] ecv::Result<std::uint64_t> parse_unsigned(std::string_view value,
                                                        std::string_view option)
{
    std::uint64_t parsed = 0;
    const char* begin = value.data();
    const char* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (ec != std::errc{} || ptr != end) {
        return std::unexpected(ecv::Error::make(
            "InvalidArgument",
            std::format("Invalid {} value: {}", option, value)));
    }
    return parsed;
}

/// Options taking a value. Returns true if `arg` was one of them.
[[nodiscard]] auto set_value_option(std::string_view arg,
                                    const std::string& value,
                                    CliOptions& options) -> ecv::Result<bool>
{
    if (arg == "--input" || arg == "-i") {
        options.input = value;
    } else if (arg == "--manifest") {
        options.manifests.push_back(value);
    } else if (arg == "--config") {
        options.config_path = value;
    } else if (arg == "--schema-dir") {
        options.schema_dir = value;
    } else if (arg == "--cache") {
        options.cache_dir = value;
    } else if (arg == "--output" || arg == "-o") {
        options.output = value;
    } else if (arg == "--timeout-ms") {
        auto parsed = parse_unsigned(value, arg);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        options.timeout_ms = *parsed;
    } else if (arg == "--jobs" || arg == "-j") {
        auto parsed = parse_unsigned(value, arg);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        options.jobs = static_cast<std::size_t>(*parsed);
    } else if (arg == "--format") {
        if (value == "text") {
            options.format = ecv::report::ReportFormat::kText;
        } else if (value == "json") {
            options.format = ecv::report::ReportFormat::kJson;
        } else {
            return std::unexpected(
                ecv::Error::make("InvalidArgument", std::format("Invalid --format value: {}", value)));
        }
    } else {
        return false;
    }
    return true;
}

[[nodiscard]] bool set_flag_option(std::string_view arg, CliOptions& options)
{
    if (arg == "--help" || arg == "-h") {
        options.show_help = true;
    } else if (arg == "--strict") {
        options.unknown_mode = ecv::effects::UnknownMode::kStrict;
    } else if (arg == "--permissive") {
        options.unknown_mode = ecv::effects::UnknownMode::kPermissive;
    } else if (arg == "--no-effects") {
        options.no_effects = true;
    } else if (arg == "--no-static") {
        options.no_static = true;
    } else if (arg == "--disproven-error") {
        options.disproven_error = true;
    } else if (arg == "--verbose") {
        options.verbose = true;
    } else {
        return false;
    }
    return true;
}

[[nodiscard]] ecv::Result<CliOptions> parse_args(std::span<char*> args)
{
    CliOptions options;
    for (std::size_t idx = 0; idx < args.size(); ++idx) {
        if (args[idx] == nullptr) {
            continue;
        }
        const std::string_view arg(args[idx]);
        if (set_flag_option(arg, options)) {
            continue;
        }
        if (!arg.starts_with("-")) {
            return std::unexpected(
                ecv::Error::make("InvalidArgument", std::format("Unexpected argument: {}", arg)));
        }
        auto value = read_option_value(args, idx, arg);
        if (!value) {
            return std::unexpected(value.error());
        }
        auto handled = set_value_option(arg, *value, options);
        if (!handled) {
            return std::unexpected(handled.error());
        }
        if (!*handled) {
            return std::unexpected(
                ecv::Error::make("InvalidArgument", std::format("Unknown option: {}", arg)));
        }
        ++idx;
    }
    return options;
}

/// Config file first, then command-line overrides.
[[nodiscard]] ecv::Result<ecv::pipeline::VerificationConfig> build_config(const CliOptions& options)
{
    ecv::pipeline::VerificationConfig config;
    if (options.config_path) {
        auto loaded = ecv::pipeline::load_config_file(*options.config_path, options.schema_dir);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        config = std::move(*loaded);
    }
    if (options.unknown_mode) {
        config.unknown_mode = *options.unknown_mode;
    }
    if (options.no_effects) {
        config.enforce_effects = false;
    }
    if (options.no_static) {
        config.static_enabled = false;
    }
    if (options.timeout_ms) {
        config.verifier.timeout = std::chrono::milliseconds(*options.timeout_ms);
    }
    if (options.disproven_error) {
        config.elision.disproven_is_error = true;
    }
    if (options.cache_dir) {
        config.cache_dir = *options.cache_dir;
    }
    if (options.jobs) {
        config.jobs = *options.jobs;
    }
    return config;
}

[[nodiscard]] int run(const CliOptions& options, bool effects_only)
{
    auto config = build_config(options);
    if (!config) {
        std::println(stderr, "Error: {}", config.error().message);
        return kExitFailure;
    }
    if (effects_only) {
        config->static_enabled = false;
        config->enforce_effects = true;
    }

    auto program = ecv::ast::load_program_file(options.input, options.schema_dir);
    if (!program) {
        std::println(stderr, "Error: {}", program.error().message);
        return kExitFailure;
    }

    ecv::manifest::JsonManifestResolver resolver;
    for (const auto& path : options.manifests) {
        if (auto added = resolver.add_file(path, options.schema_dir); !added) {
            std::println(stderr, "Error: {}", added.error().message);
            return kExitFailure;
        }
    }

    const ecv::pipeline::VerificationPass pass(*config, resolver, options.schema_dir);
    auto result = pass.run(*program);
    if (!result) {
        std::println(stderr, "Error: {}", result.error().message);
        return kExitFailure;
    }

    const bool need_json =
        options.output.has_value() || options.format == ecv::report::ReportFormat::kJson;
    nlohmann::json report;
    if (need_json) {
        report = ecv::report::build_report(*program, *result, *config);
        if (auto valid = ecv::report::validate_report(report, options.schema_dir); !valid) {
            std::println(stderr, "Error: {}", valid.error().message);
            return kExitFailure;
        }
    }
    if (options.output) {
        if (auto written = ecv::common::write_canonical_json_file(*options.output, report);
            !written) {
            std::println(stderr, "Error: {}", written.error().message);
            return kExitFailure;
        }
    }

    if (options.format == ecv::report::ReportFormat::kJson) {
        auto canonical = ecv::canonical::canonicalize(report);
        if (!canonical) {
            std::println(stderr, "Error: {}", canonical.error().message);
            return kExitFailure;
        }
        std::println("{}", *canonical);
    } else {
        const ecv::report::TextOptions text_options{.verbose = options.verbose,
                                                    .effects_table = effects_only
                                                                     || options.verbose};
        for (const auto& line : ecv::report::render_text(*program, *result, text_options)) {
            std::println("{}", line);
        }
    }

    return ecv::pipeline::exit_code(*result) == 0 ? kExitOk : kExitFindings;
}

[[nodiscard]] int cmd_run(int argc, char** argv, bool effects_only)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return kExitFailure;
    }
    if (options->show_help) {
        effects_only ? print_effects_help() : print_verify_help();
        return kExitOk;
    }
    if (options->input.empty()) {
        std::println(stderr, "Error: --input is required");
        effects_only ? print_effects_help() : print_verify_help();
        return kExitFailure;
    }
    return run(*options, effects_only);
}

[[nodiscard]] int run_cli(int argc, char** argv)
{
    try {
        if (argc < 2) {
            print_help();
            return kExitFailure;
        }

        const std::string_view cmd = argv[1];
        if (cmd == "--help" || cmd == "-h") {
            print_help();
            return kExitOk;
        }
        if (cmd == "--version" || cmd == "-v" || cmd == "version") {
            print_version();
            return kExitOk;
        }

        const int sub_argc = argc - 2;
        char** sub_argv = argv + 2;
        if (cmd == "verify") {
            return cmd_run(sub_argc, sub_argv, false);
        }
        if (cmd == "effects") {
            return cmd_run(sub_argc, sub_argv, true);
        }

        std::println(stderr, "Unknown command: {}", cmd);
        print_help();
        return kExitFailure;
    } catch (const std::exception& ex) {
        std::println(stderr, "Error: {}", ex.what());
        return kExitFailure;
    }
}

}  // namespace

int main(int argc, char** argv)
{
    return run_cli(argc, argv);
}
