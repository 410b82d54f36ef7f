/**
 * @file main.cpp
 * @brief stuckrank CLI entry point
 *
 * Commands:
 *   analyze   - Rank the stuck points of a fuzzing coverage run
 *   version   - Show version information
 */

#include "stuckrank/common.hpp"
#include "stuckrank/diagnostics.hpp"
#include "stuckrank/ingest.hpp"
#include "stuckrank/pipeline.hpp"
#include "stuckrank/report.hpp"
#include "stuckrank/require_cpp23.hpp"
#include "stuckrank/version.hpp"

#include <charconv>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <optional>
#include <print>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace {

void print_version()
{
    std::println("{} {} ({})", stuckrank::kToolName, stuckrank::kVersion, stuckrank::kBuildId);
    std::println("  program:   {}", stuckrank::kProgramSchemaVersion);
    std::println("  execdata:  {}", stuckrank::kExecDataSchemaVersion);
    std::println("  report:    {}", stuckrank::kReportSchemaVersion);
    std::println("  analysis:  {}", stuckrank::kAnalysisType);
}

void print_help()
{
    std::print(R"(stuckrank - Fuzzing stuck point prioritizer

Usage: stuckrank <command> [options]

Commands:
  analyze     Rank partially covered lines by the uncovered code they block
  version     Show version information

Global Options:
  --help, -h          Show this help message
  --version, -v       Show version information

Run 'stuckrank <command> --help' for command-specific options.
)");
}

void print_analyze_help()
{
    std::print(R"(Usage: stuckrank analyze [options]

Rank partially covered lines by the uncovered code they block

Options:
  --exec FILE               Execution data (execdata.v1) (required)
  --binary FILE             Program module (program.v1); repeatable (required)
  --entry SIG               Fuzz entry point; repeatable (required)
                              <com.Foo: void fuzz(byte[])>
                              com.Foo.fuzz(byte[])
                              com.Foo.fuzz
  --output FILE, -o         Report file (default: stuck_points.json)
  --jobs N, -j N            Worker threads, 0 = hardware concurrency (default: 0)
  --schema-dir DIR          Path to schema directory (default: ./schemas)
  --source-dir DIR          Source root for code context in summaries
  --top N                   Rows of the console ranking (default: 10)
  --max-visited N           Stop a traversal after N statements
  --max-time-ms N           Stop a traversal after N milliseconds
  --no-memo                 Do not cache callee reachability
  --verbose                 Print progress of every stage
  --help, -h                Show this help

Output:
  <output> (stuck_points.v1)
)");
}

struct AnalyzeOptions
{
    std::string exec_data;
    std::vector<std::string> binaries;
    std::vector<std::string> entry_points;
    std::string output;
    unsigned jobs;
    std::string schema_dir;
    std::optional<std::string> source_dir;
    std::size_t top;
    std::optional<std::size_t> max_visited;
    std::optional<std::uint64_t> max_time_ms;
    bool memoize;
    bool verbose;
    bool show_help;
};

// CLI parsing signature is stable.
// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
[[nodiscard]] auto read_option_value(std::span<char*> args,
                                     std::size_t index,
                                     std::string_view option) -> stuckrank::Result<std::string>
{
    const std::size_t value_index = index + 1;
    if (value_index >= args.size() || args[value_index] == nullptr) {
        return std::unexpected(
            stuckrank::Error::make("MissingArgument",
                                   std::string("Missing value for option: ") + std::string(option)));
    }
    return std::string(args[value_index]);
}

template <typename T>
[[nodiscard]] stuckrank::Result<T> parse_number_value(std::string_view value, std::string_view option)
{
    T parsed{};
    const char* begin = value.data();
    const char* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (ec != std::errc{} || ptr != end) {
        return std::unexpected(stuckrank::Error::make(
            "InvalidArgument",
            std::string("Invalid ") + std::string(option) + " value: " + std::string(value)));
    }
    return parsed;
}

template <typename T>
[[nodiscard]] auto read_number_option(std::span<char*> args, std::size_t idx, std::string_view arg)
    -> stuckrank::Result<T>
{
    auto value = read_option_value(args, idx, arg);
    if (!value) {
        return std::unexpected(value.error());
    }
    return parse_number_value<T>(*value, arg);
}

[[nodiscard]] auto set_analyze_option(std::string_view arg,
                                      // CLI parsing signature is stable.
                                      // NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
                                      std::span<char*> args,
                                      std::size_t idx,
                                      AnalyzeOptions& options,
                                      bool& skip_next) -> stuckrank::Result<bool>
{
    if (arg == "--exec" || arg == "--binary" || arg == "--entry" || arg == "--output"
        || arg == "-o" || arg == "--schema-dir" || arg == "--source-dir") {
        auto value = read_option_value(args, idx, arg);
        if (!value) {
            return std::unexpected(value.error());
        }
        if (arg == "--exec") {
            options.exec_data = *value;
        } else if (arg == "--binary") {
            options.binaries.push_back(*value);
        } else if (arg == "--entry") {
            options.entry_points.push_back(*value);
        } else if (arg == "--schema-dir") {
            options.schema_dir = *value;
        } else if (arg == "--source-dir") {
            options.source_dir = *value;
        } else {
            options.output = *value;
        }
        skip_next = true;
        return stuckrank::Result<bool>{true};
    }
    if (arg == "--jobs" || arg == "-j") {
        auto parsed = read_number_option<unsigned>(args, idx, arg);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        options.jobs = *parsed;
        skip_next = true;
        return stuckrank::Result<bool>{true};
    }
    if (arg == "--top") {
        auto parsed = read_number_option<std::size_t>(args, idx, arg);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        options.top = *parsed;
        skip_next = true;
        return stuckrank::Result<bool>{true};
    }
    if (arg == "--max-visited") {
        auto parsed = read_number_option<std::size_t>(args, idx, arg);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        options.max_visited = *parsed;
        skip_next = true;
        return stuckrank::Result<bool>{true};
    }
    if (arg == "--max-time-ms") {
        auto parsed = read_number_option<std::uint64_t>(args, idx, arg);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        options.max_time_ms = *parsed;
        skip_next = true;
        return stuckrank::Result<bool>{true};
    }
    if (arg == "--no-memo") {
        options.memoize = false;
        return stuckrank::Result<bool>{true};
    }
    if (arg == "--verbose") {
        options.verbose = true;
        return stuckrank::Result<bool>{true};
    }
    return stuckrank::Result<bool>{false};
}

[[nodiscard]] stuckrank::Result<AnalyzeOptions> parse_analyze_args(std::span<char*> args)
{
    AnalyzeOptions options{.exec_data = std::string{},
                           .binaries = {},
                           .entry_points = {},
                           .output = "stuck_points.json",
                           .jobs = 0,
                           .schema_dir = "schemas",
                           .source_dir = std::nullopt,
                           .top = stuckrank::report::kDefaultTopLimit,
                           .max_visited = std::nullopt,
                           .max_time_ms = std::nullopt,
                           .memoize = true,
                           .verbose = false,
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
        auto handled = set_analyze_option(arg, args, idx, options, skip_next);
        if (!handled) {
            return std::unexpected(handled.error());
        }
        if (!*handled) {
            return std::unexpected(stuckrank::Error::make(
                "InvalidArgument", std::string("Unknown option: ") + std::string(arg)));
        }
    }
    return options;
}

[[nodiscard]] int run_analyze(const AnalyzeOptions& options)
{
    const stuckrank::Diagnostics diagnostics(stderr, options.verbose);
    stuckrank::pipeline::AnalyzerConfig config{
        .jobs = options.jobs,
        .diagnostics = diagnostics,
        .scorer = stuckrank::scorer::ScorerConfig{
            .memoize_callees = options.memoize,
            .budget = stuckrank::scorer::ScoreBudget{.max_visited_statements = options.max_visited,
                                                     .max_time_ms = options.max_time_ms}},
        .schema_dir = options.schema_dir,
    };

    stuckrank::ingest::JsonCoverageReader reader(options.schema_dir);
    const stuckrank::pipeline::StuckPointAnalyzer analyzer(config, reader);
    stuckrank::pipeline::AnalysisRequest request{
        .exec_data = options.exec_data,
        .binaries = std::vector<std::filesystem::path>(options.binaries.begin(), options.binaries.end()),
        .entry_points = options.entry_points,
    };

    auto output = analyzer.analyze(request);
    if (!output) {
        std::println(stderr, "Error: {}: {}", output.error().code, output.error().message);
        return 1;
    }

    std::println("[ingest] Coverage analysis: {} successful, {} failed out of {} binaries",
                 output->ingest.success_count, output->ingest.failure_count,
                 output->ingest.total_binaries);

    std::optional<stuckrank::report::SourceResolver> resolver;
    if (options.source_dir) {
        resolver.emplace(*options.source_dir);
    }
    const stuckrank::report::ReportContext context{
        .exec_file = options.exec_data,
        .entry_points = options.entry_points,
        .binaries = options.binaries,
        .generated_at = stuckrank::report::current_timestamp(),
    };
    const auto report =
        stuckrank::report::build_report(*output, context, resolver ? &*resolver : nullptr);
    if (auto write = stuckrank::report::write_report(report, options.output, options.schema_dir);
        !write) {
        std::println(stderr, "Error: {}: {}", write.error().code, write.error().message);
        return 1;
    }

    if (output->ranked.empty()) {
        std::println("No stuck points found");
    } else {
        std::println("[analyze] {} stuck points ranked", output->ranked.size());
        std::print("\n{}", stuckrank::report::format_top_table(output->ranked, options.top));
    }
    std::println("  output: {}", options.output);
    return 0;
}

int cmd_analyze(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_analyze_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_analyze_help();
        return 0;
    }
    if (options->exec_data.empty() || options->binaries.empty() || options->entry_points.empty()) {
        std::println(stderr, "Error: --exec, --binary and --entry are required");
        print_analyze_help();
        return 1;
    }
    return run_analyze(*options);
}

}  // namespace

namespace {

[[nodiscard]] int run_cli(int argc, char** argv)
{
    try {
        if (argc < 2) {
            print_help();
            return 1;
        }

        std::string_view cmd = argv[1];

        if (cmd == "--help" || cmd == "-h") {
            print_help();
            return 0;
        }
        if (cmd == "--version" || cmd == "-v" || cmd == "version") {
            print_version();
            return 0;
        }

        int sub_argc = argc - 2;
        char** sub_argv = argv + 2;

        if (cmd == "analyze") {
            return cmd_analyze(sub_argc, sub_argv);
        }

        std::println(stderr, "Unknown command: {}", cmd);
        print_help();
        return 1;
    } catch (const std::exception& ex) {
        try {
            std::println(stderr, "Error: {}", ex.what());
        } catch (...) {
            std::terminate();
        }
        return 1;
    } catch (...) {
        try {
            std::println(stderr, "Error: unknown exception");
        } catch (...) {
            std::terminate();
        }
        return 1;
    }
}

}  // namespace

int main(int argc, char** argv)
{
    return run_cli(argc, argv);
}
