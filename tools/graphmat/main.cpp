/**
 * @file main.cpp
 * @brief graphmat CLI entry point
 *
 * Commands:
 *   match     - Match two call graphs and write the edit sequence
 *   version   - Show version information
 */

#include "graphmat/canonical_json.hpp"
#include "graphmat/common.hpp"
#include "graphmat/config.hpp"
#include "graphmat/edit_sequence.hpp"
#include "graphmat/graph_io.hpp"
#include "graphmat/json_io.hpp"
#include "graphmat/matcher.hpp"
#include "graphmat/version.hpp"

#include <chrono>
#include <exception>
#include <optional>
#include <print>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace {

void print_version()
{
    std::println("graphmat {} ({})", graphmat::kVersion, graphmat::kBuildId);
    std::println("  call graph:    {}", graphmat::kCallGraphSchemaVersion);
    std::println("  seed:          {}", graphmat::kSeedSchemaVersion);
    std::println("  config:        {}", graphmat::kMatcherConfigSchemaVersion);
    std::println("  edit sequence: {}", graphmat::kEditSequenceSchemaVersion);
}

void print_help()
{
    std::print(R"(graphmat - Seeded call graph matching for binary diffing

Usage: graphmat <command> [options]

Commands:
  match       Match two call graphs and write the edit sequence
  version     Show version information

Global Options:
  --help, -h          Show this help message
  --version, -v       Show version information

Run 'graphmat <command> --help' for command-specific options.
)");
}

void print_match_help()
{
    std::print(R"(Usage: graphmat match [options]

Match two call graphs and write the edit sequence

Options:
  --first FILE, -f          Call graph of the first binary (required)
  --second FILE, -s         Call graph of the second binary (required)
  --seed FILE               Seed matching (default: the two entry points)
  --config FILE             Matcher configuration file
  --output FILE, -o         Output file (default: stdout)
  --format csv|json         Output format (default: csv)
  --schema-dir DIR          Path to schema directory (default: ./schemas)
  --verbose                 Print match statistics to stderr
  --help, -h                Show this help
)");
}

enum class OutputFormat {
    kCsv,
    kJson
};

struct MatchOptions
{
    std::string first;
    std::string second;
    std::optional<std::string> seed;
    std::optional<std::string> config;
    std::optional<std::string> output;
    OutputFormat format;
    std::string schema_dir;
    bool verbose;
    bool show_help;
};

// CLI parsing signature is stable.
// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
[[nodiscard]] auto read_option_value(std::span<char*> args,
                                     std::size_t index,
                                     std::string_view option) -> graphmat::Result<std::string>
{
    const std::size_t value_index = index + 1;
    if (value_index >= args.size() || args[value_index] == nullptr) {
        return std::unexpected(
            graphmat::Error::make("MissingArgument",
                                  std::string("Missing value for option: ") + std::string(option)));
    }
    return std::string(args[value_index]);
}

[[nodiscard]] graphmat::Result<OutputFormat> parse_format_value(std::string_view value)
{
    if (value == "csv") {
        return OutputFormat::kCsv;
    }
    if (value == "json") {
        return OutputFormat::kJson;
    }
    return std::unexpected(graphmat::Error::make(
        "InvalidArgument", std::string("Invalid --format value: ") + std::string(value)));
}

[[nodiscard]] auto set_match_option(std::string_view arg,
                                    // CLI parsing signature is stable.
                                    // NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
                                    std::span<char*> args,
                                    std::size_t idx,
                                    MatchOptions& options,
                                    bool& skip_next) -> graphmat::Result<bool>
{
    const auto take_value = [&](auto assign) -> graphmat::Result<bool> {
        auto value = read_option_value(args, idx, arg);
        if (!value) {
            return std::unexpected(value.error());
        }
        assign(std::move(*value));
        skip_next = true;
        return true;
    };

    if (arg == "--first" || arg == "-f") {
        return take_value([&](std::string v) { options.first = std::move(v); });
    }
    if (arg == "--second" || arg == "-s") {
        return take_value([&](std::string v) { options.second = std::move(v); });
    }
    if (arg == "--seed") {
        return take_value([&](std::string v) { options.seed = std::move(v); });
    }
    if (arg == "--config") {
        return take_value([&](std::string v) { options.config = std::move(v); });
    }
    if (arg == "--output" || arg == "-o") {
        return take_value([&](std::string v) { options.output = std::move(v); });
    }
    if (arg == "--schema-dir") {
        return take_value([&](std::string v) { options.schema_dir = std::move(v); });
    }
    if (arg == "--format") {
        auto value = read_option_value(args, idx, arg);
        if (!value) {
            return std::unexpected(value.error());
        }
        auto format = parse_format_value(*value);
        if (!format) {
            return std::unexpected(format.error());
        }
        options.format = *format;
        skip_next = true;
        return true;
    }
    if (arg == "--verbose") {
        options.verbose = true;
        return true;
    }
    return false;
}

[[nodiscard]] graphmat::Result<MatchOptions> parse_match_args(std::span<char*> args)
{
    MatchOptions options{.first = std::string{},
                         .second = std::string{},
                         .seed = std::nullopt,
                         .config = std::nullopt,
                         .output = std::nullopt,
                         .format = OutputFormat::kCsv,
                         .schema_dir = "schemas",
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
        std::string_view arg(arg_ptr);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        auto handled = set_match_option(arg, args, static_cast<std::size_t>(i), options, skip_next);
        if (!handled) {
            return std::unexpected(handled.error());
        }
        if (!*handled) {
            return std::unexpected(graphmat::Error::make(
                "InvalidArgument", std::string("Unknown option: ") + std::string(arg)));
        }
    }
    return options;
}

void print_stats(const graphmat::match::MatchResult& result,
                 const graphmat::edit::EditSummary& summary,
                 std::chrono::milliseconds elapsed)
{
    const auto& stats = result.stats;
    std::println(stderr, "graphmat: {} after {} ms", graphmat::match::to_string(result.stop_reason),
                 elapsed.count());
    std::println(stderr,
                 "  anchors {}, scored {}, pruned {}, seeds {}, propagated {}, oversized {}",
                 stats.anchors_processed,
                 stats.pairs_scored,
                 stats.pairs_pruned,
                 stats.seed_pairs,
                 stats.pairs_confirmed,
                 stats.oversized_neighborhoods);
    std::println(stderr,
                 "  matched {}, only in first {}, only in second {}",
                 summary.matched,
                 summary.inserted_a,
                 summary.inserted_b);
    std::println(stderr,
                 "  edges preserved {}, removed {}, added {}",
                 summary.preserved_edges,
                 summary.removed_edges,
                 summary.added_edges);
}

[[nodiscard]] graphmat::Result<std::string> render(const graphmat::edit::EditSequence& sequence,
                                                   const graphmat::graph::CallGraph& graph_a,
                                                   const graphmat::graph::CallGraph& graph_b,
                                                   OutputFormat format)
{
    if (format == OutputFormat::kCsv) {
        return graphmat::edit::to_csv(sequence, graph_a.base_address(), graph_b.base_address());
    }
    auto canonical = graphmat::canonical::canonicalize(graphmat::edit::to_json(sequence));
    if (!canonical) {
        return std::unexpected(canonical.error());
    }
    return *canonical + "\n";
}

int run_match(const MatchOptions& options)
{
    graphmat::config::MatcherConfig config;
    if (options.config) {
        auto loaded = graphmat::config::load_matcher_config(*options.config, options.schema_dir);
        if (!loaded) {
            std::println(stderr, "Error: {}", loaded.error().message);
            return 1;
        }
        config = *loaded;
    }

    auto graph_a = graphmat::io::load_call_graph(options.first, options.schema_dir);
    if (!graph_a) {
        std::println(stderr, "Error: {}", graph_a.error().message);
        return 1;
    }
    auto graph_b = graphmat::io::load_call_graph(options.second, options.schema_dir);
    if (!graph_b) {
        std::println(stderr, "Error: {}", graph_b.error().message);
        return 1;
    }

    auto seed = options.seed ? graphmat::io::load_seed(*options.seed, options.schema_dir)
                             : graphmat::io::entry_seed(*graph_a, *graph_b);
    if (!seed) {
        std::println(stderr, "Error: {}", seed.error().message);
        return 1;
    }

    const auto started = std::chrono::steady_clock::now();
    auto result = graphmat::match::match(*graph_a, *graph_b, *seed, config);
    if (!result) {
        std::println(stderr, "Error: {}: {}", result.error().code, result.error().message);
        return 1;
    }
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    auto sequence =
        graphmat::edit::EditSequenceBuilder::build(*graph_a, *graph_b, result->correspondence);
    if (options.verbose) {
        print_stats(*result, sequence.summary, elapsed);
    }

    auto text = render(sequence, *graph_a, *graph_b, options.format);
    if (!text) {
        std::println(stderr, "Error: {}", text.error().message);
        return 1;
    }
    if (!options.output) {
        std::print("{}", *text);
        return 0;
    }
    if (auto written = graphmat::common::write_text_file(*options.output, *text); !written) {
        std::println(stderr, "Error: {}", written.error().message);
        return 1;
    }
    return 0;
}

int cmd_match(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_match_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_match_help();
        return 0;
    }
    if (options->first.empty() || options->second.empty()) {
        std::println(stderr, "Error: --first and --second are required");
        print_match_help();
        return 1;
    }
    return run_match(*options);
}

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
        if (cmd == "match") {
            return cmd_match(argc - 2, argv + 2);
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
    }
}

}  // namespace

int main(int argc, char** argv)
{
    return run_cli(argc, argv);
}
