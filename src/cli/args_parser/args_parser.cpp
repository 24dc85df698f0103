#include "args_parser.hpp"
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

namespace tickbar::args_parser {

std::optional<CLIArgs> parse_args(int argc, char const* const* argv) {
    CLIArgs args;
    CLI::App app{"tickbar - terminal progress bar driver"};

    app.add_option("--total", args.total, "Expected number of iterations (omit for unknown length)")
        ->check(CLI::NonNegativeNumber);
    app.add_option("-d,--desc", args.description, "Description prefix");
    app.add_option("-n,--count", args.count, "Run a synthetic workload of N iterations");
    app.add_option("--delay-us", args.delay_us, "Sleep between synthetic iterations, microseconds");
    app.add_option("--producers", args.producers, "Producer threads for --async")
        ->check(CLI::Range(1u, 256u));
    app.add_flag("--stdin", args.from_stdin, "Count lines read from stdin");
    app.add_flag("--ascii", args.ascii, "ASCII-only glyphs");
    app.add_flag("--no-leave", args.no_leave, "Clear the bar on completion");
    app.add_flag("--disable", args.disable, "Count without rendering");
    app.add_flag("--async", args.async_render, "Render from a dedicated thread");
    app.add_flag("--stderr", args.to_stderr, "Render to stderr instead of stdout");
    app.add_option("--ncols", args.ncols, "Fixed width instead of terminal probe")
        ->check(CLI::Range(1u, 9999u));
    app.add_option("--min-interval", args.min_interval_ms, "Sync render throttle, milliseconds");
    app.add_flag("-v,--verbose", args.verbosity, "Increase log verbosity");
    app.add_flag("-q,--quiet", args.quiet, "Only log errors");
    app.add_flag("--version", args.version, "Print build info and exit");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        app.exit(e);
        return std::nullopt;
    }

    if (!args.version && !args.from_stdin && args.count == 0) {
        spdlog::error("Nothing to do: pass --stdin or --count N");
        return std::nullopt;
    }
    if (args.from_stdin && args.count != 0) {
        spdlog::error("--stdin and --count are mutually exclusive");
        return std::nullopt;
    }
    if (args.producers > 1 && !args.async_render) {
        spdlog::warn("--producers ignored without --async");
        args.producers = 1;
    }

    return args;
}

} // namespace tickbar::args_parser
