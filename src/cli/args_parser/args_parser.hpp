#pragma once

#include <string>
#include <cstdint>
#include <optional>



namespace tickbar::args_parser {
    struct CLIArgs
{
    std::optional<std::int64_t> total;              // --total=N (без него длина неизвестна)
    std::string description;                        // -d, --desc
    std::uint64_t count{0};                         // --count=N, синтетическая нагрузка
    std::uint32_t delay_us{0};                      // --delay-us=D между итерациями
    std::uint32_t producers{1};                     // --producers=K (только --async)
    bool from_stdin{false};                         // --stdin, считать строки из stdin
    bool ascii{false};                              // --ascii
    bool no_leave{false};                           // --no-leave
    bool disable{false};                            // --disable
    bool async_render{false};                       // --async
    bool to_stderr{false};                          // --stderr
    std::optional<std::uint32_t> ncols;             // --ncols=W
    std::optional<std::uint32_t> min_interval_ms;   // --min-interval=MS
    int verbosity{0};                               // -v, -vv
    bool quiet{false};                              // -q, --quiet
    bool version{false};                            // --version
};



/// Parses command-line arguments and returns a CLIArgs struct.
/// std::nullopt means the process should exit (help printed or parse error).
std::optional<CLIArgs> parse_args(int argc, char const* const* argv);

} // namespace tickbar::args_parser

using __CLI = tickbar::args_parser::CLIArgs;
