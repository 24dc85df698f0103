#include <iostream>
#include <fmt/core.h>

#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/interrupt.hpp"
#include "cli/args_parser/args_parser.hpp"
#include "core/engine/progress_engine.hpp"
#include "core/engine/scoped_bar.hpp"
#include <build_info.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using ARGS = tickbar::args_parser::CLIArgs;
using CONFIG = tickbar::infra::Config;

constexpr auto load_from_cli = tickbar::infra::config_from_cli;
constexpr auto load_config_file = tickbar::infra::load_config_from_file;
constexpr auto args_parser = tickbar::args_parser::parse_args;

namespace core = tickbar::core;

static auto
__out_build_verse()
-> void {
    namespace bi = tickbar::build_info;
    fmt::print("tickbar {}\n", bi::version);
    fmt::print("Git commit: {}{}\n", bi::git_commit, bi::git_dirty ? " (dirty)" : "");
    fmt::print("Build type: {}\n", bi::build_type);
}

static auto
make_flags(const ARGS& args, const CONFIG& config)
-> std::uint32_t {
    std::uint32_t flags = 0;
    if (config.leave.value_or(true)) flags |= core::kLeave;
    if (config.ascii.value_or(false)) flags |= core::kAscii;
    if (args.disable) flags |= core::kDisable;
    if (args.async_render) flags |= core::kAsync;
    return flags;
}

// Считает строки stdin, сами строки никуда не выводятся
static auto
run_stdin(core::ScopedBar& bar)
-> void {
    std::string line;
    while (!tickbar::infra::is_interrupted() && std::getline(std::cin, line)) {
        bar.update(1);
    }
}

static auto
run_synthetic(core::ProgressEngine& engine, core::ScopedBar& bar, const ARGS& args)
-> void {
    const auto delay = std::chrono::microseconds(args.delay_us);

    if (args.producers <= 1 || !bar.is_open()) {
        for (std::uint64_t i = 0; i < args.count && !tickbar::infra::is_interrupted(); ++i) {
            bar.update(1);
            if (args.delay_us) std::this_thread::sleep_for(delay);
        }
        return;
    }

    // Несколько производителей бьют в один счётчик через update_async
    const auto handle = bar.handle();
    const auto share = args.count / args.producers;
    const auto remainder = args.count % args.producers;

    std::vector<std::jthread> producers;
    producers.reserve(args.producers);
    for (std::uint32_t p = 0; p < args.producers; ++p) {
        const auto iterations = share + (p == 0 ? remainder : 0);
        producers.emplace_back([&engine, handle, iterations, delay, &args] {
            for (std::uint64_t i = 0; i < iterations && !tickbar::infra::is_interrupted(); ++i) {
                (void)engine.update_async(handle, 1);
                if (args.delay_us) std::this_thread::sleep_for(delay);
            }
        });
    }
    // jthread join в деструкторе
}

int main(int argc, char** argv)
{
    try {
        // Кадры бара идут в stdout, логи в stderr
        spdlog::set_default_logger(spdlog::stderr_color_mt("tickbar"));
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");

        tickbar::infra::install_signal_handler();

        auto args_opt = args_parser(argc, argv);
        if (!args_opt) {
            return 1; // --help или ошибка
        }
        const auto& args = *args_opt;

        if (args.version) {
            __out_build_verse();
            return 0;
        }

        // 1. Загрузить из файла
        auto config_res = load_config_file();
        if (!config_res) {
            spdlog::error("Config error: {}", config_res.error());
            return tickbar::infra::make_error(tickbar::infra::ErrorCode::ConfigInvalid,
                                              config_res.error()).to_exit_code();
        }
        auto config = config_res.value();

        // 2. Переопределить из CLI
        config.merge_with(load_from_cli(args));
        if (config.log_level) {
            spdlog::set_level(spdlog::level::from_str(*config.log_level));
        }

        auto options = core::EngineOptions::from_config(config);
        options.bar.fd = args.to_stderr ? STDERR_FILENO : STDOUT_FILENO;
        core::ProgressEngine engine(options);

        const auto total = args.total.value_or(args.from_stdin ? 0 : static_cast<std::int64_t>(args.count));
        const auto flags = make_flags(args, config);
        spdlog::debug("Starting: total={} flags={:#04x} producers={}", total, flags, args.producers);

        auto start_time = std::chrono::steady_clock::now();
        std::int64_t final_count = 0;
        {
            core::ScopedBar bar(engine, total, args.description, flags);
            if (args.from_stdin) {
                run_stdin(bar);
            } else {
                run_synthetic(engine, bar, args);
            }
            bar.close();
            final_count = bar.count();
        }
        auto duration = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time);

        spdlog::info("Processed {} item(s) in {:.3f}s", final_count, duration.count());
        if (duration.count() > 0) {
            spdlog::info("Average rate: {:.1f} it/s", final_count / duration.count());
        }

        if (tickbar::infra::is_interrupted()) {
            (void)tickbar::infra::log_and_return(tickbar::infra::make_error(
                tickbar::infra::ErrorCode::Interrupted,
                fmt::format("stopped by signal {} after {} item(s)",
                            tickbar::infra::interrupt_signal(), final_count)));
            return tickbar::infra::interrupted_exit_code();
        }
        return 0;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
