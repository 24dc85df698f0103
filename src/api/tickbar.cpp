#include "tickbar.h"
#include <atomic>
#include <memory>
#include <mutex>
#include <string_view>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include "core/engine/progress_engine.hpp"
#include "infra/clock/time_source.hpp"
#include "infra/config/config.hpp"
#include "infra/terminal/terminal_probe.hpp"

using tickbar::core::EngineOptions;
using tickbar::core::Handle;
using tickbar::core::ProgressEngine;
using tickbar::infra::ErrorCode;

namespace {

std::mutex g_lifecycle_mutex;
std::unique_ptr<ProgressEngine> g_engine_owner;
std::atomic<ProgressEngine*> g_engine{nullptr};

// Результат последнего create/update/read в этом потоке
thread_local int t_last_error = TICKBAR_OK;

auto engine() noexcept -> ProgressEngine* {
    return g_engine.load(std::memory_order_acquire);
}

auto as_view(const char* desc, std::int64_t len) noexcept -> std::string_view {
    if (desc == nullptr || len <= 0) return {};
    return {desc, static_cast<std::size_t>(len)};
}

auto error_number(ErrorCode code) noexcept -> int {
    switch (code) {
        case ErrorCode::InvalidHandle:      return TICKBAR_E_INVALID_HANDLE;
        case ErrorCode::HandleClosed:       return TICKBAR_E_HANDLE_CLOSED;
        case ErrorCode::CapacityExhausted:  return TICKBAR_E_CAPACITY;
        case ErrorCode::AllocationFailed:
        case ErrorCode::ThreadSpawnFailed:  return TICKBAR_E_RESOURCE;
        default:                            return TICKBAR_E_INTERNAL;
    }
}

template<typename T>
auto record(const tickbar::infra::Result<T>& res) noexcept -> void {
    t_last_error = res ? TICKBAR_OK : error_number(res.error().code);
}

// Исключения не пересекают C-границу
template<typename R, typename F>
auto guarded(const char* call, R fallback, F&& body) noexcept -> R {
    try {
        return body();
    } catch (const std::exception& e) {
        spdlog::error("{}: {}", call, e.what());
        t_last_error = TICKBAR_E_INTERNAL;
        return fallback;
    }
}

auto not_initialised(const char* call) -> void {
    spdlog::warn("{}: tickbar_init() has not been called", call);
    t_last_error = TICKBAR_E_NOT_INITIALISED;
}

auto create_impl(const char* call, std::int64_t total, const char* desc,
                 std::int64_t desc_len, std::uint32_t flags, bool async) noexcept -> tickbar_handle
{
    return guarded<tickbar_handle>(call, 0, [&]() -> tickbar_handle {
        auto* e = engine();
        if (!e) {
            not_initialised(call);
            return 0;
        }
        auto created = async ? e->create_async(total, as_view(desc, desc_len), flags)
                             : e->create(total, as_view(desc, desc_len), flags);
        record(created);
        return created ? created->value : 0;
    });
}

auto update_impl(const char* call, tickbar_handle handle, std::int64_t n, bool async) noexcept
    -> std::int64_t
{
    return guarded<std::int64_t>(call, -1, [&]() -> std::int64_t {
        auto* e = engine();
        if (!e) {
            not_initialised(call);
            return -1;
        }
        auto res = async ? e->update_async(Handle{handle}, n) : e->update(Handle{handle}, n);
        record(res);
        return res ? *res : -1;
    });
}

} // namespace

extern "C" {

int tickbar_init(void) {
    std::lock_guard lock(g_lifecycle_mutex);
    if (g_engine_owner) return 0;

    return guarded<int>("tickbar_init", -1, []() -> int {
        // Кадры идут в stdout, поэтому диагностика библиотеки уходит в stderr
        if (!spdlog::get("tickbar")) {
            spdlog::set_default_logger(spdlog::stderr_color_mt("tickbar"));
            spdlog::set_level(spdlog::level::warn);
        }

        auto config = tickbar::infra::load_config_from_file();
        if (!config) {
            spdlog::error("tickbar_init: {}", config.error());
            return -1;
        }
        if (config->log_level) {
            spdlog::set_level(spdlog::level::from_str(*config->log_level));
        }

        g_engine_owner = std::make_unique<ProgressEngine>(EngineOptions::from_config(*config));
        g_engine.store(g_engine_owner.get(), std::memory_order_release);
        return 0;
    });
}

void tickbar_shutdown(void) {
    std::lock_guard lock(g_lifecycle_mutex);
    g_engine.store(nullptr, std::memory_order_release);
    g_engine_owner.reset();
}

tickbar_handle tickbar_create(int64_t total, const char* desc, int64_t desc_len, uint32_t flags) {
    return create_impl("tickbar_create", total, desc, desc_len, flags, false);
}

tickbar_handle tickbar_create_async(int64_t total, const char* desc, int64_t desc_len, uint32_t flags) {
    return create_impl("tickbar_create_async", total, desc, desc_len, flags, true);
}

int64_t tickbar_update(tickbar_handle handle, int64_t n) {
    return update_impl("tickbar_update", handle, n, false);
}

int64_t tickbar_update_async(tickbar_handle handle, int64_t n) {
    return update_impl("tickbar_update_async", handle, n, true);
}

int64_t tickbar_read(tickbar_handle handle) {
    return guarded<std::int64_t>("tickbar_read", -1, [&]() -> std::int64_t {
        auto* e = engine();
        if (!e) {
            t_last_error = TICKBAR_E_NOT_INITIALISED;
            return -1;
        }
        auto res = e->read(Handle{handle});
        record(res);
        return res ? *res : -1;
    });
}

void tickbar_render(tickbar_handle handle) {
    guarded<int>("tickbar_render", 0, [&] {
        if (auto* e = engine()) (void)e->render(Handle{handle});
        return 0;
    });
}

void tickbar_close(tickbar_handle handle) {
    guarded<int>("tickbar_close", 0, [&] {
        if (auto* e = engine()) (void)e->close(Handle{handle});
        return 0;
    });
}

void tickbar_close_async(tickbar_handle handle) {
    guarded<int>("tickbar_close_async", 0, [&] {
        if (auto* e = engine()) (void)e->close_async(Handle{handle});
        return 0;
    });
}

void tickbar_set_description(tickbar_handle handle, const char* desc, int64_t desc_len) {
    guarded<int>("tickbar_set_description", 0, [&] {
        if (auto* e = engine()) (void)e->set_description(Handle{handle}, as_view(desc, desc_len));
        return 0;
    });
}

int tickbar_last_error(void) {
    return t_last_error;
}

int64_t tickbar_terminal_width(void) {
    return tickbar::infra::terminal_width();
}

int64_t tickbar_time_ns(void) {
    return tickbar::infra::time_ns();
}

} // extern "C"
