#include "progress_engine.hpp"
#include <algorithm>
#include <new>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace tickbar::core {

auto EngineOptions::from_config(const infra::Config& config) -> EngineOptions {
    EngineOptions opts;
    if (config.max_instances) opts.max_instances = *config.max_instances;
    if (config.min_interval_ms) opts.bar.min_interval = std::chrono::milliseconds(*config.min_interval_ms);
    if (config.sample_interval_ms) opts.bar.sample_interval = std::chrono::milliseconds(*config.sample_interval_ms);
    if (config.stale_refresh_ms) opts.bar.stale_refresh = std::chrono::milliseconds(*config.stale_refresh_ms);
    if (config.default_width) opts.bar.default_width = *config.default_width;
    if (config.ncols) opts.bar.ncols = *config.ncols;
    return opts;
}

ProgressEngine::ProgressEngine(EngineOptions options)
    : options_(std::move(options))
    , capacity_(std::max<std::uint32_t>(options_.max_instances, 1))
    , slots_(std::make_unique<Slot[]>(capacity_))
{
    free_.reserve(capacity_);
    for (std::uint32_t i = capacity_; i > 0; --i) {
        free_.push_back(i - 1);
    }
    spdlog::debug("progress engine ready: {} slots", capacity_);
}

ProgressEngine::~ProgressEngine() {
    std::vector<Handle> open;
    {
        std::lock_guard lock(mutex_);
        for (std::uint32_t i = 0; i < capacity_; ++i) {
            if (slots_[i].live.load(std::memory_order_acquire)) {
                open.push_back(Handle::make(i, slots_[i].generation.load(std::memory_order_relaxed)));
            }
        }
    }
    if (!open.empty()) {
        spdlog::debug("closing {} bar(s) left open", open.size());
    }
    for (auto handle : open) {
        (void)close(handle);
    }
}

auto ProgressEngine::resolve_(Handle handle) const -> infra::Result<ProgressState*> {
    if (handle.is_null()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidHandle, "null handle"));
    }
    if (handle.index() >= capacity_) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidHandle,
            fmt::format("handle {:#x}: slot {} out of range", handle.value, handle.index())));
    }

    const auto& slot = slots_[handle.index()];
    const auto generation = slot.generation.load(std::memory_order_acquire);
    if (handle.generation() == generation && slot.live.load(std::memory_order_acquire)) {
        return slot.state.get();
    }
    if (generation_issued_before(handle.generation(), generation,
                                 slot.wrapped.load(std::memory_order_acquire))) {
        return std::unexpected(infra::make_error(infra::ErrorCode::HandleClosed,
            fmt::format("handle {:#x} already closed", handle.value)));
    }
    return std::unexpected(infra::make_error(infra::ErrorCode::InvalidHandle,
        fmt::format("handle {:#x} was never issued", handle.value)));
}

auto ProgressEngine::create(std::int64_t total, std::string_view description,
                            std::uint32_t flags) -> infra::Result<Handle> {
    return create_(total, description, flags, options_.bar);
}

auto ProgressEngine::create(std::int64_t total, std::string_view description,
                            std::uint32_t flags, const BarOptions& bar) -> infra::Result<Handle> {
    return create_(total, description, flags, bar);
}

auto ProgressEngine::create_async(std::int64_t total, std::string_view description,
                                  std::uint32_t flags) -> infra::Result<Handle> {
    return create_(total, description, flags | kAsync, options_.bar);
}

auto ProgressEngine::create_async(std::int64_t total, std::string_view description,
                                  std::uint32_t flags, const BarOptions& bar) -> infra::Result<Handle> {
    return create_(total, description, flags | kAsync, bar);
}

auto ProgressEngine::create_(std::int64_t total, std::string_view description,
                             std::uint32_t flags, const BarOptions& bar) -> infra::Result<Handle>
{
    if (flags & kReservedFlags) {
        spdlog::debug("reserved flag bits {:#x} ignored", flags & kReservedFlags);
    }
    flags &= kKnownFlags;

    std::uint32_t index = 0;
    {
        std::lock_guard lock(mutex_);
        if (free_.empty()) {
            return std::unexpected(infra::log_and_return(infra::make_error(
                infra::ErrorCode::CapacityExhausted,
                fmt::format("all {} bar slots in use", capacity_))));
        }
        index = free_.back();
        free_.pop_back();
    }

    // Состояние и поток строим вне мьютекса: спавн потока не быстрый
    std::unique_ptr<ProgressState> state;
    infra::VoidResult started{};
    try {
        state = std::make_unique<ProgressState>(
            total > 0 ? std::optional<std::int64_t>{total} : std::nullopt,
            description, flags, bar);
        if (flags & kAsync) {
            started = state->start_render_thread();
        }
    } catch (const std::bad_alloc&) {
        started = std::unexpected(infra::make_error(infra::ErrorCode::AllocationFailed,
                                                    "cannot allocate progress state"));
    }

    std::lock_guard lock(mutex_);
    if (!started) {
        // Недостроенное состояние освобождается здесь, слот возвращается в пул
        state.reset();
        free_.push_back(index);
        return std::unexpected(infra::log_and_return(std::move(started.error())));
    }

    auto& slot = slots_[index];
    slot.state = std::move(state);
    const auto generation = slot.generation.load(std::memory_order_relaxed);
    slot.live.store(true, std::memory_order_release);

    const auto handle = Handle::make(index, generation);
    spdlog::debug("bar {:#x} created: total={} flags={:#04x}", handle.value, total, flags);
    return handle;
}

auto ProgressEngine::update(Handle handle, std::int64_t n) -> infra::Result<std::int64_t> {
    auto state = resolve_(handle);
    if (!state) [[unlikely]] {
        return std::unexpected(infra::log_and_return(std::move(state.error())));
    }
    if ((*state)->is_async()) {
        return (*state)->add(n);
    }
    return (*state)->update(n);
}

auto ProgressEngine::update_async(Handle handle, std::int64_t n) -> infra::Result<std::int64_t> {
    auto state = resolve_(handle);
    if (!state) [[unlikely]] {
        return std::unexpected(infra::log_and_return(std::move(state.error())));
    }
    return (*state)->add(n);
}

auto ProgressEngine::read(Handle handle) const -> infra::Result<std::int64_t> {
    std::lock_guard lock(mutex_);
    auto state = resolve_(handle);
    if (!state) {
        return std::unexpected(infra::log_and_return(std::move(state.error())));
    }
    return (*state)->count();
}

auto ProgressEngine::render(Handle handle) -> infra::VoidResult {
    auto state = resolve_(handle);
    if (!state) {
        return std::unexpected(infra::log_and_return(std::move(state.error())));
    }
    (*state)->render();
    return {};
}

auto ProgressEngine::close(Handle handle) -> infra::VoidResult {
    std::unique_ptr<ProgressState> state;
    {
        std::lock_guard lock(mutex_);
        auto resolved = resolve_(handle);
        if (!resolved) {
            if (resolved.error().code == infra::ErrorCode::HandleClosed) {
                spdlog::trace("bar {:#x}: close on closed handle ignored", handle.value);
                return {};
            }
            return std::unexpected(infra::log_and_return(std::move(resolved.error())));
        }

        auto& slot = slots_[handle.index()];
        slot.live.store(false, std::memory_order_release);
        const auto next = next_generation(handle.generation());
        if (next < handle.generation()) {
            slot.wrapped.store(true, std::memory_order_release);
        }
        slot.generation.store(next, std::memory_order_release);
        state = std::move(slot.state);
        free_.push_back(handle.index());
    }

    // Вне мьютекса: join render-потока может занять до одного интервала
    const bool async = state->is_async();
    state->stop_render_thread();
    state->finish();
    spdlog::debug("bar {:#x} closed at {} ({})", handle.value, state->count(), async ? "async" : "sync");
    return {};
}

auto ProgressEngine::close_async(Handle handle) -> infra::VoidResult {
    return close(handle);
}

auto ProgressEngine::set_description(Handle handle, std::string_view description) -> infra::VoidResult {
    auto state = resolve_(handle);
    if (!state) {
        return std::unexpected(infra::log_and_return(std::move(state.error())));
    }
    (*state)->set_description(description);
    return {};
}

auto ProgressEngine::write_message(Handle handle, std::string_view message) -> infra::VoidResult {
    auto state = resolve_(handle);
    if (!state) {
        return std::unexpected(infra::log_and_return(std::move(state.error())));
    }
    return (*state)->write_message(message);
}

auto ProgressEngine::snapshot(Handle handle) const -> infra::Result<Snapshot> {
    std::lock_guard lock(mutex_);
    auto state = resolve_(handle);
    if (!state) {
        return std::unexpected(infra::log_and_return(std::move(state.error())));
    }
    const auto* s = *state;
    const auto desc = s->description();
    return Snapshot{
        .count = s->count(),
        .total = s->total(),
        .description = desc ? *desc : std::string{},
        .flags = s->flags(),
        .frames_rendered = s->frames_rendered(),
    };
}

auto ProgressEngine::live_count() const -> std::size_t {
    std::lock_guard lock(mutex_);
    std::size_t live = 0;
    for (std::uint32_t i = 0; i < capacity_; ++i) {
        if (slots_[i].live.load(std::memory_order_acquire)) ++live;
    }
    return live;
}

} // namespace tickbar::core
