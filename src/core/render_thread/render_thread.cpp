#include "render_thread.hpp"
#include <optional>
#include <utility>
#include <spdlog/spdlog.h>
#include "core/state/progress_state.hpp"

namespace tickbar::core {

RenderThread::RenderThread(ProgressState& state)
    : state_(state)
    , stale_refresh_ns_(infra::to_nanos(state.options().stale_refresh))
    , thread_([this](std::stop_token st) { run_(st); })
{
}

RenderThread::~RenderThread() {
    stop();
}

void RenderThread::wake() {
    {
        std::lock_guard lock(mutex_);
        refresh_requested_ = true;
    }
    cv_.notify_one();
}

void RenderThread::stop() {
    if (!thread_.joinable()) return;
    // request_stop будит wait на cv_ через stop_token
    thread_.request_stop();
    thread_.join();
}

void RenderThread::run_(std::stop_token st) {
    const auto interval = state_.options().sample_interval;
    spdlog::debug("render thread started (interval {}ms)", interval.count());

    std::optional<std::int64_t> last_rendered;
    infra::Nanos last_render_ns = 0;

    std::unique_lock lock(mutex_);
    while (!st.stop_requested()) {
        cv_.wait_for(lock, st, interval, [this] { return refresh_requested_; });
        if (st.stop_requested()) break;

        const bool forced = std::exchange(refresh_requested_, false);
        const auto current = state_.count();
        const auto now = infra::time_ns();

        if (forced || current != last_rendered || now - last_render_ns >= stale_refresh_ns_) {
            lock.unlock();
            state_.render_frame();
            lock.lock();
            last_rendered = current;
            last_render_ns = now;
        }
    }
    lock.unlock();

    // Финальный кадр с окончательным значением счётчика
    state_.render_frame();
    spdlog::debug("render thread stopped at count {}", state_.count());
}

} // namespace tickbar::core
