#include "progress_state.hpp"
#include <system_error>
#include <spdlog/spdlog.h>
#include "adapters/terminal.hpp"
#include "core/render/renderer.hpp"
#include "core/render_thread/render_thread.hpp"

namespace tickbar::core {

ProgressState::ProgressState(std::optional<std::int64_t> total,
                             std::string_view description,
                             std::uint32_t flags,
                             BarOptions options)
    : total_(total)
    , flags_(flags)
    , options_(std::move(options))
    , start_ns_(infra::time_ns())
    , min_interval_ns_(infra::to_nanos(options_.min_interval))
    , cached_width_(options_.ncols.value_or(options_.default_width))
{
    // disable: ни буфера, ни пробы терминала
    if (!disabled() && !description.empty()) {
        description_.store(std::make_shared<const std::string>(description),
                           std::memory_order_release);
    }
}

ProgressState::~ProgressState() {
    // Поток обязан быть остановлен до освобождения состояния
    stop_render_thread();
}

auto ProgressState::update(std::int64_t n) -> std::int64_t {
    const auto previous = count_.load(std::memory_order_relaxed);
    const auto current = previous + n;
    count_.store(current, std::memory_order_release);

    if (!disabled() && should_render_(previous, current)) {
        render_frame();
    }
    return current;
}

auto ProgressState::should_render_(std::int64_t previous, std::int64_t current) -> bool {
    if (first_update_pending_) {
        first_update_pending_ = false;
        return true;
    }
    // Завершение рисуем всегда, но только в момент пересечения total
    if (total_ && previous < *total_ && current >= *total_) {
        return true;
    }
    return infra::time_ns() - last_render_ns_ >= min_interval_ns_;
}

void ProgressState::set_description(std::string_view description) {
    if (disabled()) return;
    // Сначала публикуем новый буфер; старый умрёт вместе с последней ссылкой
    description_.store(std::make_shared<const std::string>(description),
                       std::memory_order_release);
}

auto ProgressState::description() const -> std::shared_ptr<const std::string> {
    return description_.load(std::memory_order_acquire);
}

void ProgressState::render() {
    if (disabled()) return;
    if (render_thread_) {
        render_thread_->wake();
        return;
    }
    render_frame();
}

auto ProgressState::compose_frame_() -> std::string {
    const auto width = options_.ncols
        ? *options_.ncols
        : infra::terminal_width(options_.fd, options_.default_width);
    cached_width_.store(width, std::memory_order_relaxed);

    // Держим ссылку на буфер, пока собирается строка
    const auto desc = description();
    const auto now = infra::time_ns();
    last_render_ns_ = now;

    return compose_line(Frame{
        .count = count(),
        .total = total_,
        .description = desc ? std::string_view{*desc} : std::string_view{},
        .width = width,
        .ascii = ascii(),
        .elapsed_ns = now - start_ns_,
    });
}

void ProgressState::render_frame() {
    if (disabled()) return;
    auto line = compose_frame_();

    std::lock_guard lock(output_mutex_);
    report_write_(adapters::terminal::draw_line(options_.fd, line));
    frames_rendered_.fetch_add(1, std::memory_order_relaxed);
}

auto ProgressState::write_message(std::string_view message) -> infra::VoidResult {
    if (disabled()) return {};
    {
        std::lock_guard lock(output_mutex_);
        auto res = adapters::terminal::write_message(options_.fd, message);
        if (!res) return res;
    }
    if (!render_thread_ && frames_rendered() > 0) {
        render_frame();
    }
    return {};
}

void ProgressState::report_write_(infra::VoidResult result) {
    // Ошибка вывода не должна ломать update: логируем один раз и продолжаем
    if (result || write_failed_) return;
    write_failed_ = true;
    (void)infra::log_and_return(std::move(result.error()));
}

auto ProgressState::start_render_thread() -> infra::VoidResult {
    if (disabled() || render_thread_) return {};
    try {
        render_thread_ = std::make_unique<RenderThread>(*this);
    } catch (const std::system_error& e) {
        render_thread_.reset();
        return std::unexpected(infra::make_error(infra::ErrorCode::ThreadSpawnFailed, e.what()));
    } catch (const std::bad_alloc&) {
        return std::unexpected(infra::make_error(infra::ErrorCode::AllocationFailed,
                                                 "render thread allocation failed"));
    }
    return {};
}

auto ProgressState::stop_render_thread() -> bool {
    if (shutdown_requested_.exchange(true, std::memory_order_acq_rel)) {
        return false;
    }
    if (render_thread_) {
        render_thread_->stop();
        render_thread_.reset();
    }
    return true;
}

void ProgressState::finish() {
    if (disabled()) return;

    std::unique_lock lock(output_mutex_, std::defer_lock);
    if (is_async()) {
        // Финальный кадр уже нарисован RenderThread перед выходом
        lock.lock();
        if (leave()) {
            report_write_(adapters::terminal::write_all(options_.fd, "\n"));
        } else if (frames_rendered() > 0) {
            report_write_(adapters::terminal::clear_line(options_.fd));
        }
        return;
    }

    if (leave()) {
        auto line = compose_frame_();
        lock.lock();
        report_write_(adapters::terminal::finish_line(options_.fd, line));
        frames_rendered_.fetch_add(1, std::memory_order_relaxed);
    } else if (frames_rendered() > 0) {
        lock.lock();
        report_write_(adapters::terminal::clear_line(options_.fd));
    }
}

} // namespace tickbar::core
