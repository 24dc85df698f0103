#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unistd.h>
#include "infra/clock/time_source.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/terminal/terminal_probe.hpp"

namespace tickbar::core {

enum Flag : std::uint32_t {
    kLeave   = 0x01,
    kDisable = 0x02,
    kAscii   = 0x04,
    kAsync   = 0x20,
};

// 0x08 и 0x10 зарезервированы: принимаются и игнорируются
inline constexpr std::uint32_t kReservedFlags = 0x08 | 0x10;
inline constexpr std::uint32_t kKnownFlags = kLeave | kDisable | kAscii | kAsync;

struct BarOptions {
    int fd = STDOUT_FILENO;
    std::optional<std::int64_t> ncols;          // задано: ширина не пробуется
    std::int64_t default_width = infra::kDefaultTerminalWidth;
    std::chrono::milliseconds min_interval{50};
    std::chrono::milliseconds sample_interval{16};
    std::chrono::milliseconds stale_refresh{1000};
};

class RenderThread;

/// Состояние одного бара: счётчик, total, описание, флаги, отметки времени.
///
/// Счётчик атомарный в обоих режимах. В sync-режиме его пишет только
/// вызывающий поток (load + store, без lock-префикса), в async-режиме
/// update идёт через fetch_add и может вызываться из любых потоков.
/// Рисует либо вызывающий поток (sync), либо RenderThread (async), но не оба.
class ProgressState {
public:
    ProgressState(std::optional<std::int64_t> total,
                  std::string_view description,
                  std::uint32_t flags,
                  BarOptions options);
    ~ProgressState();

    ProgressState(const ProgressState&) = delete;
    ProgressState& operator=(const ProgressState&) = delete;
    ProgressState(ProgressState&&) = delete;
    ProgressState& operator=(ProgressState&&) = delete;

    // Горячий путь async-режима: один fetch_add и больше ничего
    auto add(std::int64_t n) noexcept -> std::int64_t {
        return count_.fetch_add(n, std::memory_order_acq_rel) + n;
    }

    /// sync: прибавляет n и рисует, если это разрешает троттлинг.
    auto update(std::int64_t n) -> std::int64_t;

    [[nodiscard]] auto count() const noexcept -> std::int64_t {
        return count_.load(std::memory_order_acquire);
    }
    [[nodiscard]] auto total() const noexcept -> std::optional<std::int64_t> { return total_; }
    [[nodiscard]] auto flags() const noexcept -> std::uint32_t { return flags_; }
    [[nodiscard]] auto options() const noexcept -> const BarOptions& { return options_; }

    [[nodiscard]] auto is_async() const noexcept -> bool { return (flags_ & kAsync) != 0; }
    [[nodiscard]] auto disabled() const noexcept -> bool { return (flags_ & kDisable) != 0; }
    [[nodiscard]] auto leave() const noexcept -> bool { return (flags_ & kLeave) != 0; }
    [[nodiscard]] auto ascii() const noexcept -> bool { return (flags_ & kAscii) != 0; }

    [[nodiscard]] auto start_time_ns() const noexcept -> infra::Nanos { return start_ns_; }
    [[nodiscard]] auto cached_width() const noexcept -> std::int64_t {
        return cached_width_.load(std::memory_order_relaxed);
    }

    /// Публикует новый буфер; старый освобождается, когда его отпустит последний читатель.
    void set_description(std::string_view description);
    [[nodiscard]] auto description() const -> std::shared_ptr<const std::string>;

    /// Принудительная перерисовка: sync рисует сразу, async будит RenderThread.
    void render();

    /// Собирает и выводит один кадр. Вызывается только рисующим актором.
    void render_frame();

    /// Текст над баром; бар перерисовывается сразу же (sync) или на следующем тике (async).
    [[nodiscard]] auto write_message(std::string_view message) -> infra::VoidResult;

    [[nodiscard]] auto start_render_thread() -> infra::VoidResult;

    /// Однократный shutdown: будит поток, ждёт финальный кадр и join.
    /// false, если shutdown уже был запрошен ранее.
    auto stop_render_thread() -> bool;

    [[nodiscard]] auto has_render_thread() const noexcept -> bool { return render_thread_ != nullptr; }
    [[nodiscard]] auto shutdown_requested() const noexcept -> bool {
        return shutdown_requested_.load(std::memory_order_acquire);
    }

    /// Финальный вывод при close: при leave кадр и перевод строки, иначе очистка строки.
    /// В async-режиме вызывается после stop_render_thread().
    void finish();

    [[nodiscard]] auto frames_rendered() const noexcept -> std::uint64_t {
        return frames_rendered_.load(std::memory_order_relaxed);
    }

private:
    [[nodiscard]] auto should_render_(std::int64_t previous, std::int64_t current) -> bool;
    [[nodiscard]] auto compose_frame_() -> std::string;
    void report_write_(infra::VoidResult result);

    const std::optional<std::int64_t> total_;
    const std::uint32_t flags_;
    const BarOptions options_;
    const infra::Nanos start_ns_;
    const infra::Nanos min_interval_ns_;

    std::atomic<std::int64_t> count_{0};
    std::atomic<std::shared_ptr<const std::string>> description_;

    // Пишет только рисующий актор
    infra::Nanos last_render_ns_ = 0;
    bool first_update_pending_ = true;
    std::atomic<std::int64_t> cached_width_;
    std::atomic<std::uint64_t> frames_rendered_{0};

    // Сериализует записи в fd: кадры RenderThread и write_message вызывающего
    std::mutex output_mutex_;
    bool write_failed_ = false;

    std::atomic<bool> shutdown_requested_{false};
    std::unique_ptr<RenderThread> render_thread_;
};

} // namespace tickbar::core
