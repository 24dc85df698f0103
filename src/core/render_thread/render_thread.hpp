#pragma once

#include <condition_variable>
#include <mutex>
#include <stop_token>
#include <thread>
#include "infra/clock/time_source.hpp"

namespace tickbar::core {

class ProgressState;

/// Фоновый поток отрисовки одного async-бара.
///
/// Раз в sample_interval читает счётчик и рисует кадр, если счётчик
/// изменился или с прошлого кадра прошло stale_refresh (чтобы тикали часы).
/// Счётчик только читает. При остановке рисует ровно один финальный кадр
/// и выходит; stop() возвращается после join.
class RenderThread {
public:
    explicit RenderThread(ProgressState& state);
    ~RenderThread();

    RenderThread(const RenderThread&) = delete;
    RenderThread& operator=(const RenderThread&) = delete;

    /// Внеочередной кадр на ближайшей итерации.
    void wake();

    void stop();

private:
    void run_(std::stop_token st);

    ProgressState& state_;
    const infra::Nanos stale_refresh_ns_;

    std::mutex mutex_;
    std::condition_variable_any cv_;
    bool refresh_requested_ = false;

    // Последним, чтобы поток стартовал с уже готовыми полями
    std::jthread thread_;
};

} // namespace tickbar::core
