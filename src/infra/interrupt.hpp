#pragma once

#include <atomic>
#include <csignal>

namespace tickbar::infra {

// Номер пойманного сигнала, 0 пока сигнала не было
extern std::atomic<int> g_interrupt_signal;

/// SIGINT/SIGTERM только запоминают номер сигнала; рабочие циклы сами
/// проверяют is_interrupted() и закрывают бар штатно.
void install_signal_handler();

inline bool is_interrupted() {
    return g_interrupt_signal.load(std::memory_order_relaxed) != 0;
}

inline int interrupt_signal() {
    return g_interrupt_signal.load(std::memory_order_relaxed);
}

/// 128 + номер сигнала, как у shell.
[[nodiscard]] auto interrupted_exit_code() -> int;

void reset_interrupt();

} // namespace tickbar::infra
