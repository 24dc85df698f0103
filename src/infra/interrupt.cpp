#include "interrupt.hpp"
#include <cerrno>
#include <cstring>
#include <initializer_list>
#include <spdlog/spdlog.h>

namespace tickbar::infra {

std::atomic<int> g_interrupt_signal{0};

namespace {

// Только async-signal-safe операции: логирует уже основной поток
extern "C" void on_signal(int sig) {
    g_interrupt_signal.store(sig, std::memory_order_relaxed);
}

} // namespace

void install_signal_handler() {
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = on_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;

    for (int sig : {SIGINT, SIGTERM}) {
        if (::sigaction(sig, &sa, nullptr) != 0) {
            spdlog::warn("cannot install handler for signal {}: {}", sig, std::strerror(errno));
        }
    }
}

auto interrupted_exit_code() -> int {
    const int sig = interrupt_signal();
    return sig != 0 ? 128 + sig : 0;
}

void reset_interrupt() {
    g_interrupt_signal.store(0, std::memory_order_relaxed);
}

} // namespace tickbar::infra
