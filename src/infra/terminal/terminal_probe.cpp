#include "terminal_probe.hpp"
#include <sys/ioctl.h>

namespace tickbar::infra {

auto terminal_width(int fd, std::int64_t fallback) noexcept -> std::int64_t {
    struct winsize ws{};
    if (::ioctl(fd, TIOCGWINSZ, &ws) == -1 || ws.ws_col == 0) {
        return fallback;
    }
    return static_cast<std::int64_t>(ws.ws_col);
}

auto is_terminal(int fd) noexcept -> bool {
    return ::isatty(fd) == 1;
}

} // namespace tickbar::infra
