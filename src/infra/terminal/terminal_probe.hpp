#pragma once

#include <cstdint>
#include <unistd.h>

namespace tickbar::infra {

inline constexpr std::int64_t kDefaultTerminalWidth = 80;

/// Ширина терминала в колонках для дескриптора fd.
/// При ошибке ioctl, не-tty выводе или нулевой ширине возвращает fallback.
[[nodiscard]] auto terminal_width(int fd = STDOUT_FILENO,
                                  std::int64_t fallback = kDefaultTerminalWidth) noexcept
    -> std::int64_t;

[[nodiscard]] auto is_terminal(int fd) noexcept -> bool;

} // namespace tickbar::infra
