#pragma once

#include <expected>
#include <string_view>
#include "infra/error_handler/error.hpp"

namespace tickbar::adapters::terminal {

// CR + очистка до конца строки (ANSI EL0)
inline constexpr std::string_view kReturnClear = "\r\033[K";

/// Пишет буфер целиком: повторяет write(2) при EINTR и частичной записи.
[[nodiscard]] auto write_all(int fd, std::string_view data)
    -> std::expected<void, infra::Error>;

/// Кадр бара: "\r\033[K" + line, без перевода строки, одним вызовом write.
[[nodiscard]] auto draw_line(int fd, std::string_view line)
    -> std::expected<void, infra::Error>;

/// Финальный кадр с переводом строки (leave=true).
[[nodiscard]] auto finish_line(int fd, std::string_view line)
    -> std::expected<void, infra::Error>;

/// Стирает строку бара, курсор остаётся в начале строки (leave=false).
[[nodiscard]] auto clear_line(int fd)
    -> std::expected<void, infra::Error>;

/// Печатает сообщение поверх бара: очистка строки, текст, перевод строки.
[[nodiscard]] auto write_message(int fd, std::string_view message)
    -> std::expected<void, infra::Error>;

} // namespace tickbar::adapters::terminal
