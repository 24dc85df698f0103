#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include "infra/clock/time_source.hpp"
#include "infra/terminal/terminal_probe.hpp"

namespace tickbar::core {

/// Всё, что нужно для одного кадра. Чистые данные, без ссылок на состояние бара.
struct Frame {
    std::int64_t count = 0;
    std::optional<std::int64_t> total;      // nullopt: длина неизвестна
    std::string_view description;
    std::int64_t width = infra::kDefaultTerminalWidth;
    bool ascii = false;
    infra::Nanos elapsed_ns = 0;
};

/// Собирает строку бара.
///
/// Известный total:   "desc:  42%|####------| 42/100 [00:03<00:04, 14.00it/s]"
/// Неизвестный total: "desc: | 42it [00:03, 14.00it/s]"
///
/// Процент и заполнение клампятся в [0, total], счётчик печатается как есть.
/// Результат не длиннее width - 1 колонок (последняя колонка не занимается,
/// чтобы терминал не перенёс курсор на следующую строку). При нехватке места
/// сначала сжимается бар, потом описание; числовые поля режутся последними.
/// ETA больше 1e9 секунд показывается как "?".
[[nodiscard]] auto compose_line(const Frame& frame) -> std::string;

/// MM:SS, либо HH:MM:SS начиная с часа.
[[nodiscard]] auto format_duration(std::int64_t seconds) -> std::string;

/// "12.34it/s", для медленных процессов "2.50s/it".
[[nodiscard]] auto format_rate(double per_second) -> std::string;

/// Заполненная часть бара шириной ровно columns колонок.
[[nodiscard]] auto compose_bar(double fraction, std::int64_t columns, bool ascii) -> std::string;

/// Ширина в колонках: один code point UTF-8 = одна колонка.
[[nodiscard]] auto display_width(std::string_view utf8) -> std::int64_t;

/// Обрезает строку до columns колонок, не разрывая многобайтовые символы.
[[nodiscard]] auto truncate_to_width(std::string_view utf8, std::int64_t columns) -> std::string_view;

} // namespace tickbar::core
