#pragma once

#include <string>
#include <optional>
#include <cstdint>
#include <expected>
#include <filesystem>

namespace tickbar::args_parser{
    struct CLIArgs;
}

namespace tickbar::infra {

// Все поля необязательны: значения по умолчанию живут в EngineOptions,
// Config хранит только то, что явно задано в файле или в CLI.
struct Config {
    // Тайминги
    std::optional<std::uint32_t> min_interval_ms;     // троттлинг sync-режима
    std::optional<std::uint32_t> sample_interval_ms;  // период render-потока
    std::optional<std::uint32_t> stale_refresh_ms;    // перерисовка без изменений

    // Терминал
    std::optional<std::uint32_t> default_width;
    std::optional<std::uint32_t> ncols;               // фиксированная ширина вместо ioctl

    // Поведение
    std::optional<std::uint32_t> max_instances;
    std::optional<bool> leave;
    std::optional<bool> ascii;
    std::optional<std::string> log_level;

    // Слияние с другим Config (например, из CLI)
    void merge_with(const Config& other);
};

/// Загружает конфигурацию из файла YAML.
/// Ищет файл в порядке:
///   1. ./.tickbar.yaml
///   2. $XDG_CONFIG_HOME/tickbar/config.yaml или ~/.config/tickbar/config.yaml
/// Возвращает пустой Config, если файл не найден.
[[nodiscard]] auto load_config_from_file() -> std::expected<Config, std::string>;

/// Загружает и валидирует конкретный файл.
[[nodiscard]] auto load_config_from(const std::filesystem::path& path)
    -> std::expected<Config, std::string>;

/// Создаёт Config из CLI аргументов
[[nodiscard]] auto config_from_cli(const struct tickbar::args_parser::CLIArgs& args) -> Config;

} // namespace tickbar::infra
