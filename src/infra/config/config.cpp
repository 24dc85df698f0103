#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <cstdlib>
#include <vector>

#include "config.hpp"
#include "../../cli/args_parser/args_parser.hpp"

namespace tickbar::infra {

namespace {

struct Range {
    std::uint32_t min;
    std::uint32_t max;
};

constexpr Range kIntervalRange{1, 60'000};
constexpr Range kMinIntervalRange{0, 60'000};
constexpr Range kWidthRange{1, 9'999};
constexpr Range kInstancesRange{1, 65'536};

auto read_bounded(const YAML::Node& root, const char* key, Range range)
    -> std::expected<std::optional<std::uint32_t>, std::string>
{
    if (!root[key]) return std::optional<std::uint32_t>{};

    auto value = root[key].as<std::int64_t>();
    if (value < range.min || value > range.max) {
        return std::unexpected(fmt::format("{} = {} out of range [{}, {}]",
                                           key, value, range.min, range.max));
    }
    return std::optional<std::uint32_t>{static_cast<std::uint32_t>(value)};
}

auto is_known_level(const std::string& level) -> bool {
    // from_str возвращает off для неизвестных строк
    return level == "off" || spdlog::level::from_str(level) != spdlog::level::off;
}

} // namespace

void Config::merge_with(const Config& other) {
    if (other.min_interval_ms) min_interval_ms = other.min_interval_ms;
    if (other.sample_interval_ms) sample_interval_ms = other.sample_interval_ms;
    if (other.stale_refresh_ms) stale_refresh_ms = other.stale_refresh_ms;
    if (other.default_width) default_width = other.default_width;
    if (other.ncols) ncols = other.ncols;
    if (other.max_instances) max_instances = other.max_instances;
    if (other.leave) leave = other.leave;
    if (other.ascii) ascii = other.ascii;
    if (other.log_level) log_level = other.log_level;
}

static auto get_config_paths() -> std::vector<std::filesystem::path> {
    std::vector<std::filesystem::path> paths;

    // 1. Локальный файл
    paths.push_back(".tickbar.yaml");

    // 2. Глобальный файл
    const char* config_home = std::getenv("XDG_CONFIG_HOME");
    if (config_home && std::filesystem::exists(config_home)) {
        paths.push_back(std::filesystem::path(config_home) / "tickbar" / "config.yaml");
    } else {
        const char* home = std::getenv("HOME");
        if (home) {
            paths.push_back(std::filesystem::path(home) / ".config" / "tickbar" / "config.yaml");
        }
    }

    return paths;
}

auto load_config_from(const std::filesystem::path& path)
    -> std::expected<Config, std::string>
{
    try {
        YAML::Node root = YAML::LoadFile(path.string());
        Config cfg{};

        if (!root || root.IsNull()) {
            return cfg; // пустой файл
        }
        if (!root.IsMap()) {
            return std::unexpected(fmt::format("{}: top-level node must be a map", path.string()));
        }

        struct BoundedKey {
            const char* key;
            Range range;
            std::optional<std::uint32_t> Config::* field;
        };
        const BoundedKey keys[] = {
            {"min_interval_ms", kMinIntervalRange, &Config::min_interval_ms},
            {"sample_interval_ms", kIntervalRange, &Config::sample_interval_ms},
            {"stale_refresh_ms", kIntervalRange, &Config::stale_refresh_ms},
            {"default_width", kWidthRange, &Config::default_width},
            {"ncols", kWidthRange, &Config::ncols},
            {"max_instances", kInstancesRange, &Config::max_instances},
        };
        for (const auto& k : keys) {
            auto value = read_bounded(root, k.key, k.range);
            if (!value) {
                return std::unexpected(fmt::format("{}: {}", path.string(), value.error()));
            }
            cfg.*(k.field) = *value;
        }

        if (root["leave"]) cfg.leave = root["leave"].as<bool>();
        if (root["ascii"]) cfg.ascii = root["ascii"].as<bool>();

        if (root["log_level"]) {
            auto level = root["log_level"].as<std::string>();
            if (!is_known_level(level)) {
                return std::unexpected(fmt::format("{}: unknown log_level '{}'", path.string(), level));
            }
            cfg.log_level = std::move(level);
        }

        spdlog::debug("Loaded config from {}", path.string());
        return cfg;

    } catch (const std::exception& e) {
        return std::unexpected(fmt::format("Failed to parse {}: {}", path.string(), e.what()));
    }
}

auto load_config_from_file() -> std::expected<Config, std::string> {
    for (const auto& path : get_config_paths()) {
        if (!std::filesystem::exists(path)) continue;
        return load_config_from(path);
    }

    // Файла нет: пустой конфиг, это не ошибка
    return Config{};
}

[[nodiscard]]
auto config_from_cli(const __CLI& args) -> Config {
    Config cfg{};
    cfg.min_interval_ms = args.min_interval_ms;
    cfg.ncols = args.ncols;
    if (args.ascii) cfg.ascii = true;
    if (args.no_leave) cfg.leave = false;
    if (args.quiet) {
        cfg.log_level = "err";
    } else if (args.verbosity >= 2) {
        cfg.log_level = "trace";
    } else if (args.verbosity == 1) {
        cfg.log_level = "debug";
    }
    return cfg;
}

} // namespace tickbar::infra
