#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "core/engine/handle.hpp"
#include "core/state/progress_state.hpp"
#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"

namespace tickbar::core {

struct EngineOptions {
    std::uint32_t max_instances = 256;
    BarOptions bar{};

    [[nodiscard]] static auto from_config(const infra::Config& config) -> EngineOptions;
};

struct Snapshot {
    std::int64_t count = 0;
    std::optional<std::int64_t> total;
    std::string description;
    std::uint32_t flags = 0;
    std::uint64_t frames_rendered = 0;
};

/// Фасад над набором баров.
///
/// Бары живут в арене фиксированного размера и адресуются Handle с
/// поколением: устаревший handle распознаётся (HandleClosed), а не
/// разыменовывается. create/close/read/snapshot сериализуются мьютексом,
/// update/update_async обходятся без блокировок.
///
/// total <= 0 означает неизвестную длину. Режим бара задаётся битом kAsync
/// при создании и дальше не меняется; update сам выбирает путь по режиму.
class ProgressEngine {
public:
    explicit ProgressEngine(EngineOptions options = {});
    ~ProgressEngine();

    ProgressEngine(const ProgressEngine&) = delete;
    ProgressEngine& operator=(const ProgressEngine&) = delete;
    ProgressEngine(ProgressEngine&&) = delete;
    ProgressEngine& operator=(ProgressEngine&&) = delete;

    [[nodiscard]] auto create(std::int64_t total,
                              std::string_view description = {},
                              std::uint32_t flags = kLeave) -> infra::Result<Handle>;
    [[nodiscard]] auto create(std::int64_t total,
                              std::string_view description,
                              std::uint32_t flags,
                              const BarOptions& bar) -> infra::Result<Handle>;

    // То же, что create, но kAsync взводится принудительно
    [[nodiscard]] auto create_async(std::int64_t total,
                                    std::string_view description = {},
                                    std::uint32_t flags = kLeave) -> infra::Result<Handle>;
    [[nodiscard]] auto create_async(std::int64_t total,
                                    std::string_view description,
                                    std::uint32_t flags,
                                    const BarOptions& bar) -> infra::Result<Handle>;

    /// sync: прибавить и, возможно, нарисовать; async: только fetch_add.
    auto update(Handle handle, std::int64_t n = 1) -> infra::Result<std::int64_t>;

    /// Только атомарное прибавление, без отрисовки в любом режиме.
    auto update_async(Handle handle, std::int64_t n = 1) -> infra::Result<std::int64_t>;

    [[nodiscard]] auto read(Handle handle) const -> infra::Result<std::int64_t>;

    auto render(Handle handle) -> infra::VoidResult;

    /// Идемпотентно: повторный close уже закрытого handle ничего не делает.
    auto close(Handle handle) -> infra::VoidResult;
    auto close_async(Handle handle) -> infra::VoidResult;

    auto set_description(Handle handle, std::string_view description) -> infra::VoidResult;
    auto write_message(Handle handle, std::string_view message) -> infra::VoidResult;

    [[nodiscard]] auto snapshot(Handle handle) const -> infra::Result<Snapshot>;

    [[nodiscard]] auto live_count() const -> std::size_t;
    [[nodiscard]] auto capacity() const -> std::size_t { return capacity_; }
    [[nodiscard]] auto options() const -> const EngineOptions& { return options_; }

private:
    struct Slot {
        std::atomic<std::uint32_t> generation{1};
        std::atomic<bool> wrapped{false};   // поколение хоть раз переполнялось
        std::atomic<bool> live{false};
        std::unique_ptr<ProgressState> state;
    };

    [[nodiscard]] auto resolve_(Handle handle) const -> infra::Result<ProgressState*>;
    [[nodiscard]] auto create_(std::int64_t total,
                               std::string_view description,
                               std::uint32_t flags,
                               const BarOptions& bar) -> infra::Result<Handle>;

    const EngineOptions options_;
    const std::uint32_t capacity_;
    std::unique_ptr<Slot[]> slots_;

    mutable std::mutex mutex_;
    std::vector<std::uint32_t> free_;
};

} // namespace tickbar::core
