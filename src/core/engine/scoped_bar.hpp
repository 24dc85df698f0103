#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <ranges>
#include <string_view>
#include <utility>
#include "core/engine/progress_engine.hpp"

namespace tickbar::core {

/// RAII-владелец одного бара: close вызывается на любом пути выхода.
///
/// Если создать бар не удалось (или он уже закрыт), продолжает считать
/// локально, как и при kDisable.
class ScopedBar {
public:
    ScopedBar(ProgressEngine& engine,
              std::int64_t total,
              std::string_view description = {},
              std::uint32_t flags = kLeave);
    ~ScopedBar();

    ScopedBar(const ScopedBar&) = delete;
    ScopedBar& operator=(const ScopedBar&) = delete;
    ScopedBar(ScopedBar&& other) noexcept;
    ScopedBar& operator=(ScopedBar&& other) noexcept;

    auto update(std::int64_t n = 1) -> std::int64_t;
    void set_description(std::string_view description);
    void refresh();
    void write(std::string_view message);
    void close();

    [[nodiscard]] auto count() const noexcept -> std::int64_t { return n_; }
    [[nodiscard]] auto total() const noexcept -> std::int64_t { return total_; }
    [[nodiscard]] auto handle() const noexcept -> Handle { return handle_; }
    [[nodiscard]] auto is_open() const noexcept -> bool { return static_cast<bool>(handle_); }

private:
    ProgressEngine* engine_;
    Handle handle_{};
    std::int64_t total_ = 0;
    std::int64_t n_ = 0;
};

/// Обёртка над диапазоном: update(1) на каждый пройденный элемент,
/// close при разрушении (в том числе при выходе из цикла по break).
template<std::ranges::viewable_range R>
class Tracked {
    using View = std::views::all_t<R>;
    using Base = std::ranges::iterator_t<View>;
    using BaseSentinel = std::ranges::sentinel_t<View>;

public:
    Tracked(ProgressEngine& engine, R&& range, std::string_view description, std::uint32_t flags)
        : view_(std::views::all(std::forward<R>(range)))
        , bar_(engine, total_of_(view_), description, flags)
    {}

    Tracked(const Tracked&) = delete;
    Tracked& operator=(const Tracked&) = delete;

    struct sentinel {
        BaseSentinel end_;
    };

    class iterator {
    public:
        using value_type = std::ranges::range_value_t<View>;
        using difference_type = std::ptrdiff_t;

        iterator() = default;
        iterator(Base it, Tracked* owner) : it_(std::move(it)), owner_(owner) {}

        decltype(auto) operator*() const { return *it_; }

        iterator& operator++() {
            ++it_;
            owner_->bar_.update(1);
            return *this;
        }
        void operator++(int) { ++*this; }

        friend bool operator==(const iterator& it, const sentinel& s) { return it.it_ == s.end_; }

    private:
        Base it_{};
        Tracked* owner_ = nullptr;
    };

    auto begin() -> iterator { return iterator{std::ranges::begin(view_), this}; }
    auto end() -> sentinel { return sentinel{std::ranges::end(view_)}; }

    [[nodiscard]] auto bar() -> ScopedBar& { return bar_; }

private:
    static auto total_of_(View& view) -> std::int64_t {
        if constexpr (std::ranges::sized_range<View>) {
            return static_cast<std::int64_t>(std::ranges::size(view));
        } else {
            return 0; // длина неизвестна
        }
    }

    View view_;
    ScopedBar bar_;
};

template<std::ranges::viewable_range R>
[[nodiscard]] auto tracked(ProgressEngine& engine, R&& range,
                           std::string_view description = {},
                           std::uint32_t flags = kLeave) -> Tracked<R>
{
    return Tracked<R>(engine, std::forward<R>(range), description, flags);
}

[[nodiscard]] inline auto tracked_iota(ProgressEngine& engine, std::int64_t n,
                                       std::string_view description = {},
                                       std::uint32_t flags = kLeave)
{
    return tracked(engine, std::views::iota(std::int64_t{0}, n), description, flags);
}

} // namespace tickbar::core
