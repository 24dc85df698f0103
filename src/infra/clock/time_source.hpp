#pragma once

#include <chrono>
#include <cstdint>

namespace tickbar::infra {

using Nanos = std::int64_t;

inline constexpr Nanos kNanosPerMilli = 1'000'000;
inline constexpr Nanos kNanosPerSecond = 1'000'000'000;

/// Монотонное время в наносекундах (steady_clock, не зависит от смены системных часов).
[[nodiscard]] auto time_ns() noexcept -> Nanos;

[[nodiscard]] constexpr auto to_nanos(std::chrono::nanoseconds d) noexcept -> Nanos {
    return static_cast<Nanos>(d.count());
}

} // namespace tickbar::infra
