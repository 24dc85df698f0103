#pragma once

#include <cstdint>

namespace tickbar::core {

/// Непрозрачный токен бара: индекс слота (младшие 32 бита) и поколение слота
/// (старшие 32 бита). Поколение начинается с 1, поэтому валидный handle
/// никогда не равен нулю.
struct Handle {
    std::uint64_t value = 0;

    [[nodiscard]] static constexpr auto make(std::uint32_t index, std::uint32_t generation) -> Handle {
        return Handle{(static_cast<std::uint64_t>(generation) << 32) | index};
    }

    [[nodiscard]] constexpr auto index() const -> std::uint32_t {
        return static_cast<std::uint32_t>(value & 0xFFFF'FFFFu);
    }
    [[nodiscard]] constexpr auto generation() const -> std::uint32_t {
        return static_cast<std::uint32_t>(value >> 32);
    }
    [[nodiscard]] constexpr auto is_null() const -> bool { return value == 0; }
    constexpr explicit operator bool() const { return value != 0; }

    friend constexpr bool operator==(Handle, Handle) = default;
};

inline constexpr Handle kNullHandle{};

/// Следующее поколение слота; после UINT32_MAX снова 1 (0 занят нулевым handle).
[[nodiscard]] constexpr auto next_generation(std::uint32_t generation) -> std::uint32_t {
    return generation == UINT32_MAX ? 1u : generation + 1;
}

/// Выдавалось ли поколение этому слоту раньше текущего. Пока счётчик слота не
/// переполнялся, выданы ровно [1, current); после переполнения выданы все.
[[nodiscard]] constexpr auto generation_issued_before(std::uint32_t handle_generation,
                                                      std::uint32_t current,
                                                      bool wrapped) -> bool {
    if (handle_generation == 0 || handle_generation == current) return false;
    return wrapped || handle_generation < current;
}

} // namespace tickbar::core
