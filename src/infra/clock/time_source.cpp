#include "time_source.hpp"

namespace tickbar::infra {

static_assert(std::chrono::steady_clock::is_steady);

auto time_ns() noexcept -> Nanos {
    const auto since_epoch = std::chrono::steady_clock::now().time_since_epoch();
    return to_nanos(std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch));
}

} // namespace tickbar::infra
