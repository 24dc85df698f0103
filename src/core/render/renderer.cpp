#include "renderer.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <fmt/core.h>

namespace tickbar::core {

namespace {

constexpr std::array<std::string_view, 4> kAsciiSpinner{"|", "/", "-", "\\"};
constexpr std::array<std::string_view, 10> kUnicodeSpinner{
    "⠋", "⠙", "⠹", "⠸", "⠼", "⠴", "⠦", "⠧", "⠇", "⠏"};

// Индекс = число восьмых долей клетки
constexpr std::array<std::string_view, 8> kPartialBlocks{
    "", "▏", "▎", "▍", "▌", "▋", "▊", "▉"};
constexpr std::string_view kFullBlock = "█";

constexpr infra::Nanos kSpinnerPeriod = 100 * infra::kNanosPerMilli;

auto spinner_glyph(infra::Nanos elapsed_ns, bool ascii) -> std::string_view {
    const auto tick = static_cast<std::size_t>(std::max<infra::Nanos>(elapsed_ns, 0) / kSpinnerPeriod);
    return ascii ? kAsciiSpinner[tick % kAsciiSpinner.size()]
                 : kUnicodeSpinner[tick % kUnicodeSpinner.size()];
}

auto percent_of(std::int64_t shown, std::int64_t total) -> std::int64_t {
    if (shown <= std::numeric_limits<std::int64_t>::max() / 100) {
        return shown * 100 / total;
    }
    return static_cast<std::int64_t>(static_cast<long double>(shown) * 100 / total);
}

// Дальше ETA не показываем: такие значения бессмысленны и не влезают в int64
constexpr double kMaxEtaSeconds = 1e9;

/// "desc: ", ужатое до room колонок. Описание режется первым, числа остаются.
auto fit_prefix(std::string_view description, std::int64_t room) -> std::string {
    if (description.empty() || room < 3) return {};
    if (display_width(description) + 2 <= room) {
        return fmt::format("{}: ", description);
    }
    return fmt::format("{}: ", truncate_to_width(description, room - 2));
}

} // namespace

auto format_duration(std::int64_t seconds) -> std::string {
    if (seconds < 0) seconds = 0;
    const auto hours = seconds / 3600;
    const auto minutes = (seconds % 3600) / 60;
    seconds %= 60;
    if (hours > 0) {
        return fmt::format("{:02d}:{:02d}:{:02d}", hours, minutes, seconds);
    }
    return fmt::format("{:02d}:{:02d}", minutes, seconds);
}

auto format_rate(double per_second) -> std::string {
    if (!std::isfinite(per_second) || per_second <= 0.0) {
        return "0.00it/s";
    }
    if (per_second < 1.0) {
        return fmt::format("{:.2f}s/it", 1.0 / per_second);
    }
    return fmt::format("{:.2f}it/s", per_second);
}

auto compose_bar(double fraction, std::int64_t columns, bool ascii) -> std::string {
    if (columns <= 0) return {};
    fraction = std::clamp(fraction, 0.0, 1.0);

    std::string bar;
    if (ascii) {
        const auto filled = static_cast<std::int64_t>(fraction * static_cast<double>(columns));
        bar.append(static_cast<std::size_t>(filled), '#');
        bar.append(static_cast<std::size_t>(columns - filled), '-');
        return bar;
    }

    const auto eighths = static_cast<std::int64_t>(fraction * static_cast<double>(columns) * 8);
    const auto full = std::min(eighths / 8, columns);
    const auto partial = full < columns ? eighths % 8 : 0;

    bar.reserve(static_cast<std::size_t>(columns) * kFullBlock.size());
    for (std::int64_t i = 0; i < full; ++i) bar.append(kFullBlock);
    auto used = full;
    if (partial > 0) {
        bar.append(kPartialBlocks[static_cast<std::size_t>(partial)]);
        ++used;
    }
    bar.append(static_cast<std::size_t>(columns - used), ' ');
    return bar;
}

auto display_width(std::string_view utf8) -> std::int64_t {
    return std::count_if(utf8.begin(), utf8.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    });
}

auto truncate_to_width(std::string_view utf8, std::int64_t columns) -> std::string_view {
    if (columns <= 0) return {};
    std::int64_t seen = 0;
    for (std::size_t i = 0; i < utf8.size(); ++i) {
        const auto byte = static_cast<unsigned char>(utf8[i]);
        if ((byte & 0xC0) == 0x80) continue; // продолжение символа
        if (seen == columns) return utf8.substr(0, i);
        ++seen;
    }
    return utf8;
}

auto compose_line(const Frame& frame) -> std::string {
    const double elapsed_s = static_cast<double>(frame.elapsed_ns) / infra::kNanosPerSecond;
    const double rate = elapsed_s > 0.0 ? static_cast<double>(frame.count) / elapsed_s : 0.0;
    const std::string elapsed = format_duration(frame.elapsed_ns / infra::kNanosPerSecond);
    const std::string rate_str = frame.elapsed_ns > 0 ? format_rate(rate) : std::string{"?it/s"};
    const std::int64_t budget = std::max<std::int64_t>(frame.width - 1, 1);

    std::string line;
    if (frame.total && *frame.total > 0) {
        const auto total = *frame.total;
        const auto shown = std::clamp<std::int64_t>(frame.count, 0, total);
        const auto percent = percent_of(shown, total);

        std::string eta = "?";
        if (frame.count >= total) {
            eta = format_duration(0);
        } else if (rate > 0.0) {
            const double seconds = static_cast<double>(total - frame.count) / rate;
            if (std::isfinite(seconds) && seconds <= kMaxEtaSeconds) {
                eta = format_duration(static_cast<std::int64_t>(seconds));
            }
        }

        const std::string left = fmt::format("{:3d}%|", percent);
        const std::string right = fmt::format("| {}/{} [{}<{}, {}]",
                                              frame.count, total, elapsed, eta, rate_str);
        const auto room = budget - display_width(left) - display_width(right);
        const std::string prefix = fit_prefix(frame.description, room);
        const auto bar_cols = room - display_width(prefix);

        line = prefix + left;
        if (bar_cols > 0) {
            const double fraction = static_cast<double>(shown) / static_cast<double>(total);
            line += compose_bar(fraction, bar_cols, frame.ascii);
        }
        line += right;
    } else {
        const std::string tail = fmt::format("{} {}it [{}, {}]",
                                             spinner_glyph(frame.elapsed_ns, frame.ascii),
                                             frame.count, elapsed, rate_str);
        line = fit_prefix(frame.description, budget - display_width(tail)) + tail;
    }

    // Сюда доходит только если не влезают сами числовые поля
    const auto cut = truncate_to_width(line, budget);
    if (cut.size() != line.size()) {
        line.resize(cut.size());
    }
    return line;
}

} // namespace tickbar::core
