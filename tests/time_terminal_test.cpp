#include <gtest/gtest.h>
#include <chrono>
#include <thread>

#include "infra/clock/time_source.hpp"
#include "infra/terminal/terminal_probe.hpp"
#include "test_support.hpp"

using namespace tickbar::infra;
using namespace std::chrono_literals;

TEST(TerminalProbeTest, WidthIsPositive)
{
    // Под ctest stdout обычно не tty, тогда срабатывает fallback
    const auto width = terminal_width();
    EXPECT_GT(width, 0);
    EXPECT_LT(width, 10000);
}

TEST(TerminalProbeTest, RegularFileFallsBack)
{
    tickbar::testing::CapturedOutput file;
    EXPECT_FALSE(is_terminal(file.fd()));
    EXPECT_EQ(terminal_width(file.fd()), kDefaultTerminalWidth);
    EXPECT_EQ(terminal_width(file.fd(), 132), 132);
}

TEST(TerminalProbeTest, BadDescriptorFallsBack)
{
    EXPECT_EQ(terminal_width(-1), kDefaultTerminalWidth);
    EXPECT_FALSE(is_terminal(-1));
}

TEST(TimeSourceTest, AdvancesAcrossSleep)
{
    const auto before = time_ns();
    std::this_thread::sleep_for(10ms);
    const auto after = time_ns();
    EXPECT_GT(after - before, 1'000'000);
}

TEST(TimeSourceTest, NeverGoesBackwards)
{
    auto previous = time_ns();
    for (int i = 0; i < 100'000; ++i) {
        const auto now = time_ns();
        ASSERT_GE(now, previous);
        previous = now;
    }
}

TEST(TimeSourceTest, ToNanos)
{
    static_assert(to_nanos(std::chrono::milliseconds(3)) == 3 * kNanosPerMilli);
    EXPECT_EQ(to_nanos(std::chrono::seconds(2)), 2 * kNanosPerSecond);
}
