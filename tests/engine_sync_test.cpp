#include <gtest/gtest.h>
#include <cstdint>
#include <random>
#include <string>

#include "core/engine/progress_engine.hpp"
#include "test_support.hpp"

using namespace tickbar::core;
using tickbar::infra::ErrorCode;
using tickbar::testing::CapturedOutput;
using tickbar::testing::count_of;
using namespace std::chrono_literals;

namespace {

auto engine_options(const CapturedOutput& out, std::uint32_t max_instances = 8) -> EngineOptions {
    EngineOptions opts;
    opts.max_instances = max_instances;
    opts.bar.fd = out.fd();
    opts.bar.ncols = 80;
    return opts;
}

} // namespace

class EngineSyncTest : public ::testing::Test {
protected:
    CapturedOutput out;
    ProgressEngine engine{engine_options(out)};
};

TEST_F(EngineSyncTest, CreateStartsAtZero)
{
    auto handle = engine.create(100, "job", kLeave);
    ASSERT_TRUE(handle);
    EXPECT_FALSE(handle->is_null());
    EXPECT_EQ(engine.read(*handle).value(), 0);
    EXPECT_EQ(engine.live_count(), 1u);
    EXPECT_TRUE(engine.close(*handle));
    EXPECT_EQ(engine.live_count(), 0u);
}

TEST_F(EngineSyncTest, TenUpdatesReachTotal)
{
    auto handle = engine.create(100, "", kLeave | kAscii);
    ASSERT_TRUE(handle);
    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(engine.update(*handle, 10));
    }
    EXPECT_EQ(engine.read(*handle).value(), 100);
    ASSERT_TRUE(engine.close(*handle));

    const auto text = out.contents();
    EXPECT_NE(out.last_frame().find("100/100"), std::string::npos);
    EXPECT_EQ(count_of(text, "\n"), 1u);
    EXPECT_EQ(text.back(), '\n');
}

TEST_F(EngineSyncTest, NoLeaveClearsLine)
{
    auto handle = engine.create(10, "", kAscii);
    ASSERT_TRUE(handle);
    ASSERT_TRUE(engine.update(*handle, 10));
    ASSERT_TRUE(engine.close(*handle));

    const auto text = out.contents();
    EXPECT_EQ(count_of(text, "\n"), 0u);
    ASSERT_GE(text.size(), 4u);
    EXPECT_EQ(text.substr(text.size() - 4), "\r\033[K");
}

TEST_F(EngineSyncTest, DisabledBarCountsSilently)
{
    auto handle = engine.create(1000, "quiet", kLeave | kDisable);
    ASSERT_TRUE(handle);
    for (int i = 0; i < 1000; ++i) {
        ASSERT_TRUE(engine.update(*handle, 1));
    }
    EXPECT_EQ(engine.read(*handle).value(), 1000);
    ASSERT_TRUE(engine.render(*handle));
    ASSERT_TRUE(engine.close(*handle));
    EXPECT_TRUE(out.contents().empty());
}

TEST_F(EngineSyncTest, SumOfUpdatesIsExact)
{
    auto handle = engine.create(0, "", kDisable);
    ASSERT_TRUE(handle);

    std::mt19937_64 rng(12345);
    std::uniform_int_distribution<std::int64_t> dist(-50, 200);
    std::int64_t expected = 0;
    for (int i = 0; i < 5000; ++i) {
        const auto n = dist(rng);
        expected += n;
        EXPECT_EQ(engine.update(*handle, n).value(), expected);
    }
    EXPECT_EQ(engine.read(*handle).value(), expected);
}

TEST_F(EngineSyncTest, CloseIsIdempotent)
{
    auto handle = engine.create(5);
    ASSERT_TRUE(handle);
    EXPECT_TRUE(engine.close(*handle));
    EXPECT_TRUE(engine.close(*handle));
    EXPECT_TRUE(engine.close_async(*handle));
    EXPECT_EQ(count_of(out.contents(), "\n"), 1u);
}

TEST_F(EngineSyncTest, UseAfterCloseIsRejected)
{
    auto handle = engine.create(5, "", kDisable);
    ASSERT_TRUE(handle);
    ASSERT_TRUE(engine.close(*handle));

    auto updated = engine.update(*handle, 1);
    ASSERT_FALSE(updated);
    EXPECT_EQ(updated.error().code, ErrorCode::HandleClosed);

    auto read = engine.read(*handle);
    ASSERT_FALSE(read);
    EXPECT_EQ(read.error().code, ErrorCode::HandleClosed);
    EXPECT_TRUE(read.error().is_precondition());

    EXPECT_FALSE(engine.update_async(*handle, 1));
    EXPECT_FALSE(engine.render(*handle));
    EXPECT_FALSE(engine.set_description(*handle, "late"));
    EXPECT_FALSE(engine.snapshot(*handle));
}

TEST_F(EngineSyncTest, UnknownHandlesAreInvalid)
{
    auto null_update = engine.update(kNullHandle, 1);
    ASSERT_FALSE(null_update);
    EXPECT_EQ(null_update.error().code, ErrorCode::InvalidHandle);

    auto out_of_range = engine.read(Handle::make(1000, 1));
    ASSERT_FALSE(out_of_range);
    EXPECT_EQ(out_of_range.error().code, ErrorCode::InvalidHandle);

    auto handle = engine.create(5, "", kDisable);
    ASSERT_TRUE(handle);
    auto forged = engine.read(Handle::make(handle->index(), handle->generation() + 7));
    ASSERT_FALSE(forged);
    EXPECT_EQ(forged.error().code, ErrorCode::InvalidHandle);

    auto never_issued = engine.close(kNullHandle);
    ASSERT_FALSE(never_issued);
    EXPECT_EQ(never_issued.error().code, ErrorCode::InvalidHandle);
}

TEST(EngineCapacityTest, ExhaustionAndSlotReuse)
{
    CapturedOutput out;
    ProgressEngine engine(engine_options(out, 2));
    ASSERT_EQ(engine.capacity(), 2u);

    auto first = engine.create(1, "", kDisable);
    auto second = engine.create(1, "", kDisable);
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);

    auto third = engine.create(1, "", kDisable);
    ASSERT_FALSE(third);
    EXPECT_EQ(third.error().code, ErrorCode::CapacityExhausted);
    EXPECT_TRUE(third.error().is_fatal());

    ASSERT_TRUE(engine.close(*first));
    auto reused = engine.create(1, "", kDisable);
    ASSERT_TRUE(reused);
    EXPECT_EQ(reused->index(), first->index());
    EXPECT_NE(*reused, *first);

    // Старый handle того же слота распознаётся как закрытый
    auto stale = engine.read(*first);
    ASSERT_FALSE(stale);
    EXPECT_EQ(stale.error().code, ErrorCode::HandleClosed);
    EXPECT_EQ(engine.read(*reused).value(), 0);
}

TEST_F(EngineSyncTest, ReservedFlagsAreIgnored)
{
    auto handle = engine.create(5, "", kDisable | 0x08u | 0x10u | 0x100u);
    ASSERT_TRUE(handle);
    auto snap = engine.snapshot(*handle);
    ASSERT_TRUE(snap);
    EXPECT_EQ(snap->flags, static_cast<std::uint32_t>(kDisable));
}

TEST_F(EngineSyncTest, SnapshotReflectsState)
{
    auto handle = engine.create(-1, "before", kLeave);
    ASSERT_TRUE(handle);
    ASSERT_TRUE(engine.update(*handle, 7));
    ASSERT_TRUE(engine.set_description(*handle, "after"));

    auto snap = engine.snapshot(*handle);
    ASSERT_TRUE(snap);
    EXPECT_EQ(snap->count, 7);
    EXPECT_FALSE(snap->total.has_value());
    EXPECT_EQ(snap->description, "after");
    EXPECT_EQ(snap->flags, static_cast<std::uint32_t>(kLeave));
    EXPECT_EQ(snap->frames_rendered, 1u);
}

TEST_F(EngineSyncTest, RenderForcesFrameWithNewDescription)
{
    auto handle = engine.create(50, "old", kLeave | kAscii);
    ASSERT_TRUE(handle);
    ASSERT_TRUE(engine.update(*handle, 1));
    ASSERT_TRUE(engine.set_description(*handle, "new"));
    ASSERT_TRUE(engine.render(*handle));

    EXPECT_EQ(engine.snapshot(*handle)->frames_rendered, 2u);
    EXPECT_EQ(out.last_frame().rfind("new:   2%|", 0), 0u);
}

TEST_F(EngineSyncTest, UnknownTotalRendersCounter)
{
    auto handle = engine.create(0, "", kLeave | kAscii);
    ASSERT_TRUE(handle);
    ASSERT_TRUE(engine.update(*handle, 3));
    EXPECT_NE(out.last_frame().find(" 3it ["), std::string::npos);
}

TEST_F(EngineSyncTest, WriteMessageAboveBar)
{
    auto handle = engine.create(10, "", kLeave | kAscii);
    ASSERT_TRUE(handle);
    ASSERT_TRUE(engine.update(*handle, 4));
    ASSERT_TRUE(engine.write_message(*handle, "checkpoint"));

    const auto text = out.contents();
    const auto msg = text.find("\r\033[Kcheckpoint\n");
    ASSERT_NE(msg, std::string::npos);
    EXPECT_NE(text.find("4/10", msg), std::string::npos);
}

TEST_F(EngineSyncTest, PerBarOptionsOverrideEngineDefaults)
{
    CapturedOutput other;
    BarOptions bar = engine.options().bar;
    bar.fd = other.fd();
    bar.ncols = 40;

    auto handle = engine.create(10, "", kLeave | kAscii, bar);
    ASSERT_TRUE(handle);
    ASSERT_TRUE(engine.update(*handle, 1));

    EXPECT_TRUE(out.contents().empty());
    EXPECT_EQ(other.last_frame().size(), 39u);
}

TEST(EngineLifetimeTest, DestructorClosesOpenBars)
{
    CapturedOutput out;
    {
        ProgressEngine engine(engine_options(out));
        ASSERT_TRUE(engine.create(3, "a", kLeave | kAscii));
        ASSERT_TRUE(engine.create(3, "b", kLeave | kAscii));
        EXPECT_EQ(engine.live_count(), 2u);
    }
    EXPECT_EQ(count_of(out.contents(), "\n"), 2u);
}
