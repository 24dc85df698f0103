#include <gtest/gtest.h>
#include <cstdint>

#include "core/engine/handle.hpp"

using namespace tickbar::core;

TEST(HandleTest, PacksIndexAndGeneration)
{
    constexpr auto h = Handle::make(7, 3);
    static_assert(h.index() == 7 && h.generation() == 3);
    EXPECT_FALSE(h.is_null());
    EXPECT_TRUE(kNullHandle.is_null());
    EXPECT_FALSE(static_cast<bool>(kNullHandle));
}

TEST(HandleTest, GenerationWrapSkipsZero)
{
    EXPECT_EQ(next_generation(1), 2u);
    EXPECT_EQ(next_generation(UINT32_MAX - 1), UINT32_MAX);
    EXPECT_EQ(next_generation(UINT32_MAX), 1u);
}

TEST(HandleTest, IssuedBeforeWithoutWrap)
{
    EXPECT_TRUE(generation_issued_before(1, 5, false));
    EXPECT_TRUE(generation_issued_before(4, 5, false));
    EXPECT_FALSE(generation_issued_before(5, 5, false));  // текущее поколение
    EXPECT_FALSE(generation_issued_before(9, 5, false));  // ещё не выдавалось
    EXPECT_FALSE(generation_issued_before(0, 5, false));
}

TEST(HandleTest, IssuedBeforeAfterWrap)
{
    // Слот прошёл UINT32_MAX и сейчас на поколении 2: старые большие
    // поколения закрыты, а не "никогда не выданы"
    EXPECT_TRUE(generation_issued_before(UINT32_MAX, 2, true));
    EXPECT_TRUE(generation_issued_before(1, 2, true));
    EXPECT_TRUE(generation_issued_before(100, 2, true));
    EXPECT_FALSE(generation_issued_before(2, 2, true));
    EXPECT_FALSE(generation_issued_before(0, 2, true));
}
