#include <gtest/gtest.h>
#include <csignal>

#include "infra/interrupt.hpp"

using namespace tickbar::infra;

class InterruptTest : public ::testing::Test {
protected:
    void SetUp() override { reset_interrupt(); }
    void TearDown() override {
        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGTERM, SIG_DFL);
        reset_interrupt();
    }
};

TEST_F(InterruptTest, NotInterruptedByDefault)
{
    EXPECT_FALSE(is_interrupted());
    EXPECT_EQ(interrupted_exit_code(), 0);
}

TEST_F(InterruptTest, SigtermIsRecorded)
{
    install_signal_handler();
    ASSERT_EQ(std::raise(SIGTERM), 0);

    EXPECT_TRUE(is_interrupted());
    EXPECT_EQ(interrupt_signal(), SIGTERM);
    EXPECT_EQ(interrupted_exit_code(), 128 + SIGTERM);
}

TEST_F(InterruptTest, SigintGives130)
{
    install_signal_handler();
    ASSERT_EQ(std::raise(SIGINT), 0);
    EXPECT_EQ(interrupted_exit_code(), 130);

    reset_interrupt();
    EXPECT_FALSE(is_interrupted());
}
