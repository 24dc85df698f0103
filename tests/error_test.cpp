#include <gtest/gtest.h>
#include <cstdlib>
#include <string>

#include "infra/error_handler/error.hpp"

using namespace tickbar::infra;

TEST(ErrorTest, CapturesCallSite)
{
    const int line = __LINE__ + 1;
    auto err = make_error(ErrorCode::WriteFailed, "disk full");
    EXPECT_EQ(err.code, ErrorCode::WriteFailed);
    EXPECT_STREQ(err.what(), "disk full");
    EXPECT_EQ(err.line, line);
    EXPECT_NE(err.file.find("error_test.cpp"), std::string::npos);
}

TEST(ErrorTest, ExitCodes)
{
    EXPECT_EQ(make_error(ErrorCode::ConfigInvalid, "").to_exit_code(), 2);
    EXPECT_EQ(make_error(ErrorCode::WriteFailed, "").to_exit_code(), 74);
    EXPECT_EQ(make_error(ErrorCode::Interrupted, "").to_exit_code(), 130);
    EXPECT_EQ(make_error(ErrorCode::InvalidHandle, "").to_exit_code(), EXIT_FAILURE);
}

TEST(ErrorTest, Classification)
{
    EXPECT_TRUE(make_error(ErrorCode::InvalidHandle, "").is_precondition());
    EXPECT_TRUE(make_error(ErrorCode::HandleClosed, "").is_precondition());
    EXPECT_FALSE(make_error(ErrorCode::HandleClosed, "").is_fatal());

    EXPECT_TRUE(make_error(ErrorCode::CapacityExhausted, "").is_fatal());
    EXPECT_TRUE(make_error(ErrorCode::ThreadSpawnFailed, "").is_fatal());
    EXPECT_FALSE(make_error(ErrorCode::ThreadSpawnFailed, "").is_precondition());
    EXPECT_FALSE(make_error(ErrorCode::WriteFailed, "").is_fatal());
}

TEST(ErrorTest, LogAndReturnPassesErrorThrough)
{
    auto err = log_and_return(make_error(ErrorCode::HandleClosed, "handle 0x100000000 already closed"));
    EXPECT_EQ(err.code, ErrorCode::HandleClosed);
    EXPECT_EQ(err.message, "handle 0x100000000 already closed");
    EXPECT_NE(err.file.find("error_test.cpp"), std::string::npos);
}

TEST(ErrorTest, ResultCarriesError)
{
    Result<int> ok = 7;
    Result<int> failed = std::unexpected(make_error(ErrorCode::AllocationFailed, "oom"));
    ASSERT_TRUE(ok);
    EXPECT_EQ(*ok, 7);
    ASSERT_FALSE(failed);
    EXPECT_EQ(failed.error().code, ErrorCode::AllocationFailed);
}

TEST(ErrorTest, CodeNames)
{
    EXPECT_EQ(to_string(ErrorCode::InvalidHandle), "invalid handle");
    EXPECT_EQ(to_string(ErrorCode::CapacityExhausted), "capacity exhausted");
    EXPECT_EQ(to_string(ErrorCode::Unknown), "unknown");
}
