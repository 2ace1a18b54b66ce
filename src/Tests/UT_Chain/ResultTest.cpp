//----------------------------------------------------------------------------------------------------------------------
#include "Components/Core/Result.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <sstream>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

TEST(ResultSuite, DefaultConstructorTest)
{
    Courier::Result const result;
    EXPECT_TRUE(result);
    EXPECT_TRUE(result.IsSuccess());
    EXPECT_FALSE(result.IsError());
    EXPECT_EQ(result, Courier::ResultCode::Accepted);
    EXPECT_TRUE(result.GetDetail().empty());
    EXPECT_EQ(std::string_view{ result.what() }, "Accepted");
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ResultSuite, ErrorTest)
{
    Courier::Result const result{ Courier::ResultCode::InsufficientFunds, "value 4 is less than cost 5" };
    EXPECT_FALSE(result);
    EXPECT_FALSE(result.IsSuccess());
    EXPECT_TRUE(result.IsError());
    EXPECT_EQ(result.GetCode(), Courier::ResultCode::InsufficientFunds);
    EXPECT_EQ(result.GetDetail(), "value 4 is less than cost 5");
    EXPECT_EQ(std::string_view{ result.what() }, "Insufficient funds (value 4 is less than cost 5)");

    std::ostringstream oss;
    oss << result;
    EXPECT_EQ(oss.str(), result.what());
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ResultSuite, ComparisonTest)
{
    // The detail is informational, results with matching codes are equal.
    Courier::Result const first{ Courier::ResultCode::UpstreamError, "first" };
    Courier::Result const second{ Courier::ResultCode::UpstreamError, "second" };
    EXPECT_EQ(first, second);
    EXPECT_NE(first, Courier::Result{ Courier::ResultCode::Unauthorized });
    EXPECT_NE(first, Courier::ResultCode::Accepted);
}

//----------------------------------------------------------------------------------------------------------------------

TEST(ResultSuite, ThrowTest)
{
    EXPECT_THROW(throw Courier::Result{ Courier::ResultCode::InvalidArgument }, std::exception);

    try {
        throw Courier::Result{ Courier::ResultCode::InvalidArgument, "relay address" };
    } catch (Courier::Result const& result) {
        EXPECT_EQ(result, Courier::ResultCode::InvalidArgument);
        EXPECT_EQ(result.GetDetail(), "relay address");
    }
}

//----------------------------------------------------------------------------------------------------------------------
