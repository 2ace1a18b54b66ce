//----------------------------------------------------------------------------------------------------------------------
#include "TestHelpers.hpp"
#include "Components/Core/Result.hpp"
#include "Components/Relay/FeeQuoter.hpp"
#include "Components/Relay/RelayDefinitions.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <memory>
//----------------------------------------------------------------------------------------------------------------------

class FeeQuoterSuite : public testing::Test
{
protected:
    void SetUp() override
    {
        m_spRelayService = std::make_shared<Relay::Test::RelayService>();
        m_spFeeQuoter = std::make_shared<Relay::FeeQuoter>(m_spRelayService);
    }

    std::shared_ptr<Relay::Test::RelayService> m_spRelayService;
    std::shared_ptr<Relay::FeeQuoter> m_spFeeQuoter;
};

//----------------------------------------------------------------------------------------------------------------------

TEST_F(FeeQuoterSuite, QuoteTest)
{
    auto const [result, cost] = m_spFeeQuoter->Quote(Relay::Test::TargetDomain);
    EXPECT_TRUE(result.IsSuccess());
    EXPECT_EQ(cost, Relay::Test::DefaultPrice);

    // The execution budget is fixed for every delivery.
    ASSERT_TRUE(m_spRelayService->GetQuotedGasLimit());
    EXPECT_EQ(*m_spRelayService->GetQuotedGasLimit(), Relay::ExecutionGasLimit);
    EXPECT_EQ(Relay::ExecutionGasLimit, Chain::Gas{ 50'000 });
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(FeeQuoterSuite, RequoteTest)
{
    EXPECT_EQ(m_spFeeQuoter->Quote(Relay::Test::TargetDomain).second, Relay::Test::DefaultPrice);

    // A change in the relay service's price is observed by the next quote.
    m_spRelayService->SetPrice(Chain::Amount{ 42 });
    EXPECT_EQ(m_spFeeQuoter->Quote(Relay::Test::TargetDomain).second, Chain::Amount{ 42 });
    EXPECT_EQ(m_spRelayService->QuoteCount(), std::size_t{ 2 });
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(FeeQuoterSuite, ZeroPriceTest)
{
    m_spRelayService->SetPrice(Chain::Amount{ 0 });
    auto const [result, cost] = m_spFeeQuoter->Quote(Relay::Test::TargetDomain);
    EXPECT_TRUE(result.IsSuccess());
    EXPECT_EQ(cost, Chain::Amount{ 0 });
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(FeeQuoterSuite, UpstreamFailureTest)
{
    m_spRelayService->FailQuotes({ Courier::ResultCode::UpstreamError, "unsupported target domain" });

    auto const [result, cost] = m_spFeeQuoter->Quote(Chain::Domain{ 999 });
    EXPECT_TRUE(result.IsError());
    EXPECT_EQ(result, Courier::ResultCode::UpstreamError);
    EXPECT_EQ(result.GetDetail(), "unsupported target domain"); // The relay service's failure is passed through.
    EXPECT_EQ(cost, Chain::Amount{ 0 });
}

//----------------------------------------------------------------------------------------------------------------------
