//----------------------------------------------------------------------------------------------------------------------
#include "TestHelpers.hpp"
#include "Components/Chain/CallContext.hpp"
#include "Components/Core/Result.hpp"
#include "Components/Event/Publisher.hpp"
#include "Components/Payload/Codec.hpp"
#include "Components/Relay/FeeQuoter.hpp"
#include "Components/Relay/MessageSender.hpp"
#include "Components/Relay/RelayDefinitions.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <memory>
#include <string>
//----------------------------------------------------------------------------------------------------------------------

class MessageSenderSuite : public testing::Test
{
protected:
    void SetUp() override
    {
        m_spPublisher = std::make_shared<Event::Publisher>();
        m_upObserver = std::make_unique<Relay::Test::EventObserver>(m_spPublisher);
        m_spRelayService = std::make_shared<Relay::Test::RelayService>();
        m_spFeeQuoter = std::make_shared<Relay::FeeQuoter>(m_spRelayService);
        m_upSender = std::make_unique<Relay::MessageSender>(
            Relay::Test::EndpointAddress, m_spFeeQuoter, m_spRelayService, m_spPublisher);
    }

    [[nodiscard]] Courier::Result Send(Chain::Amount funds, std::string_view text = Relay::Test::Greeting) const
    {
        return m_upSender->Send(
            { Relay::Test::SenderAddress, funds }, Relay::Test::TargetDomain, Relay::Test::TargetAddress, text);
    }

    Event::SharedPublisher m_spPublisher;
    std::unique_ptr<Relay::Test::EventObserver> m_upObserver;
    std::shared_ptr<Relay::Test::RelayService> m_spRelayService;
    std::shared_ptr<Relay::FeeQuoter> m_spFeeQuoter;
    std::unique_ptr<Relay::MessageSender> m_upSender;
};

//----------------------------------------------------------------------------------------------------------------------

TEST_F(MessageSenderSuite, ExactFundsTest)
{
    EXPECT_TRUE(Send(Relay::Test::DefaultPrice).IsSuccess());

    auto const& dispatches = m_spRelayService->GetDispatches();
    ASSERT_EQ(dispatches.size(), std::size_t{ 1 });

    auto const& dispatch = dispatches.front();
    EXPECT_EQ(dispatch.context.caller, Relay::Test::EndpointAddress); // The endpoint pays the relay service.
    EXPECT_EQ(dispatch.context.value, Relay::Test::DefaultPrice);
    EXPECT_EQ(dispatch.target, Relay::Test::TargetDomain);
    EXPECT_EQ(dispatch.targetAddress, Relay::Test::TargetAddress);
    EXPECT_EQ(dispatch.receiverValue, Relay::ReceiverValue);
    EXPECT_EQ(dispatch.gasLimit, Relay::ExecutionGasLimit);

    // The payload records the caller of the send as the author of the message.
    auto const optMessage = Payload::Decode(dispatch.payload);
    ASSERT_TRUE(optMessage);
    EXPECT_EQ(optMessage->GetText(), Relay::Test::Greeting);
    EXPECT_EQ(optMessage->GetSender(), Relay::Test::SenderAddress);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(MessageSenderSuite, ExcessFundsTest)
{
    EXPECT_TRUE(Send(Chain::Amount{ 1'000 }).IsSuccess());

    // Only the quoted cost is forwarded, the excess is never passed on to the relay service.
    auto const& dispatches = m_spRelayService->GetDispatches();
    ASSERT_EQ(dispatches.size(), std::size_t{ 1 });
    EXPECT_EQ(dispatches.front().context.value, Relay::Test::DefaultPrice);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(MessageSenderSuite, InsufficientFundsTest)
{
    auto const result = Send(Chain::Amount{ Relay::Test::DefaultPrice.GetValue() - 1 });
    EXPECT_EQ(result, Courier::ResultCode::InsufficientFunds);
    EXPECT_TRUE(m_spRelayService->GetDispatches().empty());

    m_spRelayService->SetPrice(Chain::Amount{ 100 });
    EXPECT_EQ(Send(Relay::Test::DefaultPrice), Courier::ResultCode::InsufficientFunds);
    EXPECT_TRUE(m_spRelayService->GetDispatches().empty());
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(MessageSenderSuite, ZeroTargetAddressTest)
{
    auto const result = m_upSender->Send(
        { Relay::Test::SenderAddress, Relay::Test::DefaultPrice }, Relay::Test::TargetDomain, Chain::Address{},
        Relay::Test::Greeting);
    EXPECT_EQ(result, Courier::ResultCode::InvalidArgument);
    EXPECT_EQ(result.GetDetail(), "target address");

    // The target is validated before the delivery is priced.
    EXPECT_EQ(m_spRelayService->QuoteCount(), std::size_t{ 0 });
    EXPECT_TRUE(m_spRelayService->GetDispatches().empty());

    // A zero target is reported ahead of every other problem with the request.
    auto const combined = m_upSender->Send(
        { Relay::Test::SenderAddress, Chain::Amount{ 0 } }, Relay::Test::TargetDomain, Chain::Address{}, "");
    EXPECT_EQ(combined, Courier::ResultCode::InvalidArgument);
    EXPECT_EQ(combined.GetDetail(), "target address");
    EXPECT_EQ(m_spRelayService->QuoteCount(), std::size_t{ 0 });
    EXPECT_TRUE(m_spRelayService->GetDispatches().empty());
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(MessageSenderSuite, EmptyTextTest)
{
    auto const result = Send(Relay::Test::DefaultPrice, "");
    EXPECT_EQ(result, Courier::ResultCode::InvalidArgument);
    EXPECT_EQ(result.GetDetail(), "empty message");
    EXPECT_EQ(m_spRelayService->QuoteCount(), std::size_t{ 0 });
    EXPECT_TRUE(m_spRelayService->GetDispatches().empty());

    // Empty text is reported before the funds are compared against a quote.
    auto const unfunded = Send(Chain::Amount{ 0 }, "");
    EXPECT_EQ(unfunded, Courier::ResultCode::InvalidArgument);
    EXPECT_EQ(unfunded.GetDetail(), "empty message");
    EXPECT_EQ(m_spRelayService->QuoteCount(), std::size_t{ 0 });
    EXPECT_TRUE(m_spRelayService->GetDispatches().empty());
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(MessageSenderSuite, RejectedQuoteTest)
{
    m_spRelayService->FailQuotes({ Courier::ResultCode::UpstreamError, "unsupported target domain" });

    auto const result = Send(Relay::Test::DefaultPrice);
    EXPECT_EQ(result, Courier::ResultCode::UpstreamError);
    EXPECT_EQ(result.GetDetail(), "unsupported target domain");
    EXPECT_TRUE(m_spRelayService->GetDispatches().empty());
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(MessageSenderSuite, RejectedDispatchTest)
{
    m_spRelayService->FailSends({ Courier::ResultCode::UpstreamError, "relay paused" });

    auto const result = Send(Relay::Test::DefaultPrice);
    EXPECT_EQ(result, Courier::ResultCode::UpstreamError);
    EXPECT_EQ(result.GetDetail(), "relay paused");

    EXPECT_EQ(m_upObserver->Dispatch(), std::size_t{ 0 });
    EXPECT_TRUE(m_upObserver->GetDispatched().empty());
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(MessageSenderSuite, FreshQuoteTest)
{
    EXPECT_TRUE(Send(Relay::Test::DefaultPrice).IsSuccess());

    // Every send prices the delivery again, a price change between sends is observed.
    m_spRelayService->SetPrice(Chain::Amount{ 9 });
    EXPECT_EQ(Send(Relay::Test::DefaultPrice), Courier::ResultCode::InsufficientFunds);
    EXPECT_TRUE(Send(Chain::Amount{ 9 }).IsSuccess());

    EXPECT_EQ(m_spRelayService->QuoteCount(), std::size_t{ 3 });
    ASSERT_EQ(m_spRelayService->GetDispatches().size(), std::size_t{ 2 });
    EXPECT_EQ(m_spRelayService->GetDispatches().back().context.value, Chain::Amount{ 9 });
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(MessageSenderSuite, DispatchedEventTest)
{
    EXPECT_TRUE(m_spPublisher->IsAdvertised(Event::Type::MessageDispatched));
    EXPECT_TRUE(Send(Chain::Amount{ 50 }).IsSuccess());

    EXPECT_EQ(m_upObserver->Dispatch(), std::size_t{ 1 });
    auto const& dispatched = m_upObserver->GetDispatched();
    ASSERT_EQ(dispatched.size(), std::size_t{ 1 });
    EXPECT_EQ(dispatched.front().target, Relay::Test::TargetDomain);
    EXPECT_EQ(dispatched.front().targetAddress, Relay::Test::TargetAddress);
    EXPECT_EQ(dispatched.front().cost, Relay::Test::DefaultPrice);
}

//----------------------------------------------------------------------------------------------------------------------
