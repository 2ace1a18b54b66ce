//----------------------------------------------------------------------------------------------------------------------
#include "TestHelpers.hpp"
#include "Components/Chain/CallContext.hpp"
#include "Components/Core/Endpoint.hpp"
#include "Components/Core/Result.hpp"
#include "Components/Event/Publisher.hpp"
#include "Components/Payload/Codec.hpp"
#include "Components/State/LatestMessage.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <memory>
#include <string>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

template<typename Constructor>
[[nodiscard]] Courier::ResultCode CaptureConstructionError(Constructor const& construct);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
//----------------------------------------------------------------------------------------------------------------------
namespace test {
//----------------------------------------------------------------------------------------------------------------------

Chain::DeliveryHash const DeliveryHash{};

//----------------------------------------------------------------------------------------------------------------------
} // test namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

class EndpointSuite : public testing::Test
{
protected:
    void SetUp() override
    {
        m_spPublisher = std::make_shared<Event::Publisher>();
        m_upObserver = std::make_unique<Relay::Test::EventObserver>(m_spPublisher);
        m_spRelayService = std::make_shared<Relay::Test::RelayService>();
        m_spEndpoint = std::make_shared<Courier::Endpoint>(
            Relay::Test::SourceDomain, Relay::Test::EndpointAddress, Relay::Test::RelayAddress,
            m_spRelayService, m_spPublisher);
    }

    Event::SharedPublisher m_spPublisher;
    std::unique_ptr<Relay::Test::EventObserver> m_upObserver;
    std::shared_ptr<Relay::Test::RelayService> m_spRelayService;
    std::shared_ptr<Courier::Endpoint> m_spEndpoint;
};

//----------------------------------------------------------------------------------------------------------------------

TEST_F(EndpointSuite, ConstructorTest)
{
    EXPECT_EQ(m_spEndpoint->GetDomain(), Relay::Test::SourceDomain);
    EXPECT_EQ(m_spEndpoint->GetIdentity(), Relay::Test::EndpointAddress);
    EXPECT_EQ(Courier::Endpoint::ExecutionGasLimit, Chain::Gas{ 50'000 });

    // A newly created endpoint has not received anything.
    EXPECT_FALSE(m_spEndpoint->GetLatestMessage());
    EXPECT_TRUE(m_spEndpoint->GetLatestText().empty());
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(EndpointSuite, InvalidConstructionTest)
{
    EXPECT_EQ(local::CaptureConstructionError([this] {
        return Courier::Endpoint{
            Relay::Test::SourceDomain, Relay::Test::EndpointAddress, Chain::Address{}, m_spRelayService, m_spPublisher };
    }), Courier::ResultCode::InvalidArgument);

    EXPECT_EQ(local::CaptureConstructionError([this] {
        return Courier::Endpoint{
            Relay::Test::SourceDomain, Chain::Address{}, Relay::Test::RelayAddress, m_spRelayService, m_spPublisher };
    }), Courier::ResultCode::InvalidArgument);

    EXPECT_EQ(local::CaptureConstructionError([this] {
        return Courier::Endpoint{
            Relay::Test::SourceDomain, Relay::Test::EndpointAddress, Relay::Test::RelayAddress, nullptr, m_spPublisher };
    }), Courier::ResultCode::InvalidArgument);

    EXPECT_EQ(local::CaptureConstructionError([this] {
        return Courier::Endpoint{
            Relay::Test::SourceDomain, Relay::Test::EndpointAddress, Relay::Test::RelayAddress, m_spRelayService, nullptr };
    }), Courier::ResultCode::InvalidArgument);

    EXPECT_EQ(local::CaptureConstructionError([this] {
        return Courier::Endpoint{
            Relay::Test::SourceDomain, Relay::Test::EndpointAddress, nullptr, std::make_shared<State::LatestMessage>(),
            m_spRelayService, m_spPublisher };
    }), Courier::ResultCode::InvalidArgument);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(EndpointSuite, QuoteTest)
{
    auto const [result, cost] = m_spEndpoint->Quote(Relay::Test::TargetDomain);
    EXPECT_TRUE(result.IsSuccess());
    EXPECT_EQ(cost, Relay::Test::DefaultPrice);

    m_spRelayService->FailQuotes({ Courier::ResultCode::UpstreamError, "unsupported target domain" });
    auto const [failure, zero] = m_spEndpoint->Quote(Relay::Test::TargetDomain);
    EXPECT_EQ(failure, Courier::ResultCode::UpstreamError);
    EXPECT_EQ(zero, Chain::Amount{ 0 });
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(EndpointSuite, SendTest)
{
    Chain::CallContext const context{ Relay::Test::SenderAddress, Relay::Test::DefaultPrice };
    EXPECT_TRUE(m_spEndpoint->Send(
        context, Relay::Test::TargetDomain, Relay::Test::TargetAddress, Relay::Test::Greeting).IsSuccess());

    ASSERT_EQ(m_spRelayService->GetDispatches().size(), std::size_t{ 1 });
    EXPECT_EQ(m_spRelayService->GetDispatches().front().context.caller, Relay::Test::EndpointAddress);

    Chain::CallContext const underfunded{ Relay::Test::SenderAddress, Chain::Amount{ 0 } };
    EXPECT_EQ(
        m_spEndpoint->Send(underfunded, Relay::Test::TargetDomain, Relay::Test::TargetAddress, Relay::Test::Greeting),
        Courier::ResultCode::InsufficientFunds);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(EndpointSuite, DeliverTest)
{
    auto const payload = Payload::Encode(Relay::Test::Greeting, Relay::Test::SenderAddress);

    Chain::CallContext const relay{ Relay::Test::RelayAddress, Chain::Amount{ 0 } };
    EXPECT_TRUE(m_spEndpoint->OnDeliver(
        relay, payload, {}, Relay::Test::TargetAddress, Relay::Test::TargetDomain, test::DeliveryHash).IsSuccess());

    EXPECT_EQ(m_spEndpoint->GetLatestText(), Relay::Test::Greeting);
    auto const optMessage = m_spEndpoint->GetLatestMessage();
    ASSERT_TRUE(optMessage);
    EXPECT_EQ(optMessage->GetSender(), Relay::Test::SenderAddress);
    EXPECT_EQ(optMessage->GetSourceDomain(), Relay::Test::TargetDomain);

    Chain::CallContext const stranger{ Relay::Test::StrangerAddress, Chain::Amount{ 0 } };
    auto const forged = Payload::Encode("forged", Relay::Test::StrangerAddress);
    EXPECT_EQ(
        m_spEndpoint->OnDeliver(
            stranger, forged, {}, Relay::Test::TargetAddress, Relay::Test::TargetDomain, test::DeliveryHash),
        Courier::ResultCode::Unauthorized);
    EXPECT_EQ(m_spEndpoint->GetLatestText(), Relay::Test::Greeting);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(EndpointSuite, QuoteSendDeliverTest)
{
    constexpr Chain::Domain Domain{ 5 };

    auto const [quoted, cost] = m_spEndpoint->Quote(Domain);
    ASSERT_TRUE(quoted.IsSuccess());

    Chain::CallContext const context{ Relay::Test::SenderAddress, cost };
    EXPECT_TRUE(m_spEndpoint->Send(context, Domain, Relay::Test::TargetAddress, "hello").IsSuccess());
    ASSERT_EQ(m_spRelayService->GetDispatches().size(), std::size_t{ 1 });

    // Hand the dispatched payload back to the endpoint as though the relay service delivered it from domain 5.
    auto const& payload = m_spRelayService->GetDispatches().front().payload;
    Chain::CallContext const relay{ Relay::Test::RelayAddress, Chain::Amount{ 0 } };
    EXPECT_TRUE(m_spEndpoint->OnDeliver(
        relay, payload, {}, Relay::Test::TargetAddress, Domain, test::DeliveryHash).IsSuccess());

    auto const optMessage = m_spEndpoint->GetLatestMessage();
    ASSERT_TRUE(optMessage);
    EXPECT_EQ(optMessage->GetText(), "hello");
    EXPECT_EQ(optMessage->GetSourceDomain(), Domain);
    EXPECT_EQ(optMessage->GetSender(), Relay::Test::SenderAddress);

    m_upObserver->Dispatch();
    ASSERT_EQ(m_upObserver->GetReceived().size(), std::size_t{ 1 });
    EXPECT_EQ(m_upObserver->GetReceived().front().text, "hello");
    EXPECT_EQ(m_upObserver->GetReceived().front().source, Domain);
    EXPECT_EQ(m_upObserver->GetReceived().front().sender, Relay::Test::SenderAddress);
}

//----------------------------------------------------------------------------------------------------------------------

TEST_F(EndpointSuite, SubstitutedAuthorityTest)
{
    auto const spAuthority = std::make_shared<Relay::Test::DelivererAuthority>(Relay::Test::StrangerAddress);
    auto const spStore = std::make_shared<State::LatestMessage>();
    Courier::Endpoint endpoint{
        Relay::Test::SourceDomain, Relay::Test::EndpointAddress, spAuthority, spStore, m_spRelayService, m_spPublisher };

    auto const payload = Payload::Encode(Relay::Test::Greeting, Relay::Test::SenderAddress);
    Chain::CallContext const stranger{ Relay::Test::StrangerAddress, Chain::Amount{ 0 } };
    EXPECT_TRUE(endpoint.OnDeliver(
        stranger, payload, {}, Relay::Test::TargetAddress, Relay::Test::TargetDomain, test::DeliveryHash).IsSuccess());

    // The endpoint reads from the store it was provided.
    EXPECT_EQ(spStore->GetUpdateCount(), std::uint64_t{ 1 });
    EXPECT_EQ(endpoint.GetLatestText(), Relay::Test::Greeting);
}

//----------------------------------------------------------------------------------------------------------------------

template<typename Constructor>
Courier::ResultCode local::CaptureConstructionError(Constructor const& construct)
{
    try {
        [[maybe_unused]] auto const endpoint = construct();
    } catch (Courier::Result const& result) {
        return result.GetCode();
    }
    return Courier::ResultCode::Accepted;
}

//----------------------------------------------------------------------------------------------------------------------
