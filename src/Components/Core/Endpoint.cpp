//----------------------------------------------------------------------------------------------------------------------
// File: Endpoint.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Endpoint.hpp"
#include "Components/Relay/FeeQuoter.hpp"
#include "Components/Relay/MessageSender.hpp"
#include "Components/Relay/TrustedDeliverer.hpp"
#include "Components/State/LatestMessage.hpp"
#include "Interfaces/DelivererAuthority.hpp"
#include "Interfaces/MessageStore.hpp"
#include "Interfaces/RelayService.hpp"
//----------------------------------------------------------------------------------------------------------------------

Courier::Endpoint::Endpoint(
    Chain::Domain domain,
    Chain::Address const& identity,
    Chain::Address const& relay,
    std::shared_ptr<IRelayService> const& spRelayService,
    Event::SharedPublisher const& spPublisher,
    ReplayPolicy policy)
    : Endpoint(
        domain,
        identity,
        std::make_shared<Relay::TrustedDeliverer>(relay),
        std::make_shared<State::LatestMessage>(),
        spRelayService,
        spPublisher,
        policy)
{
}

//----------------------------------------------------------------------------------------------------------------------

Courier::Endpoint::Endpoint(
    Chain::Domain domain,
    Chain::Address const& identity,
    std::shared_ptr<IDelivererAuthority const> const& spAuthority,
    std::shared_ptr<IMessageStore> const& spStore,
    std::shared_ptr<IRelayService> const& spRelayService,
    Event::SharedPublisher const& spPublisher,
    ReplayPolicy policy)
    : m_domain(domain)
    , m_identity(identity)
    , m_spStore(spStore)
    , m_spFeeQuoter()
    , m_upSender()
    , m_upReceiver()
{
    if (m_identity.IsZero()) { throw Result{ ResultCode::InvalidArgument, "endpoint address" }; }
    if (!spAuthority) { throw Result{ ResultCode::InvalidArgument, "deliverer authority" }; }
    if (!m_spStore) { throw Result{ ResultCode::InvalidArgument, "message store" }; }
    if (!spRelayService) { throw Result{ ResultCode::InvalidArgument, "relay service" }; }
    if (!spPublisher) { throw Result{ ResultCode::InvalidArgument, "event publisher" }; }

    m_spFeeQuoter = std::make_shared<Relay::FeeQuoter>(spRelayService);
    m_upSender = std::make_unique<Relay::MessageSender>(m_identity, m_spFeeQuoter, spRelayService, spPublisher);
    m_upReceiver = std::make_unique<Relay::MessageReceiver>(spAuthority, m_spStore, spPublisher, policy);
}

//----------------------------------------------------------------------------------------------------------------------

Courier::Endpoint::~Endpoint() = default;

//----------------------------------------------------------------------------------------------------------------------

Chain::Domain Courier::Endpoint::GetDomain() const
{
    return m_domain;
}

//----------------------------------------------------------------------------------------------------------------------

Chain::Address const& Courier::Endpoint::GetIdentity() const
{
    return m_identity;
}

//----------------------------------------------------------------------------------------------------------------------

Courier::Endpoint::QuoteResult Courier::Endpoint::Quote(Chain::Domain target) const
{
    return m_spFeeQuoter->Quote(target);
}

//----------------------------------------------------------------------------------------------------------------------

Courier::Result Courier::Endpoint::Send(
    Chain::CallContext const& context,
    Chain::Domain target,
    Chain::Address const& targetAddress,
    std::string_view text) const
{
    return m_upSender->Send(context, target, targetAddress, text);
}

//----------------------------------------------------------------------------------------------------------------------

Courier::Result Courier::Endpoint::OnDeliver(
    Chain::CallContext const& context,
    Chain::ReadableView payload,
    Relay::AdditionalMessages const& additional,
    Chain::Address const& sourceAddress,
    Chain::Domain sourceDomain,
    Chain::DeliveryHash const& deliveryHash)
{
    return m_upReceiver->OnDeliver(context, payload, additional, sourceAddress, sourceDomain, deliveryHash);
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<State::ReceivedMessage> Courier::Endpoint::GetLatestMessage() const
{
    return m_spStore->Get();
}

//----------------------------------------------------------------------------------------------------------------------

std::string Courier::Endpoint::GetLatestText() const
{
    if (auto const optMessage = m_spStore->Get(); optMessage) { return optMessage->GetText(); }
    return {};
}

//----------------------------------------------------------------------------------------------------------------------
