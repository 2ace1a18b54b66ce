//----------------------------------------------------------------------------------------------------------------------
// File: Endpoint.hpp
// Description: A courier participant deployed on a single domain. The endpoint quotes and sends messages to other
// domains and exposes the delivery callback the relay service invokes when a message arrives.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Result.hpp"
#include "Components/Chain/Address.hpp"
#include "Components/Chain/CallContext.hpp"
#include "Components/Chain/ChainTypes.hpp"
#include "Components/Event/Publisher.hpp"
#include "Components/Relay/MessageReceiver.hpp"
#include "Components/Relay/RelayDefinitions.hpp"
#include "Components/State/ReceivedMessage.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

class IDelivererAuthority;
class IMessageStore;
class IRelayService;

namespace Relay { class FeeQuoter; class MessageSender; }

//----------------------------------------------------------------------------------------------------------------------
namespace Courier {
//----------------------------------------------------------------------------------------------------------------------

class Endpoint;

//----------------------------------------------------------------------------------------------------------------------
} // Courier namespace
//----------------------------------------------------------------------------------------------------------------------

class Courier::Endpoint
{
public:
    using ReplayPolicy = Relay::MessageReceiver::ReplayPolicy;
    using QuoteResult = std::pair<Result, Chain::Amount>;

    static constexpr Chain::Gas ExecutionGasLimit = Relay::ExecutionGasLimit;

    // Throws a Courier::Result with an InvalidArgument code if the identity or relay address is the zero address, or
    // if the relay service is not provided.
    Endpoint(
        Chain::Domain domain,
        Chain::Address const& identity,
        Chain::Address const& relay,
        std::shared_ptr<IRelayService> const& spRelayService,
        Event::SharedPublisher const& spPublisher,
        ReplayPolicy policy = ReplayPolicy::Overwrite);

    // Allows an alternate deliverer authority and message store to be substituted.
    Endpoint(
        Chain::Domain domain,
        Chain::Address const& identity,
        std::shared_ptr<IDelivererAuthority const> const& spAuthority,
        std::shared_ptr<IMessageStore> const& spStore,
        std::shared_ptr<IRelayService> const& spRelayService,
        Event::SharedPublisher const& spPublisher,
        ReplayPolicy policy = ReplayPolicy::Overwrite);

    ~Endpoint();

    Endpoint(Endpoint const&) = delete;
    Endpoint(Endpoint&&) = delete;
    Endpoint& operator=(Endpoint const&) = delete;
    Endpoint& operator=(Endpoint&&) = delete;

    [[nodiscard]] Chain::Domain GetDomain() const;
    [[nodiscard]] Chain::Address const& GetIdentity() const;

    [[nodiscard]] QuoteResult Quote(Chain::Domain target) const;

    [[nodiscard]] Result Send(
        Chain::CallContext const& context,
        Chain::Domain target,
        Chain::Address const& targetAddress,
        std::string_view text) const;

    [[nodiscard]] Result OnDeliver(
        Chain::CallContext const& context,
        Chain::ReadableView payload,
        Relay::AdditionalMessages const& additional,
        Chain::Address const& sourceAddress,
        Chain::Domain sourceDomain,
        Chain::DeliveryHash const& deliveryHash);

    [[nodiscard]] std::optional<State::ReceivedMessage> GetLatestMessage() const;
    [[nodiscard]] std::string GetLatestText() const; // Provides an empty string until a message has been received.

private:
    Chain::Domain const m_domain;
    Chain::Address const m_identity;

    std::shared_ptr<IMessageStore> m_spStore;
    std::shared_ptr<Relay::FeeQuoter const> m_spFeeQuoter;
    std::unique_ptr<Relay::MessageSender> m_upSender;
    std::unique_ptr<Relay::MessageReceiver> m_upReceiver;
};

//----------------------------------------------------------------------------------------------------------------------
