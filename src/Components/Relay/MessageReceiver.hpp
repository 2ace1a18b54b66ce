//----------------------------------------------------------------------------------------------------------------------
// File: MessageReceiver.hpp
// Description: The delivery callback of an endpoint. A delivery is applied only when the immediate caller is an
// authorized deliverer and the payload decodes, in which case the message store is overwritten and a
// MessageReceived event is published. Rejected deliveries leave the store untouched.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Chain/Address.hpp"
#include "Components/Chain/CallContext.hpp"
#include "Components/Chain/ChainTypes.hpp"
#include "Components/Core/Result.hpp"
#include "Components/Event/Publisher.hpp"
#include "Utilities/LogUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

class IDelivererAuthority;
class IMessageStore;

//----------------------------------------------------------------------------------------------------------------------
namespace Relay {
//----------------------------------------------------------------------------------------------------------------------

class MessageReceiver;

using AdditionalMessages = std::vector<Chain::Buffer>;

//----------------------------------------------------------------------------------------------------------------------
} // Relay namespace
//----------------------------------------------------------------------------------------------------------------------

class Relay::MessageReceiver
{
public:
    enum class ReplayPolicy : std::uint32_t { Overwrite, Reject };

    MessageReceiver(
        std::shared_ptr<IDelivererAuthority const> const& spAuthority,
        std::shared_ptr<IMessageStore> const& spStore,
        Event::SharedPublisher const& spPublisher,
        ReplayPolicy policy = ReplayPolicy::Overwrite);

    MessageReceiver(MessageReceiver const&) = delete;
    MessageReceiver& operator=(MessageReceiver const&) = delete;

    // The additional messages are reserved for proof material supplied by the relay service and are not inspected.
    // The delivery hash is only consulted when the receiver rejects replayed deliveries.
    [[nodiscard]] Courier::Result OnDeliver(
        Chain::CallContext const& context,
        Chain::ReadableView payload,
        AdditionalMessages const& additional,
        Chain::Address const& sourceAddress,
        Chain::Domain sourceDomain,
        Chain::DeliveryHash const& deliveryHash);

    [[nodiscard]] ReplayPolicy GetReplayPolicy() const;
    [[nodiscard]] std::size_t RecordedDeliveries() const;

private:
    [[nodiscard]] Courier::Result Apply(Chain::ReadableView payload, Chain::Domain sourceDomain);

    std::shared_ptr<IDelivererAuthority const> m_spAuthority;
    std::shared_ptr<IMessageStore> m_spStore;
    Event::SharedPublisher m_spPublisher;
    ReplayPolicy const m_policy;
    LogUtils::Logger m_logger;

    mutable std::mutex m_deliveriesMutex;
    std::set<Chain::DeliveryHash> m_deliveries;
};

//----------------------------------------------------------------------------------------------------------------------
