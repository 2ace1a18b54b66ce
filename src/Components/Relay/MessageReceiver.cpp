//----------------------------------------------------------------------------------------------------------------------
// File: MessageReceiver.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "MessageReceiver.hpp"
#include "Components/Payload/Codec.hpp"
#include "Components/State/ReceivedMessage.hpp"
#include "Interfaces/DelivererAuthority.hpp"
#include "Interfaces/MessageStore.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
//----------------------------------------------------------------------------------------------------------------------

using DeliveryRejected = Event::Message<Event::Type::DeliveryRejected>;

//----------------------------------------------------------------------------------------------------------------------

Relay::MessageReceiver::MessageReceiver(
    std::shared_ptr<IDelivererAuthority const> const& spAuthority,
    std::shared_ptr<IMessageStore> const& spStore,
    Event::SharedPublisher const& spPublisher,
    ReplayPolicy policy)
    : m_spAuthority(spAuthority)
    , m_spStore(spStore)
    , m_spPublisher(spPublisher)
    , m_policy(policy)
    , m_logger(LogUtils::GetLogger(LogUtils::Name::Core))
    , m_deliveriesMutex()
    , m_deliveries()
{
    assert(m_spAuthority && m_spStore && m_spPublisher);
    m_spPublisher->Advertise({ Event::Type::DeliveryRejected, Event::Type::MessageReceived });
}

//----------------------------------------------------------------------------------------------------------------------

Courier::Result Relay::MessageReceiver::OnDeliver(
    Chain::CallContext const& context,
    Chain::ReadableView payload,
    [[maybe_unused]] AdditionalMessages const& additional,
    Chain::Address const& sourceAddress,
    Chain::Domain sourceDomain,
    Chain::DeliveryHash const& deliveryHash)
{
    if (!m_spAuthority->IsAuthorizedDeliverer(context.caller)) {
        m_logger->warn("Rejecting a delivery from {}, the caller is not an authorized deliverer.", context.caller);
        m_spPublisher->Publish<Event::Type::DeliveryRejected>(sourceDomain, DeliveryRejected::Cause::Unauthorized);
        return { Courier::ResultCode::Unauthorized, "caller is not the relay service" };
    }

    m_logger->trace(
        "Processing a {} byte delivery from {} on domain {}.", payload.size(), sourceAddress, sourceDomain.GetValue());

    if (m_policy == ReplayPolicy::Overwrite) { return Apply(payload, sourceDomain); }

    // The hash is claimed under the lock and the message is applied after releasing it, the store may call back into
    // the endpoint. A concurrent delivery of a claimed hash is treated as a replay.
    {
        std::scoped_lock lock(m_deliveriesMutex);
        if (!m_deliveries.emplace(deliveryHash).second) {
            m_logger->warn("Rejecting a replayed delivery from domain {}.", sourceDomain.GetValue());
            m_spPublisher->Publish<Event::Type::DeliveryRejected>(sourceDomain, DeliveryRejected::Cause::Duplicate);
            return { Courier::ResultCode::DuplicateDelivery, "delivery hash has already been applied" };
        }
    }

    auto result = Apply(payload, sourceDomain);
    if (result.IsError()) {
        std::scoped_lock lock(m_deliveriesMutex);
        m_deliveries.erase(deliveryHash); // A rejected delivery may be retried.
    }

    return result;
}

//----------------------------------------------------------------------------------------------------------------------

Relay::MessageReceiver::ReplayPolicy Relay::MessageReceiver::GetReplayPolicy() const
{
    return m_policy;
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Relay::MessageReceiver::RecordedDeliveries() const
{
    std::scoped_lock lock(m_deliveriesMutex);
    return m_deliveries.size();
}

//----------------------------------------------------------------------------------------------------------------------

Courier::Result Relay::MessageReceiver::Apply(Chain::ReadableView payload, Chain::Domain sourceDomain)
{
    auto optMessage = Payload::Decode(payload);
    if (!optMessage) {
        m_logger->warn("Rejecting a delivery from domain {}, the payload is malformed.", sourceDomain.GetValue());
        m_spPublisher->Publish<Event::Type::DeliveryRejected>(sourceDomain, DeliveryRejected::Cause::Malformed);
        return { Courier::ResultCode::DecodeError, "payload is not an encoded message" };
    }

    m_spStore->Set(State::ReceivedMessage{ *optMessage, sourceDomain });

    m_logger->info(
        "Received \"{}\" from {} on domain {}.", optMessage->GetText(), optMessage->GetSender(), sourceDomain.GetValue());
    m_spPublisher->Publish<Event::Type::MessageReceived>(
        optMessage->GetText(), sourceDomain, optMessage->GetSender());

    return {};
}

//----------------------------------------------------------------------------------------------------------------------
