//----------------------------------------------------------------------------------------------------------------------
// File: MessageSender.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "MessageSender.hpp"
#include "FeeQuoter.hpp"
#include "RelayDefinitions.hpp"
#include "Components/Payload/Codec.hpp"
#include "Interfaces/RelayService.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
//----------------------------------------------------------------------------------------------------------------------

Relay::MessageSender::MessageSender(
    Chain::Address const& identity,
    std::shared_ptr<FeeQuoter const> const& spFeeQuoter,
    std::shared_ptr<IRelayService> const& spRelayService,
    Event::SharedPublisher const& spPublisher)
    : m_identity(identity)
    , m_spFeeQuoter(spFeeQuoter)
    , m_spRelayService(spRelayService)
    , m_spPublisher(spPublisher)
    , m_logger(LogUtils::GetLogger(LogUtils::Name::Core))
{
    assert(m_spFeeQuoter && m_spRelayService && m_spPublisher);
    m_spPublisher->Advertise(Event::Type::MessageDispatched);
}

//----------------------------------------------------------------------------------------------------------------------

Courier::Result Relay::MessageSender::Send(
    Chain::CallContext const& context,
    Chain::Domain target,
    Chain::Address const& targetAddress,
    std::string_view text) const
{
    if (targetAddress.IsZero()) { return { Courier::ResultCode::InvalidArgument, "target address" }; }
    if (text.empty()) { return { Courier::ResultCode::InvalidArgument, "empty message" }; }

    // The cost must be quoted immediately before the dispatch, a price obtained from an earlier call may be stale.
    auto const [quoted, cost] = m_spFeeQuoter->Quote(target);
    if (quoted.IsError()) { return quoted; }

    if (context.value < cost) {
        m_logger->debug(
            "Rejecting a message to domain {}, {} was provided for a cost of {}.",
            target.GetValue(), context.value.GetValue(), cost.GetValue());
        return { Courier::ResultCode::InsufficientFunds, "provided funds are below the quoted cost" };
    }

    auto const payload = Payload::Encode(text, context.caller);
    auto const dispatched = m_spRelayService->SendPayload(
        Chain::CallContext{ m_identity, cost }, target, targetAddress, payload, ReceiverValue, ExecutionGasLimit);
    if (dispatched.IsError()) {
        m_logger->warn("The relay service rejected a message to domain {}: {}", target.GetValue(), dispatched.what());
        return dispatched;
    }

    m_logger->debug(
        "Dispatched a {} byte payload to {} on domain {} for {}.",
        payload.size(), targetAddress, target.GetValue(), cost.GetValue());
    m_spPublisher->Publish<Event::Type::MessageDispatched>(target, targetAddress, cost);

    return dispatched;
}

//----------------------------------------------------------------------------------------------------------------------
