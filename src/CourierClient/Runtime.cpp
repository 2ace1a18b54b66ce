//----------------------------------------------------------------------------------------------------------------------
// File: Runtime.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Runtime.hpp"
#include "Components/Chain/CallContext.hpp"
#include "Components/Core/Endpoint.hpp"
#include "Components/Core/Result.hpp"
#include "Components/Event/Events.hpp"
#include "Utilities/LogUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <memory>
#include <string>
//----------------------------------------------------------------------------------------------------------------------

void Runtime::SubscribeToEvents(Event::Publisher& publisher)
{
    using Cause = Event::Message<Event::Type::DeliveryRejected>::Cause;

    auto const logger = LogUtils::GetLogger(LogUtils::Name::Core);

    publisher.Subscribe<Event::Type::MessageDispatched>(
        [logger] (Chain::Domain domain, Chain::Address const& address, Chain::Amount cost) {
            logger->debug(
                "Dispatched a message to {} on domain {} at a cost of {}.",
                address, domain.GetValue(), cost.GetValue());
        });

    publisher.Subscribe<Event::Type::MessageReceived>(
        [logger] (std::string const& text, Chain::Domain domain, Chain::Address const& sender) {
            logger->debug("{} on domain {} wrote \"{}\".", sender, domain.GetValue(), text);
        });

    publisher.Subscribe<Event::Type::DeliveryRejected>([logger] (Chain::Domain domain, Cause cause) {
        switch (cause) {
            case Cause::Unauthorized: {
                logger->error("A delivery from domain {} was not authorized.", domain.GetValue());
            } break;
            case Cause::Malformed: logger->error("A delivery from domain {} was malformed.", domain.GetValue()); break;
            case Cause::Duplicate: logger->warn("A delivery from domain {} was replayed.", domain.GetValue()); break;
        }
    });

    publisher.SuspendSubscriptions(); // Publishing may begin once the endpoints have been created.
}

//----------------------------------------------------------------------------------------------------------------------

std::int32_t Runtime::Execute(
    Startup::Options const& options, Configuration::Parser const& parser, std::ostream& output)
{
    auto const logger = LogUtils::GetLogger(LogUtils::Name::Core);

    auto const spPublisher = std::make_shared<Event::Publisher>();
    SubscribeToEvents(*spPublisher);

    auto const policy = parser.UseReplayProtection() ?
        Courier::Endpoint::ReplayPolicy::Reject : Courier::Endpoint::ReplayPolicy::Overwrite;

    auto const spRelayService = std::make_shared<Relay::LoopbackService>(parser.GetRelayAddress());
    spRelayService->SetPricing(parser.GetEndpointDomain(), DefaultPricing);
    spRelayService->SetPricing(options.GetTargetDomain(), DefaultPricing);

    std::shared_ptr<Courier::Endpoint> spSource;
    try {
        spSource = std::make_shared<Courier::Endpoint>(
            parser.GetEndpointDomain(), parser.GetEndpointAddress(), parser.GetRelayAddress(),
            spRelayService, spPublisher, policy);
    } catch (Courier::Result const& result) {
        logger->critical("Failed to create the source endpoint! Reason: {}", result.what());
        return 1;
    }

    if (!spRelayService->Register(spSource)) {
        logger->critical("Failed to register the source endpoint with the relay service!");
        return 1;
    }

    auto const [quoted, cost] = spSource->Quote(options.GetTargetDomain());
    if (quoted.IsError()) {
        logger->error(
            "Unable to quote a delivery to domain {}! Reason: {}", options.GetTargetDomain().GetValue(), quoted.what());
        return 1;
    }

    output << "quote: " << cost.GetValue() << std::endl;
    if (options.IsQuoteOnly()) { return 0; }

    Chain::CallContext const context{
        options.GetSender().value_or(parser.GetEndpointAddress()), options.GetFunds().value_or(cost) };

    // The send validates the recipient, the target endpoint is only created once the message has been accepted.
    auto const sent = spSource->Send(
        context, options.GetTargetDomain(), options.GetTargetAddress(), options.GetMessage());
    if (sent.IsError()) {
        logger->error("Unable to send the message! Reason: {}", sent.what());
        return 1;
    }

    std::shared_ptr<Courier::Endpoint> spTarget;
    try {
        spTarget = std::make_shared<Courier::Endpoint>(
            options.GetTargetDomain(), options.GetTargetAddress(), parser.GetRelayAddress(),
            spRelayService, spPublisher, policy);
    } catch (Courier::Result const& result) {
        logger->critical("Failed to create the target endpoint! Reason: {}", result.what());
        return 1;
    }

    if (!spRelayService->Register(spTarget)) {
        logger->critical("Failed to register the target endpoint with the relay service!");
        return 1;
    }

    auto const delivered = spRelayService->DeliverPending();
    spPublisher->Dispatch();

    if (delivered == 0) {
        logger->error("The message was not accepted by the target endpoint.");
        return 1;
    }

    output << "received: " << spTarget->GetLatestText() << std::endl;
    return 0;
}

//----------------------------------------------------------------------------------------------------------------------
