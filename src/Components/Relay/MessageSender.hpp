//----------------------------------------------------------------------------------------------------------------------
// File: MessageSender.hpp
// Description: Validates an outbound message, prices it, and hands the encoded payload to the relay service. The
// sender holds no state of its own, delivery and any retries are owned by the relay service.
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
#include <memory>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

class IRelayService;

//----------------------------------------------------------------------------------------------------------------------
namespace Relay {
//----------------------------------------------------------------------------------------------------------------------

class FeeQuoter;
class MessageSender;

//----------------------------------------------------------------------------------------------------------------------
} // Relay namespace
//----------------------------------------------------------------------------------------------------------------------

class Relay::MessageSender
{
public:
    MessageSender(
        Chain::Address const& identity,
        std::shared_ptr<FeeQuoter const> const& spFeeQuoter,
        std::shared_ptr<IRelayService> const& spRelayService,
        Event::SharedPublisher const& spPublisher);

    MessageSender(MessageSender const&) = delete;
    MessageSender& operator=(MessageSender const&) = delete;

    // The context's caller is encoded as the author of the message and the context's value is the funds available
    // to pay for the delivery. Exactly the quoted cost is forwarded to the relay service.
    [[nodiscard]] Courier::Result Send(
        Chain::CallContext const& context,
        Chain::Domain target,
        Chain::Address const& targetAddress,
        std::string_view text) const;

private:
    Chain::Address m_identity;
    std::shared_ptr<FeeQuoter const> m_spFeeQuoter;
    std::shared_ptr<IRelayService> m_spRelayService;
    Event::SharedPublisher m_spPublisher;
    LogUtils::Logger m_logger;
};

//----------------------------------------------------------------------------------------------------------------------
