//----------------------------------------------------------------------------------------------------------------------
// File: RelayService.hpp
// Description: Defines the pricing and dispatch interface of the external relay service. Any result the service
// reports is forwarded to the courier's callers without modification.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Chain/Address.hpp"
#include "Components/Chain/CallContext.hpp"
#include "Components/Chain/ChainTypes.hpp"
#include "Components/Core/Result.hpp"
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------

struct DeliveryQuote
{
    Courier::Result result;
    Chain::Amount cost;
    Chain::Amount refundPerUnusedGas;
};

//----------------------------------------------------------------------------------------------------------------------

class IRelayService
{
public:
    virtual ~IRelayService() = default;

    [[nodiscard]] virtual DeliveryQuote QuoteDeliveryPrice(
        Chain::Domain target, Chain::Amount receiverValue, Chain::Gas gasLimit) const = 0;

    // The context's value is the payment for the delivery. Completion of the delivery is asynchronous and is not
    // reported back through this interface.
    [[nodiscard]] virtual Courier::Result SendPayload(
        Chain::CallContext const& context,
        Chain::Domain target,
        Chain::Address const& targetAddress,
        Chain::ReadableView payload,
        Chain::Amount receiverValue,
        Chain::Gas gasLimit) = 0;
};

//----------------------------------------------------------------------------------------------------------------------
