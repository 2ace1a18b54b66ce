//----------------------------------------------------------------------------------------------------------------------
// File: FeeQuoter.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "FeeQuoter.hpp"
#include "RelayDefinitions.hpp"
#include "Interfaces/RelayService.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
//----------------------------------------------------------------------------------------------------------------------

Relay::FeeQuoter::FeeQuoter(std::shared_ptr<IRelayService> const& spRelayService)
    : m_spRelayService(spRelayService)
    , m_logger(LogUtils::GetLogger(LogUtils::Name::Core))
{
    assert(m_spRelayService);
}

//----------------------------------------------------------------------------------------------------------------------

Relay::FeeQuoter::QuoteResult Relay::FeeQuoter::Quote(Chain::Domain target) const
{
    auto const quote = m_spRelayService->QuoteDeliveryPrice(target, ReceiverValue, ExecutionGasLimit);
    if (quote.result.IsError()) {
        m_logger->debug("Unable to quote a delivery to domain {}: {}", target.GetValue(), quote.result.what());
        return { quote.result, Chain::Amount{} };
    }

    m_logger->trace("Quoted a delivery to domain {} at {}.", target.GetValue(), quote.cost.GetValue());
    return { quote.result, quote.cost };
}

//----------------------------------------------------------------------------------------------------------------------
