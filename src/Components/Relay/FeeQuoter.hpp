//----------------------------------------------------------------------------------------------------------------------
// File: FeeQuoter.hpp
// Description: Prices a delivery to a target domain. Every call asks the relay service again, prices are never cached.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Chain/ChainTypes.hpp"
#include "Components/Core/Result.hpp"
#include "Utilities/LogUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <memory>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

class IRelayService;

//----------------------------------------------------------------------------------------------------------------------
namespace Relay {
//----------------------------------------------------------------------------------------------------------------------

class FeeQuoter;

//----------------------------------------------------------------------------------------------------------------------
} // Relay namespace
//----------------------------------------------------------------------------------------------------------------------

class Relay::FeeQuoter
{
public:
    using QuoteResult = std::pair<Courier::Result, Chain::Amount>;

    explicit FeeQuoter(std::shared_ptr<IRelayService> const& spRelayService);

    FeeQuoter(FeeQuoter const&) = delete;
    FeeQuoter& operator=(FeeQuoter const&) = delete;

    // On failure the relay service's result is returned as it was received and the amount is zero.
    [[nodiscard]] QuoteResult Quote(Chain::Domain target) const;

private:
    std::shared_ptr<IRelayService> m_spRelayService;
    LogUtils::Logger m_logger;
};

//----------------------------------------------------------------------------------------------------------------------
