//----------------------------------------------------------------------------------------------------------------------
// File: TrustedDeliverer.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "TrustedDeliverer.hpp"
#include "Components/Core/Result.hpp"
//----------------------------------------------------------------------------------------------------------------------

Relay::TrustedDeliverer::TrustedDeliverer(Chain::Address const& relay)
    : m_relay(relay)
{
    if (m_relay.IsZero()) { throw Courier::Result{ Courier::ResultCode::InvalidArgument, "relay address" }; }
}

//----------------------------------------------------------------------------------------------------------------------

bool Relay::TrustedDeliverer::IsAuthorizedDeliverer(Chain::Address const& caller) const
{
    return caller == m_relay;
}

//----------------------------------------------------------------------------------------------------------------------

Chain::Address const& Relay::TrustedDeliverer::GetRelay() const
{
    return m_relay;
}

//----------------------------------------------------------------------------------------------------------------------
