//----------------------------------------------------------------------------------------------------------------------
// File: TrustedDeliverer.hpp
// Description: Authorizes deliveries made by a single, fixed relay service identity.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Chain/Address.hpp"
#include "Interfaces/DelivererAuthority.hpp"
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Relay {
//----------------------------------------------------------------------------------------------------------------------

class TrustedDeliverer;

//----------------------------------------------------------------------------------------------------------------------
} // Relay namespace
//----------------------------------------------------------------------------------------------------------------------

class Relay::TrustedDeliverer : public IDelivererAuthority
{
public:
    // Throws a Courier::Result with an InvalidArgument code when provided the zero address.
    explicit TrustedDeliverer(Chain::Address const& relay);

    // IDelivererAuthority {
    [[nodiscard]] virtual bool IsAuthorizedDeliverer(Chain::Address const& caller) const override;
    // } IDelivererAuthority

    [[nodiscard]] Chain::Address const& GetRelay() const;

private:
    Chain::Address const m_relay;
};

//----------------------------------------------------------------------------------------------------------------------
