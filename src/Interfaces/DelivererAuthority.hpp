//----------------------------------------------------------------------------------------------------------------------
// File: DelivererAuthority.hpp
// Description: Defines an interface that decides whether the immediate caller of the delivery callback may deliver.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Chain/Address.hpp"
//----------------------------------------------------------------------------------------------------------------------

class IDelivererAuthority
{
public:
    virtual ~IDelivererAuthority() = default;
    [[nodiscard]] virtual bool IsAuthorizedDeliverer(Chain::Address const& caller) const = 0;
};

//----------------------------------------------------------------------------------------------------------------------
