//----------------------------------------------------------------------------------------------------------------------
// File: RelayDefinitions.hpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Chain/ChainTypes.hpp"
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Relay {
//----------------------------------------------------------------------------------------------------------------------

// The execution budget purchased for every delivery. The same value must be used to quote and to dispatch, otherwise
// the forwarded cost will not match what the relay service charges.
constexpr Chain::Gas ExecutionGasLimit{ 50'000 };

// No value is forwarded to the receiving endpoint.
constexpr Chain::Amount ReceiverValue{ 0 };

//----------------------------------------------------------------------------------------------------------------------
} // Relay namespace
//----------------------------------------------------------------------------------------------------------------------
