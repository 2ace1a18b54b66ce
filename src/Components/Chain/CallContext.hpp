//----------------------------------------------------------------------------------------------------------------------
// File: CallContext.hpp
// Description: The implicit parameters of an invocation, the immediate caller and the funds attached to the call.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Address.hpp"
#include "ChainTypes.hpp"
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Chain {
//----------------------------------------------------------------------------------------------------------------------

struct CallContext
{
    Address caller;
    Amount value;
};

//----------------------------------------------------------------------------------------------------------------------
} // Chain namespace
//----------------------------------------------------------------------------------------------------------------------
