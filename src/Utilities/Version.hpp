//----------------------------------------------------------------------------------------------------------------------
// File: Version.hpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Courier {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::string_view Version = "0.1.0";

//----------------------------------------------------------------------------------------------------------------------
} // Courier namespace
//----------------------------------------------------------------------------------------------------------------------
