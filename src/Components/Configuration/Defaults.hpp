//----------------------------------------------------------------------------------------------------------------------
// File: Defaults.hpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration::Defaults {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::uint32_t FileSizeLimit = 12'000; // Limit the configuration files to 12KB

constexpr std::string_view ConfigurationFilename = "config.json";

constexpr bool ReplayProtection = false;

//----------------------------------------------------------------------------------------------------------------------
} // Configuration::Defaults namespace
//----------------------------------------------------------------------------------------------------------------------
