//----------------------------------------------------------------------------------------------------------------------
// File: Runtime.hpp
// Description: Drives a single quote, send, and delivery through an in process loopback relay using the parsed
// startup options and configuration.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "StartupOptions.hpp"
#include "Components/Configuration/Parser.hpp"
#include "Components/Event/Publisher.hpp"
#include "Components/Relay/LoopbackService.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <ostream>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Runtime {
//----------------------------------------------------------------------------------------------------------------------

// The loopback relay charges every domain the same price.
constexpr Relay::LoopbackService::Pricing DefaultPricing{ Chain::Amount{ 1'000 }, Chain::Amount{ 1 } };

void SubscribeToEvents(Event::Publisher& publisher);

// Writes the quoted cost and the received text to the output. Returns the process exit code.
[[nodiscard]] std::int32_t Execute(
    Startup::Options const& options, Configuration::Parser const& parser, std::ostream& output);

//----------------------------------------------------------------------------------------------------------------------
} // Runtime namespace
//----------------------------------------------------------------------------------------------------------------------
