//----------------------------------------------------------------------------------------------------------------------
// File: ChainTypes.hpp
// Description: The primitive value types shared by the sending and receiving sides of a cross-domain delivery.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Utilities/StrongType.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <array>
#include <cstdint>
#include <span>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Chain {
//----------------------------------------------------------------------------------------------------------------------

struct DomainTag;
struct AmountTag;
struct GasTag;

// An opaque tag identifying a network. The relay service is the only authority on which domains exist.
using Domain = StrongType<std::uint16_t, DomainTag>;

// Native currency amounts in the smallest denomination of the origin domain.
using Amount = StrongType<std::uint64_t, AmountTag>;

// Units of execution the relay service is paid to spend on the destination domain.
using Gas = StrongType<std::uint64_t, GasTag>;

constexpr std::size_t DeliveryHashSize = 32;
using DeliveryHash = std::array<std::uint8_t, DeliveryHashSize>;

using Buffer = std::vector<std::uint8_t>;
using ReadableView = std::span<std::uint8_t const>;

//----------------------------------------------------------------------------------------------------------------------
} // Chain namespace
//----------------------------------------------------------------------------------------------------------------------
