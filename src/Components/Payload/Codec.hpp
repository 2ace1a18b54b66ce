//----------------------------------------------------------------------------------------------------------------------
// File: Codec.hpp
// Description: Conversion of a message to and from the byte payload handed to the relay service. The layout is the
// tuple encoding of (string, address) in 32 byte words:
//     [0, 32)    The offset of the string head, always 0x40.
//     [32, 64)   The sender address, right aligned.
//     [64, 96)   The length of the text in bytes.
//     [96, ...)  The text, zero padded to a word boundary.
// The layout carries no version tag, any change to it is a breaking change for deployed receivers.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Message.hpp"
#include "PackUtils.hpp"
#include "Components/Chain/Address.hpp"
#include "Components/Chain/ChainTypes.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <optional>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Payload {
//----------------------------------------------------------------------------------------------------------------------

constexpr std::uint64_t TextHeadOffset = 2 * PackUtils::WordSize;
constexpr std::size_t MinimumEncodedSize = 3 * PackUtils::WordSize;

[[nodiscard]] std::size_t GetEncodedSize(std::string_view text);

[[nodiscard]] Chain::Buffer Encode(std::string_view text, Chain::Address const& sender);
[[nodiscard]] Chain::Buffer Encode(Message const& message);

// Returns an empty optional when the buffer is not exactly the layout produced by Encode. Empty text is accepted.
[[nodiscard]] std::optional<Message> Decode(Chain::ReadableView buffer);

//----------------------------------------------------------------------------------------------------------------------
} // Payload namespace
//----------------------------------------------------------------------------------------------------------------------
