//----------------------------------------------------------------------------------------------------------------------
// File: Codec.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Codec.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <string>
//----------------------------------------------------------------------------------------------------------------------

std::size_t Payload::GetEncodedSize(std::string_view text)
{
    return MinimumEncodedSize + PackUtils::PaddedSize(text.size());
}

//----------------------------------------------------------------------------------------------------------------------

Chain::Buffer Payload::Encode(std::string_view text, Chain::Address const& sender)
{
    Chain::Buffer encoded;
    encoded.reserve(GetEncodedSize(text));

    PackUtils::PackWord(TextHeadOffset, encoded);
    PackUtils::PackWord(sender.GetBytes(), encoded);
    PackUtils::PackWord(static_cast<std::uint64_t>(text.size()), encoded);
    PackUtils::PackPadded(text, encoded);

    return encoded;
}

//----------------------------------------------------------------------------------------------------------------------

Chain::Buffer Payload::Encode(Message const& message)
{
    return Encode(message.GetText(), message.GetSender());
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<Payload::Message> Payload::Decode(Chain::ReadableView buffer)
{
    if (buffer.size() < MinimumEncodedSize) { return {}; }

    auto begin = buffer.begin();
    auto const end = buffer.end();

    // The head of a two field tuple is always immediately after the two static words.
    std::uint64_t offset = 0;
    if (!PackUtils::UnpackWord(begin, end, offset) || offset != TextHeadOffset) { return {}; }

    Chain::Address::Bytes sender;
    if (!PackUtils::UnpackWord(begin, end, sender)) { return {}; }

    std::uint64_t length = 0;
    if (!PackUtils::UnpackWord(begin, end, length)) { return {}; }

    // Verify the length against the remaining bytes before computing the padded size such that a hostile length
    // can not wrap the arithmetic.
    auto const remaining = static_cast<std::uint64_t>(std::distance(begin, end));
    if (length > remaining || PackUtils::PaddedSize(length) != remaining) { return {}; }

    std::string text;
    if (!PackUtils::UnpackPadded(begin, end, text, length)) { return {}; }

    return Message{ text, Chain::Address{ sender } };
}

//----------------------------------------------------------------------------------------------------------------------
