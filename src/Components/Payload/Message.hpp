//----------------------------------------------------------------------------------------------------------------------
// File: Message.hpp
// Description: The application message carried between domains, a text body and the identity of its author.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Chain/Address.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Payload {
//----------------------------------------------------------------------------------------------------------------------

class Message;

//----------------------------------------------------------------------------------------------------------------------
} // Payload namespace
//----------------------------------------------------------------------------------------------------------------------

class Payload::Message
{
public:
    Message(std::string_view text, Chain::Address const& sender);

    Message(Message const&) = default;
    Message(Message&&) = default;
    Message& operator=(Message const&) = default;
    Message& operator=(Message&&) = default;

    [[nodiscard]] bool operator==(Message const& other) const = default;

    [[nodiscard]] std::string const& GetText() const;
    [[nodiscard]] Chain::Address const& GetSender() const;

private:
    std::string m_text;
    Chain::Address m_sender;
};

//----------------------------------------------------------------------------------------------------------------------
