//----------------------------------------------------------------------------------------------------------------------
// File: Message.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Message.hpp"
//----------------------------------------------------------------------------------------------------------------------

Payload::Message::Message(std::string_view text, Chain::Address const& sender)
    : m_text(text)
    , m_sender(sender)
{
}

//----------------------------------------------------------------------------------------------------------------------

std::string const& Payload::Message::GetText() const
{
    return m_text;
}

//----------------------------------------------------------------------------------------------------------------------

Chain::Address const& Payload::Message::GetSender() const
{
    return m_sender;
}

//----------------------------------------------------------------------------------------------------------------------
