//----------------------------------------------------------------------------------------------------------------------
// File: ReceivedMessage.hpp
// Description: A decoded message along with the provenance captured when it was applied.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Chain/Address.hpp"
#include "Components/Chain/ChainTypes.hpp"
#include "Components/Payload/Message.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <string>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace State {
//----------------------------------------------------------------------------------------------------------------------

struct ReceivedMessage
{
    [[nodiscard]] bool operator==(ReceivedMessage const& other) const = default;

    [[nodiscard]] std::string const& GetText() const { return message.GetText(); }
    [[nodiscard]] Chain::Address const& GetSender() const { return message.GetSender(); }
    [[nodiscard]] Chain::Domain GetSourceDomain() const { return source; }

    Payload::Message message;
    Chain::Domain source;
};

//----------------------------------------------------------------------------------------------------------------------
} // State namespace
//----------------------------------------------------------------------------------------------------------------------
