//----------------------------------------------------------------------------------------------------------------------
// File: MessageStore.hpp
// Description: Defines the single slot store for the most recently received message. A store holds at most one
// record and every Set replaces the previous record as a whole. The receiver holds none of its locks while calling
// into a store.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/State/ReceivedMessage.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <optional>
//----------------------------------------------------------------------------------------------------------------------

class IMessageStore
{
public:
    virtual ~IMessageStore() = default;
    [[nodiscard]] virtual std::optional<State::ReceivedMessage> Get() const = 0;
    virtual void Set(State::ReceivedMessage const& message) = 0;
};

//----------------------------------------------------------------------------------------------------------------------
