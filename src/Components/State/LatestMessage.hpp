//----------------------------------------------------------------------------------------------------------------------
// File: LatestMessage.hpp
// Description: The message store used by an endpoint. Only the most recent delivery is retained, concurrent writers
// resolve to whichever Set acquires the lock last.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "ReceivedMessage.hpp"
#include "Interfaces/MessageStore.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <optional>
#include <shared_mutex>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace State {
//----------------------------------------------------------------------------------------------------------------------

class LatestMessage;

//----------------------------------------------------------------------------------------------------------------------
} // State namespace
//----------------------------------------------------------------------------------------------------------------------

class State::LatestMessage : public IMessageStore
{
public:
    LatestMessage();

    LatestMessage(LatestMessage const&) = delete;
    LatestMessage& operator=(LatestMessage const&) = delete;

    // IMessageStore {
    [[nodiscard]] virtual std::optional<ReceivedMessage> Get() const override;
    virtual void Set(ReceivedMessage const& message) override;
    // } IMessageStore

    [[nodiscard]] std::uint64_t GetUpdateCount() const;

private:
    mutable std::shared_mutex m_mutex;
    std::optional<ReceivedMessage> m_optMessage;
    std::uint64_t m_updates;
};

//----------------------------------------------------------------------------------------------------------------------
