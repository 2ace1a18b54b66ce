//----------------------------------------------------------------------------------------------------------------------
// File: LatestMessage.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "LatestMessage.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <mutex>
//----------------------------------------------------------------------------------------------------------------------

State::LatestMessage::LatestMessage()
    : m_mutex()
    , m_optMessage()
    , m_updates(0)
{
}

//----------------------------------------------------------------------------------------------------------------------

std::optional<State::ReceivedMessage> State::LatestMessage::Get() const
{
    std::shared_lock lock(m_mutex);
    return m_optMessage;
}

//----------------------------------------------------------------------------------------------------------------------

void State::LatestMessage::Set(ReceivedMessage const& message)
{
    std::unique_lock lock(m_mutex);
    m_optMessage = message;
    ++m_updates;
}

//----------------------------------------------------------------------------------------------------------------------

std::uint64_t State::LatestMessage::GetUpdateCount() const
{
    std::shared_lock lock(m_mutex);
    return m_updates;
}

//----------------------------------------------------------------------------------------------------------------------
