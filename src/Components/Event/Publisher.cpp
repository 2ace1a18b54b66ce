//----------------------------------------------------------------------------------------------------------------------
// File: Publisher.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Publisher.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <bit>
#include <numeric>
#include <thread>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] constexpr std::uint32_t ToMask(Event::Type type) { return 1u << Event::ToIndex(type); }

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

std::string_view Event::GetTypeName(Type type)
{
    switch (type) {
        case Type::DeliveryRejected: return "DeliveryRejected";
        case Type::MessageDispatched: return "MessageDispatched";
        case Type::MessageReceived: return "MessageReceived";
    }
    return "Unknown";
}

//----------------------------------------------------------------------------------------------------------------------

Event::Publisher::Publisher()
    : m_logger(LogUtils::GetLogger(LogUtils::Name::Core))
    , m_hasSuspendedSubscriptions(false)
    , m_listeners()
    , m_advertised(0)
    , m_dropped(0)
    , m_eventsMutex()
    , m_events()
{
    assert(Assertions::IsSubscriberThread()); // Pins the subscriber thread when this is the first publisher.
}

//----------------------------------------------------------------------------------------------------------------------

void Event::Publisher::SuspendSubscriptions()
{
    assert(Assertions::IsSubscriberThread());
    m_hasSuspendedSubscriptions = true;
}

//----------------------------------------------------------------------------------------------------------------------

void Event::Publisher::Advertise(Type type)
{
    m_advertised.fetch_or(local::ToMask(type));
}

//----------------------------------------------------------------------------------------------------------------------

void Event::Publisher::Advertise(std::initializer_list<Type> types)
{
    auto const mask = std::accumulate(
        types.begin(), types.end(), std::uint32_t{ 0 },
        [] (std::uint32_t combined, Type type) { return combined | local::ToMask(type); });
    m_advertised.fetch_or(mask);
}

//----------------------------------------------------------------------------------------------------------------------

bool Event::Publisher::IsSubscribed(Type type) const
{
    return !m_listeners[ToIndex(type)].empty();
}

//----------------------------------------------------------------------------------------------------------------------

bool Event::Publisher::IsAdvertised(Type type) const
{
    return (m_advertised.load() & local::ToMask(type)) != 0;
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Event::Publisher::EventCount() const
{
    std::scoped_lock lock(m_eventsMutex);
    return m_events.size();
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Event::Publisher::ListenerCount() const
{
    return std::accumulate(
        m_listeners.begin(), m_listeners.end(), std::size_t{ 0 },
        [] (std::size_t count, auto const& listeners) { return count + listeners.size(); });
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Event::Publisher::AdvertisedCount() const
{
    return static_cast<std::size_t>(std::popcount(m_advertised.load()));
}

//----------------------------------------------------------------------------------------------------------------------

std::uint64_t Event::Publisher::DroppedCount() const
{
    return m_dropped.load();
}

//----------------------------------------------------------------------------------------------------------------------

std::size_t Event::Publisher::Dispatch()
{
    std::vector<EventProxy> events;
    {
        std::scoped_lock lock(m_eventsMutex);
        events.swap(m_events);
    }

    for (auto const& upEvent : events) {
        auto const& listeners = m_listeners[ToIndex(upEvent->GetType())];
        assert(!listeners.empty()); // Events without listeners are never queued.
        std::ranges::for_each(listeners, [&upEvent] (Listener const& listener) { listener(*upEvent); });
    }

    if (!events.empty()) { m_logger->trace("Dispatched {} event(s).", events.size()); }
    return events.size();
}

//----------------------------------------------------------------------------------------------------------------------

bool Event::Publisher::AddListener(Type type, Listener&& listener)
{
    if (m_hasSuspendedSubscriptions) {
        m_logger->warn("Unable to subscribe to {} after subscriptions have been suspended.", GetTypeName(type));
        return false;
    }

    assert(Assertions::IsSubscriberThread());
    m_listeners[ToIndex(type)].emplace_back(std::move(listener));
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

bool Event::Publisher::Accepts(Type type)
{
    assert(m_hasSuspendedSubscriptions); // Publishing may not begin until the listener table is read only.
    if (IsSubscribed(type)) { return true; }
    ++m_dropped;
    return false;
}

//----------------------------------------------------------------------------------------------------------------------

void Event::Publisher::Enqueue(EventProxy&& upEvent)
{
    std::scoped_lock lock(m_eventsMutex);
    m_events.emplace_back(std::move(upEvent));
}

//----------------------------------------------------------------------------------------------------------------------

bool Event::Assertions::IsSubscriberThread()
{
    // The listener table is only safe to read without a lock if every subscription was made by a single thread before
    // publishing began. The first caller of this method becomes that thread.
    static auto const thread = std::this_thread::get_id();
    return (thread == std::this_thread::get_id());
}

//----------------------------------------------------------------------------------------------------------------------
