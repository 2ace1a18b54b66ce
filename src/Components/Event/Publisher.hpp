//----------------------------------------------------------------------------------------------------------------------
// File: Publisher.hpp
// Description: Queues courier events for the owner of the publisher to dispatch to the subscribed listeners.
// Notes: Subscriptions are not thread safe. Only the thread that created the first publisher may subscribe and it must
// suspend subscriptions before any component begins publishing. After that point the listener table is read only and
// may be used without a lock. Publishing may occur from any thread, the listeners are only invoked by Dispatch().
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Events.hpp"
#include "Utilities/LogUtils.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <array>
#include <atomic>
#include <cassert>
#include <concepts>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Event {
//----------------------------------------------------------------------------------------------------------------------

class Publisher;

using SharedPublisher = std::shared_ptr<Publisher>;

//----------------------------------------------------------------------------------------------------------------------
namespace Assertions {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] bool IsSubscriberThread();

//----------------------------------------------------------------------------------------------------------------------
} // Assertions namespace
//----------------------------------------------------------------------------------------------------------------------
} // Event namespace
//----------------------------------------------------------------------------------------------------------------------

class Event::Publisher
{
public:
    Publisher();

    Publisher(Publisher const&) = delete;
    Publisher(Publisher&& ) = delete;
    Publisher& operator=(Publisher const&) = delete;
    Publisher& operator=(Publisher&&) = delete;

    template<Type SpecificType> requires MessageWithContent<SpecificType>
    bool Subscribe(typename Event::Message<SpecificType>::CallbackTrait const& callback)
    {
        return AddListener(SpecificType, [callback] (IMessage const& event) {
            // The listener table is indexed by type, the event is guaranteed to be the specialization for this slot.
            assert(event.GetType() == SpecificType);
            std::apply(callback, static_cast<Event::Message<SpecificType> const&>(event).GetContent());
        });
    }

    template<Type SpecificType> requires MessageWithoutContent<SpecificType>
    bool Subscribe(typename Event::Message<SpecificType>::CallbackTrait const& callback)
    {
        return AddListener(SpecificType, [callback] (IMessage const&) { std::invoke(callback); });
    }

    void SuspendSubscriptions();

    // Components advertise the events they may publish. The owner can use this to verify its subscriptions.
    void Advertise(Type type);
    void Advertise(std::initializer_list<Type> types);

    template<Type SpecificType, typename... Arguments> requires MessageWithContent<SpecificType>
    void Publish(Arguments&&... arguments)
    {
        if (!Accepts(SpecificType)) { return; }
        Enqueue(std::make_unique<Event::Message<SpecificType>>(std::forward<Arguments>(arguments)...));
    }

    template<Type SpecificType> requires MessageWithoutContent<SpecificType>
    void Publish()
    {
        if (!Accepts(SpecificType)) { return; }
        Enqueue(std::make_unique<Event::Message<SpecificType>>());
    }

    [[nodiscard]] bool IsSubscribed(Type type) const;
    [[nodiscard]] bool IsAdvertised(Type type) const;

    [[nodiscard]] std::size_t EventCount() const;
    [[nodiscard]] std::size_t ListenerCount() const;
    [[nodiscard]] std::size_t AdvertisedCount() const;
    [[nodiscard]] std::uint64_t DroppedCount() const;

    // Invokes the listeners of every queued event in publication order. Returns the number of events dispatched.
    std::size_t Dispatch();

private:
    using EventProxy = std::unique_ptr<IMessage>;
    using Listener = std::function<void(IMessage const& event)>;
    using ListenerTable = std::array<std::vector<Listener>, TypeCount>;

    bool AddListener(Type type, Listener&& listener);

    [[nodiscard]] bool Accepts(Type type);
    void Enqueue(EventProxy&& upEvent);

    LogUtils::Logger m_logger;

    std::atomic_bool m_hasSuspendedSubscriptions;
    ListenerTable m_listeners;

    std::atomic_uint32_t m_advertised; // A mask of the advertised event types.
    std::atomic_uint64_t m_dropped;

    mutable std::mutex m_eventsMutex;
    std::vector<EventProxy> m_events;
};

//----------------------------------------------------------------------------------------------------------------------
