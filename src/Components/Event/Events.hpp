//----------------------------------------------------------------------------------------------------------------------
// File: Events.hpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Components/Chain/Address.hpp"
#include "Components/Chain/ChainTypes.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/preprocessor/seq/for_each_i.hpp>
#include <boost/preprocessor/facilities/empty.hpp>
#include <boost/preprocessor/facilities/va_opt.hpp>
#include <boost/preprocessor/punctuation/comma_if.hpp>
#include <boost/preprocessor/variadic/to_seq.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Event {
//----------------------------------------------------------------------------------------------------------------------

enum class Type : std::uint32_t
{
    DeliveryRejected,
    MessageDispatched,
    MessageReceived
};

constexpr std::size_t TypeCount = 3;

[[nodiscard]] constexpr std::size_t ToIndex(Type type) { return static_cast<std::size_t>(type); }
[[nodiscard]] std::string_view GetTypeName(Type type);

class IMessage;

// By default, the message constructor is deleted to prevent usage of unspecialized types.
template<Type SpecificType>
class Message { Message() = delete; };

template<Type SpecificType>
concept MessageWithContent = requires { typename Message<SpecificType>::EventContent; };

template<Type SpecificType>
concept MessageWithoutContent = !MessageWithContent<SpecificType>;

//----------------------------------------------------------------------------------------------------------------------
} // Event namespace
//----------------------------------------------------------------------------------------------------------------------

class Event::IMessage
{
public:
    virtual ~IMessage() = default;
    [[nodiscard]] virtual Event::Type GetType() const = 0;
};

//----------------------------------------------------------------------------------------------------------------------
// Note: The following macros define the boilerplate types, methods, and variables that should be present in event
// specializations.
//----------------------------------------------------------------------------------------------------------------------

// Allows the event to define custom causes, (e.g. the event fired because of a defined error).
#define EVENT_MESSAGE_CAUSE(...) \
public: enum class Cause : std::uint32_t { __VA_ARGS__ };

// Converts a callback type into an unqualified content store type (e.g. std::string const& becomes std::string).
#define EVENT_MESSAGE_CONTENT_STORE_TYPES(r, data, i, elem) BOOST_PP_COMMA_IF(i) std::remove_cvref_t<elem>
// Converts a callback type into a named parameter (e.g. std::string const& becomes std::string const& arg_0).
#define EVENT_MESSAGE_CONTENT_STORE_ARGS(r, data, i, elem) BOOST_PP_COMMA_IF(i) elem arg_##i
// Converted a callback type into the name argument (e.g. std::string const& becomes arg_0)
#define EVENT_MESSAGE_CONTENT_STORE_NAMES(r, data, i, elem) BOOST_PP_COMMA_IF(i) arg_##i

// Creates the types, methods, and variables needed to support storing and providing callback content.
#define EVENT_MESSAGE_CONTENT_STORE(...) \
public:\
    using EventContent = std::tuple<\
        BOOST_PP_SEQ_FOR_EACH_I(EVENT_MESSAGE_CONTENT_STORE_TYPES, _, BOOST_PP_VARIADIC_TO_SEQ(__VA_ARGS__))>; \
    explicit Message(BOOST_PP_SEQ_FOR_EACH_I(\
        EVENT_MESSAGE_CONTENT_STORE_ARGS, _, BOOST_PP_VARIADIC_TO_SEQ(__VA_ARGS__))) \
        : m_content(std::make_tuple(BOOST_PP_SEQ_FOR_EACH_I( \
            EVENT_MESSAGE_CONTENT_STORE_NAMES, _, BOOST_PP_VARIADIC_TO_SEQ(__VA_ARGS__)))) {} \
    explicit Message(EventContent&& content) : m_content(std::move(content)) {} \
    auto const& GetContent() const { return m_content; } \
private: \
    EventContent m_content;
#define EVENT_MESSAGE_CONTENT_STORE_EMPTY \
private: \
    using EventContent = void;

// Creates the core types and methods needed to define an event specialization.
#define EVENT_MESSAGE_CORE(type, ...) \
public:\
    using CallbackTrait = std::function<void(__VA_ARGS__)>; \
    static constexpr Event::Type Type = type; \
    Message() = default; \
    ~Message() = default; \
    Message(Message const&) = delete; \
    Message(Message&& ) = default; \
    Message& operator=(Message const&) = delete; \
    Message& operator=(Message&&) = default; \
    virtual Event::Type GetType() const override { return Type; } \
    BOOST_PP_VA_OPT((EVENT_MESSAGE_CONTENT_STORE(__VA_ARGS__)), (EVENT_MESSAGE_CONTENT_STORE_EMPTY), __VA_ARGS__)

//----------------------------------------------------------------------------------------------------------------------
// Schema: The domain the delivery claimed to originate from and the cause of the rejection.
//----------------------------------------------------------------------------------------------------------------------
template<>
class Event::Message<Event::Type::DeliveryRejected> : public Event::IMessage
{
    EVENT_MESSAGE_CAUSE(Unauthorized, Malformed, Duplicate)
    EVENT_MESSAGE_CORE(Event::Type::DeliveryRejected, Chain::Domain, Cause)
};

//----------------------------------------------------------------------------------------------------------------------
// Schema: The target domain, the target address, and the cost forwarded to the relay service.
//----------------------------------------------------------------------------------------------------------------------
template<>
class Event::Message<Event::Type::MessageDispatched> : public Event::IMessage
{
    EVENT_MESSAGE_CORE(Event::Type::MessageDispatched, Chain::Domain, Chain::Address const&, Chain::Amount)
};

//----------------------------------------------------------------------------------------------------------------------
// Schema: The decoded text, the source domain, and the decoded sender of the message.
//----------------------------------------------------------------------------------------------------------------------
template<>
class Event::Message<Event::Type::MessageReceived> : public Event::IMessage
{
    EVENT_MESSAGE_CORE(Event::Type::MessageReceived, std::string const&, Chain::Domain, Chain::Address const&)
};

//----------------------------------------------------------------------------------------------------------------------
