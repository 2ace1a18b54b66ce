//----------------------------------------------------------------------------------------------------------------------
// File: Options.hpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include "Field.hpp"
#include "StatusCode.hpp"
#include "Components/Chain/Address.hpp"
#include "Components/Chain/ChainTypes.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json/fwd.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration {
//----------------------------------------------------------------------------------------------------------------------
namespace Options {
//----------------------------------------------------------------------------------------------------------------------

class Endpoint;
class Relay;
class Receiver;

//----------------------------------------------------------------------------------------------------------------------
} // Options namespace
//----------------------------------------------------------------------------------------------------------------------
namespace Symbols {
//----------------------------------------------------------------------------------------------------------------------

DEFINE_FIELD_NAME(Address);
DEFINE_FIELD_NAME(Domain);
DEFINE_FIELD_NAME(Endpoint);
DEFINE_FIELD_NAME(Receiver);
DEFINE_FIELD_NAME(Relay);
DEFINE_FIELD_NAME(ReplayProtection);
DEFINE_FIELD_NAME(Version);

//----------------------------------------------------------------------------------------------------------------------
} // Symbols namespace
//----------------------------------------------------------------------------------------------------------------------
} // Configuration namespace
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
// Description: The domain and address the local endpoint operates as.
//----------------------------------------------------------------------------------------------------------------------
class Configuration::Options::Endpoint
{
public:
    static constexpr std::string_view Symbol = Symbols::Endpoint{};
    static constexpr std::uint64_t DomainLimit = std::numeric_limits<Chain::Domain::UnderlyingType>::max();

    Endpoint();
    Endpoint(Chain::Domain domain, Chain::Address const& address);

    [[nodiscard]] bool operator==(Endpoint const& other) const = default;

    [[nodiscard]] static constexpr std::string_view GetFieldName() { return Symbol; }
    [[nodiscard]] static constexpr bool IsOptional() { return false; }

    [[nodiscard]] DeserializationResult Merge(boost::json::object const& json);
    [[nodiscard]] ValidationResult AreOptionsAllowable() const;

    [[nodiscard]] Chain::Domain GetDomain() const;
    [[nodiscard]] Chain::Address const& GetAddress() const;

private:
    Field<Symbols::Domain, Chain::Domain> m_domain;
    Field<Symbols::Address, Chain::Address> m_address;
};

//----------------------------------------------------------------------------------------------------------------------
// Description: The relay service the endpoint trusts to invoke its delivery callback.
//----------------------------------------------------------------------------------------------------------------------
class Configuration::Options::Relay
{
public:
    static constexpr std::string_view Symbol = Symbols::Relay{};

    Relay();
    explicit Relay(Chain::Address const& address);

    [[nodiscard]] bool operator==(Relay const& other) const = default;

    [[nodiscard]] static constexpr std::string_view GetFieldName() { return Symbol; }
    [[nodiscard]] static constexpr bool IsOptional() { return false; }

    [[nodiscard]] DeserializationResult Merge(boost::json::object const& json);
    [[nodiscard]] ValidationResult AreOptionsAllowable() const;

    [[nodiscard]] Chain::Address const& GetAddress() const;

private:
    Field<Symbols::Address, Chain::Address> m_address;
};

//----------------------------------------------------------------------------------------------------------------------
// Description: Receive side behavior. The group and each of its fields may be omitted.
//----------------------------------------------------------------------------------------------------------------------
class Configuration::Options::Receiver
{
public:
    static constexpr std::string_view Symbol = Symbols::Receiver{};

    Receiver();

    [[nodiscard]] bool operator==(Receiver const& other) const = default;

    [[nodiscard]] static constexpr std::string_view GetFieldName() { return Symbol; }
    [[nodiscard]] static constexpr bool IsOptional() { return true; }

    [[nodiscard]] DeserializationResult Merge(boost::json::object const& json);

    [[nodiscard]] bool UseReplayProtection() const;
    [[nodiscard]] bool SetReplayProtection(bool enabled);

private:
    OptionalField<Symbols::ReplayProtection, bool> m_optReplayProtection;
};

//----------------------------------------------------------------------------------------------------------------------
