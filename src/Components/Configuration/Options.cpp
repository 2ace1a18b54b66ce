//----------------------------------------------------------------------------------------------------------------------
// File: Options.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Options.hpp"
#include "Defaults.hpp"
#include "SerializationErrors.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <optional>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace {
namespace local {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] bool IsNonZeroAddress(Chain::Address const& address);

// Reads a required hexadecimal address field from the provided group.
template<typename AddressField>
[[nodiscard]] Configuration::DeserializationResult MergeAddress(
    boost::json::object const& json, std::string_view group, AddressField& field);

//----------------------------------------------------------------------------------------------------------------------
} // local namespace
} // namespace
//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Endpoint::Endpoint()
    : m_domain()
    , m_address(local::IsNonZeroAddress)
{
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Endpoint::Endpoint(Chain::Domain domain, Chain::Address const& address)
    : m_domain(domain)
    , m_address(address, local::IsNonZeroAddress)
{
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Options::Endpoint::Merge(boost::json::object const& json)
{
    // JSON Schema:
    // "endpoint": {
    //     "domain": Integer,
    //     "address": String
    // },

    if (auto const itr = json.find(m_domain.GetFieldName()); itr != json.end()) {
        auto const& value = itr->value();
        if (!value.is_int64() && !value.is_uint64()) {
            return {
                StatusCode::DecodeError,
                CreateMismatchedValueTypeMessage("integer", GetFieldName(), m_domain.GetFieldName())
            };
        }

        bool const negative = value.is_int64() && value.as_int64() < 0;
        auto const domain = value.is_uint64() ? value.as_uint64() : static_cast<std::uint64_t>(value.as_int64());
        if (negative || domain > DomainLimit) {
            return {
                StatusCode::InputError,
                CreateExceededValueLimitMessage(DomainLimit, GetFieldName(), m_domain.GetFieldName())
            };
        }

        auto const narrowed = static_cast<Chain::Domain::UnderlyingType>(domain);
        if (!m_domain.SetValueFromConfig(Chain::Domain{ narrowed })) {
            return { StatusCode::InputError, CreateInvalidValueMessage(GetFieldName(), m_domain.GetFieldName()) };
        }
    } else {
        return { StatusCode::InputError, CreateMissingFieldMessage(GetFieldName(), m_domain.GetFieldName()) };
    }

    return local::MergeAddress(json, GetFieldName(), m_address);
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ValidationResult Configuration::Options::Endpoint::AreOptionsAllowable() const
{
    if (!m_domain.Allowable()) {
        return { StatusCode::InputError, CreateMissingFieldMessage(GetFieldName(), m_domain.GetFieldName()) };
    }

    if (!m_address.Allowable()) {
        return { StatusCode::InputError, CreateInvalidValueMessage(GetFieldName(), m_address.GetFieldName()) };
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Chain::Domain Configuration::Options::Endpoint::GetDomain() const { return m_domain.GetValue(); }

//----------------------------------------------------------------------------------------------------------------------

Chain::Address const& Configuration::Options::Endpoint::GetAddress() const { return m_address.GetValue(); }

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Relay::Relay()
    : m_address(local::IsNonZeroAddress)
{
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Relay::Relay(Chain::Address const& address)
    : m_address(address, local::IsNonZeroAddress)
{
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Options::Relay::Merge(boost::json::object const& json)
{
    // JSON Schema:
    // "relay": {
    //     "address": String
    // },
    return local::MergeAddress(json, GetFieldName(), m_address);
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::ValidationResult Configuration::Options::Relay::AreOptionsAllowable() const
{
    if (!m_address.Allowable()) {
        return { StatusCode::InputError, CreateInvalidValueMessage(GetFieldName(), m_address.GetFieldName()) };
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

Chain::Address const& Configuration::Options::Relay::GetAddress() const { return m_address.GetValue(); }

//----------------------------------------------------------------------------------------------------------------------

Configuration::Options::Receiver::Receiver()
    : m_optReplayProtection()
{
}

//----------------------------------------------------------------------------------------------------------------------

Configuration::DeserializationResult Configuration::Options::Receiver::Merge(boost::json::object const& json)
{
    // JSON Schema:
    // "receiver": {
    //     "replay_protection": Optional Boolean
    // },

    if (m_optReplayProtection.NotModified()) {
        if (auto const itr = json.find(m_optReplayProtection.GetFieldName()); itr != json.end()) {
            if (!itr->value().is_bool()) {
                return {
                    StatusCode::DecodeError,
                    CreateMismatchedValueTypeMessage("boolean", GetFieldName(), m_optReplayProtection.GetFieldName())
                };
            }

            if (!m_optReplayProtection.SetValueFromConfig(itr->value().as_bool())) {
                return {
                    StatusCode::InputError,
                    CreateInvalidValueMessage(GetFieldName(), m_optReplayProtection.GetFieldName())
                };
            }
        }
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Options::Receiver::UseReplayProtection() const
{
    if (!m_optReplayProtection.HasValue()) { return Defaults::ReplayProtection; }
    return m_optReplayProtection.GetValue();
}

//----------------------------------------------------------------------------------------------------------------------

bool Configuration::Options::Receiver::SetReplayProtection(bool enabled)
{
    return m_optReplayProtection.SetValue(enabled);
}

//----------------------------------------------------------------------------------------------------------------------

bool local::IsNonZeroAddress(Chain::Address const& address)
{
    return !address.IsZero();
}

//----------------------------------------------------------------------------------------------------------------------

template<typename AddressField>
Configuration::DeserializationResult local::MergeAddress(
    boost::json::object const& json, std::string_view group, AddressField& field)
{
    using namespace Configuration;

    auto const itr = json.find(field.GetFieldName());
    if (itr == json.end()) {
        return { StatusCode::InputError, CreateMissingFieldMessage(group, field.GetFieldName()) };
    }

    if (!itr->value().is_string()) {
        return { StatusCode::DecodeError, CreateMismatchedValueTypeMessage("string", group, field.GetFieldName()) };
    }

    auto const& encoded = itr->value().as_string();
    auto const optAddress = Chain::Address::FromString({ encoded.data(), encoded.size() });
    if (!optAddress || !field.SetValueFromConfig(*optAddress)) {
        return { StatusCode::InputError, CreateInvalidValueMessage(group, field.GetFieldName()) };
    }

    return { StatusCode::Success, "" };
}

//----------------------------------------------------------------------------------------------------------------------
