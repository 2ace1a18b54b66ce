//----------------------------------------------------------------------------------------------------------------------
// File: Field.hpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <array>
#include <concepts>
#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration {
//----------------------------------------------------------------------------------------------------------------------

template<typename T>
concept FieldNameTag = requires(T t)
{
    { static_cast<std::string_view>(t) } -> std::same_as<std::string_view>;
};

template <std::size_t SourceSize>
constexpr std::size_t GetSnakeCaseSize(const char (&source)[SourceSize])
{
    std::size_t size = SourceSize > 0 ? 1 : 0;

    for (std::size_t idx = 1; idx < SourceSize; ++idx) {
        if (source[idx] >= 'A' && source[idx] <= 'Z' && source[idx - 1] >= 'a' && source[idx - 1] <= 'z') {
            ++size;
        }
        ++size;
    }
    return size;
}

template <std::size_t DestinationSize, std::size_t SourceSize>
constexpr auto ConvertToSnakeCase(const char (&source)[SourceSize])
{
    std::array<char, DestinationSize> converted{};

    std::size_t idx = 0;
    for (std::size_t jdx = 0; jdx < SourceSize - 1; ++jdx) {
        if (source[jdx] >= 'A' && source[jdx] <= 'Z') {
            if (jdx > 0 && source[jdx - 1] >= 'a' && source[jdx - 1] <= 'z') { converted[idx++] = '_'; }
            converted[idx++] = static_cast<char>(source[jdx] - 'A' + 'a');
        } else {
            converted[idx++] = source[jdx];
        }
    }

    converted[idx] = '\0';
    return converted;
}

// Defines a tag type whose field name is the snake case form of the tag (e.g. ReplayProtection is replay_protection).
#define DEFINE_FIELD_NAME(name) \
    struct name { \
        static constexpr auto FieldName = ConvertToSnakeCase<GetSnakeCaseSize(#name)>(#name); \
        static constexpr std::string_view GetFieldName() { return FieldName.data(); } \
        constexpr operator std::string_view() const { return FieldName.data(); } \
    }

//----------------------------------------------------------------------------------------------------------------------
// Description: A named configuration value. A field is unset until a value passing the validator has been provided.
// A required field must be set before the enclosing options are considered allowable.
//----------------------------------------------------------------------------------------------------------------------
template<FieldNameTag ProvidedNameTag, typename ValueType, bool Required = true>
class Field
{
public:
    using Validator = std::function<bool(ValueType const&)>;

    static constexpr std::string_view FieldName = ProvidedNameTag{};
    static constexpr auto DefaultValidator = [] (ValueType const&) { return true; };

    explicit Field(Validator const& validator = DefaultValidator)
        : m_modified(false)
        , m_optValue()
        , m_validator(validator)
    {
    }

    explicit Field(ValueType const& value, Validator const& validator = DefaultValidator)
        : m_modified(false)
        , m_optValue(value)
        , m_validator(validator)
    {
    }

    [[nodiscard]] bool operator==(Field const& other) const { return m_optValue == other.m_optValue; }

    [[nodiscard]] static constexpr std::string_view GetFieldName() { return FieldName; }
    [[nodiscard]] static constexpr bool IsOptional() { return !Required; }

    [[nodiscard]] ValueType const& GetValue() const { return *m_optValue; }
    [[nodiscard]] bool HasValue() const { return m_optValue.has_value(); }

    [[nodiscard]] bool Modified() const { return m_modified; }
    [[nodiscard]] bool NotModified() const { return !m_modified; }

    [[nodiscard]] bool Allowable() const
    {
        if (!m_optValue) { return IsOptional(); }
        return m_validator(*m_optValue);
    }

    [[nodiscard]] bool SetValue(ValueType const& value)
    {
        if (m_optValue && *m_optValue == value) { return true; }
        if (!m_validator(value)) { return false; }
        m_optValue = value;
        m_modified = true;
        return true;
    }

    // Values read from a configuration file do not mark the field as modified.
    [[nodiscard]] bool SetValueFromConfig(ValueType const& value)
    {
        if (!m_validator(value)) { return false; }
        m_optValue = value;
        return true;
    }

private:
    bool m_modified;
    std::optional<ValueType> m_optValue;
    Validator m_validator;
};

template<FieldNameTag ProvidedNameTag, typename ValueType>
using OptionalField = Field<ProvidedNameTag, ValueType, false>;

//----------------------------------------------------------------------------------------------------------------------
} // Configuration namespace
//----------------------------------------------------------------------------------------------------------------------
