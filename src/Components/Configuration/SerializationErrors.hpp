//----------------------------------------------------------------------------------------------------------------------
// File: SerializationErrors.hpp
// Description: Diagnostic messages reported alongside a non-success StatusCode.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/fmt/fmt.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cctype>
#include <concepts>
#include <cstdint>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace Configuration {
//----------------------------------------------------------------------------------------------------------------------

[[nodiscard]] inline std::string_view GetIndefiniteArticle(std::string_view value)
{
    if (value.empty()) { return ""; }

    switch (std::tolower(static_cast<unsigned char>(value.front()))) {
        case 'a':
        case 'e':
        case 'i':
        case 'o':
        case 'u': return "an";
        default: return "a";
    }
}

//----------------------------------------------------------------------------------------------------------------------

template<typename... Fields> requires (std::convertible_to<Fields, std::string_view> && ...)
[[nodiscard]] std::string ConcatenateFieldNames(Fields const&... fields)
{
    std::string result;
    ((result.append(result.empty() ? "" : ".").append(std::string_view{ fields })), ...);
    return result;
}

//----------------------------------------------------------------------------------------------------------------------

template<typename... Fields> requires (std::convertible_to<Fields, std::string_view> && ...)
[[nodiscard]] std::string CreateMissingFieldMessage(Fields const&... fields)
{
    return fmt::format("The '{}' field is required.", ConcatenateFieldNames(fields...));
}

//----------------------------------------------------------------------------------------------------------------------

template<typename... Fields> requires (std::convertible_to<Fields, std::string_view> && ...)
[[nodiscard]] std::string CreateMismatchedValueTypeMessage(std::string_view type, Fields const&... fields)
{
    return fmt::format(
        "The '{}' field must be {} {}.",
        ConcatenateFieldNames(fields...), GetIndefiniteArticle(type), type);
}

//----------------------------------------------------------------------------------------------------------------------

template<typename... Fields> requires (std::convertible_to<Fields, std::string_view> && ...)
[[nodiscard]] std::string CreateInvalidValueMessage(Fields const&... fields)
{
    return fmt::format(
        "The '{}' field contains an invalid value. See documentation for supported values.",
        ConcatenateFieldNames(fields...));
}

//----------------------------------------------------------------------------------------------------------------------

template<typename... Fields> requires (std::convertible_to<Fields, std::string_view> && ...)
[[nodiscard]] std::string CreateExceededValueLimitMessage(std::integral auto max, Fields const&... fields)
{
    return fmt::format("The '{}' field must not exceed a value of '{}'.", ConcatenateFieldNames(fields...), max);
}

//----------------------------------------------------------------------------------------------------------------------
} // Configuration namespace
//----------------------------------------------------------------------------------------------------------------------
