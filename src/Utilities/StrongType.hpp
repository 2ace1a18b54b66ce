//----------------------------------------------------------------------------------------------------------------------
// File: StrongType.hpp
// Description: A tagged wrapper around an integral value such that domains, amounts, and gas units can not be mixed.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <compare>
#include <concepts>
#include <cstdint>
//----------------------------------------------------------------------------------------------------------------------

template<std::integral WeakType, typename TypeTag>
class StrongType
{
public:
    using UnderlyingType = WeakType;

    constexpr StrongType() : m_value() {}
    constexpr explicit StrongType(UnderlyingType value) : m_value(value) {}

    constexpr StrongType(StrongType const& other) = default;
    constexpr StrongType(StrongType&& other) = default;
    constexpr StrongType& operator=(StrongType const& other) = default;
    constexpr StrongType& operator=(StrongType&& other) = default;

    [[nodiscard]] constexpr bool operator==(StrongType const& other) const = default;
    [[nodiscard]] constexpr std::strong_ordering operator<=>(StrongType const& other) const = default;

    [[nodiscard]] constexpr UnderlyingType GetValue() const { return m_value; }

private:
    UnderlyingType m_value;
};

//----------------------------------------------------------------------------------------------------------------------
